#ifndef BYTEPROC_CORE_ERROR_HPP
#define BYTEPROC_CORE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace byteproc::core {

class ByteProcError : public std::runtime_error {
public:
    explicit ByteProcError(const std::string& message)
        : std::runtime_error(message) {}
};

class IoError : public ByteProcError {
public:
    explicit IoError(const std::string& message)
        : ByteProcError("I/O error: " + message) {}
};

class InvalidConfigurationError : public ByteProcError {
public:
    explicit InvalidConfigurationError(const std::string& message)
        : ByteProcError("Invalid configuration: " + message) {}
};

class HexDecodeError : public ByteProcError {
public:
    explicit HexDecodeError(const std::string& message)
        : ByteProcError("Hex decode error: " + message) {}
};

// Carries the configured bound and the offending buffer size
class MaxSizeExceededError : public ByteProcError {
public:
    MaxSizeExceededError(std::size_t limit, std::size_t actual)
        : ByteProcError("Stream too large: max " + std::to_string(limit) +
                        " bytes, got " + std::to_string(actual))
        , limit_(limit)
        , actual_(actual) {}

    std::size_t limit() const { return limit_; }
    std::size_t actual() const { return actual_; }

private:
    std::size_t limit_;
    std::size_t actual_;
};

class TransportError : public ByteProcError {
public:
    explicit TransportError(const std::string& message)
        : ByteProcError("Transport error: " + message) {}
};

class ModuleError : public ByteProcError {
public:
    explicit ModuleError(const std::string& message)
        : ByteProcError("Module processing error: " + message) {}
};

} // namespace byteproc::core

#endif // BYTEPROC_CORE_ERROR_HPP
