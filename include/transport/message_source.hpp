#pragma once

#include <string>

namespace byteproc {
namespace transport {

// Supplies the raw hex text of one message
class MessageSource {
public:
  virtual ~MessageSource() = default;

  // Blocks until one complete message is available
  virtual std::string receive() = 0;
  virtual const char* describe() const = 0;
};

// Accepts the hex text of one processed message
class MessageSink {
public:
  virtual ~MessageSink() = default;

  virtual void send(const std::string& message) = 0;
  virtual const char* describe() const = 0;
};

} // namespace transport
} // namespace byteproc
