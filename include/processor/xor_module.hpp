#ifndef BYTEPROC_PROCESSOR_XOR_MODULE_HPP
#define BYTEPROC_PROCESSOR_XOR_MODULE_HPP

#include <optional>
#include "processor/byte_processor.hpp"
#include "utils/secure_buffer.hpp"

namespace byteproc::processor {

class XorModule : public ByteProcessor {
public:
  static constexpr const char* NAME = "xor";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Decodes the hex key. Throws HexDecodeError on malformed hex and
  // InvalidConfigurationError if the key decodes to zero bytes.
  XorModule(const std::string& hex_key, std::optional<uint8_t> pad_byte);

  XorModule(const XorModule&) = delete;
  XorModule& operator=(const XorModule&) = delete;


  // ---- PROCESSING ----
  std::string name() const override { return NAME; }
  // output[i] = input[i] ^ key[i % key_size]
  core::Bytes process(const core::Bytes& input) const override;


  // ---- GETTERS ----
  std::size_t key_size() const { return key_.size(); }
  // Stored only; the transform always cycles the key
  std::optional<uint8_t> pad_byte() const { return pad_byte_; }

private:
  // ---- PARAMETERS ----
  utils::SecureBuffer key_;
  std::optional<uint8_t> pad_byte_;
};

} // namespace byteproc::processor

#endif // BYTEPROC_PROCESSOR_XOR_MODULE_HPP
