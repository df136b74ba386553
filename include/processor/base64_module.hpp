#ifndef BYTEPROC_PROCESSOR_BASE64_MODULE_HPP
#define BYTEPROC_PROCESSOR_BASE64_MODULE_HPP

#include "processor/byte_processor.hpp"

namespace byteproc::processor {

// Standard alphabet Base64 in one direction, with or without '=' padding
class Base64Module : public ByteProcessor {
public:
  static constexpr const char* NAME = "base64";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Base64Module(bool encode, bool padding);


  // ---- PROCESSING ----
  std::string name() const override { return NAME; }
  // Encodes input into Base64 text bytes, or decodes Base64 text bytes.
  // Decoding throws ModuleError for text invalid under the padding mode.
  core::Bytes process(const core::Bytes& input) const override;


  // ---- GETTERS ----
  bool is_encoder() const { return encode_; }
  bool uses_padding() const { return padding_; }

private:
  // ---- PARAMETERS ----
  bool encode_;
  bool padding_;


  // ---- ENCODING/DECODING ----
  core::Bytes encode(const core::Bytes& input) const;
  core::Bytes decode(const core::Bytes& input) const;
  // Checks alphabet, padding placement and trailing bits before OpenSSL sees the text
  void validate_encoded(const core::Bytes& input, std::size_t& pad_count) const;
};

} // namespace byteproc::processor

#endif // BYTEPROC_PROCESSOR_BASE64_MODULE_HPP
