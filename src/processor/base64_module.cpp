#include "processor/base64_module.hpp"
#include <limits>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace byteproc::processor {

namespace {

// EVP block functions take int lengths; keep the encoded form within range
constexpr std::size_t MAX_ENCODE_INPUT = static_cast<std::size_t>(std::numeric_limits<int>::max() / 4) * 3;
constexpr std::size_t MAX_DECODE_INPUT = static_cast<std::size_t>(std::numeric_limits<int>::max() - 3);

// Returns the 6-bit value of a standard alphabet character, or -1
int sextet_value(uint8_t c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Base64Module::Base64Module(bool encode, bool padding)
  : encode_(encode)
  , padding_(padding) {
  BOOST_LOG_TRIVIAL(debug) << "Base64 module: Initialized for "
                           << (encode_ ? "encoding" : "decoding")
                           << (padding_ ? " with padding" : " without padding");
}


//==============================================
// PROCESSING
//==============================================

core::Bytes Base64Module::process(const core::Bytes& input) const {
  return encode_ ? encode(input) : decode(input);
}

core::Bytes Base64Module::encode(const core::Bytes& input) const {
  if (input.empty()) {
    return {};
  }

  if (input.size() > MAX_ENCODE_INPUT) {
    throw core::ModuleError("Base64 input of " + std::to_string(input.size()) + " bytes is too large");
  }

  // EVP_EncodeBlock always pads and NUL terminates
  core::Bytes out(4 * ((input.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(out.data(), input.data(), static_cast<int>(input.size()));
  if (written < 0) {
    throw core::ModuleError("Base64 encoding failed");
  }
  out.resize(static_cast<std::size_t>(written));

  if (!padding_) {
    while (!out.empty() && out.back() == '=') {
      out.pop_back();
    }
  }

  BOOST_LOG_TRIVIAL(trace) << "Base64 module: Encoded " << input.size()
                           << " bytes into " << out.size() << " characters";
  return out;
}

core::Bytes Base64Module::decode(const core::Bytes& input) const {
  if (input.empty()) {
    return {};
  }

  if (input.size() > MAX_DECODE_INPUT) {
    throw core::ModuleError("Base64 input of " + std::to_string(input.size()) + " characters is too large");
  }

  std::size_t pad_count = 0;
  validate_encoded(input, pad_count);

  // OpenSSL only decodes complete quanta, so restore padding for unpadded text
  core::Bytes text(input);
  if (!padding_) {
    pad_count = (4 - text.size() % 4) % 4;
    text.insert(text.end(), pad_count, '=');
  }

  core::Bytes out(3 * (text.size() / 4));
  int written = EVP_DecodeBlock(out.data(), text.data(), static_cast<int>(text.size()));
  if (written < 0) {
    throw core::ModuleError("Invalid Base64 input");
  }

  // EVP_DecodeBlock counts the zero bytes that stand in for padding
  out.resize(static_cast<std::size_t>(written) - pad_count);

  BOOST_LOG_TRIVIAL(trace) << "Base64 module: Decoded " << input.size()
                           << " characters into " << out.size() << " bytes";
  return out;
}

void Base64Module::validate_encoded(const core::Bytes& input, std::size_t& pad_count) const {
  const std::size_t length = input.size();

  pad_count = 0;
  while (pad_count < length && input[length - 1 - pad_count] == '=') {
    ++pad_count;
  }

  if (padding_) {
    if (length % 4 != 0) {
      throw core::ModuleError("Invalid Base64 length " + std::to_string(length) +
                              " for padded input");
    }
    if (pad_count > 2) {
      throw core::ModuleError("Invalid Base64 padding");
    }
  } else {
    if (pad_count > 0) {
      throw core::ModuleError("Unexpected padding in unpadded Base64 input");
    }
    if (length % 4 == 1) {
      throw core::ModuleError("Invalid Base64 length " + std::to_string(length));
    }
  }

  const std::size_t data_len = length - pad_count;
  for (std::size_t i = 0; i < data_len; ++i) {
    if (sextet_value(input[i]) < 0) {
      throw core::ModuleError("Invalid Base64 character at offset " + std::to_string(i));
    }
  }

  // The last character of a partial quantum may only carry bits that fit
  const std::size_t tail = data_len % 4;
  if (tail != 0) {
    const int last = sextet_value(input[data_len - 1]);
    const int unused_mask = (tail == 2) ? 0x0F : 0x03;
    if ((last & unused_mask) != 0) {
      throw core::ModuleError("Invalid trailing bits in Base64 input");
    }
  }
}

} // namespace byteproc::processor
