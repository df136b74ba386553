#include "processor/xor_module.hpp"
#include <boost/log/trivial.hpp>
#include "utils/hex.hpp"

namespace byteproc::processor {

namespace {

utils::SecureBuffer decode_key(const std::string& hex_key) {
  utils::SecureBuffer key(utils::hex_decode(hex_key));
  if (key.empty()) {
    throw core::InvalidConfigurationError("xor_key cannot be empty");
  }
  return key;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

XorModule::XorModule(const std::string& hex_key, std::optional<uint8_t> pad_byte)
  : key_(decode_key(hex_key))
  , pad_byte_(pad_byte) {
  BOOST_LOG_TRIVIAL(debug) << "Xor module: Initialized with " << key_.size() << " byte key";
}


//==============================================
// PROCESSING
//==============================================

core::Bytes XorModule::process(const core::Bytes& input) const {
  core::Bytes out(input.size());
  const std::size_t key_len = key_.size();
  for (std::size_t i = 0; i < input.size(); ++i) {
    out[i] = static_cast<uint8_t>(input[i] ^ key_[i % key_len]);
  }
  BOOST_LOG_TRIVIAL(trace) << "Xor module: Processed " << input.size() << " bytes";
  return out;
}

} // namespace byteproc::processor
