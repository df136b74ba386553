#include "utils/hex.hpp"
#include <iterator>
#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "core/error.hpp"

namespace byteproc::utils {

//==============================================
// HEX CODEC
//==============================================

core::Bytes hex_decode(const std::string& text) {
  if (text.size() % 2 != 0) {
    throw core::HexDecodeError("Odd number of digits (" + std::to_string(text.size()) + ")");
  }

  core::Bytes out;
  out.reserve(text.size() / 2);
  try {
    boost::algorithm::unhex(text.begin(), text.end(), std::back_inserter(out));
  } catch (const boost::algorithm::non_hex_input&) {
    throw core::HexDecodeError("Invalid character in hex string");
  } catch (const boost::algorithm::hex_decode_error&) {
    throw core::HexDecodeError("Malformed hex string");
  }
  return out;
}

std::string hex_encode(const core::Bytes& data) {
  std::string out;
  out.reserve(data.size() * 2);
  boost::algorithm::hex_lower(data.begin(), data.end(), std::back_inserter(out));
  return out;
}

std::string trim(const std::string& text) {
  return boost::algorithm::trim_copy(text);
}

} // namespace byteproc::utils
