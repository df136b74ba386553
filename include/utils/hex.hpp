#ifndef BYTEPROC_UTILS_HEX_HPP
#define BYTEPROC_UTILS_HEX_HPP

#include <string>
#include "core/types.hpp"

namespace byteproc::utils {

// Strict decode: odd length or any non-hex character throws HexDecodeError.
// Both upper and lower case digits are accepted.
core::Bytes hex_decode(const std::string& text);

// Lowercase encode
std::string hex_encode(const core::Bytes& data);

// Strips leading and trailing ASCII whitespace
std::string trim(const std::string& text);

} // namespace byteproc::utils

#endif // BYTEPROC_UTILS_HEX_HPP
