#ifndef BYTEPROC_CORE_TYPES_HPP
#define BYTEPROC_CORE_TYPES_HPP

#include <cstdint>
#include <vector>

namespace byteproc::core {

using Bytes = std::vector<uint8_t>;

} // namespace byteproc::core

#endif // BYTEPROC_CORE_TYPES_HPP
