#include "transport/frame_codec.hpp"
#include <cstring>
#include <limits>
#include "core/error.hpp"

namespace byteproc {
namespace transport {

FrameCodec::Header FrameCodec::encode_header(std::size_t payload_size) {
  if (payload_size > std::numeric_limits<uint32_t>::max()) {
    throw core::TransportError("Frame payload of " + std::to_string(payload_size) +
                               " bytes exceeds the 32-bit length field");
  }
  const uint32_t length = to_network_order(static_cast<uint32_t>(payload_size));
  Header header;
  std::memcpy(header.data(), &length, HEADER_SIZE);
  return header;
}

uint32_t FrameCodec::decode_header(const Header& header) {
  uint32_t length = 0;
  std::memcpy(&length, header.data(), HEADER_SIZE);
  return from_network_order(length);
}

std::string FrameCodec::encode(const std::string& payload) {
  const Header header = encode_header(payload.size());
  std::string frame;
  frame.reserve(HEADER_SIZE + payload.size());
  frame.append(reinterpret_cast<const char*>(header.data()), HEADER_SIZE);
  frame.append(payload);
  return frame;
}

} // namespace transport
} // namespace byteproc
