#ifndef BYTEPROC_TRANSPORT_FRAME_CODEC_HPP
#define BYTEPROC_TRANSPORT_FRAME_CODEC_HPP

#include <array>
#include <cstdint>
#include <string>
#include <boost/endian/conversion.hpp>

namespace byteproc {
namespace transport {

// Length-prefixed framing: 4-byte big-endian payload length, then the payload
class FrameCodec {
public:
  static constexpr std::size_t HEADER_SIZE = 4;
  using Header = std::array<uint8_t, HEADER_SIZE>;

  // ---- SERIALIZATION ----
  // Throws TransportError if the payload does not fit a 32-bit length
  static Header encode_header(std::size_t payload_size);
  static uint32_t decode_header(const Header& header);
  // Header followed by payload
  static std::string encode(const std::string& payload);

private:
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace transport
} // namespace byteproc

#endif // BYTEPROC_TRANSPORT_FRAME_CODEC_HPP
