#ifndef BYTEPROC_TRANSPORT_ENDPOINT_HPP
#define BYTEPROC_TRANSPORT_ENDPOINT_HPP

#include <cstdint>
#include <string>

namespace byteproc {
namespace transport {

// Queue socket address in the form tcp://host:port. A host of "*" means
// every local interface and is only meaningful when binding.
struct Endpoint {
  std::string host;
  uint16_t port{0};

  bool is_wildcard() const { return host == "*"; }
  std::string to_string() const;

  // Throws InvalidConfigurationError for anything but tcp://host:port
  static Endpoint parse(const std::string& text);
};

} // namespace transport
} // namespace byteproc

#endif // BYTEPROC_TRANSPORT_ENDPOINT_HPP
