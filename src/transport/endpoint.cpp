#include "transport/endpoint.hpp"
#include <limits>
#include "core/error.hpp"

namespace byteproc {
namespace transport {

namespace {

constexpr const char* SCHEME = "tcp://";

} // namespace

std::string Endpoint::to_string() const {
  return std::string(SCHEME) + host + ":" + std::to_string(port);
}

Endpoint Endpoint::parse(const std::string& text) {
  const std::string scheme(SCHEME);
  if (text.compare(0, scheme.size(), scheme) != 0) {
    throw core::InvalidConfigurationError("endpoint '" + text + "' must start with " + scheme);
  }

  const std::string address = text.substr(scheme.size());
  const std::size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw core::InvalidConfigurationError("endpoint '" + text + "' must be tcp://host:port");
  }

  Endpoint endpoint;
  endpoint.host = address.substr(0, colon);
  // Bracketed IPv6 literal
  if (endpoint.host.size() > 2 && endpoint.host.front() == '[' && endpoint.host.back() == ']') {
    endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
  }

  const std::string port_str = address.substr(colon + 1);
  if (port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5) {
    throw core::InvalidConfigurationError("invalid port in endpoint '" + text + "'");
  }
  const unsigned long port = std::stoul(port_str);
  if (port > std::numeric_limits<uint16_t>::max()) {
    throw core::InvalidConfigurationError("port out of range in endpoint '" + text + "'");
  }
  endpoint.port = static_cast<uint16_t>(port);
  return endpoint;
}

} // namespace transport
} // namespace byteproc
