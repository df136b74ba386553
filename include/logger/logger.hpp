#ifndef BYTEPROC_LOGGER_HPP
#define BYTEPROC_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>
#include "config/config.hpp"

namespace byteproc::logging {

using severity_level = boost::log::trivial::severity_level;

// Maps trace|debug|info|warn|warning|error|fatal (any case) to a severity.
// Returns nullopt for "off" and for unknown names.
std::optional<severity_level> parse_log_level(const std::string& name);

// Installs the file sink described by settings. Records carry the instance
// identifier so output from chained processes can be told apart.
void init_logging(const config::LogSettings& settings, const std::string& instance_id);

// Removes installed sinks and attributes added by init_logging
void shutdown_logging();

void set_log_level(severity_level level);
void enable_logging();
void disable_logging();

} // namespace byteproc::logging

#endif // BYTEPROC_LOGGER_HPP
