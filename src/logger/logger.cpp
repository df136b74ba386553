#include "logger/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include "core/error.hpp"

namespace byteproc::logging {

namespace {

constexpr const char* INSTANCE_ATTRIBUTE = "Instance";

using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;

// State installed by init_logging and removed by shutdown_logging
struct InstalledLogging {
  boost::shared_ptr<text_sink> sink;
  boost::log::attribute_set::iterator instance_attribute;
  bool has_instance_attribute = false;
};

InstalledLogging& installed() {
  static InstalledLogging state;
  return state;
}

} // namespace

//==============================================
// LEVELS
//==============================================

std::optional<severity_level> parse_log_level(const std::string& name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") return severity_level::trace;
  if (lowered == "debug") return severity_level::debug;
  if (lowered == "info") return severity_level::info;
  if (lowered == "warn" || lowered == "warning") return severity_level::warning;
  if (lowered == "error") return severity_level::error;
  if (lowered == "fatal") return severity_level::fatal;
  return std::nullopt;
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}


//==============================================
// SINK SETUP
//==============================================

void init_logging(const config::LogSettings& settings, const std::string& instance_id) {
  namespace logging = boost::log;
  namespace sinks = boost::log::sinks;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  auto log_core = logging::core::get();
  shutdown_logging();

  if (!settings.enabled) {
    disable_logging();
    return;
  }

  const std::string lowered_level = [&settings]() {
    std::string s(settings.level);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }();
  if (lowered_level == "off") {
    disable_logging();
    return;
  }

  try {
    std::filesystem::path log_path = std::filesystem::absolute(settings.file);
    std::filesystem::path log_dir = log_path.parent_path();
    if (!log_dir.empty()) {
      std::filesystem::create_directories(log_dir);
    }

    std::ios_base::openmode mode = std::ios::out;
    mode |= settings.append ? std::ios::app : std::ios::trunc;

    // A zero size disables rotation
    std::uintmax_t rotation_size = std::numeric_limits<std::uintmax_t>::max();
    if (settings.max_file_size_mb > 0) {
      rotation_size = static_cast<std::uintmax_t>(settings.max_file_size_mb) * 1024 * 1024;
    }

    auto backend = boost::make_shared<sinks::text_file_backend>(
      keywords::file_name = log_path.string(),
      keywords::open_mode = mode,
      keywords::rotation_size = rotation_size);
    backend->auto_flush(true);

    // Rotated files are kept beside the active log
    if (settings.rotation_count > 0) {
      backend->set_file_collector(sinks::file::make_collector(
        keywords::target = log_dir.string(),
        keywords::max_files = settings.rotation_count));
      backend->scan_for_files();
    }

    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "]"
        << " [" << expr::attr<std::string>(INSTANCE_ATTRIBUTE) << "] "
        << expr::smessage);

    logging::add_common_attributes();
    auto added = log_core->add_global_attribute(
      INSTANCE_ATTRIBUTE, logging::attributes::constant<std::string>(instance_id));
    installed().instance_attribute = added.first;
    installed().has_instance_attribute = added.second;
    log_core->add_sink(sink);
    installed().sink = sink;

    auto level = parse_log_level(settings.level);
    set_log_level(level.value_or(severity_level::info));
    enable_logging();

    if (!level) {
      BOOST_LOG_TRIVIAL(warning) << "Logger: Unknown log level '" << settings.level
                                 << "', using info";
    }
    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw core::IoError("Cannot open log file " + settings.file + ": " + e.what());
  }
}

void shutdown_logging() {
  auto log_core = boost::log::core::get();
  InstalledLogging& state = installed();
  if (state.sink) {
    log_core->flush();
    log_core->remove_sink(state.sink);
    state.sink.reset();
  }
  if (state.has_instance_attribute) {
    log_core->remove_global_attribute(state.instance_attribute);
    state.has_instance_attribute = false;
  }
}

} // namespace byteproc::logging
