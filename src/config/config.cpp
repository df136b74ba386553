#include "config/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include "core/error.hpp"

namespace byteproc::config {

namespace pt = boost::property_tree;

namespace {

template <typename T>
std::optional<T> read_value(const pt::ptree& root, const std::string& key) {
  auto child = root.get_child_optional(key);
  if (!child) {
    return std::nullopt;
  }
  if (!child->empty()) {
    throw core::IoError("Config key '" + key + "' must be a scalar value");
  }
  // JSON null leaves the key unset
  if (child->data() == "null") {
    return std::nullopt;
  }
  try {
    return child->get_value<T>();
  } catch (const pt::ptree_bad_data&) {
    throw core::IoError("Config key '" + key + "' has invalid value '" + child->data() + "'");
  }
}

// Reads an integer and checks it fits the target type
template <typename T>
std::optional<T> read_integer(const pt::ptree& root, const std::string& key) {
  auto value = read_value<long long>(root, key);
  if (!value) {
    return std::nullopt;
  }
  if (*value < 0 && !std::numeric_limits<T>::is_signed) {
    throw core::IoError("Config key '" + key + "' must not be negative");
  }
  if (*value < static_cast<long long>(std::numeric_limits<T>::min()) ||
      (*value > 0 && static_cast<unsigned long long>(*value) >
                       static_cast<unsigned long long>(std::numeric_limits<T>::max()))) {
    throw core::IoError("Config key '" + key + "' is out of range");
  }
  return static_cast<T>(*value);
}

template <typename T>
void take(std::optional<T>& target, const std::optional<T>& source) {
  if (source) {
    target = source;
  }
}

bool is_hex_digit(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

} // namespace

//==============================================
// LAYERS
//==============================================

ConfigLayer ConfigLayer::defaults() {
  ConfigLayer layer;
  layer.schema_version = "1.0";
  layer.max_stream_size_kb = 64;

  layer.input_type = "stdin";
  layer.input_queue_bind = false;
  layer.output_type = "stdout";
  layer.output_queue_bind = false;

  layer.queue_reconnect_interval_ms = 1000;
  layer.queue_max_reconnect_attempts = 5;
  layer.queue_send_timeout_ms = 5000;
  layer.queue_receive_timeout_ms = 5000;
  layer.queue_linger_ms = 0;

  layer.log_enabled = true;
  layer.log_level = "info";
  layer.log_file = "byteproc.log";
  layer.log_append = true;
  layer.log_max_file_size_mb = 10;
  layer.log_rotation_count = 5;

  layer.xor_enabled = false;
  layer.xor_pad = "00";

  layer.base64_enabled = false;
  layer.base64_mode = "encode";
  layer.base64_padding = true;
  return layer;
}

void ConfigLayer::merge_from(const ConfigLayer& over) {
  take(schema_version, over.schema_version);
  take(max_stream_size_kb, over.max_stream_size_kb);

  take(input_type, over.input_type);
  take(input_queue_endpoint, over.input_queue_endpoint);
  take(input_queue_bind, over.input_queue_bind);
  take(output_type, over.output_type);
  take(output_queue_endpoint, over.output_queue_endpoint);
  take(output_queue_bind, over.output_queue_bind);

  take(queue_reconnect_interval_ms, over.queue_reconnect_interval_ms);
  take(queue_max_reconnect_attempts, over.queue_max_reconnect_attempts);
  take(queue_send_timeout_ms, over.queue_send_timeout_ms);
  take(queue_receive_timeout_ms, over.queue_receive_timeout_ms);
  take(queue_linger_ms, over.queue_linger_ms);

  take(log_enabled, over.log_enabled);
  take(log_level, over.log_level);
  take(log_file, over.log_file);
  take(log_append, over.log_append);
  take(log_max_file_size_mb, over.log_max_file_size_mb);
  take(log_rotation_count, over.log_rotation_count);

  take(xor_enabled, over.xor_enabled);
  take(xor_key, over.xor_key);
  take(xor_pad, over.xor_pad);

  take(base64_enabled, over.base64_enabled);
  take(base64_mode, over.base64_mode);
  take(base64_padding, over.base64_padding);
}


//==============================================
// VALIDATION
//==============================================

Config Config::resolve(const ConfigLayer& layer) {
  // Start from defaults so a partial layer still resolves
  ConfigLayer merged = ConfigLayer::defaults();
  merged.merge_from(layer);

  Config cfg;
  cfg.schema_version = *merged.schema_version;

  const std::size_t size_kb = *merged.max_stream_size_kb;
  if (size_kb == 0) {
    throw core::InvalidConfigurationError("max_stream_size_kb must be positive");
  }
  if (size_kb > MAX_STREAM_SIZE_KB) {
    throw core::InvalidConfigurationError("max_stream_size_kb must not exceed " +
                                          std::to_string(MAX_STREAM_SIZE_KB));
  }
  cfg.max_stream_size = size_kb * 1024;

  // Transport selection
  if (*merged.input_type == "stdin") {
    cfg.input_type = InputType::Stdin;
  } else if (*merged.input_type == "queue_pull") {
    cfg.input_type = InputType::QueuePull;
  } else {
    throw core::InvalidConfigurationError("unknown input_type '" + *merged.input_type +
                                          "' (expected stdin or queue_pull)");
  }
  if (*merged.output_type == "stdout") {
    cfg.output_type = OutputType::Stdout;
  } else if (*merged.output_type == "queue_push") {
    cfg.output_type = OutputType::QueuePush;
  } else {
    throw core::InvalidConfigurationError("unknown output_type '" + *merged.output_type +
                                          "' (expected stdout or queue_push)");
  }

  cfg.input_queue_endpoint = merged.input_queue_endpoint;
  cfg.input_queue_bind = *merged.input_queue_bind;
  cfg.output_queue_endpoint = merged.output_queue_endpoint;
  cfg.output_queue_bind = *merged.output_queue_bind;

  if (cfg.input_type == InputType::QueuePull && !cfg.input_queue_endpoint) {
    throw core::InvalidConfigurationError("input_queue_endpoint must be set for queue_pull");
  }
  if (cfg.output_type == OutputType::QueuePush && !cfg.output_queue_endpoint) {
    throw core::InvalidConfigurationError("output_queue_endpoint must be set for queue_push");
  }

  cfg.queue.reconnect_interval_ms = *merged.queue_reconnect_interval_ms;
  cfg.queue.max_reconnect_attempts = *merged.queue_max_reconnect_attempts;
  cfg.queue.send_timeout_ms = *merged.queue_send_timeout_ms;
  cfg.queue.receive_timeout_ms = *merged.queue_receive_timeout_ms;
  cfg.queue.linger_ms = *merged.queue_linger_ms;

  // Logging
  cfg.log.enabled = *merged.log_enabled;
  cfg.log.level = *merged.log_level;
  cfg.log.file = *merged.log_file;
  cfg.log.append = *merged.log_append;
  cfg.log.max_file_size_mb = *merged.log_max_file_size_mb;
  cfg.log.rotation_count = *merged.log_rotation_count;
  if (cfg.log.enabled && cfg.log.file.empty()) {
    throw core::InvalidConfigurationError("log_file must not be empty when logging is enabled");
  }

  // Modules
  cfg.xor_enabled = *merged.xor_enabled;
  cfg.xor_key = merged.xor_key;
  cfg.xor_pad = merged.xor_pad ? parse_pad_byte(*merged.xor_pad) : std::nullopt;
  if (cfg.xor_enabled && !cfg.xor_key) {
    throw core::InvalidConfigurationError("xor_key must be set if xor_enabled");
  }

  cfg.base64_enabled = *merged.base64_enabled;
  if (*merged.base64_mode == "encode") {
    cfg.base64_encode = true;
  } else if (*merged.base64_mode == "decode") {
    cfg.base64_encode = false;
  } else {
    throw core::InvalidConfigurationError("unknown base64_mode '" + *merged.base64_mode +
                                          "' (expected encode or decode)");
  }
  cfg.base64_padding = *merged.base64_padding;

  return cfg;
}

std::optional<uint8_t> parse_pad_byte(const std::string& text) {
  if (text.empty() || text.size() > 2) {
    return std::nullopt;
  }
  for (char c : text) {
    if (!is_hex_digit(c)) {
      return std::nullopt;
    }
  }
  return static_cast<uint8_t>(std::stoul(text, nullptr, 16));
}


//==============================================
// LOADING
//==============================================

std::string resolve_config_path(const std::optional<std::string>& explicit_path) {
  if (explicit_path) {
    return *explicit_path;
  }
  if (const char* env = std::getenv(CONFIG_ENV_VAR); env != nullptr && *env != '\0') {
    return env;
  }
  return DEFAULT_CONFIG_FILE;
}

ConfigLayer parse_config_json(const std::string& json_text) {
  pt::ptree root;
  try {
    std::istringstream input(json_text);
    pt::read_json(input, root);
  } catch (const pt::json_parser_error& e) {
    throw core::IoError("Malformed config JSON: " + std::string(e.what()));
  }

  ConfigLayer layer;
  layer.schema_version = read_value<std::string>(root, "schema_version");
  layer.max_stream_size_kb = read_integer<std::size_t>(root, "max_stream_size_kb");

  layer.input_type = read_value<std::string>(root, "input_type");
  layer.input_queue_endpoint = read_value<std::string>(root, "input_queue_endpoint");
  layer.input_queue_bind = read_value<bool>(root, "input_queue_bind");
  layer.output_type = read_value<std::string>(root, "output_type");
  layer.output_queue_endpoint = read_value<std::string>(root, "output_queue_endpoint");
  layer.output_queue_bind = read_value<bool>(root, "output_queue_bind");

  layer.queue_reconnect_interval_ms = read_integer<uint32_t>(root, "queue_reconnect_interval_ms");
  layer.queue_max_reconnect_attempts = read_integer<uint32_t>(root, "queue_max_reconnect_attempts");
  layer.queue_send_timeout_ms = read_integer<int32_t>(root, "queue_send_timeout_ms");
  layer.queue_receive_timeout_ms = read_integer<int32_t>(root, "queue_receive_timeout_ms");
  layer.queue_linger_ms = read_integer<int32_t>(root, "queue_linger_ms");

  layer.log_enabled = read_value<bool>(root, "log_enabled");
  layer.log_level = read_value<std::string>(root, "log_level");
  layer.log_file = read_value<std::string>(root, "log_file");
  layer.log_append = read_value<bool>(root, "log_append");
  layer.log_max_file_size_mb = read_integer<uint64_t>(root, "log_max_file_size_mb");
  layer.log_rotation_count = read_integer<std::size_t>(root, "log_rotation_count");

  layer.xor_enabled = read_value<bool>(root, "xor_enabled");
  layer.xor_key = read_value<std::string>(root, "xor_key");
  layer.xor_pad = read_value<std::string>(root, "xor_pad");

  layer.base64_enabled = read_value<bool>(root, "base64_enabled");
  layer.base64_mode = read_value<std::string>(root, "base64_mode");
  layer.base64_padding = read_value<bool>(root, "base64_padding");
  return layer;
}

ConfigLayer load_config_file(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    throw core::IoError("Cannot open config file " + path);
  }
  std::stringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    throw core::IoError("Failed to read config file " + path);
  }
  return parse_config_json(content.str());
}

Config load_config(const std::optional<std::string>& explicit_path,
                   const ConfigLayer& overrides) {
  ConfigLayer layer = ConfigLayer::defaults();

  const std::string path = resolve_config_path(explicit_path);
  std::error_code ec;
  const bool found = std::filesystem::is_regular_file(path, ec);
  if (found) {
    layer.merge_from(load_config_file(path));
  }

  layer.merge_from(overrides);
  Config cfg = Config::resolve(layer);
  if (found) {
    cfg.source_file = path;
  }
  return cfg;
}

const char* to_string(InputType type) {
  switch (type) {
    case InputType::Stdin:     return "stdin";
    case InputType::QueuePull: return "queue_pull";
    default:                   return "unknown";
  }
}

const char* to_string(OutputType type) {
  switch (type) {
    case OutputType::Stdout:    return "stdout";
    case OutputType::QueuePush: return "queue_push";
    default:                    return "unknown";
  }
}

} // namespace byteproc::config
