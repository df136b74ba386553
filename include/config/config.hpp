#ifndef BYTEPROC_CONFIG_CONFIG_HPP
#define BYTEPROC_CONFIG_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace byteproc::config {

// Environment variable naming the config file when --config is absent
constexpr const char* CONFIG_ENV_VAR = "BYTEPROC_CONFIG";
constexpr const char* DEFAULT_CONFIG_FILE = "byteproc.json";
// Upper bound for max_stream_size_kb (1 GiB)
constexpr std::size_t MAX_STREAM_SIZE_KB = 1024 * 1024;

/**
 * One layer of settings. Every field is optional so layers can be merged:
 * built-in defaults, then the JSON file, then the command line.
 */
struct ConfigLayer {
  std::optional<std::string> schema_version;
  std::optional<std::size_t> max_stream_size_kb;

  std::optional<std::string> input_type;
  std::optional<std::string> input_queue_endpoint;
  std::optional<bool> input_queue_bind;
  std::optional<std::string> output_type;
  std::optional<std::string> output_queue_endpoint;
  std::optional<bool> output_queue_bind;

  std::optional<uint32_t> queue_reconnect_interval_ms;
  std::optional<uint32_t> queue_max_reconnect_attempts;
  std::optional<int32_t> queue_send_timeout_ms;
  std::optional<int32_t> queue_receive_timeout_ms;
  std::optional<int32_t> queue_linger_ms;

  std::optional<bool> log_enabled;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::optional<bool> log_append;
  std::optional<uint64_t> log_max_file_size_mb;
  std::optional<std::size_t> log_rotation_count;

  std::optional<bool> xor_enabled;
  std::optional<std::string> xor_key;
  std::optional<std::string> xor_pad;

  std::optional<bool> base64_enabled;
  std::optional<std::string> base64_mode;
  std::optional<bool> base64_padding;

  // Built-in defaults
  static ConfigLayer defaults();

  // Fields set in `over` replace the ones in this layer
  void merge_from(const ConfigLayer& over);
};

enum class InputType { Stdin, QueuePull };
enum class OutputType { Stdout, QueuePush };

struct QueueSettings {
  uint32_t reconnect_interval_ms{1000};
  uint32_t max_reconnect_attempts{5};
  int32_t send_timeout_ms{5000};
  int32_t receive_timeout_ms{5000};
  int32_t linger_ms{0};
};

struct LogSettings {
  bool enabled{true};
  std::string level{"info"};
  std::string file{"byteproc.log"};
  bool append{true};
  uint64_t max_file_size_mb{10};
  std::size_t rotation_count{5};
};

// Resolved, validated configuration
struct Config {
  std::string schema_version;
  std::size_t max_stream_size{64 * 1024};

  InputType input_type{InputType::Stdin};
  std::optional<std::string> input_queue_endpoint;
  bool input_queue_bind{false};
  OutputType output_type{OutputType::Stdout};
  std::optional<std::string> output_queue_endpoint;
  bool output_queue_bind{false};
  QueueSettings queue;

  LogSettings log;

  bool xor_enabled{false};
  std::optional<std::string> xor_key;
  std::optional<uint8_t> xor_pad;

  bool base64_enabled{false};
  bool base64_encode{true};
  bool base64_padding{true};

  // Path of the config file that was applied, if one was found
  std::optional<std::string> source_file;

  // Validates a merged layer. Throws InvalidConfigurationError.
  static Config resolve(const ConfigLayer& layer);
};

// ---- LOADING ----
// Picks the config file: explicit path, then $BYTEPROC_CONFIG, then byteproc.json
std::string resolve_config_path(const std::optional<std::string>& explicit_path);
// Parses a JSON config file. Throws IoError if it cannot be read or parsed.
ConfigLayer load_config_file(const std::string& path);
// Parses JSON text into a layer. Throws IoError on malformed JSON.
ConfigLayer parse_config_json(const std::string& json_text);
// Defaults, then the file at the resolved path if it exists, then overrides
Config load_config(const std::optional<std::string>& explicit_path,
                   const ConfigLayer& overrides);

// Lenient single byte parse used for xor_pad
std::optional<uint8_t> parse_pad_byte(const std::string& text);

const char* to_string(InputType type);
const char* to_string(OutputType type);

} // namespace byteproc::config

#endif // BYTEPROC_CONFIG_CONFIG_HPP
