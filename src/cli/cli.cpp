#include "cli/cli.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <limits>
#include <type_traits>
#include <unordered_map>
#include "core/error.hpp"

namespace byteproc {
namespace cli {

namespace {

struct FlagSpec {
  bool is_bool;
  std::function<void(CommandLine&, const std::string& flag, const std::string& value)> apply;
};

template <typename T>
T parse_number(const std::string& flag, const std::string& value) {
  const bool is_signed = std::numeric_limits<T>::is_signed;
  if (value.empty() || (!is_signed && value.front() == '-')) {
    throw core::InvalidConfigurationError("invalid value '" + value + "' for " + flag);
  }

  long long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoll(value, &consumed, 10);
  } catch (const std::exception&) {
    throw core::InvalidConfigurationError("invalid value '" + value + "' for " + flag);
  }
  if (consumed != value.size() ||
      parsed < static_cast<long long>(std::numeric_limits<T>::min()) ||
      (parsed > 0 && static_cast<unsigned long long>(parsed) >
                       static_cast<unsigned long long>(std::numeric_limits<T>::max()))) {
    throw core::InvalidConfigurationError("value '" + value + "' out of range for " + flag);
  }
  return static_cast<T>(parsed);
}

// Flag handlers, keyed by flag name
const std::unordered_map<std::string, FlagSpec>& flag_map() {
  using Layer = config::ConfigLayer;

  auto text = [](std::optional<std::string> Layer::*field) {
    return FlagSpec{false, [field](CommandLine& cl, const std::string&, const std::string& v) {
      cl.overrides.*field = v;
    }};
  };
  auto flag = [](std::optional<bool> Layer::*field) {
    return FlagSpec{true, [field](CommandLine& cl, const std::string& f, const std::string& v) {
      cl.overrides.*field = parse_bool(f, v);
    }};
  };
  auto number = [](auto field) {
    return FlagSpec{false, [field](CommandLine& cl, const std::string& f, const std::string& v) {
      using Value = typename std::remove_reference_t<decltype(cl.overrides.*field)>::value_type;
      cl.overrides.*field = parse_number<Value>(f, v);
    }};
  };

  static const std::unordered_map<std::string, FlagSpec> flags = {
    {"--config", {false, [](CommandLine& cl, const std::string&, const std::string& v) {
      cl.config_path = v;
    }}},
    {"--max-stream-size-kb", number(&Layer::max_stream_size_kb)},

    {"--input-type", text(&Layer::input_type)},
    {"--input-queue-endpoint", text(&Layer::input_queue_endpoint)},
    {"--input-queue-bind", flag(&Layer::input_queue_bind)},
    {"--output-type", text(&Layer::output_type)},
    {"--output-queue-endpoint", text(&Layer::output_queue_endpoint)},
    {"--output-queue-bind", flag(&Layer::output_queue_bind)},

    {"--queue-reconnect-interval-ms", number(&Layer::queue_reconnect_interval_ms)},
    {"--queue-max-reconnect-attempts", number(&Layer::queue_max_reconnect_attempts)},
    {"--queue-send-timeout-ms", number(&Layer::queue_send_timeout_ms)},
    {"--queue-receive-timeout-ms", number(&Layer::queue_receive_timeout_ms)},
    {"--queue-linger-ms", number(&Layer::queue_linger_ms)},

    {"--log-enabled", flag(&Layer::log_enabled)},
    {"--log-level", text(&Layer::log_level)},
    {"--log-file", text(&Layer::log_file)},
    {"--log-append", flag(&Layer::log_append)},
    {"--log-max-file-size-mb", number(&Layer::log_max_file_size_mb)},
    {"--log-rotation-count", number(&Layer::log_rotation_count)},

    {"--xor-enabled", flag(&Layer::xor_enabled)},
    {"--xor-key", text(&Layer::xor_key)},
    {"--xor-pad", text(&Layer::xor_pad)},

    {"--base64-enabled", flag(&Layer::base64_enabled)},
    {"--base64-mode", text(&Layer::base64_mode)},
    {"--base64-padding", flag(&Layer::base64_padding)},
  };
  return flags;
}

bool looks_like_bool(const std::string& value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered == "true" || lowered == "false" || lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

} // namespace

//==============================================
// PARSING
//==============================================

bool parse_bool(const std::string& flag, const std::string& value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    return false;
  }
  throw core::InvalidConfigurationError("invalid boolean '" + value + "' for " + flag);
}

CommandLine parse_arguments(const std::vector<std::string>& args) {
  CommandLine result;
  const auto& flags = flag_map();

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string name = args[i];
    std::optional<std::string> value;

    if (name == "-h" || name == "--help") {
      result.show_help = true;
      continue;
    }

    const std::size_t eq = name.find('=');
    if (name.rfind("--", 0) == 0 && eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }

    auto it = flags.find(name);
    if (it == flags.end()) {
      throw core::InvalidConfigurationError("unknown argument: " + args[i]);
    }
    const FlagSpec& spec = it->second;

    if (!value) {
      if (spec.is_bool) {
        // Bare boolean flag means true
        if (i + 1 < args.size() && looks_like_bool(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if (i + 1 >= args.size()) {
          throw core::InvalidConfigurationError("missing value for " + name);
        }
        value = args[++i];
      }
    }

    spec.apply(result, name, *value);
  }

  return result;
}

CommandLine parse_command_line(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_arguments(args);
}


//==============================================
// USAGE
//==============================================

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [--config <path>] [options]\n"
      << "Reads one hex-encoded message, runs it through the module chain and\n"
      << "writes the hex-encoded result.\n"
      << "\n"
      << "Configuration:\n"
      << "  --config <path>                    JSON config file (default: $"
      << config::CONFIG_ENV_VAR << ", then " << config::DEFAULT_CONFIG_FILE << ")\n"
      << "  --max-stream-size-kb <n>           Size limit for decoded and processed data\n"
      << "\n"
      << "Transport:\n"
      << "  --input-type stdin|queue_pull\n"
      << "  --input-queue-endpoint tcp://host:port\n"
      << "  --input-queue-bind [bool]\n"
      << "  --output-type stdout|queue_push\n"
      << "  --output-queue-endpoint tcp://host:port\n"
      << "  --output-queue-bind [bool]\n"
      << "  --queue-reconnect-interval-ms <n>  --queue-max-reconnect-attempts <n>\n"
      << "  --queue-send-timeout-ms <n>        --queue-receive-timeout-ms <n>\n"
      << "  --queue-linger-ms <n>\n"
      << "\n"
      << "Logging:\n"
      << "  --log-enabled [bool]  --log-level <level>  --log-file <path>\n"
      << "  --log-append [bool]   --log-max-file-size-mb <n>  --log-rotation-count <n>\n"
      << "\n"
      << "Modules (run in this order after passthrough):\n"
      << "  --xor-enabled [bool]  --xor-key <hex>  --xor-pad <hex byte>\n"
      << "  --base64-enabled [bool]  --base64-mode encode|decode  --base64-padding [bool]\n"
      << "\n"
      << "Example: echo deadbeef | " << program_name << " --xor-enabled --xor-key ff\n";
}

} // namespace cli
} // namespace byteproc
