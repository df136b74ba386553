#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "config/config.hpp"

namespace byteproc {
namespace cli {

// Parsed command line: where to find the config file and what to override
struct CommandLine {
  std::optional<std::string> config_path;
  config::ConfigLayer overrides;
  bool show_help{false};
};

// ---- PARSING ----
// Arguments exclude the program name. Accepts --flag value and --flag=value;
// boolean flags may omit their value. Throws InvalidConfigurationError.
CommandLine parse_arguments(const std::vector<std::string>& args);
CommandLine parse_command_line(int argc, char* argv[]);

// Parses true|false|1|0|yes|no (any case). Throws InvalidConfigurationError.
bool parse_bool(const std::string& flag, const std::string& value);


// ---- USAGE ----
void print_usage(std::ostream& out, const std::string& program_name);

} // namespace cli
} // namespace byteproc
