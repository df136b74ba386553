#include <iostream>
#include <string>
#include <boost/log/trivial.hpp>
#include "app/application.hpp"
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "core/error.hpp"
#include "logger/logger.hpp"

namespace {

int run(int argc, char* argv[]) {
  // Nothing is logged until the configured sink is installed
  byteproc::logging::disable_logging();

  const std::string program_name = argc > 0 ? argv[0] : "byteproc";
  const auto command_line = byteproc::cli::parse_command_line(argc, argv);
  if (command_line.show_help) {
    byteproc::cli::print_usage(std::cout, program_name);
    return 0;
  }

  const auto config = byteproc::config::load_config(command_line.config_path,
                                                    command_line.overrides);

  const std::string instance_id = byteproc::app::generate_instance_id();
  byteproc::logging::init_logging(config.log, instance_id);

  if (config.source_file) {
    BOOST_LOG_TRIVIAL(info) << "Main: Loaded config " << *config.source_file
                            << " (schema " << config.schema_version << ")";
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Main: No config file found, using defaults and arguments";
  }

  byteproc::app::Application application(config, instance_id, std::cin, std::cout);
  application.run();

  BOOST_LOG_TRIVIAL(info) << "Main: Done";
  byteproc::logging::shutdown_logging();
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  try {
    return run(argc, argv);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Main: " << e.what();
    byteproc::logging::shutdown_logging();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
