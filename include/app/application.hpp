#pragma once

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include "config/config.hpp"
#include "processor/module_registry.hpp"
#include "processor/size_guard.hpp"
#include "transport/message_source.hpp"

namespace byteproc {
namespace app {

// Random 8 hex digit tag used to correlate log records of one run
std::string generate_instance_id();

/**
 * One invocation: receive hex text, decode, bound, run the module chain,
 * bound again, encode, deliver. The module chain is built in the
 * constructor so configuration errors surface before any transport I/O.
 */
class Application {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens the transports named by the configuration
  Application(const config::Config& config, const std::string& instance_id,
              std::istream& input, std::ostream& output);
  Application(const config::Config& config, const std::string& instance_id,
              std::unique_ptr<transport::MessageSource> source,
              std::unique_ptr<transport::MessageSink> sink);


  // ---- EXECUTION ----
  // Processes exactly one message. Throws ByteProcError on any failure, in
  // which case nothing is sent.
  void run();
  // Hex in, hex out, without touching the transports
  std::string process(const std::string& hex_input) const;


  // ---- GETTERS ----
  const processor::ModuleRegistry& registry() const { return registry_; }
  const std::string& instance_id() const { return instance_id_; }

private:
  // ---- PARAMETERS ----
  std::string instance_id_;
  processor::ModuleRegistry registry_;
  processor::SizeGuard size_guard_;
  std::unique_ptr<transport::MessageSource> source_;
  std::unique_ptr<transport::MessageSink> sink_;
};

} // namespace app
} // namespace byteproc
