#ifndef BYTEPROC_PROCESSOR_MODULE_REGISTRY_HPP
#define BYTEPROC_PROCESSOR_MODULE_REGISTRY_HPP

#include <memory>
#include <string>
#include <vector>
#include "processor/byte_processor.hpp"
#include "config/config.hpp"

namespace byteproc::processor {

/**
 * Ordered chain of enabled modules, built once from configuration.
 * Passthrough always runs first, then Xor and Base64 when enabled, in that
 * order. The order is fixed at construction and never re-evaluated.
 */
class ModuleRegistry {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws the module's construction error; no partial chain is kept
  explicit ModuleRegistry(const config::Config& config);
  // Builds a registry from an explicit chain
  explicit ModuleRegistry(std::vector<std::unique_ptr<ByteProcessor>> modules);

  ModuleRegistry(const ModuleRegistry&) = delete;
  ModuleRegistry& operator=(const ModuleRegistry&) = delete;
  ModuleRegistry(ModuleRegistry&&) = default;
  ModuleRegistry& operator=(ModuleRegistry&&) = default;


  // ---- PROCESSING ----
  // Folds data through every module in chain order. The first error thrown
  // by a module stops the chain and propagates unchanged.
  core::Bytes process_all(core::Bytes data) const;


  // ---- GETTERS ----
  std::vector<std::string> module_names() const;
  std::size_t size() const { return modules_.size(); }

private:
  // ---- PARAMETERS ----
  std::vector<std::unique_ptr<ByteProcessor>> modules_;
};

} // namespace byteproc::processor

#endif // BYTEPROC_PROCESSOR_MODULE_REGISTRY_HPP
