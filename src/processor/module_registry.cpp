#include "processor/module_registry.hpp"
#include <boost/log/trivial.hpp>
#include "processor/passthrough.hpp"
#include "processor/xor_module.hpp"
#include "processor/base64_module.hpp"

namespace byteproc::processor {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ModuleRegistry::ModuleRegistry(const config::Config& config) {
  BOOST_LOG_TRIVIAL(debug) << "Module registry: Building module chain";

  modules_.push_back(std::make_unique<Passthrough>());

  if (config.xor_enabled) {
    if (!config.xor_key) {
      throw core::InvalidConfigurationError("xor_key must be set if xor_enabled");
    }
    modules_.push_back(std::make_unique<XorModule>(*config.xor_key, config.xor_pad));
  }

  if (config.base64_enabled) {
    modules_.push_back(std::make_unique<Base64Module>(config.base64_encode, config.base64_padding));
  }

  BOOST_LOG_TRIVIAL(info) << "Module registry: Chain built with " << modules_.size() << " modules";
}

ModuleRegistry::ModuleRegistry(std::vector<std::unique_ptr<ByteProcessor>> modules)
  : modules_(std::move(modules)) {
  for (const auto& module : modules_) {
    if (!module) {
      throw core::InvalidConfigurationError("module chain contains an empty entry");
    }
  }
}


//==============================================
// PROCESSING
//==============================================

core::Bytes ModuleRegistry::process_all(core::Bytes data) const {
  const std::size_t total = modules_.size();
  std::size_t position = 0;

  for (const auto& module : modules_) {
    ++position;
    BOOST_LOG_TRIVIAL(info) << "Module registry: Running module " << module->name()
                            << " [" << position << "/" << total << "] on "
                            << data.size() << " bytes";
    try {
      data = module->process(data);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Module registry: Module " << module->name()
                               << " failed: " << e.what();
      throw;
    }
  }

  return data;
}


//==============================================
// GETTERS
//==============================================

std::vector<std::string> ModuleRegistry::module_names() const {
  std::vector<std::string> names;
  names.reserve(modules_.size());
  for (const auto& module : modules_) {
    names.push_back(module->name());
  }
  return names;
}

} // namespace byteproc::processor
