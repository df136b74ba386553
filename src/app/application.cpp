#include "app/application.hpp"
#include <iomanip>
#include <random>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "core/error.hpp"
#include "transport/transport_factory.hpp"
#include "utils/hex.hpp"

namespace byteproc {
namespace app {

std::string generate_instance_id() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<uint32_t> dis;
  std::ostringstream id;
  id << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
  return id.str();
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Application::Application(const config::Config& config, const std::string& instance_id,
                         std::istream& input, std::ostream& output)
  : instance_id_(instance_id)
  , registry_(config)
  , size_guard_(config.max_stream_size) {
  source_ = transport::make_source(config, input);
  sink_ = transport::make_sink(config, output);
  BOOST_LOG_TRIVIAL(info) << "Application: Ready (" << source_->describe() << " -> "
                          << sink_->describe() << ", limit " << size_guard_.limit() << " bytes)";
}

Application::Application(const config::Config& config, const std::string& instance_id,
                         std::unique_ptr<transport::MessageSource> source,
                         std::unique_ptr<transport::MessageSink> sink)
  : instance_id_(instance_id)
  , registry_(config)
  , size_guard_(config.max_stream_size)
  , source_(std::move(source))
  , sink_(std::move(sink)) {
  if (!source_ || !sink_) {
    throw core::InvalidConfigurationError("application requires a source and a sink");
  }
}


//==============================================
// EXECUTION
//==============================================

void Application::run() {
  BOOST_LOG_TRIVIAL(info) << "Application: Waiting for input from " << source_->describe();
  const std::string raw = source_->receive();
  BOOST_LOG_TRIVIAL(info) << "Application: Received hex input (len=" << raw.size() << " chars)";

  const std::string result = process(raw);

  sink_->send(result);
  BOOST_LOG_TRIVIAL(info) << "Application: Delivered " << result.size() << " hex chars to "
                          << sink_->describe();
}

std::string Application::process(const std::string& hex_input) const {
  core::Bytes data = utils::hex_decode(utils::trim(hex_input));
  size_guard_.check(data, processor::SizeGuard::Stage::Input);

  core::Bytes processed = registry_.process_all(std::move(data));
  size_guard_.check(processed, processor::SizeGuard::Stage::Output);

  return utils::hex_encode(processed);
}

} // namespace app
} // namespace byteproc
