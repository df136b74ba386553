#include "transport/transport_factory.hpp"
#include <limits>
#include "core/error.hpp"
#include "transport/queue_socket.hpp"
#include "transport/stdio_transport.hpp"

namespace byteproc {
namespace transport {

std::size_t max_frame_size(std::size_t max_stream_size) {
  constexpr std::size_t limit = std::numeric_limits<std::size_t>::max();
  if (max_stream_size > (limit - FRAME_SLACK) / 2) {
    return limit;
  }
  return max_stream_size * 2 + FRAME_SLACK;
}

std::unique_ptr<MessageSource> make_source(const config::Config& config, std::istream& input) {
  switch (config.input_type) {
    case config::InputType::Stdin:
      return std::make_unique<StreamSource>(input);
    case config::InputType::QueuePull:
      if (!config.input_queue_endpoint) {
        throw core::InvalidConfigurationError("input_queue_endpoint must be set for queue_pull");
      }
      return std::make_unique<QueuePullSource>(*config.input_queue_endpoint,
                                               config.input_queue_bind, config.queue,
                                               max_frame_size(config.max_stream_size));
  }
  throw core::InvalidConfigurationError("unsupported input type");
}

std::unique_ptr<MessageSink> make_sink(const config::Config& config, std::ostream& output) {
  switch (config.output_type) {
    case config::OutputType::Stdout:
      return std::make_unique<StreamSink>(output);
    case config::OutputType::QueuePush:
      if (!config.output_queue_endpoint) {
        throw core::InvalidConfigurationError("output_queue_endpoint must be set for queue_push");
      }
      return std::make_unique<QueuePushSink>(*config.output_queue_endpoint,
                                             config.output_queue_bind, config.queue);
  }
  throw core::InvalidConfigurationError("unsupported output type");
}

} // namespace transport
} // namespace byteproc
