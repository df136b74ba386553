#pragma once

#include <istream>
#include <memory>
#include <ostream>
#include "config/config.hpp"
#include "transport/message_source.hpp"

namespace byteproc {
namespace transport {

// Extra frame bytes allowed beyond the hex text for surrounding whitespace
constexpr std::size_t FRAME_SLACK = 64;

// Largest frame the pull side accepts for a given decoded size limit
std::size_t max_frame_size(std::size_t max_stream_size);

// Builds the source named by input_type; stdin reads from `input`
std::unique_ptr<MessageSource> make_source(const config::Config& config, std::istream& input);
// Builds the sink named by output_type; stdout writes to `output`
std::unique_ptr<MessageSink> make_sink(const config::Config& config, std::ostream& output);

} // namespace transport
} // namespace byteproc
