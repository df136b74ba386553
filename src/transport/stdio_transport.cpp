#include "transport/stdio_transport.hpp"
#include <iterator>
#include <boost/log/trivial.hpp>
#include "core/error.hpp"

namespace byteproc {
namespace transport {

std::string StreamSource::receive() {
  BOOST_LOG_TRIVIAL(debug) << "Stream source: Reading input stream";

  std::string content{std::istreambuf_iterator<char>(input_), std::istreambuf_iterator<char>()};
  if (input_.bad()) {
    throw core::IoError("Failed to read from input stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Stream source: Read " << content.size() << " characters";
  return content;
}

void StreamSink::send(const std::string& message) {
  output_ << message << '\n';
  output_.flush();
  if (!output_.good()) {
    throw core::IoError("Failed to write to output stream");
  }
  BOOST_LOG_TRIVIAL(debug) << "Stream sink: Wrote " << message.size() << " characters";
}

} // namespace transport
} // namespace byteproc
