#include "processor/passthrough.hpp"
#include <boost/log/trivial.hpp>

namespace byteproc::processor {

core::Bytes Passthrough::process(const core::Bytes& input) const {
  BOOST_LOG_TRIVIAL(trace) << "Passthrough: Copying " << input.size() << " bytes";
  return input;
}

} // namespace byteproc::processor
