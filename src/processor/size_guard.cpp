#include "processor/size_guard.hpp"
#include <boost/log/trivial.hpp>
#include "core/error.hpp"

namespace byteproc::processor {

void SizeGuard::check(const core::Bytes& buffer, Stage stage) const {
  if (buffer.size() > limit_) {
    BOOST_LOG_TRIVIAL(error) << "Size guard: " << to_string(stage) << " of " << buffer.size()
                             << " bytes exceeds limit of " << limit_ << " bytes";
    throw core::MaxSizeExceededError(limit_, buffer.size());
  }
  BOOST_LOG_TRIVIAL(debug) << "Size guard: " << to_string(stage) << " size " << buffer.size()
                           << "/" << limit_ << " bytes";
}

const char* to_string(SizeGuard::Stage stage) {
  switch (stage) {
    case SizeGuard::Stage::Input:  return "input";
    case SizeGuard::Stage::Output: return "output";
    default:                       return "unknown";
  }
}

} // namespace byteproc::processor
