#ifndef BYTEPROC_PROCESSOR_SIZE_GUARD_HPP
#define BYTEPROC_PROCESSOR_SIZE_GUARD_HPP

#include <cstddef>
#include "core/types.hpp"

namespace byteproc::processor {

// Bounds buffer size around the module chain
class SizeGuard {
public:
  enum class Stage {
    Input,
    Output
  };

  explicit SizeGuard(std::size_t limit) : limit_(limit) {}

  // Throws MaxSizeExceededError(limit, size) when the buffer is larger than the limit
  void check(const core::Bytes& buffer, Stage stage) const;

  std::size_t limit() const { return limit_; }

private:
  std::size_t limit_;
};

const char* to_string(SizeGuard::Stage stage);

} // namespace byteproc::processor

#endif // BYTEPROC_PROCESSOR_SIZE_GUARD_HPP
