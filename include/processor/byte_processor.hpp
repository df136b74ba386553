#ifndef BYTEPROC_PROCESSOR_BYTE_PROCESSOR_HPP
#define BYTEPROC_PROCESSOR_BYTE_PROCESSOR_HPP

#include <string>
#include "core/types.hpp"
#include "core/error.hpp"

namespace byteproc::processor {

/**
 * A named unit that deterministically transforms one byte buffer into another.
 * process() depends only on its input and the parameters fixed at construction.
 * It accepts every input, including an empty one, and throws a ByteProcError
 * only when the input is malformed for the module's format.
 */
class ByteProcessor {
public:
  virtual ~ByteProcessor() = default;

  // Stable identifier used for ordering and logging
  virtual std::string name() const = 0;

  virtual core::Bytes process(const core::Bytes& input) const = 0;
};

} // namespace byteproc::processor

#endif // BYTEPROC_PROCESSOR_BYTE_PROCESSOR_HPP
