#ifndef BYTEPROC_PROCESSOR_PASSTHROUGH_HPP
#define BYTEPROC_PROCESSOR_PASSTHROUGH_HPP

#include "processor/byte_processor.hpp"

namespace byteproc::processor {

class Passthrough : public ByteProcessor {
public:
  static constexpr const char* NAME = "passthrough";

  std::string name() const override { return NAME; }
  core::Bytes process(const core::Bytes& input) const override;
};

} // namespace byteproc::processor

#endif // BYTEPROC_PROCESSOR_PASSTHROUGH_HPP
