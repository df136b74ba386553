#pragma once

#include <istream>
#include <ostream>
#include "transport/message_source.hpp"

namespace byteproc {
namespace transport {

// Reads the whole input stream as one message
class StreamSource : public MessageSource {
public:
  explicit StreamSource(std::istream& input) : input_(input) {}

  std::string receive() override;
  const char* describe() const override { return "stdin"; }

private:
  std::istream& input_;
};

// Writes the message followed by a newline
class StreamSink : public MessageSink {
public:
  explicit StreamSink(std::ostream& output) : output_(output) {}

  void send(const std::string& message) override;
  const char* describe() const override { return "stdout"; }

private:
  std::ostream& output_;
};

} // namespace transport
} // namespace byteproc
