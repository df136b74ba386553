#include <gtest/gtest.h>
#include <sstream>
#include "transport/stdio_transport.hpp"
#include "core/error.hpp"
#include "test_utils.hpp"

using namespace byteproc;
using namespace byteproc::transport;

class StdioTransportTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::quiet_logging();
  }
};

TEST_F(StdioTransportTest, SourceReadsWholeStream) {
  std::istringstream input("dead\nbeef\n");
  StreamSource source(input);
  EXPECT_EQ(source.receive(), "dead\nbeef\n");
  EXPECT_STREQ(source.describe(), "stdin");
}

TEST_F(StdioTransportTest, SourceReadsEmptyStream) {
  std::istringstream input("");
  StreamSource source(input);
  EXPECT_EQ(source.receive(), "");
}

TEST_F(StdioTransportTest, SinkAppendsNewline) {
  std::ostringstream output;
  StreamSink sink(output);
  sink.send("abcd");
  EXPECT_EQ(output.str(), "abcd\n");
  EXPECT_STREQ(sink.describe(), "stdout");
}

TEST_F(StdioTransportTest, SinkReportsWriteFailure) {
  std::ostringstream output;
  output.setstate(std::ios::badbit);
  StreamSink sink(output);
  EXPECT_THROW(sink.send("abcd"), core::IoError);
}
