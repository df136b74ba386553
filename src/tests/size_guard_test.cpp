#include <gtest/gtest.h>
#include "processor/size_guard.hpp"
#include "core/error.hpp"

using namespace byteproc;
using byteproc::processor::SizeGuard;

TEST(SizeGuardTest, AcceptsBuffersUpToTheLimit) {
  SizeGuard guard(4);
  EXPECT_NO_THROW(guard.check(core::Bytes(0), SizeGuard::Stage::Input));
  EXPECT_NO_THROW(guard.check(core::Bytes(4), SizeGuard::Stage::Input));
  EXPECT_NO_THROW(guard.check(core::Bytes(4), SizeGuard::Stage::Output));
}

TEST(SizeGuardTest, RejectsLargerBuffersWithLimitAndSize) {
  SizeGuard guard(4);
  try {
    guard.check(core::Bytes(5), SizeGuard::Stage::Output);
    FAIL() << "Expected MaxSizeExceededError";
  } catch (const core::MaxSizeExceededError& e) {
    EXPECT_EQ(e.limit(), 4u);
    EXPECT_EQ(e.actual(), 5u);
    EXPECT_STREQ(e.what(), "Stream too large: max 4 bytes, got 5");
  }
}

TEST(SizeGuardTest, StageNames) {
  EXPECT_STREQ(processor::to_string(SizeGuard::Stage::Input), "input");
  EXPECT_STREQ(processor::to_string(SizeGuard::Stage::Output), "output");
}
