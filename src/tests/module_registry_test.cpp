#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "processor/module_registry.hpp"
#include "core/error.hpp"
#include "test_utils.hpp"

using namespace byteproc;
using byteproc::processor::ByteProcessor;
using byteproc::processor::ModuleRegistry;
using byteproc::test::bytes_of;
using byteproc::test::string_of;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockProcessor : public ByteProcessor {
public:
  MOCK_METHOD(std::string, name, (), (const, override));
  MOCK_METHOD(core::Bytes, process, (const core::Bytes& input), (const, override));
};

} // namespace

class ModuleRegistryTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::quiet_logging();
  }

  static config::Config make_config(const config::ConfigLayer& layer) {
    return config::Config::resolve(layer);
  }
};

TEST_F(ModuleRegistryTest, PassthroughOnlyByDefault) {
  ModuleRegistry registry(make_config({}));
  EXPECT_EQ(registry.module_names(), (std::vector<std::string>{"passthrough"}));
  EXPECT_EQ(registry.process_all({1, 2, 3}), (core::Bytes{1, 2, 3}));
}

TEST_F(ModuleRegistryTest, ChainOrderIsPassthroughXorBase64) {
  config::ConfigLayer layer;
  layer.xor_enabled = true;
  layer.xor_key = "ff";
  layer.base64_enabled = true;

  ModuleRegistry registry(make_config(layer));
  EXPECT_EQ(registry.module_names(),
            (std::vector<std::string>{"passthrough", "xor", "base64"}));
  EXPECT_EQ(registry.size(), 3u);
}

TEST_F(ModuleRegistryTest, XorThroughConfig) {
  config::ConfigLayer layer;
  layer.xor_enabled = true;
  layer.xor_key = "abcd1234";

  ModuleRegistry registry(make_config(layer));
  EXPECT_EQ(registry.process_all({0x00, 0x11, 0x22, 0x33}),
            (core::Bytes{0xab, 0xdc, 0x30, 0x07}));
}

TEST_F(ModuleRegistryTest, XorThenUnpaddedBase64) {
  config::ConfigLayer layer;
  layer.xor_enabled = true;
  layer.xor_key = "ff";
  layer.base64_enabled = true;
  layer.base64_mode = "encode";
  layer.base64_padding = false;

  ModuleRegistry registry(make_config(layer));
  EXPECT_EQ(string_of(registry.process_all({0xff})), "AA");
}

TEST_F(ModuleRegistryTest, Base64DecodeOnly) {
  config::ConfigLayer layer;
  layer.base64_enabled = true;
  layer.base64_mode = "decode";

  ModuleRegistry registry(make_config(layer));
  EXPECT_EQ(string_of(registry.process_all(bytes_of("aGVsbG8gd29ybGQ="))), "hello world");
  EXPECT_THROW(registry.process_all(bytes_of("not base64")), core::ModuleError);
}

TEST_F(ModuleRegistryTest, EmptyXorKeyFailsConstruction) {
  config::ConfigLayer layer;
  layer.xor_enabled = true;
  layer.xor_key = "";
  layer.base64_enabled = true;

  EXPECT_THROW(ModuleRegistry registry(make_config(layer)), core::InvalidConfigurationError);
}

TEST_F(ModuleRegistryTest, InvalidHexKeyFailsConstruction) {
  config::ConfigLayer layer;
  layer.xor_enabled = true;
  layer.xor_key = "nothex";

  EXPECT_THROW(ModuleRegistry registry(make_config(layer)), core::HexDecodeError);
}

TEST_F(ModuleRegistryTest, IdenticalConfigsProduceIdenticalChains) {
  config::ConfigLayer layer;
  layer.xor_enabled = true;
  layer.xor_key = "0a0b0c";
  layer.base64_enabled = true;

  const core::Bytes input = bytes_of("determinism check payload");
  ModuleRegistry first(make_config(layer));
  for (int run = 0; run < 10; ++run) {
    ModuleRegistry again(make_config(layer));
    EXPECT_EQ(again.module_names(), first.module_names());
    EXPECT_EQ(again.process_all(input), first.process_all(input));
  }
}

TEST_F(ModuleRegistryTest, RunsModulesInInsertionOrder) {
  auto first = std::make_unique<MockProcessor>();
  auto second = std::make_unique<MockProcessor>();
  ON_CALL(*first, name()).WillByDefault(Return("first"));
  ON_CALL(*second, name()).WillByDefault(Return("second"));
  EXPECT_CALL(*first, name()).Times(::testing::AnyNumber());
  EXPECT_CALL(*second, name()).Times(::testing::AnyNumber());
  {
    InSequence order;
    EXPECT_CALL(*first, process(core::Bytes{1})).WillOnce(Return(core::Bytes{2}));
    EXPECT_CALL(*second, process(core::Bytes{2})).WillOnce(Return(core::Bytes{3}));
  }

  std::vector<std::unique_ptr<ByteProcessor>> chain;
  chain.push_back(std::move(first));
  chain.push_back(std::move(second));
  ModuleRegistry registry(std::move(chain));

  EXPECT_EQ(registry.process_all({1}), (core::Bytes{3}));
}

TEST_F(ModuleRegistryTest, FirstFailureStopsTheChain) {
  auto failing = std::make_unique<MockProcessor>();
  auto never_run = std::make_unique<MockProcessor>();
  ON_CALL(*failing, name()).WillByDefault(Return("failing"));
  ON_CALL(*never_run, name()).WillByDefault(Return("never_run"));
  EXPECT_CALL(*failing, name()).Times(::testing::AnyNumber());
  EXPECT_CALL(*never_run, name()).Times(::testing::AnyNumber());
  EXPECT_CALL(*failing, process(_)).WillOnce(Throw(core::ModuleError("boom")));
  EXPECT_CALL(*never_run, process(_)).Times(0);

  std::vector<std::unique_ptr<ByteProcessor>> chain;
  chain.push_back(std::move(failing));
  chain.push_back(std::move(never_run));
  ModuleRegistry registry(std::move(chain));

  EXPECT_THROW(registry.process_all({1, 2}), core::ModuleError);
}

TEST_F(ModuleRegistryTest, RejectsNullModule) {
  std::vector<std::unique_ptr<ByteProcessor>> chain;
  chain.push_back(nullptr);
  EXPECT_THROW(ModuleRegistry registry(std::move(chain)), core::InvalidConfigurationError);
}
