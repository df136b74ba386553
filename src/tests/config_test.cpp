#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "config/config.hpp"
#include "core/error.hpp"
#include "test_utils.hpp"

using namespace byteproc;
using namespace byteproc::config;

class ConfigTest : public ::testing::Test {
protected:
  std::filesystem::path dir_;

  void SetUp() override {
    dir_ = test::make_temp_dir("byteproc_config");
    unsetenv(CONFIG_ENV_VAR);
  }

  void TearDown() override {
    unsetenv(CONFIG_ENV_VAR);
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string write_file(const std::string& name, const std::string& content) {
    auto path = dir_ / name;
    std::ofstream out(path);
    out << content;
    return path.string();
  }
};

TEST_F(ConfigTest, DefaultsResolve) {
  Config cfg = Config::resolve(ConfigLayer::defaults());

  EXPECT_EQ(cfg.schema_version, "1.0");
  EXPECT_EQ(cfg.max_stream_size, 64u * 1024u);
  EXPECT_EQ(cfg.input_type, InputType::Stdin);
  EXPECT_EQ(cfg.output_type, OutputType::Stdout);
  EXPECT_TRUE(cfg.log.enabled);
  EXPECT_EQ(cfg.log.level, "info");
  EXPECT_EQ(cfg.log.file, "byteproc.log");
  EXPECT_FALSE(cfg.xor_enabled);
  EXPECT_FALSE(cfg.xor_key.has_value());
  EXPECT_EQ(cfg.xor_pad, std::optional<uint8_t>(0));
  EXPECT_FALSE(cfg.base64_enabled);
  EXPECT_TRUE(cfg.base64_encode);
  EXPECT_TRUE(cfg.base64_padding);
  EXPECT_EQ(cfg.queue.max_reconnect_attempts, 5u);
  EXPECT_EQ(cfg.queue.receive_timeout_ms, 5000);
}

TEST_F(ConfigTest, ParsesJson) {
  ConfigLayer layer = parse_config_json(R"({
    "schema_version": "1.1",
    "max_stream_size_kb": 128,
    "input_type": "queue_pull",
    "input_queue_endpoint": "tcp://127.0.0.1:5555",
    "input_queue_bind": true,
    "log_level": "debug",
    "log_rotation_count": 3,
    "xor_enabled": true,
    "xor_key": "abcd1234",
    "base64_enabled": true,
    "base64_mode": "decode",
    "base64_padding": false
  })");

  Config cfg = Config::resolve(layer);
  EXPECT_EQ(cfg.schema_version, "1.1");
  EXPECT_EQ(cfg.max_stream_size, 128u * 1024u);
  EXPECT_EQ(cfg.input_type, InputType::QueuePull);
  EXPECT_EQ(cfg.input_queue_endpoint, std::optional<std::string>("tcp://127.0.0.1:5555"));
  EXPECT_TRUE(cfg.input_queue_bind);
  EXPECT_EQ(cfg.log.level, "debug");
  EXPECT_EQ(cfg.log.rotation_count, 3u);
  EXPECT_TRUE(cfg.xor_enabled);
  EXPECT_EQ(cfg.xor_key, std::optional<std::string>("abcd1234"));
  EXPECT_TRUE(cfg.base64_enabled);
  EXPECT_FALSE(cfg.base64_encode);
  EXPECT_FALSE(cfg.base64_padding);
}

TEST_F(ConfigTest, MissingKeysStayUnset) {
  ConfigLayer layer = parse_config_json(R"({"xor_key": "ff"})");
  EXPECT_EQ(layer.xor_key, std::optional<std::string>("ff"));
  EXPECT_FALSE(layer.xor_enabled.has_value());
  EXPECT_FALSE(layer.max_stream_size_kb.has_value());
  EXPECT_FALSE(layer.log_level.has_value());
}

TEST_F(ConfigTest, MalformedJsonIsIoError) {
  EXPECT_THROW(parse_config_json("{ not json"), core::IoError);
  EXPECT_THROW(parse_config_json(R"({"max_stream_size_kb": "lots"})"), core::IoError);
  EXPECT_THROW(parse_config_json(R"({"max_stream_size_kb": -1})"), core::IoError);
  EXPECT_THROW(parse_config_json(R"({"xor_enabled": "maybe"})"), core::IoError);
  EXPECT_THROW(parse_config_json(R"({"xor_key": {"nested": "ff"}})"), core::IoError);
}

TEST_F(ConfigTest, JsonNullLeavesKeyUnset) {
  ConfigLayer layer = parse_config_json(R"({"max_stream_size_kb": null, "xor_key": null})");
  EXPECT_FALSE(layer.max_stream_size_kb.has_value());
  EXPECT_FALSE(layer.xor_key.has_value());

  Config cfg = Config::resolve(layer);
  EXPECT_EQ(cfg.max_stream_size, 64u * 1024u);
  EXPECT_FALSE(cfg.xor_key.has_value());
}

TEST_F(ConfigTest, NullKeyWithXorEnabledIsMissingKey) {
  ConfigLayer layer = parse_config_json(R"({"xor_enabled": true, "xor_key": null})");
  try {
    Config::resolve(layer);
    FAIL() << "Expected InvalidConfigurationError";
  } catch (const core::InvalidConfigurationError& e) {
    EXPECT_NE(std::string(e.what()).find("xor_key must be set"), std::string::npos);
  }
}

TEST_F(ConfigTest, LaterLayersWin) {
  ConfigLayer base = ConfigLayer::defaults();
  ConfigLayer file_layer;
  file_layer.xor_key = "aa";
  file_layer.log_level = "debug";
  ConfigLayer cli_layer;
  cli_layer.xor_key = "bb";

  base.merge_from(file_layer);
  base.merge_from(cli_layer);

  EXPECT_EQ(base.xor_key, std::optional<std::string>("bb"));
  EXPECT_EQ(base.log_level, std::optional<std::string>("debug"));
  EXPECT_EQ(base.log_file, std::optional<std::string>("byteproc.log"));
}

TEST_F(ConfigTest, RejectsInvalidValues) {
  ConfigLayer zero_size;
  zero_size.max_stream_size_kb = 0;
  EXPECT_THROW(Config::resolve(zero_size), core::InvalidConfigurationError);

  ConfigLayer at_cap;
  at_cap.max_stream_size_kb = MAX_STREAM_SIZE_KB;
  EXPECT_EQ(Config::resolve(at_cap).max_stream_size, MAX_STREAM_SIZE_KB * 1024);

  ConfigLayer over_cap;
  over_cap.max_stream_size_kb = MAX_STREAM_SIZE_KB + 1;
  EXPECT_THROW(Config::resolve(over_cap), core::InvalidConfigurationError);

  ConfigLayer bad_input;
  bad_input.input_type = "carrier_pigeon";
  EXPECT_THROW(Config::resolve(bad_input), core::InvalidConfigurationError);

  ConfigLayer bad_output;
  bad_output.output_type = "file";
  EXPECT_THROW(Config::resolve(bad_output), core::InvalidConfigurationError);

  ConfigLayer bad_mode;
  bad_mode.base64_mode = "both";
  EXPECT_THROW(Config::resolve(bad_mode), core::InvalidConfigurationError);

  ConfigLayer xor_without_key;
  xor_without_key.xor_enabled = true;
  EXPECT_THROW(Config::resolve(xor_without_key), core::InvalidConfigurationError);

  ConfigLayer pull_without_endpoint;
  pull_without_endpoint.input_type = "queue_pull";
  EXPECT_THROW(Config::resolve(pull_without_endpoint), core::InvalidConfigurationError);

  ConfigLayer push_without_endpoint;
  push_without_endpoint.output_type = "queue_push";
  EXPECT_THROW(Config::resolve(push_without_endpoint), core::InvalidConfigurationError);
}

TEST_F(ConfigTest, PadByteIsLenient) {
  EXPECT_EQ(parse_pad_byte("00"), std::optional<uint8_t>(0x00));
  EXPECT_EQ(parse_pad_byte("ff"), std::optional<uint8_t>(0xff));
  EXPECT_EQ(parse_pad_byte("A"), std::optional<uint8_t>(0x0a));
  EXPECT_FALSE(parse_pad_byte("").has_value());
  EXPECT_FALSE(parse_pad_byte("zz").has_value());
  EXPECT_FALSE(parse_pad_byte("100").has_value());

  ConfigLayer layer;
  layer.xor_pad = "junk";
  EXPECT_NO_THROW(Config::resolve(layer));
  EXPECT_FALSE(Config::resolve(layer).xor_pad.has_value());
}

TEST_F(ConfigTest, ConfigPathPrecedence) {
  EXPECT_EQ(resolve_config_path(std::string("explicit.json")), "explicit.json");
  EXPECT_EQ(resolve_config_path(std::nullopt), DEFAULT_CONFIG_FILE);

  setenv(CONFIG_ENV_VAR, "from_env.json", 1);
  EXPECT_EQ(resolve_config_path(std::nullopt), "from_env.json");
  EXPECT_EQ(resolve_config_path(std::string("explicit.json")), "explicit.json");
}

TEST_F(ConfigTest, LoadsFileThenOverrides) {
  const std::string path = write_file("settings.json",
    R"({"xor_enabled": true, "xor_key": "aa", "log_level": "warn"})");

  ConfigLayer overrides;
  overrides.xor_key = "bb";
  Config cfg = load_config(path, overrides);

  EXPECT_TRUE(cfg.xor_enabled);
  EXPECT_EQ(cfg.xor_key, std::optional<std::string>("bb"));
  EXPECT_EQ(cfg.log.level, "warn");
  EXPECT_EQ(cfg.source_file, std::optional<std::string>(path));
}

TEST_F(ConfigTest, LoadsFileNamedByEnvironment) {
  const std::string path = write_file("env.json", R"({"max_stream_size_kb": 2})");
  setenv(CONFIG_ENV_VAR, path.c_str(), 1);

  Config cfg = load_config(std::nullopt, {});
  EXPECT_EQ(cfg.max_stream_size, 2048u);
  EXPECT_EQ(cfg.source_file, std::optional<std::string>(path));
}

TEST_F(ConfigTest, MissingFileFallsBackToDefaults) {
  const std::string path = (dir_ / "absent.json").string();
  Config cfg = load_config(path, {});

  EXPECT_FALSE(cfg.source_file.has_value());
  EXPECT_EQ(cfg.max_stream_size, 64u * 1024u);
}

TEST_F(ConfigTest, MalformedFileFailsLoad) {
  const std::string path = write_file("broken.json", "{\"xor_key\": ");
  EXPECT_THROW(load_config(path, {}), core::IoError);
  EXPECT_THROW(load_config_file((dir_ / "absent.json").string()), core::IoError);
}

TEST_F(ConfigTest, TypeNames) {
  EXPECT_STREQ(to_string(InputType::Stdin), "stdin");
  EXPECT_STREQ(to_string(InputType::QueuePull), "queue_pull");
  EXPECT_STREQ(to_string(OutputType::Stdout), "stdout");
  EXPECT_STREQ(to_string(OutputType::QueuePush), "queue_push");
}
