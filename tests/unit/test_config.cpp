#include <gtest/gtest.h>
#include "ondd/core/config.hpp"
#include "ondd/ipc/protocol_client.hpp"
#include <fstream>
#include <filesystem>

using namespace ondd::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_onddctl.conf";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("ondd.socket", "/tmp/ondd.ctrl");

    auto value = config.get("ondd.socket");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "/tmp/ondd.ctrl");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();

    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "true");
    config.set("bool.yes", "yes");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("int.garbage", "42ms");
    config.set("string.value", "hello world");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_TRUE(config.get_bool("bool.yes"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_as<int>("int.value"), 42);
    EXPECT_FALSE(config.get_as<int>("int.garbage").has_value());
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_FALSE(config.get_as<int>("nonexistent").has_value());
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, BuiltInDefaults) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_string("ondd.socket"), "/var/run/ondd.ctrl");
    EXPECT_EQ(config.get_as<int>("ondd.timeout_ms"), 20000);
    EXPECT_EQ(config.get_as<int>("ondd.connect_timeout_ms"), 5000);
    EXPECT_EQ(config.get_string("ondd.connection_mode"), "per-call");
    EXPECT_TRUE(config.get_bool("ondd.auto_open"));
    EXPECT_EQ(config.get_as<int>("ondd.max_response_bytes"), 1048576);
    EXPECT_EQ(config.get_string("log.level"), "info");
    EXPECT_EQ(config.get_string("log.file", "unset"), "");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "ondd.socket=/run/ondd.ctrl\n";
    file << "  ondd.connection_mode = persistent  \n";
    file << "not a setting\n";
    file << "ondd.auto_open=no\n";
    file << "ondd.timeout_ms=2000\n";
    file.close();

    auto& config = Config::instance();
    config.set_defaults();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("ondd.socket"), "/run/ondd.ctrl");
    EXPECT_EQ(config.get_string("ondd.connection_mode"), "persistent");
    EXPECT_FALSE(config.get_bool("ondd.auto_open", true));
    EXPECT_EQ(config.get_as<int>("ondd.timeout_ms"), 2000);
    EXPECT_EQ(config.get_as<int>("ondd.connect_timeout_ms"), 5000);
}

TEST_F(ConfigTest, LoadMissingFile) {
    EXPECT_FALSE(Config::instance().load_from_file("does-not-exist.conf"));
}

TEST_F(ConfigTest, MalformedLinesSkipped) {
    std::ofstream file(test_file);
    file << "=orphan value\n";
    file << "ondd.socket /run/ondd.ctrl\n";
    file << "log.level=debug\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_FALSE(config.get("").has_value());
    EXPECT_FALSE(config.get("ondd.socket").has_value());
    EXPECT_EQ(config.get_string("log.level"), "debug");
}

TEST_F(ConfigTest, NonBooleanFallsBackToDefault) {
    auto& config = Config::instance();
    config.set("ondd.auto_open", "sometimes");

    EXPECT_TRUE(config.get_bool("ondd.auto_open", true));
    EXPECT_FALSE(config.get_bool("ondd.auto_open", false));
}

TEST_F(ConfigTest, ClientOptionsFromDefaults) {
    auto& config = Config::instance();
    config.set_defaults();

    auto options = ondd::ipc::ClientOptions::from_config(config);

    EXPECT_EQ(options.endpoint, "/var/run/ondd.ctrl");
    EXPECT_EQ(options.timeout, std::chrono::milliseconds(20000));
    EXPECT_EQ(options.connect_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(options.mode, ondd::ipc::ConnectionMode::PerCall);
    EXPECT_TRUE(options.auto_open);
    EXPECT_EQ(options.max_response_size, 1048576u);
}

TEST_F(ConfigTest, ClientOptionsOverrides) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("ondd.socket", "127.0.0.1:8090");
    config.set("ondd.timeout_ms", "2000");
    config.set("ondd.connection_mode", "persistent");
    config.set("ondd.auto_open", "false");
    config.set("ondd.max_response_bytes", "4096");

    auto options = ondd::ipc::ClientOptions::from_config(config);

    EXPECT_EQ(options.endpoint, "127.0.0.1:8090");
    EXPECT_EQ(options.timeout, std::chrono::milliseconds(2000));
    EXPECT_EQ(options.mode, ondd::ipc::ConnectionMode::Persistent);
    EXPECT_FALSE(options.auto_open);
    EXPECT_EQ(options.max_response_size, 4096u);
}

TEST_F(ConfigTest, ClientOptionsIgnoresInvalidValues) {
    auto& config = Config::instance();
    config.set("ondd.timeout_ms", "-5");
    config.set("ondd.connection_mode", "sometimes");

    auto options = ondd::ipc::ClientOptions::from_config(config);

    EXPECT_EQ(options.timeout, std::chrono::milliseconds(20000));
    EXPECT_EQ(options.mode, ondd::ipc::ConnectionMode::PerCall);
}
