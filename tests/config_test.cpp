#include <gtest/gtest.h>
#include <cstdlib>
#include <string>
#include <vector>
#include "activities/config.hpp"
#include "activities/errors.hpp"

using namespace activities;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : {"ACTIVITIES_HOST", "PORT", "GRPC_PORT",
                                 "ACTIVITIES_CATALOG", "ACTIVITIES_ENFORCE_CAPACITY"}) {
            unsetenv(name);
        }
    }

    static ServerConfig load(std::vector<std::string> args = {}) {
        std::vector<char*> argv;
        std::string program = "activities_server";
        argv.push_back(program.data());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return load_config(static_cast<int>(argv.size()), argv.data());
    }
};

// =============================================================================
// Defaults and Environment
// =============================================================================

TEST_F(ConfigTest, NoEnvironment_ShouldUseDefaults) {
    auto config = load();

    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.http_port, DEFAULT_HTTP_PORT);
    EXPECT_EQ(config.grpc_port, DEFAULT_GRPC_PORT);
    EXPECT_TRUE(config.catalog_path.empty());
    EXPECT_TRUE(config.enforce_capacity);
    EXPECT_EQ(config.http_address(), "0.0.0.0:8000");
}

TEST_F(ConfigTest, Environment_ShouldOverrideDefaults) {
    setenv("ACTIVITIES_HOST", "127.0.0.1", 1);
    setenv("PORT", "9090", 1);
    setenv("GRPC_PORT", "50100", 1);
    setenv("ACTIVITIES_CATALOG", "/etc/activities.json", 1);
    setenv("ACTIVITIES_ENFORCE_CAPACITY", "false", 1);

    auto config = load();

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.http_port, 9090);
    EXPECT_EQ(config.grpc_port, 50100);
    EXPECT_EQ(config.catalog_path, "/etc/activities.json");
    EXPECT_FALSE(config.enforce_capacity);
    EXPECT_EQ(config.grpc_address(), "127.0.0.1:50100");
}

TEST_F(ConfigTest, PortArgument_ShouldOverrideEnvironment) {
    setenv("PORT", "9090", 1);

    auto config = load({"8081"});

    EXPECT_EQ(config.http_port, 8081);
}

TEST_F(ConfigTest, EmptyVariable_ShouldBeIgnored) {
    setenv("PORT", "", 1);

    EXPECT_EQ(load().http_port, DEFAULT_HTTP_PORT);
}

// =============================================================================
// Malformed Values
// =============================================================================

TEST_F(ConfigTest, NonNumericPort_ShouldThrow) {
    setenv("PORT", "http", 1);

    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, SamePortForBothServers_ShouldThrow) {
    setenv("PORT", "50051", 1);

    EXPECT_THROW(load(), ConfigError);
}

TEST_F(ConfigTest, BadBoolean_ShouldThrow) {
    setenv("ACTIVITIES_ENFORCE_CAPACITY", "maybe", 1);

    EXPECT_THROW(load(), ConfigError);
}

TEST(ParsePortTest, Range) {
    EXPECT_EQ(parse_port("1", "p"), 1);
    EXPECT_EQ(parse_port("65535", "p"), 65535);
    EXPECT_THROW(parse_port("0", "p"), ConfigError);
    EXPECT_THROW(parse_port("65536", "p"), ConfigError);
    EXPECT_THROW(parse_port("123456", "p"), ConfigError);
    EXPECT_THROW(parse_port("-1", "p"), ConfigError);
    EXPECT_THROW(parse_port("", "p"), ConfigError);
}

TEST(ParseBoolTest, AcceptedSpellings) {
    EXPECT_TRUE(parse_bool("TRUE", "b"));
    EXPECT_TRUE(parse_bool("1", "b"));
    EXPECT_TRUE(parse_bool("on", "b"));
    EXPECT_FALSE(parse_bool("No", "b"));
    EXPECT_FALSE(parse_bool("0", "b"));
    EXPECT_FALSE(parse_bool("off", "b"));
}
