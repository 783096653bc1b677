#include "app/options.h"

#include "core/daemon_constants.h"

#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <unordered_map>
#include <vector>

using namespace needledrop;
using namespace needledrop::app;

namespace {

std::vector<char*> makeArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return argv;
}

using EnvMap = std::unordered_map<std::string, std::string>;

std::function<const char*(const char*)> makeGetEnv(const EnvMap& env) {
    return [&env](const char* name) -> const char* {
        auto it = env.find(name ? std::string{name} : std::string{});
        if (it == env.end()) {
            return nullptr;
        }
        return it->second.c_str();
    };
}

ParseOptionsResult parse(const std::vector<std::string>& args, const EnvMap& env = {}) {
    auto argv = makeArgv(args);
    return parseOptions(static_cast<int>(argv.size()), argv.data(), "needledrop",
                        makeGetEnv(env));
}

}  // namespace

TEST(ParseDeviceIndex, AcceptsDigitsOnly) {
    EXPECT_EQ(parseDeviceIndex("0"), 0);
    EXPECT_EQ(parseDeviceIndex("12"), 12);
    EXPECT_FALSE(parseDeviceIndex("").has_value());
    EXPECT_FALSE(parseDeviceIndex("-1").has_value());
    EXPECT_FALSE(parseDeviceIndex("1a").has_value());
    EXPECT_FALSE(parseDeviceIndex("1234567").has_value());
}

TEST(ParseLogLevelName, IsCaseInsensitive) {
    EXPECT_EQ(parseLogLevelName("DEBUG"), logging::LogLevel::Debug);
    EXPECT_EQ(parseLogLevelName("warning"), logging::LogLevel::Warn);
    EXPECT_EQ(parseLogLevelName("off"), logging::LogLevel::Off);
    EXPECT_FALSE(parseLogLevelName("loud").has_value());
}

TEST(ParseOptions, ReturnsDefaultsWhenNoArgs) {
    auto parsed = parse({"needledrop"});
    ASSERT_FALSE(parsed.hasError);
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->configPath, DaemonConstants::DEFAULT_CONFIG_FILE);
    EXPECT_FALSE(parsed.options->device.has_value());
    EXPECT_FALSE(parsed.options->listDevices);
    EXPECT_FALSE(parsed.options->verbose);
    EXPECT_FALSE(parsed.options->logLevel.has_value());
    EXPECT_FALSE(parsed.options->controlEndpoint.has_value());
}

TEST(ParseOptions, ParsesAllFlags) {
    auto parsed = parse({"needledrop", "-c", "/etc/needledrop.json", "--device", "2", "-v",
                         "--log-level", "trace", "--control-endpoint", "tcp://127.0.0.1:5555"});
    ASSERT_FALSE(parsed.hasError) << parsed.errorMessage;
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_EQ(parsed.options->configPath, "/etc/needledrop.json");
    EXPECT_EQ(parsed.options->device, 2);
    EXPECT_TRUE(parsed.options->verbose);
    EXPECT_EQ(parsed.options->logLevel, logging::LogLevel::Trace);
    EXPECT_EQ(parsed.options->controlEndpoint, "tcp://127.0.0.1:5555");
}

TEST(ParseOptions, ListDevicesFlag) {
    auto parsed = parse({"needledrop", "--list-devices"});
    ASSERT_TRUE(parsed.options.has_value());
    EXPECT_TRUE(parsed.options->listDevices);
}

TEST(ParseOptions, EnvironmentAppliesWhenNoArgs) {
    EnvMap env = {{"NEEDLEDROP_CONFIG", "/tmp/env.json"},
                  {"NEEDLEDROP_DEVICE", "3"},
                  {"NEEDLEDROP_LOG_LEVEL", "error"},
                  {"NEEDLEDROP_CONTROL_ENDPOINT", "ipc:///tmp/env.sock"}};
    auto parsed = parse({"needledrop"}, env);
    ASSERT_FALSE(parsed.hasError) << parsed.errorMessage;
    EXPECT_EQ(parsed.options->configPath, "/tmp/env.json");
    EXPECT_EQ(parsed.options->device, 3);
    EXPECT_EQ(parsed.options->logLevel, logging::LogLevel::Error);
    EXPECT_EQ(parsed.options->controlEndpoint, "ipc:///tmp/env.sock");
}

TEST(ParseOptions, ArgumentsOverrideEnvironment) {
    EnvMap env = {{"NEEDLEDROP_DEVICE", "3"}, {"NEEDLEDROP_CONFIG", "/tmp/env.json"}};
    auto parsed = parse({"needledrop", "-d", "5", "--config", "cli.json"}, env);
    ASSERT_FALSE(parsed.hasError);
    EXPECT_EQ(parsed.options->device, 5);
    EXPECT_EQ(parsed.options->configPath, "cli.json");
}

TEST(ParseOptions, RejectsInvalidEnvironment) {
    auto badDevice = parse({"needledrop"}, {{"NEEDLEDROP_DEVICE", "usb"}});
    EXPECT_TRUE(badDevice.hasError);
    EXPECT_FALSE(badDevice.options.has_value());

    auto badLevel = parse({"needledrop"}, {{"NEEDLEDROP_LOG_LEVEL", "chatty"}});
    EXPECT_TRUE(badLevel.hasError);
}

TEST(ParseOptions, RejectsInvalidArguments) {
    EXPECT_TRUE(parse({"needledrop", "--device", "-2"}).hasError);
    EXPECT_TRUE(parse({"needledrop", "--log-level", "chatty"}).hasError);
    EXPECT_TRUE(parse({"needledrop", "--bogus"}).hasError);
    // Value flag without a value
    EXPECT_TRUE(parse({"needledrop", "--config"}).hasError);
}

TEST(ParseOptions, HelpAndVersionShortCircuit) {
    auto help = parse({"needledrop", "--help", "--bogus"});
    EXPECT_TRUE(help.showHelp);
    EXPECT_FALSE(help.hasError);
    EXPECT_FALSE(help.options.has_value());

    auto version = parse({"needledrop", "-V"});
    EXPECT_TRUE(version.showVersion);
    EXPECT_FALSE(version.options.has_value());
}
