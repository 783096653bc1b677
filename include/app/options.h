#pragma once

#include "logging/logger.h"

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace needledrop {
namespace app {

struct Options {
    std::string configPath;  // Empty = DaemonConstants::DEFAULT_CONFIG_FILE
    std::optional<int> device;
    bool listDevices{false};
    bool verbose{false};
    std::optional<logging::LogLevel> logLevel;
    std::optional<std::string> controlEndpoint;
};

struct ParseOptionsResult {
    std::optional<Options> options;
    bool showHelp{false};
    bool showVersion{false};
    bool hasError{false};
    std::string errorMessage;
};

/**
 * @brief Parse command-line arguments on top of environment overrides.
 *
 * Environment: NEEDLEDROP_CONFIG, NEEDLEDROP_DEVICE, NEEDLEDROP_LOG_LEVEL,
 * NEEDLEDROP_CONTROL_ENDPOINT. Arguments win over the environment.
 */
ParseOptionsResult parseOptions(
    int argc, char** argv, std::string_view programName,
    const std::function<const char*(const char*)>& getenvFn = ::getenv);

// Non-negative integer device index, nullopt otherwise
std::optional<int> parseDeviceIndex(std::string_view value);

std::optional<logging::LogLevel> parseLogLevelName(std::string_view value);

void printHelp(std::string_view programName);
void printVersion(std::string_view programName);

}  // namespace app
}  // namespace needledrop
