#include "app/options.h"

#include "core/daemon_constants.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace needledrop {
namespace app {

namespace {

std::string toLower(std::string_view s) {
    std::string out{s};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool applyEnvOverrides(Options& opt, ParseOptionsResult& result,
                       const std::function<const char*(const char*)>& getenvFn) {
    auto fail = [&](const std::string& message) {
        result.hasError = true;
        result.errorMessage = message;
        return false;
    };

    if (const char* config = getenvFn("NEEDLEDROP_CONFIG")) {
        opt.configPath = config;
    }
    if (const char* device = getenvFn("NEEDLEDROP_DEVICE")) {
        auto parsed = parseDeviceIndex(device);
        if (!parsed) {
            return fail("NEEDLEDROP_DEVICE must be a non-negative device index");
        }
        opt.device = parsed;
    }
    if (const char* level = getenvFn("NEEDLEDROP_LOG_LEVEL")) {
        auto parsed = parseLogLevelName(level);
        if (!parsed) {
            return fail(
                "Unsupported NEEDLEDROP_LOG_LEVEL. Use one of: trace|debug|info|warn|error|critical|off");
        }
        opt.logLevel = parsed;
    }
    if (const char* endpoint = getenvFn("NEEDLEDROP_CONTROL_ENDPOINT")) {
        opt.controlEndpoint = std::string(endpoint);
    }
    return true;
}

}  // namespace

std::optional<int> parseDeviceIndex(std::string_view value) {
    if (value.empty() || value.size() > 6) {
        return std::nullopt;
    }
    if (!std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::atoi(std::string(value).c_str());
}

std::optional<logging::LogLevel> parseLogLevelName(std::string_view value) {
    const std::string lower = toLower(value);
    if (lower == "trace") {
        return logging::LogLevel::Trace;
    }
    if (lower == "debug") {
        return logging::LogLevel::Debug;
    }
    if (lower == "info") {
        return logging::LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return logging::LogLevel::Warn;
    }
    if (lower == "error") {
        return logging::LogLevel::Error;
    }
    if (lower == "critical") {
        return logging::LogLevel::Critical;
    }
    if (lower == "off") {
        return logging::LogLevel::Off;
    }
    return std::nullopt;
}

void printHelp(std::string_view programName) {
    std::cout << "Usage: " << programName
              << " [--config config.json] [--device N] [--list-devices] [--verbose]"
              << " [--log-level info] [--control-endpoint EP] [--help] [--version]" << std::endl
              << std::endl
              << "Identifies the record on the turntable and scrobbles it." << std::endl
              << "  -c, --config            JSON config file (default: "
              << DaemonConstants::DEFAULT_CONFIG_FILE << ")" << std::endl
              << "  -d, --device            Capture device index (see --list-devices);"
              << " auto-selected when omitted" << std::endl
              << "  -l, --list-devices      List capture devices and exit" << std::endl
              << "  -v, --verbose           Per-sample diagnostics (log level debug)" << std::endl
              << "  --log-level             trace|debug|info|warn|error|critical|off" << std::endl
              << "  --control-endpoint      ZeroMQ control endpoint (default: "
              << DaemonConstants::CONTROL_IPC_PATH << ")" << std::endl
              << "  -h, --help              Show this help and exit" << std::endl
              << "  -V, --version           Show version and exit" << std::endl
              << std::endl
              << "Environment overrides: NEEDLEDROP_CONFIG, NEEDLEDROP_DEVICE, "
                 "NEEDLEDROP_LOG_LEVEL, NEEDLEDROP_CONTROL_ENDPOINT"
              << std::endl;
}

void printVersion(std::string_view programName) {
    std::cout << programName << " version " << DaemonConstants::VERSION << std::endl;
}

ParseOptionsResult parseOptions(int argc, char** argv, std::string_view programName,
                                const std::function<const char*(const char*)>& getenvFn) {
    Options opt{};
    ParseOptionsResult result{};

    if (!applyEnvOverrides(opt, result, getenvFn)) {
        return result;
    }

    auto fail = [&result](std::string message) {
        result.hasError = true;
        result.errorMessage = std::move(message);
        return result;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        const bool hasValue = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            printHelp(programName);
            result.showHelp = true;
            return result;
        } else if (arg == "-V" || arg == "--version") {
            printVersion(programName);
            result.showVersion = true;
            return result;
        } else if ((arg == "-c" || arg == "--config") && hasValue) {
            opt.configPath = argv[++i];
        } else if ((arg == "-d" || arg == "--device") && hasValue) {
            auto parsed = parseDeviceIndex(argv[++i]);
            if (!parsed) {
                return fail("Device must be a non-negative index (see --list-devices)");
            }
            opt.device = parsed;
        } else if (arg == "-l" || arg == "--list-devices") {
            opt.listDevices = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opt.verbose = true;
        } else if (arg == "--log-level" && hasValue) {
            auto parsed = parseLogLevelName(argv[++i]);
            if (!parsed) {
                return fail(
                    "Unsupported log level. Use one of: trace|debug|info|warn|error|critical|off");
            }
            opt.logLevel = parsed;
        } else if (arg == "--control-endpoint" && hasValue) {
            opt.controlEndpoint = std::string(argv[++i]);
        } else {
            return fail(std::string("Unknown argument: ") + std::string(arg));
        }
    }

    if (opt.configPath.empty()) {
        opt.configPath = DaemonConstants::DEFAULT_CONFIG_FILE;
    }
    result.options = opt;
    return result;
}

}  // namespace app
}  // namespace needledrop
