#include <iostream>
#include <fstream>
#include <string>
#include <filesystem>
#include <unordered_map>
#include <unistd.h>
#include "BridgeCore.h"
#include "Config.h"
#include "Constants.h"
#include "InotifyEventSource.h"
#include "Logger.h"
#include "PathUtils.h"
#include "Version.h"

using namespace WatchBridge;

namespace {

const std::vector<std::string> KNOWN_KEYS = {
    "debounce_ms", "max_delay_ms", "wait_timeout_ms", "recursive",
    "log_file", "log_level", "read_retry_attempts", "read_retry_backoff_ms"
};

bool isNonNegativeInt(const std::string&, const std::string& value) {
    if (value.empty() || value.size() > 9) return false;
    for (char c : value) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool isPositiveInt(const std::string& key, const std::string& value) {
    return isNonNegativeInt(key, value) && std::stoi(value) > 0;
}

bool isRetryAttempts(const std::string& key, const std::string& value) {
    return isPositiveInt(key, value) && std::stoi(value) <= wb::config::MAX_READ_RETRY_ATTEMPTS;
}

bool isBoolean(const std::string&, const std::string& value) {
    return value == "true" || value == "false" || value == "yes" || value == "no" ||
           value == "on" || value == "off" || value == "1" || value == "0";
}

bool isLogLevel(const std::string&, const std::string& value) {
    return Logger::parseLevel(value).has_value();
}

void writeConfigTemplate(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) return;

    std::ofstream templateFile(path);
    if (templateFile.is_open()) {
        templateFile << "# WatchBridge (unison-fsmonitor) configuration\n";
        templateFile << "debounce_ms=" << wb::config::DEFAULT_DEBOUNCE_MS << "\n";
        templateFile << "max_delay_ms=" << wb::config::DEFAULT_MAX_DELAY_MS << "\n";
        templateFile << "# 0 = wait until changes arrive\n";
        templateFile << "wait_timeout_ms=" << wb::config::DEFAULT_WAIT_TIMEOUT_MS << "\n";
        templateFile << "recursive=true\n";
        templateFile << "log_level=warn\n";
        templateFile << "# log_file=/tmp/watchbridge.log\n";
        templateFile << "read_retry_attempts=" << wb::config::DEFAULT_READ_RETRY_ATTEMPTS << "\n";
        templateFile << "read_retry_backoff_ms=" << wb::config::DEFAULT_READ_RETRY_BACKOFF_MS << "\n";
    }
}

void printUsage(const char* program) {
    std::cout << "WatchBridge " << Version::toString() << " - filesystem monitor for Unison" << std::endl;
    std::cout << "\nUsage: " << program << " [OPTIONS]" << std::endl;
    std::cout << "\nSpeaks the Unison fsmonitor protocol on stdin/stdout; Unison starts it" << std::endl;
    std::cout << "by itself when a profile sets repeat = watch." << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --debug                    Log at DEBUG level" << std::endl;
    std::cout << "  --config <PATH>            Configuration file (default: "
              << PathUtils::getDefaultConfigPath().string() << ")" << std::endl;
    std::cout << "  --log-file <PATH>          Also write logs to PATH" << std::endl;
    std::cout << "  --debounce-ms <MS>         Quiet period before changes are announced (default: "
              << wb::config::DEFAULT_DEBOUNCE_MS << ")" << std::endl;
    std::cout << "  --version                  Show version and exit" << std::endl;
    std::cout << "  --help                     Show this help message" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging; stdout carries the protocol, so the console sink is stderr
    auto& logger = Logger::instance();
    logger.setComponent("Bridge");
    logger.setLevel(LogLevel::WARN);
    logger.setMaxFileSize(wb::config::MAX_LOG_FILE_SIZE_MB);

    // --- Parse Command Line Arguments ---
    bool debug = false;
    std::string configPath;
    std::string logFile;
    std::string debounceArg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--debug") {
            debug = true;
        }
        else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (arg == "--log-file" && i + 1 < argc) {
            logFile = argv[++i];
        }
        else if (arg == "--debounce-ms" && i + 1 < argc) {
            debounceArg = argv[++i];
        }
        else if (arg == "--version") {
            std::cout << "unison-fsmonitor (WatchBridge) " << Version::toString()
                      << ", protocol " << Version::PROTOCOL_MAX << std::endl;
            return toInt(ExitCode::Clean);
        }
        else if (arg == "--help") {
            printUsage(argv[0]);
            return toInt(ExitCode::Clean);
        }
        else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << std::endl;
            std::cerr << "Run with --help for usage." << std::endl;
            return toInt(ExitCode::StartupFailure);
        }
    }

    // --- Load Configuration ---
    Config fileConfig;
    if (!configPath.empty()) {
        if (!fileConfig.loadFromFile(configPath)) {
            std::cerr << "Error: Cannot read configuration file " << configPath << std::endl;
            return toInt(ExitCode::StartupFailure);
        }
    } else {
        std::filesystem::path defaultPath;
        try {
            defaultPath = PathUtils::getDefaultConfigPath();
        } catch (const std::runtime_error& e) {
            logger.warn(std::string("No configuration directory: ") + e.what(), "Bridge");
        }
        if (!defaultPath.empty() && !fileConfig.loadFromFile(defaultPath.string())) {
            writeConfigTemplate(defaultPath);
            if (!fileConfig.loadFromFile(defaultPath.string())) {
                logger.info("No configuration file at " + defaultPath.string() + ", using defaults", "Bridge");
            }
        }
    }

    if (!debounceArg.empty()) {
        fileConfig.set("debounce_ms", debounceArg);
    }

    const std::unordered_map<std::string, Config::Validator> schema = {
        {"debounce_ms", isNonNegativeInt},
        {"max_delay_ms", isNonNegativeInt},
        {"wait_timeout_ms", isNonNegativeInt},
        {"recursive", isBoolean},
        {"log_level", isLogLevel},
        {"read_retry_attempts", isRetryAttempts},
        {"read_retry_backoff_ms", isNonNegativeInt}
    };

    std::string badKey;
    if (!fileConfig.validate(schema, &badKey)) {
        std::cerr << "Error: Invalid value for " << badKey << ": '" << fileConfig.get(badKey) << "'" << std::endl;
        return toInt(ExitCode::StartupFailure);
    }
    for (const auto& key : fileConfig.unknownKeys(KNOWN_KEYS)) {
        logger.warn("Ignoring unknown configuration key: " + key, "Bridge");
    }

    // --- Apply Configuration ---
    if (auto level = Logger::parseLevel(fileConfig.get("log_level", "warn"))) {
        logger.setLevel(*level);
    }
    if (debug) {
        logger.setLevel(LogLevel::DEBUG);
    }
    if (logFile.empty()) {
        logFile = fileConfig.get("log_file", "");
    }
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
    }

    BridgeConfig config;
    config.debounce = fileConfig.getMillis("debounce_ms", std::chrono::milliseconds(wb::config::DEFAULT_DEBOUNCE_MS));
    config.maxDelay = fileConfig.getMillis("max_delay_ms", std::chrono::milliseconds(wb::config::DEFAULT_MAX_DELAY_MS));
    config.waitTimeout = fileConfig.getMillis("wait_timeout_ms",
                                              std::chrono::milliseconds(wb::config::DEFAULT_WAIT_TIMEOUT_MS));
    config.recursive = fileConfig.getBool("recursive", true);

    InotifyOptions inotifyOptions;
    inotifyOptions.readRetryAttempts = fileConfig.getInt("read_retry_attempts", wb::config::DEFAULT_READ_RETRY_ATTEMPTS);
    inotifyOptions.readRetryBackoff = fileConfig.getMillis("read_retry_backoff_ms",
                                                           std::chrono::milliseconds(wb::config::DEFAULT_READ_RETRY_BACKOFF_MS));
    inotifyOptions.pollInterval = std::chrono::milliseconds(wb::config::EVENT_POLL_INTERVAL_MS);

    logger.info("=== WatchBridge " + Version::toString() + " starting ===", "Bridge");

    // --- Initialize Bridge Core ---
    BridgeCore bridge(config, std::make_unique<InotifyEventSource>(inotifyOptions), STDIN_FILENO, std::cout);

    if (!bridge.initialize()) {
        std::cerr << "Failed to initialize the filesystem event source" << std::endl;
        return toInt(ExitCode::StartupFailure);
    }

    return toInt(bridge.run());
}
