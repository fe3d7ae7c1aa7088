/**
 * @file LoggerMacros.h
 * @brief Logging macros that skip message construction when the level is off
 *
 * Event-path code logs once per inotify event, so the DEBUG variants must not
 * build strings unless debugging is on:
 *   LOG_DEBUG_COMP_IF("event " + path, "Inotify");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

namespace WatchBridge {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::WatchBridge::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::WatchBridge::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::WatchBridge::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::WatchBridge::Logger::instance().critical(msg, component)

// Logs elapsed time on destruction, at DEBUG level
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto end = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_).count();
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::WatchBridge::ScopedTimer timer__(name, component)

} // namespace WatchBridge
