#pragma once

#include <string>

#define WATCHBRIDGE_VERSION_MAJOR 1
#define WATCHBRIDGE_VERSION_MINOR 0
#define WATCHBRIDGE_VERSION_PATCH 0

namespace WatchBridge {
    struct Version {
        static constexpr int MAJOR = WATCHBRIDGE_VERSION_MAJOR;
        static constexpr int MINOR = WATCHBRIDGE_VERSION_MINOR;
        static constexpr int PATCH = WATCHBRIDGE_VERSION_PATCH;
        static constexpr const char* STRING = "1.0.0";

        // Unison fsmonitor protocol versions this bridge speaks.
        static constexpr int PROTOCOL_MIN = 1;
        static constexpr int PROTOCOL_MAX = 1;

        static std::string toString() {
            return std::string(STRING);
        }
    };
}
