#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace WatchBridge {

    /**
     * @brief key=value settings store
     *
     * Lines starting with '#' are comments. Later layers override earlier
     * ones unless overrideExisting is false.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        std::chrono::milliseconds getMillis(const std::string& key,
                                            std::chrono::milliseconds defaultValue) const;

        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

        /// Keys present in the store but absent from @p known
        std::vector<std::string> unknownKeys(const std::vector<std::string>& known) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
