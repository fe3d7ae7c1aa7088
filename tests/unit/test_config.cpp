#include <gtest/gtest.h>
#include "Config.h"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace WatchBridge;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("watchbridge_config_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigTest, BasicOperations) {
    Config config;
    config.set("log_level", "info");
    EXPECT_EQ(config.get("log_level"), "info");
    EXPECT_TRUE(config.hasKey("log_level"));
    EXPECT_FALSE(config.hasKey("log_file"));
    EXPECT_EQ(config.get("log_file", "fallback"), "fallback");

    config.setInt("debounce_ms", 75);
    EXPECT_EQ(config.getInt("debounce_ms"), 75);

    config.setBool("recursive", false);
    EXPECT_FALSE(config.getBool("recursive", true));
}

TEST_F(ConfigTest, ParsesCommentsAndWhitespace) {
    auto path = writeFile("bridge.conf",
                          "# settings\n"
                          "\n"
                          "  debounce_ms = 120  \n"
                          "log_level=debug\n"
                          "not a setting\n"
                          "=orphan\n");
    Config config;
    ASSERT_TRUE(config.loadFromFile(path));

    EXPECT_EQ(config.getInt("debounce_ms"), 120);
    EXPECT_EQ(config.get("log_level"), "debug");
    EXPECT_EQ(config.unknownKeys({"debounce_ms", "log_level"}), std::vector<std::string>{});
}

TEST_F(ConfigTest, MissingFileIsReported) {
    Config config;
    EXPECT_FALSE(config.loadFromFile((dir_ / "absent.conf").string()));
}

TEST_F(ConfigTest, SaveAndReload) {
    Config config;
    config.set("max_delay_ms", "800");
    config.set("log_file", "/tmp/bridge.log");
    auto path = (dir_ / "saved.conf").string();
    ASSERT_TRUE(config.saveToFile(path));

    Config reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path));
    EXPECT_EQ(reloaded.get("max_delay_ms"), "800");
    EXPECT_EQ(reloaded.get("log_file"), "/tmp/bridge.log");
}

TEST_F(ConfigTest, LayeredLoadKeepsEarlierValuesWithoutOverride) {
    auto first = writeFile("a.conf", "debounce_ms=10\n");
    auto second = writeFile("b.conf", "debounce_ms=99\nlog_level=warn\n");

    Config config;
    ASSERT_TRUE(config.loadLayered({first, second, (dir_ / "none.conf").string()}, false));
    EXPECT_EQ(config.getInt("debounce_ms"), 10);
    EXPECT_EQ(config.get("log_level"), "warn");
}

TEST_F(ConfigTest, MalformedNumbersFallBackToDefault) {
    Config config;
    config.set("debounce_ms", "12abc");
    config.set("max_delay_ms", "-5");
    config.set("recursive", "maybe");

    EXPECT_EQ(config.getInt("debounce_ms", 50), 50);
    EXPECT_EQ(config.getMillis("max_delay_ms", std::chrono::milliseconds(500)).count(), 500);
    EXPECT_TRUE(config.getBool("recursive", true));
}

TEST_F(ConfigTest, ValidationNamesTheFailingKey) {
    Config config;
    config.set("debounce_ms", "50");

    std::unordered_map<std::string, Config::Validator> schema;
    schema["debounce_ms"] = [](const std::string&, const std::string& value) {
        return !value.empty() && value.find_first_not_of("0123456789") == std::string::npos;
    };

    EXPECT_TRUE(config.validate(schema));

    config.set("debounce_ms", "soon");
    std::string failed;
    EXPECT_FALSE(config.validate(schema, &failed));
    EXPECT_EQ(failed, "debounce_ms");
}

TEST_F(ConfigTest, UnknownKeysAreListedSorted) {
    Config config;
    config.set("debounce_ms", "50");
    config.set("zeta", "1");
    config.set("alpha", "2");

    EXPECT_EQ(config.unknownKeys({"debounce_ms"}), (std::vector<std::string>{"alpha", "zeta"}));
}
