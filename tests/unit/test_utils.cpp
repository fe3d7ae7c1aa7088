#include <gtest/gtest.h>
#include "PathUtils.h"
#include <cstdlib>

using namespace WatchBridge;

TEST(PathUtilsTest, ConfigPathFollowsXdgConfigHome) {
    const char* saved = std::getenv("XDG_CONFIG_HOME");
    std::string previous = saved ? saved : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(PathUtils::getDefaultConfigPath(), std::filesystem::path("/tmp/xdg/watchbridge/watchbridge.conf"));

    if (saved) {
        ::setenv("XDG_CONFIG_HOME", previous.c_str(), 1);
    } else {
        ::unsetenv("XDG_CONFIG_HOME");
    }
}

TEST(PathUtilsTest, RelativeToBase) {
    EXPECT_EQ(PathUtils::relativeTo("/r", "/r/a/b"), std::string("a/b"));
    EXPECT_EQ(PathUtils::relativeTo("/r/", "/r/a"), std::string("a"));
    EXPECT_EQ(PathUtils::relativeTo("/r", "/r"), std::string(""));
    EXPECT_FALSE(PathUtils::relativeTo("/r", "/rx/a"));
    EXPECT_FALSE(PathUtils::relativeTo("/r/a", "/r"));
}

TEST(PathUtilsTest, JoinRelativeHandlesRoot) {
    EXPECT_EQ(PathUtils::joinRelative("", "a"), "a");
    EXPECT_EQ(PathUtils::joinRelative("a", "b"), "a/b");
    EXPECT_EQ(PathUtils::joinRelative("a", ""), "a");
}

TEST(PathUtilsTest, SameOrBelowRespectsComponentBoundaries) {
    EXPECT_TRUE(PathUtils::isSameOrBelow("a/b", "a"));
    EXPECT_TRUE(PathUtils::isSameOrBelow("a", "a"));
    EXPECT_TRUE(PathUtils::isSameOrBelow("anything", ""));
    EXPECT_FALSE(PathUtils::isSameOrBelow("ab", "a"));
    EXPECT_FALSE(PathUtils::isSameOrBelow("a", "a/b"));
}

TEST(PathUtilsTest, AncestorsNearestFirst) {
    EXPECT_EQ(PathUtils::ancestorsOf("a/b/c"), (std::vector<std::string>{"a/b", "a", ""}));
    EXPECT_EQ(PathUtils::ancestorsOf("a"), std::vector<std::string>{""});
    EXPECT_TRUE(PathUtils::ancestorsOf("").empty());
}
