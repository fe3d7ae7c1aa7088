#include <gtest/gtest.h>
#include "ErrorCodes.h"
#include "MockEventSource.h"
#include "WatchRegistry.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace WatchBridge;
namespace fs = std::filesystem;

class WatchRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() / ("watchbridge_registry_" + std::to_string(::getpid()) + "_" +
                                             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(base_);
        fs::create_directories(base_ / "replica" / "a" / "b");
        fs::create_directories(base_ / "replica" / "c");
        root_ = fs::canonical(base_ / "replica");
        source_.initialize(nullptr, nullptr);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    void touch(const fs::path& path) {
        std::ofstream file(path);
        file << "x";
    }

    fs::path base_;
    fs::path root_;
    MockEventSource source_;
};

TEST_F(WatchRegistryTest, AddRootSubscribesEveryDirectory) {
    WatchRegistry registry(source_);
    auto info = registry.addRoot("r", root_.string(), "", true);

    ASSERT_TRUE(info);
    EXPECT_TRUE(info.value().created);
    EXPECT_EQ(info.value().fspath, root_.string());
    EXPECT_EQ(info.value().subscriptions, 4u);  // "", a, a/b, c
    EXPECT_TRUE(source_.isWatched(root_.string()));
    EXPECT_TRUE(source_.isWatched((root_ / "a" / "b").string()));
    EXPECT_EQ(registry.rootIds(), std::vector<std::string>{"r"});
}

TEST_F(WatchRegistryTest, NonRecursiveRootWatchesTopOnly) {
    WatchRegistry registry(source_);
    auto info = registry.addRoot("r", root_.string(), "", false);

    ASSERT_TRUE(info);
    EXPECT_EQ(registry.subscriptionCount("r"), 1u);
    EXPECT_FALSE(source_.isWatched((root_ / "a").string()));
}

TEST_F(WatchRegistryTest, SubpathLimitsTheWalk) {
    WatchRegistry registry(source_);
    auto info = registry.addRoot("r", root_.string(), "a", true);

    ASSERT_TRUE(info);
    EXPECT_EQ(registry.subscriptionCount("r"), 2u);  // a, a/b
    EXPECT_FALSE(source_.isWatched(root_.string()));
    EXPECT_FALSE(source_.isWatched((root_ / "c").string()));
}

TEST_F(WatchRegistryTest, RegisteringTwiceAddsNoSubscriptions) {
    WatchRegistry registry(source_);
    auto first = registry.addRoot("r", root_.string(), "", true);
    size_t calls = source_.subscribeCalls;
    auto second = registry.addRoot("r", root_.string(), "", true);

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_FALSE(second.value().created);
    EXPECT_EQ(second.value().generation, first.value().generation);
    EXPECT_EQ(source_.subscribeCalls, calls);
    EXPECT_EQ(registry.subscriptionCount("r"), 4u);
}

TEST_F(WatchRegistryTest, ReRegistrationGetsNewGeneration) {
    WatchRegistry registry(source_);
    auto first = registry.addRoot("r", root_.string(), "", true);
    ASSERT_TRUE(registry.removeRoot("r"));
    auto second = registry.addRoot("r", root_.string(), "", true);

    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_GT(second.value().generation, first.value().generation);
}

TEST_F(WatchRegistryTest, MissingRootIsNotFound) {
    WatchRegistry registry(source_);
    auto info = registry.addRoot("r", (base_ / "missing").string(), "", true);

    ASSERT_FALSE(info);
    EXPECT_EQ(codeOf(info.error()), ErrorCode::NOT_FOUND);
    EXPECT_FALSE(registry.hasRoot("r"));
    EXPECT_EQ(source_.getSubscriptionCount(), 0u);
}

TEST_F(WatchRegistryTest, FileRootIsNotADirectory) {
    touch(root_ / "file");
    WatchRegistry registry(source_);
    auto info = registry.addRoot("r", root_.string(), "file", true);

    ASSERT_FALSE(info);
    EXPECT_EQ(codeOf(info.error()), ErrorCode::NOT_A_DIRECTORY);
    EXPECT_FALSE(registry.hasRoot("r"));
}

TEST_F(WatchRegistryTest, SubpathCannotEscapeTheReplica) {
    WatchRegistry registry(source_);
    auto info = registry.addRoot("r", root_.string(), "../outside", true);

    ASSERT_FALSE(info);
    EXPECT_FALSE(registry.hasRoot("r"));
}

TEST_F(WatchRegistryTest, LimitOnTopDirectoryFailsAndRollsBack) {
    source_.failOn(root_.string(), ErrorCode::SUBSCRIPTION_LIMIT);
    WatchRegistry registry(source_);
    auto info = registry.addRoot("r", root_.string(), "", true);

    ASSERT_FALSE(info);
    EXPECT_EQ(codeOf(info.error()), ErrorCode::SUBSCRIPTION_LIMIT);
    EXPECT_FALSE(registry.hasRoot("r"));
    EXPECT_EQ(source_.getSubscriptionCount(), 0u);
}

TEST_F(WatchRegistryTest, LimitOnNestedDirectoryIsSkipped) {
    source_.failOn((root_ / "a").string(), ErrorCode::SUBSCRIPTION_LIMIT);
    WatchRegistry registry(source_);
    auto info = registry.addRoot("r", root_.string(), "", true);

    ASSERT_TRUE(info);
    EXPECT_EQ(registry.subscriptionCount("r"), 2u);  // "", c; a and its subtree skipped
    EXPECT_FALSE(source_.isWatched((root_ / "a" / "b").string()));
}

TEST_F(WatchRegistryTest, EverySubscribeIsReleased) {
    {
        WatchRegistry registry(source_);
        ASSERT_TRUE(registry.addRoot("r1", root_.string(), "", true));
        ASSERT_TRUE(registry.addRoot("r2", root_.string(), "a", true));
        fs::create_directories(root_ / "c" / "new");
        registry.onDirectoryAppeared("r1", "c/new", (root_ / "c" / "new").string());
        registry.onDirectoryRemoved("r1", "a");
        ASSERT_TRUE(registry.removeRoot("r2"));
        EXPECT_FALSE(registry.removeRoot("r2"));
    }

    EXPECT_GT(source_.subscribeCalls, 0u);
    EXPECT_EQ(source_.subscribeCalls, source_.unsubscribeCalls);
    EXPECT_EQ(source_.unknownReleases, 0u);
    EXPECT_EQ(source_.getSubscriptionCount(), 0u);
}

TEST_F(WatchRegistryTest, OverlappingRootsShareHandles) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r1", root_.string(), "", true));
    ASSERT_TRUE(registry.addRoot("r2", root_.string(), "a", true));

    RawEvent event;
    event.kind = RawEventKind::Modified;
    event.handle = source_.handleFor((root_ / "a").string());
    event.name = "f.txt";
    auto targets = registry.resolve(event);

    ASSERT_EQ(targets.size(), 2u);
    std::sort(targets.begin(), targets.end(), [](const EventTarget& x, const EventTarget& y) {
        return x.rootId < y.rootId;
    });
    EXPECT_EQ(targets[0].rootId, "r1");
    EXPECT_EQ(targets[0].relativePath, "a/f.txt");
    EXPECT_EQ(targets[1].rootId, "r2");
    EXPECT_EQ(targets[1].relativePath, "a/f.txt");

    ASSERT_TRUE(registry.removeRoot("r1"));
    EXPECT_TRUE(source_.isWatched((root_ / "a").string()));
}

TEST_F(WatchRegistryTest, ResolveMarksTopDirectorySelfEvents) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "", true));

    RawEvent top;
    top.kind = RawEventKind::Removed;
    top.isSelf = true;
    top.handle = source_.handleFor(root_.string());
    auto targets = registry.resolve(top);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].relativePath, "");
    EXPECT_TRUE(targets[0].isTopDirectory);

    RawEvent nested = top;
    nested.handle = source_.handleFor((root_ / "a").string());
    targets = registry.resolve(nested);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].relativePath, "a");
    EXPECT_FALSE(targets[0].isTopDirectory);
}

TEST_F(WatchRegistryTest, AppearedDirectoryReportsWhatIsAlreadyInside) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "", true));

    // Populated before anyone could subscribe to it
    fs::create_directories(root_ / "new" / "inner");
    touch(root_ / "new" / "file.txt");
    touch(root_ / "new" / "inner" / "deep.txt");

    auto discovered = registry.onDirectoryAppeared("r", "new", (root_ / "new").string());
    std::sort(discovered.begin(), discovered.end());

    EXPECT_EQ(discovered, (std::vector<std::string>{"new/file.txt", "new/inner", "new/inner/deep.txt"}));
    EXPECT_TRUE(source_.isWatched((root_ / "new").string()));
    EXPECT_TRUE(source_.isWatched((root_ / "new" / "inner").string()));
}

TEST_F(WatchRegistryTest, RemovedDirectoryReleasesNestedSubscriptions) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "", true));

    registry.onDirectoryRemoved("r", "a");

    EXPECT_EQ(registry.subscriptionCount("r"), 2u);
    EXPECT_FALSE(source_.isWatched((root_ / "a").string()));
    EXPECT_FALSE(source_.isWatched((root_ / "a" / "b").string()));
    EXPECT_TRUE(source_.isWatched((root_ / "c").string()));
}

TEST_F(WatchRegistryTest, RemovingAnUncoveredTopDirectoryBlindsTheRoot) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "", true));
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "a", true));

    EXPECT_FALSE(registry.onDirectoryRemoved("r", "a"));
    EXPECT_FALSE(registry.onDirectoryRemoved("r", "c"));
    EXPECT_TRUE(registry.onDirectoryRemoved("r", ""));
    EXPECT_EQ(registry.subscriptionCount("r"), 0u);
    EXPECT_EQ(source_.getSubscriptionCount(), 0u);
}

TEST_F(WatchRegistryTest, StartingAgainAfterTopDirectoryLossResubscribes) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "", true));
    ASSERT_TRUE(registry.onDirectoryRemoved("r", ""));

    auto info = registry.addRoot("r", root_.string(), "", true);
    ASSERT_TRUE(info);
    EXPECT_FALSE(info.value().created);
    EXPECT_EQ(registry.subscriptionCount("r"), 4u);
    EXPECT_TRUE(source_.isWatched(root_.string()));
    EXPECT_TRUE(source_.isWatched((root_ / "a" / "b").string()));
}

TEST_F(WatchRegistryTest, StartingAgainAfterLostTopWatchResubscribes) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "c", true));

    SubscriptionHandle handle = source_.handleFor((root_ / "c").string());
    source_.loseWatch((root_ / "c").string());
    registry.onSubscriptionLost(handle);
    EXPECT_EQ(registry.subscriptionCount("r"), 0u);

    ASSERT_TRUE(registry.addRoot("r", root_.string(), "c", true));
    EXPECT_EQ(registry.subscriptionCount("r"), 1u);
    EXPECT_TRUE(source_.isWatched((root_ / "c").string()));
}

TEST_F(WatchRegistryTest, LostSubscriptionIsNotReleasedAgain) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "", true));

    SubscriptionHandle handle = source_.handleFor((root_ / "c").string());
    source_.loseWatch((root_ / "c").string());
    registry.onSubscriptionLost(handle);

    EXPECT_EQ(registry.subscriptionCount("r"), 3u);
    registry.clear();
    EXPECT_EQ(source_.unknownReleases, 0u);
}

TEST_F(WatchRegistryTest, EnsureDirectoryAndMissingDirectory) {
    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "a", true));

    EXPECT_TRUE(registry.ensureDirectory("r", "c"));
    EXPECT_TRUE(source_.isWatched((root_ / "c").string()));

    EXPECT_TRUE(registry.ensureDirectory("r", "gone"));

    auto unknown = registry.ensureDirectory("other", "c");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(codeOf(unknown.error()), ErrorCode::UNKNOWN_ROOT);
}

TEST_F(WatchRegistryTest, FollowedLinkReportsUnderLinkPath) {
    fs::create_directories(base_ / "elsewhere" / "nested");
    fs::create_directory_symlink(base_ / "elsewhere", root_ / "link");

    WatchRegistry registry(source_);
    ASSERT_TRUE(registry.addRoot("r", root_.string(), "", true));
    ASSERT_TRUE(registry.followLink("r", "link"));

    auto target = fs::canonical(base_ / "elsewhere");
    ASSERT_TRUE(source_.isWatched(target.string()));
    ASSERT_TRUE(source_.isWatched((target / "nested").string()));

    RawEvent event;
    event.kind = RawEventKind::Created;
    event.handle = source_.handleFor((target / "nested").string());
    event.name = "new.txt";
    auto targets = registry.resolve(event);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0].relativePath, "link/nested/new.txt");
}
