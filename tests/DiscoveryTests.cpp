#include "TestSupport.h"

#include "localelo/core/discovery/EntrantFiles.h"

#include <gtest/gtest.h>

#include <filesystem>

using localelo::core::discovery::DiscoverEntrants;
using localelo::core::discovery::DiscoveryOptions;
using localelo::core::discovery::DisplayName;
using localelo::core::discovery::EntrantExists;
using localelo::core::discovery::ExtensionsToPattern;
using localelo::core::discovery::MatchesPattern;
using localelo::core::discovery::TrashEntrantFile;

TEST(DiscoveryTest, ExtensionListsBecomeAnchoredPatterns) {
    EXPECT_EQ(ExtensionsToPattern("py"), ".*\\.py$");
    EXPECT_EQ(ExtensionsToPattern(".py, js"), ".*\\.(py|js)$");
    EXPECT_EQ(ExtensionsToPattern(""), ".*");
    EXPECT_TRUE(MatchesPattern("bot.py", ExtensionsToPattern("py,js")));
    EXPECT_FALSE(MatchesPattern("bot.pyc", ExtensionsToPattern("py,js")));
    EXPECT_FALSE(MatchesPattern("bot.py", "(unclosed"));
}

TEST(DiscoveryTest, SkipsHiddenExcludedAndNonMatchingFiles) {
    localelo::test::TempDir dir;
    dir.Touch("b.py");
    dir.Touch("a.py");
    dir.Touch(".hidden.py");
    dir.Touch("local_elo.json");
    dir.Touch("readme.md");
    std::filesystem::create_directories(dir.path() / "sub.py");

    DiscoveryOptions options;
    options.excluded_names = {"local_elo.json"};
    std::string error;
    EXPECT_EQ(DiscoverEntrants(dir.path().string(), options, &error),
              (std::vector<std::string>{"a.py", "b.py", "readme.md"}));

    options.pattern = ".*\\.py$";
    EXPECT_EQ(DiscoverEntrants(dir.path().string(), options, &error), (std::vector<std::string>{"a.py", "b.py"}));
    EXPECT_TRUE(error.empty());
}

TEST(DiscoveryTest, ReportsUnreadableDirectory) {
    localelo::test::TempDir dir;
    std::string error;
    EXPECT_TRUE(DiscoverEntrants(dir.file("missing"), DiscoveryOptions{}, &error).empty());
    EXPECT_FALSE(error.empty());
}

TEST(DiscoveryTest, DisplayNameDropsExtension) {
    EXPECT_EQ(DisplayName("alpha.py"), "alpha");
    EXPECT_EQ(DisplayName("Makefile"), "Makefile");
}

TEST(DiscoveryTest, TrashMovesFileUnderTrashDir) {
    localelo::test::TempDir dir;
    dir.Touch("loser.py");

    std::string trash_path;
    std::string error;
    ASSERT_TRUE(TrashEntrantFile(dir.path().string(), "loser.py", &trash_path, &error));
    EXPECT_FALSE(EntrantExists(dir.path().string(), "loser.py"));
    EXPECT_TRUE(std::filesystem::exists(trash_path));
    EXPECT_EQ(std::filesystem::path(trash_path).parent_path().filename().string(), ".trash");
    EXPECT_EQ(std::filesystem::path(trash_path).extension().string(), ".py");

    EXPECT_FALSE(TrashEntrantFile(dir.path().string(), "loser.py", &trash_path, &error));
    EXPECT_FALSE(error.empty());
}
