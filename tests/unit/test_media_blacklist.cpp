#include <gtest/gtest.h>
#include "popswarm/content/MediaBlacklist.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace pswarm;
namespace fs = std::filesystem;

class MediaBlacklistTest : public ::testing::Test {
protected:
    fs::path root;
    std::vector<std::pair<std::string, std::string>> notifications;
    std::unique_ptr<MediaBlacklist> blacklist;

    void SetUp() override {
        root = fs::temp_directory_path() /
               ("popswarm_blacklist_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root / "pack");

        blacklist = std::make_unique<MediaBlacklist>(
            root / "blacklist",
            [this](const std::string& title, const std::string& message) {
                notifications.emplace_back(title, message);
            });
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    fs::path makeMedia(const std::string& name) {
        fs::path path = root / "pack" / name;
        std::ofstream(path) << "png";
        return path;
    }
};

TEST_F(MediaBlacklistTest, DirectoryStripsWhitespace) {
    EXPECT_EQ(blacklist->directoryFor("My Cool\tPack"), root / "blacklist" / "MyCoolPack");
    EXPECT_EQ(blacklist->directoryFor("   "), root / "blacklist" / "default");
}

TEST_F(MediaBlacklistTest, MovesFileAndNotifies) {
    fs::path media = makeMedia("a.png");

    auto target = blacklist->blacklist(media, "My Pack");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, root / "blacklist" / "MyPack" / "a.png");
    EXPECT_TRUE(fs::exists(*target));
    EXPECT_FALSE(fs::exists(media));

    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_EQ(notifications[0].first, "My Pack");
    EXPECT_EQ(notifications[0].second, "a.png has been successfully sent to blacklist");
}

TEST_F(MediaBlacklistTest, MissingFileFails) {
    auto target = blacklist->blacklist(root / "pack" / "ghost.png", "My Pack");

    EXPECT_FALSE(target.has_value());
    ASSERT_EQ(notifications.size(), 1u);
    EXPECT_NE(notifications[0].second.find("Could not blacklist ghost.png"), std::string::npos);
}

TEST_F(MediaBlacklistTest, RefusesToOverwrite) {
    fs::path first = makeMedia("a.png");
    ASSERT_TRUE(blacklist->blacklist(first, "pack").has_value());

    fs::path second = makeMedia("a.png");
    auto target = blacklist->blacklist(second, "pack");

    EXPECT_FALSE(target.has_value());
    EXPECT_TRUE(fs::exists(second));
    ASSERT_EQ(notifications.size(), 2u);
    EXPECT_NE(notifications[1].second.find("already blacklisted"), std::string::npos);
}

TEST_F(MediaBlacklistTest, WorksWithoutNotifier) {
    MediaBlacklist silent(root / "silent", nullptr);
    fs::path media = makeMedia("b.png");

    EXPECT_TRUE(silent.blacklist(media, "pack").has_value());
    EXPECT_TRUE(fs::exists(root / "silent" / "pack" / "b.png"));
}
