#include <gtest/gtest.h>
#include "popswarm/content/MediaPack.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <unistd.h>

using namespace pswarm;
namespace fs = std::filesystem;

class DirectoryPackTest : public ::testing::Test {
protected:
    fs::path root;
    std::set<std::string> unreadable;

    void SetUp() override {
        root = fs::temp_directory_path() /
               ("popswarm_pack_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name()) / "My Pack";
        fs::remove_all(root.parent_path());
        fs::create_directories(root / "nested");
    }

    void TearDown() override {
        fs::remove_all(root.parent_path());
    }

    void write(const fs::path& path, const std::string& text) {
        std::ofstream(path) << text;
    }

    DirectoryPack::SizeReader sizeReader() {
        return [this](const fs::path& path) -> std::optional<Size> {
            if (unreadable.count(path.filename().string())) return std::nullopt;
            return Size{640, 480};
        };
    }
};

TEST_F(DirectoryPackTest, MissingDirectoryFailsToLoad) {
    DirectoryPack pack(root / "missing", sizeReader(), 3);
    EXPECT_FALSE(pack.load());
}

TEST_F(DirectoryPackTest, EmptyDirectoryHasNoMedia) {
    DirectoryPack pack(root, sizeReader(), 3);
    EXPECT_FALSE(pack.load());

    RandomEngine rng(1);
    EXPECT_FALSE(pack.nextPopup(rng).has_value());
}

TEST_F(DirectoryPackTest, FindsPngFilesRecursively) {
    write(root / "a.png", "x");
    write(root / "B.PNG", "x");
    write(root / "nested" / "c.png", "x");
    write(root / "notes.txt", "x");
    write(root / "clip.gif", "x");

    DirectoryPack pack(root, sizeReader(), 3);
    ASSERT_TRUE(pack.load());
    EXPECT_EQ(pack.getMediaCount(), 3u);
    EXPECT_EQ(pack.packName(), "My Pack");
}

TEST_F(DirectoryPackTest, ClicksWithinRange) {
    write(root / "a.png", "x");

    DirectoryPack pack(root, sizeReader(), 4);
    ASSERT_TRUE(pack.load());

    RandomEngine rng(5);
    std::set<int> seen;
    for (int i = 0; i < 500; ++i) {
        auto content = pack.nextPopup(rng);
        ASSERT_TRUE(content.has_value());
        EXPECT_GE(content->clicks_to_close, 1);
        EXPECT_LE(content->clicks_to_close, 4);
        seen.insert(content->clicks_to_close);
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST_F(DirectoryPackTest, CaptionsAndDenialLines) {
    write(root / "a.png", "x");
    write(root / "captions.txt", "# comment\na.png: hello there\n\nunknown.png: nope\n");
    write(root / "denial.txt", "no\n");

    DirectoryPack pack(root, sizeReader(), 1);
    ASSERT_TRUE(pack.load());

    RandomEngine rng(1);
    auto content = pack.nextPopup(rng);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content->caption, "hello there");
    EXPECT_EQ(content->denial_text, "no");
    EXPECT_EQ(content->source_size, (Size{640, 480}));
}

TEST_F(DirectoryPackTest, DefaultDenialText) {
    write(root / "a.png", "x");

    DirectoryPack pack(root, sizeReader(), 1);
    ASSERT_TRUE(pack.load());

    RandomEngine rng(1);
    auto content = pack.nextPopup(rng);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(content->denial_text, DirectoryPack::DEFAULT_DENIAL_TEXT);
    EXPECT_TRUE(content->caption.empty());
}

TEST_F(DirectoryPackTest, WebUrls) {
    write(root / "a.png", "x");

    DirectoryPack without(root, sizeReader(), 1);
    ASSERT_TRUE(without.load());
    RandomEngine rng(1);
    EXPECT_FALSE(without.randomWebUrl(rng).has_value());

    write(root / "web.txt", "https://example.org\n# skipped\n  \n");
    DirectoryPack with(root, sizeReader(), 1);
    ASSERT_TRUE(with.load());
    EXPECT_EQ(with.randomWebUrl(rng), std::optional<std::string>("https://example.org"));
}

TEST_F(DirectoryPackTest, UnreadableMediaIsDropped) {
    write(root / "good.png", "x");
    write(root / "bad.png", "x");
    unreadable.insert("bad.png");

    DirectoryPack pack(root, sizeReader(), 1);
    ASSERT_TRUE(pack.load());

    RandomEngine rng(3);
    for (int i = 0; i < 20; ++i) {
        auto content = pack.nextPopup(rng);
        ASSERT_TRUE(content.has_value());
        EXPECT_EQ(content->media.filename(), "good.png");
    }
    EXPECT_EQ(pack.getMediaCount(), 1u);
}

TEST_F(DirectoryPackTest, ForgetMedia) {
    write(root / "a.png", "x");

    DirectoryPack pack(root, sizeReader(), 1);
    ASSERT_TRUE(pack.load());

    pack.forgetMedia(root / "a.png");
    EXPECT_EQ(pack.getMediaCount(), 0u);

    RandomEngine rng(1);
    EXPECT_FALSE(pack.nextPopup(rng).has_value());
}

TEST_F(DirectoryPackTest, ReadLinesTrimsAndSkips) {
    write(root / "lines.txt", "  one  \n#two\n\nthree\n");
    EXPECT_EQ(DirectoryPack::readLines(root / "lines.txt"), (std::vector<std::string>{"one", "three"}));
    EXPECT_TRUE(DirectoryPack::readLines(root / "absent.txt").empty());
}
