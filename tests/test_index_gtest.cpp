// ==============================================================================
// test_index_gtest.cpp - Тесты индекса объявленных паттернов (GoogleTest)
// ==============================================================================

#include "lfstrack/discovery.hpp"
#include "lfstrack/index.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <unistd.h>

namespace lfstrack::index::test {

class IndexTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    (std::string("lfstrack_index_") + test_info->name() + "_" +
                     std::to_string(getpid()));
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_ / ".git");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void create_file(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    KnownPatterns index_tree() {
        return build_index(io::locate_rule_files(test_dir_, test_dir_ / ".git"));
    }
};

// ==============================================================================
// build_index
// ==============================================================================

TEST_F(IndexTest, RootFile_PathsAndSources) {
    // Arrange
    create_file(test_dir_ / ".gitattributes",
                "*.txt text\n"
                "*.psd filter=lfs diff=lfs merge=lfs -text lockable\n"
                "*.zip filter=lfs diff=lfs merge=lfs -text\n");

    // Act
    KnownPatterns known = index_tree();

    // Assert
    ASSERT_EQ(known.size(), 2u);
    EXPECT_EQ(known[0], (pattern::PatternDescriptor{"*.psd", ".gitattributes", true}));
    EXPECT_EQ(known[1], (pattern::PatternDescriptor{"*.zip", ".gitattributes", false}));
}

TEST_F(IndexTest, NestedFile_PathsJoinedWithScope) {
    create_file(test_dir_ / "assets" / ".gitattributes",
                "*.png filter=lfs diff=lfs merge=lfs -text\n"
                "/raw/*.tga filter=lfs diff=lfs merge=lfs -text\n");

    KnownPatterns known = index_tree();

    ASSERT_EQ(known.size(), 2u);
    EXPECT_EQ(known[0].path, "assets/*.png");
    EXPECT_EQ(known[0].source, "assets/.gitattributes");
    EXPECT_EQ(known[1].path, "assets/raw/*.tga");
}

TEST_F(IndexTest, DeeperDeclarationsComeFirst) {
    // Arrange - один и тот же путь объявлен в двух файлах
    create_file(test_dir_ / ".gitattributes", "sub/*.bin filter=lfs diff=lfs merge=lfs -text\n");
    create_file(test_dir_ / "sub" / ".gitattributes",
                "*.bin filter=lfs diff=lfs merge=lfs -text lockable\n");

    // Act
    KnownPatterns known = index_tree();

    // Assert - без дедупликации, глубокий файл первым
    ASSERT_EQ(known.size(), 2u);
    EXPECT_EQ(known[0].source, "sub/.gitattributes");
    EXPECT_TRUE(known[0].lockable);
    EXPECT_EQ(known[1].source, ".gitattributes");
    EXPECT_FALSE(known[1].lockable);
}

TEST_F(IndexTest, MetadataFile_LastAndRootScoped) {
    create_file(test_dir_ / ".git" / "info" / "attributes",
                "*.iso filter=lfs diff=lfs merge=lfs -text\n");
    create_file(test_dir_ / ".gitattributes", "*.iso filter=lfs diff=lfs merge=lfs -text lockable\n");

    KnownPatterns known = index_tree();

    ASSERT_EQ(known.size(), 2u);
    EXPECT_EQ(known[0].source, ".gitattributes");
    EXPECT_EQ(known[1].source, ".git/info/attributes");
    EXPECT_EQ(known[1].path, "*.iso");
}

TEST_F(IndexTest, SpacesDecoded) {
    create_file(test_dir_ / ".gitattributes",
                "my[[:space:]]file.bin filter=lfs diff=lfs merge=lfs -text\n");

    KnownPatterns known = index_tree();

    ASSERT_EQ(known.size(), 1u);
    EXPECT_EQ(known[0].path, "my file.bin");
}

TEST_F(IndexTest, UnreadableFile_Skipped) {
    // Arrange - файл исчез между обходом и чтением
    std::vector<io::RuleFile> files;
    io::RuleFile missing;
    missing.path = test_dir_ / "gone" / ".gitattributes";
    missing.source = "gone/.gitattributes";
    missing.scope = "gone";
    files.push_back(missing);

    // Act & Assert
    KnownPatterns known;
    EXPECT_NO_THROW(known = build_index(files));
    EXPECT_TRUE(known.empty());
}

// ==============================================================================
// contains
// ==============================================================================

TEST(IndexLookupTest, Contains_MatchesPathAndLockable) {
    KnownPatterns known = {{"*.psd", ".gitattributes", true}};

    EXPECT_TRUE(contains(known, "*.psd", true));
    EXPECT_FALSE(contains(known, "*.psd", false));
    EXPECT_FALSE(contains(known, "*.zip", true));
}

TEST(IndexLookupTest, Contains_AnyDeclarationCounts) {
    KnownPatterns known = {{"*.bin", "sub/.gitattributes", true},
                           {"*.bin", ".gitattributes", false}};

    EXPECT_TRUE(contains(known, "*.bin", true));
    EXPECT_TRUE(contains(known, "*.bin", false));
}

}  // namespace lfstrack::index::test
