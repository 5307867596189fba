// ==============================================================================
// test_pattern_gtest.cpp - Тесты кодека строк .gitattributes (GoogleTest)
// ==============================================================================
//
// parse_line / render_line / экранирование пробелов / join_tree_path
//
// ==============================================================================

#include "lfstrack/pattern.hpp"

#include <gtest/gtest.h>
#include <string>

namespace lfstrack::pattern::test {

// ==============================================================================
// parse_line
// ==============================================================================

TEST(PatternTest, ParseLine_LfsRule) {
    // Arrange
    std::string line = "*.psd filter=lfs diff=lfs merge=lfs -text";

    // Act
    auto desc = parse_line(line);

    // Assert
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->path, "*.psd");
    EXPECT_FALSE(desc->lockable);
    EXPECT_TRUE(desc->source.empty());
}

TEST(PatternTest, ParseLine_Lockable) {
    auto desc = parse_line("*.psd filter=lfs diff=lfs merge=lfs -text lockable");
    ASSERT_TRUE(desc.has_value());
    EXPECT_TRUE(desc->lockable);
}

TEST(PatternTest, ParseLine_LockableInPatternIsNotAttribute) {
    // "lockable" внутри самого паттерна атрибутом не считается
    auto desc = parse_line("lockable.bin filter=lfs diff=lfs merge=lfs -text");
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->path, "lockable.bin");
    EXPECT_FALSE(desc->lockable);
}

TEST(PatternTest, ParseLine_WithoutMarkerIgnored) {
    EXPECT_FALSE(parse_line("*.txt text eol=lf").has_value());
    EXPECT_FALSE(parse_line("# comment").has_value());
    EXPECT_FALSE(parse_line("").has_value());
}

TEST(PatternTest, ParseLine_DecodesSpaces) {
    auto desc = parse_line("my[[:space:]]file.bin filter=lfs diff=lfs merge=lfs -text");
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->path, "my file.bin");
}

TEST(PatternTest, ParseLine_ToleratesCarriageReturnAndTabs) {
    auto desc = parse_line("*.iso\tfilter=lfs diff=lfs merge=lfs -text lockable\r");
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->path, "*.iso");
    EXPECT_TRUE(desc->lockable);
}

// ==============================================================================
// render_line
// ==============================================================================

TEST(PatternTest, RenderLine_Plain) {
    EXPECT_EQ(render_line("*.psd", false), "*.psd filter=lfs diff=lfs merge=lfs -text\n");
}

TEST(PatternTest, RenderLine_Lockable) {
    EXPECT_EQ(render_line("*.psd", true),
              "*.psd filter=lfs diff=lfs merge=lfs -text lockable\n");
}

TEST(PatternTest, RenderLine_EncodesSpaces) {
    EXPECT_EQ(render_line("a b.bin", false),
              "a[[:space:]]b.bin filter=lfs diff=lfs merge=lfs -text\n");
}

TEST(PatternTest, RenderedLine_ParsesBackToSamePattern) {
    // Arrange
    std::string pattern = "dir with spaces/*.bin";

    // Act
    auto desc = parse_line(render_line(pattern, true));

    // Assert
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->path, pattern);
    EXPECT_TRUE(desc->lockable);
}

// ==============================================================================
// Экранирование
// ==============================================================================

TEST(PatternTest, EncodeDecode_SpacesOnly) {
    EXPECT_EQ(encode_pattern("a  b"), "a[[:space:]][[:space:]]b");
    EXPECT_EQ(decode_pattern("a[[:space:]][[:space:]]b"), "a  b");
    EXPECT_EQ(encode_pattern("*.bin"), "*.bin");
}

TEST(PatternTest, FirstField_SkipsLeadingWhitespace) {
    EXPECT_EQ(first_field("  *.bin filter=lfs"), "*.bin");
    EXPECT_EQ(first_field(""), "");
    EXPECT_EQ(first_field("   "), "");
}

// ==============================================================================
// join_tree_path
// ==============================================================================

TEST(PatternTest, JoinTreePath_Root) {
    EXPECT_EQ(join_tree_path("", "*.bin"), "*.bin");
    EXPECT_EQ(join_tree_path(".", "*.bin"), "*.bin");
}

TEST(PatternTest, JoinTreePath_Subdirectory) {
    EXPECT_EQ(join_tree_path("assets/textures", "*.png"), "assets/textures/*.png");
}

TEST(PatternTest, JoinTreePath_LeadingSlashIsRelative) {
    EXPECT_EQ(join_tree_path("sub", "/a.bin"), "sub/a.bin");
    EXPECT_EQ(join_tree_path(".", "/a.bin"), "a.bin");
}

TEST(PatternTest, JoinTreePath_Normalizes) {
    EXPECT_EQ(join_tree_path("a/b", "../c/./d.bin"), "a/c/d.bin");
    EXPECT_EQ(join_tree_path("a", "x//y/"), "a/x/y");
    EXPECT_EQ(join_tree_path("a", ".."), ".");
    EXPECT_EQ(join_tree_path("", "../out.bin"), "../out.bin");
}

}  // namespace lfstrack::pattern::test
