// =============================================================================
// UTF-8 Helper Tests
// =============================================================================

#include <gtest/gtest.h>
#include "utf8.hpp"

#include <string>
#include <vector>

TEST(Utf8Test, SplitsMixedWidthCharacters) {
    std::vector<Utf8Char> chars = split_utf8("a├b");

    ASSERT_EQ(chars.size(), 3u);
    EXPECT_EQ(chars[0].code_point, U'a');
    EXPECT_EQ(chars[1].code_point, U'├');
    EXPECT_EQ(chars[1].offset, 1u);
    EXPECT_EQ(chars[1].length, 3u);
    EXPECT_EQ(chars[2].offset, 4u);
}

// Broken bytes still advance one at a time so offsets stay usable
TEST(Utf8Test, InvalidBytesBecomeReplacementCharacters) {
    std::vector<Utf8Char> chars = split_utf8(std::string("x\xA9y"));

    ASSERT_EQ(chars.size(), 3u);
    EXPECT_EQ(chars[1].code_point, U'�');
    EXPECT_EQ(chars[1].length, 1u);
    EXPECT_EQ(chars[2].code_point, U'y');
    EXPECT_EQ(chars[2].offset, 2u);
}

TEST(Utf8Test, TruncatedSequenceAtEnd) {
    std::vector<Utf8Char> chars = split_utf8(std::string("\xE2\x94"));
    ASSERT_EQ(chars.size(), 2u);
    EXPECT_EQ(chars[0].code_point, U'�');
    EXPECT_EQ(chars[1].code_point, U'�');
}

TEST(Utf8Test, Validation) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("│   ├── 文件.txt"));
    EXPECT_FALSE(is_valid_utf8(std::string("\xC0\xAF")));      // overlong
    EXPECT_FALSE(is_valid_utf8(std::string("\xED\xA0\x80")));  // surrogate
    EXPECT_FALSE(is_valid_utf8(std::string("\xA9\xC0\xA9\xA4")));
}
