// =============================================================================
// Listing File Reader Tests
// =============================================================================

#include <gtest/gtest.h>
#include "listing_file.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class ListingFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("tree_watcher_file_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed())
            + "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write(const std::string& name, const std::string& bytes) {
        fs::path path = dir / name;
        std::ofstream out {path, std::ios::binary};
        out << bytes;
        return path;
    }

    fs::path dir {};
};

TEST(SplitLinesTest, HandlesLineEndings) {
    std::vector<std::string> lines = split_lines("a\r\nb\n\nc");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");
}

TEST(SplitLinesTest, TrailingNewlineAddsNoLine) {
    EXPECT_EQ(split_lines("a\nb\n").size(), 2u);
    EXPECT_TRUE(split_lines("").empty());
}

TEST(DecodeListingTest, Utf8) {
    std::vector<std::string> lines {};
    std::string encoding {};
    ASSERT_EQ(decode_listing("C:.\n├── a.txt\n", lines, encoding), ReadStatus::Ok);
    EXPECT_EQ(encoding, "UTF-8");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "├── a.txt");
}

TEST(DecodeListingTest, Utf8ByteOrderMarkIsDropped) {
    std::vector<std::string> lines {};
    std::string encoding {};
    ASSERT_EQ(decode_listing("\xEF\xBB\xBF" "C:.\n", lines, encoding), ReadStatus::Ok);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "C:.");
}

// The bytes `tree` writes under the Chinese code page
TEST(DecodeListingTest, FallsBackToGbk) {
    const std::string gbk = std::string("C:.\r\n") + "\xA9\xC0\xA9\xA4\xCE\xC4\xBC\xFE\r\n";

    std::vector<std::string> lines {};
    std::string encoding {};
    ASSERT_EQ(decode_listing(gbk, lines, encoding), ReadStatus::Ok);
    EXPECT_EQ(encoding, "GBK");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "├─文件");
}

TEST(DecodeListingTest, Utf16LittleEndian) {
    const std::string bytes("\xFF\xFE" "C\0:\0.\0\n\0a\0", 12);

    std::vector<std::string> lines {};
    std::string encoding {};
    ASSERT_EQ(decode_listing(bytes, lines, encoding), ReadStatus::Ok);
    EXPECT_EQ(encoding, "UTF-16LE");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "C:.");
    EXPECT_EQ(lines[1], "a");
}

TEST(DecodeListingTest, UndecodableBytes) {
    // 0xFF is neither valid UTF-8 nor a GBK lead byte
    std::vector<std::string> lines {};
    std::string encoding {};
    EXPECT_EQ(decode_listing(std::string("C:.\n\xFF\xFF\xFF"), lines, encoding), ReadStatus::DecodeFailed);
}

TEST(DecodeListingTest, EmptyBytes) {
    std::vector<std::string> lines {};
    std::string encoding {};
    EXPECT_EQ(decode_listing("", lines, encoding), ReadStatus::Empty);
    EXPECT_EQ(decode_listing("\xEF\xBB\xBF", lines, encoding), ReadStatus::Empty);
}

TEST_F(ListingFileTest, ReadsFile) {
    fs::path path = write("tree_output.txt", "C:.\n└── only.txt\n");

    std::vector<std::string> lines {};
    std::string encoding {};
    ASSERT_EQ(read_listing_file(path, lines, encoding), ReadStatus::Ok);
    EXPECT_EQ(lines.size(), 2u);
}

TEST_F(ListingFileTest, EmptyFile) {
    fs::path path = write("empty.txt", "");

    std::vector<std::string> lines {};
    std::string encoding {};
    EXPECT_EQ(read_listing_file(path, lines, encoding), ReadStatus::Empty);
}

TEST_F(ListingFileTest, MissingFile) {
    std::vector<std::string> lines {};
    std::string encoding {};
    EXPECT_EQ(read_listing_file(dir / "missing.txt", lines, encoding), ReadStatus::OpenFailed);
}

TEST(ReadStatusTest, MessagesAreDistinct) {
    EXPECT_STREQ(describe(ReadStatus::Empty), "File is empty");
    EXPECT_STRNE(describe(ReadStatus::Empty), describe(ReadStatus::DecodeFailed));
    EXPECT_STRNE(describe(ReadStatus::OpenFailed), describe(ReadStatus::DecodeFailed));
}
