#ifndef LISTING_FILE_H
#define LISTING_FILE_H

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

enum class ReadStatus {
    Ok,
    OpenFailed,
    Empty,
    DecodeFailed
};

const char* describe(ReadStatus status);

// Reads a saved `tree` listing as UTF-8 lines. UTF-16 files are recognised by
// their byte order mark; anything that is not valid UTF-8 is retried as GBK,
// the code page `tree` writes in the Chinese Windows locale. `encoding`
// receives the encoding that worked.
ReadStatus read_listing_file(const std::filesystem::path& path,
                             std::vector<std::string>& lines, std::string& encoding);

// Same, for bytes already in memory.
ReadStatus decode_listing(const std::string& bytes,
                          std::vector<std::string>& lines, std::string& encoding);

bool convert_to_utf8(const std::string& bytes, const char* from_encoding, std::string& out);

// Splits on '\n' and drops a trailing '\r' from each line.
std::vector<std::string> split_lines(std::string_view text);

#endif
