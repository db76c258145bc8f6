#ifndef UTF8_H
#define UTF8_H

#include <cstddef>
#include <string_view>
#include <vector>

struct Utf8Char {
    char32_t code_point {};
    std::size_t offset {};
    std::size_t length {};
};

// Invalid bytes come back as U+FFFD with a length of 1 so that
// offsets always cover the whole input.
std::vector<Utf8Char> split_utf8(std::string_view text);

bool is_valid_utf8(std::string_view text);

#endif
