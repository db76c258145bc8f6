#include "utf8.hpp"

#include <cstdint>

namespace {

constexpr char32_t replacement_char { 0xFFFD };

bool is_continuation(std::uint8_t byte) {
    return (byte & 0xC0) == 0x80;
}

// Decodes one sequence starting at text[pos]. Returns the length consumed,
// or 0 when the bytes there do not form a valid sequence.
std::size_t decode_one(std::string_view text, std::size_t pos, char32_t& out) {
    const auto* p = reinterpret_cast<const std::uint8_t*>(text.data()) + pos;
    const std::size_t remaining = text.size() - pos;
    const std::uint8_t lead = p[0];

    if (lead < 0x80) {
        out = lead;
        return 1;
    }

    std::size_t length {};
    char32_t cp {};
    char32_t min_value {};
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
        min_value = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
        min_value = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
        min_value = 0x10000;
    } else {
        return 0;
    }

    if (remaining < length) {
        return 0;
    }

    for (std::size_t i = 1; i < length; ++i) {
        if (!is_continuation(p[i])) {
            return 0;
        }
        cp = (cp << 6) | (p[i] & 0x3F);
    }

    if (cp < min_value || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }

    out = cp;
    return length;
}

}

std::vector<Utf8Char> split_utf8(std::string_view text) {
    std::vector<Utf8Char> chars {};
    chars.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp {};
        std::size_t length = decode_one(text, pos, cp);
        if (length == 0) {
            chars.push_back(Utf8Char {replacement_char, pos, 1});
            ++pos;
            continue;
        }
        chars.push_back(Utf8Char {cp, pos, length});
        pos += length;
    }
    return chars;
}

bool is_valid_utf8(std::string_view text) {
    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp {};
        std::size_t length = decode_one(text, pos, cp);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}
