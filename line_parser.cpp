#include "line_parser.hpp"
#include "utf8.hpp"

#include <array>
#include <vector>

namespace {

constexpr char32_t vertical_bar { U'│' };
constexpr char32_t tee { U'├' };
constexpr char32_t corner { U'└' };

// Longer forms first so that a four character connector wins over its
// two character prefix.
constexpr std::array<std::string_view, 10> connector_prefixes {
    "├── ", "└── ", "├──", "└──", "+---", "\\---", "└─ ", "├─ ", "└─", "├─",
};

bool is_connector(char32_t c) {
    return c == tee || c == corner || c == U'+' || c == U'\\';
}

bool is_continuation(char32_t c) {
    return c == vertical_bar || c == U'|';
}

bool is_spacer(char32_t c) {
    return is_continuation(c) || c == U' ';
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

bool is_lone_continuation(std::string_view text) {
    return text == "│" || text == "|";
}

}

std::string_view trim_right(std::string_view text) {
    while (!text.empty() && is_blank(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string_view trim(std::string_view text) {
    text = trim_right(text);
    while (!text.empty() && is_blank(text.front())) {
        text.remove_prefix(1);
    }
    return text;
}

ParsedLine parse_line(std::string_view line) {
    line = trim_right(line);
    const std::vector<Utf8Char> chars = split_utf8(line);
    const std::size_t n = chars.size();

    int depth = 0;
    std::size_t idx = 0;

    while (idx + indent_unit_width <= n) {
        const char32_t first = chars[idx].code_point;

        if (is_connector(first)) {
            break;
        }
        if (!is_spacer(first)) {
            break;
        }

        bool name_inside = false;
        std::size_t safe_len = indent_unit_width;

        for (std::size_t i = 0; i < indent_unit_width; ++i) {
            const char32_t c = chars[idx + i].code_point;
            if (is_spacer(c)) {
                if (i > 0 && is_continuation(c)) {
                    // "│  │": the second bar opens the next level
                    safe_len = i;
                    break;
                }
                continue;
            }
            // either an embedded connector ("│ └─") or the name itself
            name_inside = true;
            safe_len = i;
            break;
        }

        ++depth;
        idx += safe_len;
        if (name_inside) {
            break;
        }
    }

    const std::size_t offset = idx < n ? chars[idx].offset : line.size();
    std::string_view rest = line.substr(offset);

    const std::string_view stripped = trim(rest);
    if (stripped.empty() || is_lone_continuation(stripped)) {
        return ParsedLine {depth, std::nullopt};
    }

    bool found_prefix = false;
    for (std::string_view prefix : connector_prefixes) {
        if (starts_with(rest, prefix)) {
            rest.remove_prefix(prefix.size());
            found_prefix = true;
            break;
        }
    }

    if (!found_prefix) {
        if (starts_with(rest, "│") || starts_with(rest, "|")) {
            return ParsedLine {depth, std::nullopt};
        }
        // remnant of a partially consumed connector
        if (starts_with(rest, "─ ")) {
            rest.remove_prefix(std::string_view("─ ").size());
        } else if (starts_with(rest, "─")) {
            rest.remove_prefix(std::string_view("─").size());
        }
    }

    return ParsedLine {depth, std::string(rest)};
}
