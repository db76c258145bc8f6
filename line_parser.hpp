#ifndef LINE_PARSER_H
#define LINE_PARSER_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

struct ParsedItem {
    int depth {};
    std::string name {};
};

// Result of parsing one line. A line made only of indentation or a lone
// continuation bar has a depth but no name.
struct ParsedLine {
    int depth {};
    std::optional<std::string> name {};

    bool is_spacer() const {
        return !name.has_value();
    }
};

constexpr std::size_t indent_unit_width { 4 };

// Infers the depth of a listing line from its connector glyphs and strips
// them off the name. Never fails: malformed indentation degrades to a best
// guess.
ParsedLine parse_line(std::string_view line);

std::string_view trim_right(std::string_view text);

std::string_view trim(std::string_view text);

#endif
