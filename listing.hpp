#ifndef LISTING_H
#define LISTING_H

#include "line_parser.hpp"
#include "progress.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class LoadStatus {
    Ok,
    NoRootFound,
    Cancelled,
    Failed
};

const char* describe(LoadStatus status);

// Banners printed by `tree` ahead of the listing, in the English and the
// Chinese (GBK) Windows locales.
bool is_banner_line(std::string_view line);

// Index of the top path line: the first line that is neither a banner nor
// blank.
std::optional<std::size_t> find_root_line(const std::vector<std::string>& lines);

struct ParsedListing {
    LoadStatus status {LoadStatus::NoRootFound};
    // items[0] is the root line at depth 0. Every other item sits one level
    // below what parse_line reported, since connector lines without
    // indentation are the root's children.
    std::vector<ParsedItem> items {};
    // Lines from the root to the end of input.
    std::size_t line_count {};
};

ParsedListing parse_listing(const std::vector<std::string>& lines,
                            ProgressReporter* progress = nullptr,
                            const CancelCheck& cancelled = {});

#endif
