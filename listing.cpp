#include "listing.hpp"

#include <utility>

namespace {

bool contains(std::string_view text, std::string_view part) {
    return text.find(part) != std::string_view::npos;
}

}

const char* describe(LoadStatus status) {
    switch (status) {
    case LoadStatus::Ok:
        return "Loaded";
    case LoadStatus::NoRootFound:
        return "No tree structure found.";
    case LoadStatus::Cancelled:
        return "Load superseded";
    case LoadStatus::Failed:
        return "Error loading file";
    }
    return "Unknown";
}

bool is_banner_line(std::string_view line) {
    if (contains(line, "PATH") && (contains(line, "listing") || contains(line, "列表"))) {
        return true;
    }
    return contains(line, "Volume serial number") || contains(line, "卷序列号");
}

std::optional<std::size_t> find_root_line(const std::vector<std::string>& lines) {
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (is_banner_line(lines[i]) || trim(lines[i]).empty()) {
            continue;
        }
        return i;
    }
    return std::nullopt;
}

ParsedListing parse_listing(const std::vector<std::string>& lines,
                            ProgressReporter* progress, const CancelCheck& cancelled)
{
    ParsedListing parsed {};

    const std::optional<std::size_t> root = find_root_line(lines);
    if (!root) {
        parsed.status = LoadStatus::NoRootFound;
        return parsed;
    }

    const std::size_t start = *root;
    const std::size_t total = lines.size() - start - 1;
    parsed.line_count = lines.size() - start;

    // The top path line carries no connectors; take it verbatim.
    parsed.items.push_back(ParsedItem {0, std::string(trim_right(lines[start]))});

    if (progress) {
        progress->report(Phase::Parsing, 0, total);
    }

    for (std::size_t i = start + 1; i < lines.size(); ++i) {
        const std::size_t done = i - start;
        if (done % cancel_poll_interval == 0 && cancelled && cancelled()) {
            parsed.status = LoadStatus::Cancelled;
            return parsed;
        }

        std::string_view line = trim_right(lines[i]);
        if (!line.empty()) {
            ParsedLine result = parse_line(line);
            if (result.name) {
                parsed.items.push_back(ParsedItem {result.depth + 1, std::move(*result.name)});
            }
        }

        if (progress) {
            progress->report(Phase::Parsing, done, total);
        }
    }

    if (progress) {
        progress->finish(Phase::Parsing, total);
    }
    parsed.status = LoadStatus::Ok;
    return parsed;
}
