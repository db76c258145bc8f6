#ifndef FOREST_BUILDER_H
#define FOREST_BUILDER_H

#include "line_parser.hpp"
#include "listing_node.hpp"
#include "lookahead.hpp"
#include "progress.hpp"

#include <cstddef>
#include <string>
#include <vector>

enum class BuildStrategy {
    Stack,
    Recursive
};

const char* strategy_name(BuildStrategy strategy);
bool parse_strategy(const std::string& text, BuildStrategy& strategy);

// Places items one at a time, keeping the chain of open ancestors. Suited
// to feeding a live view line by line.
class StackForestBuilder
{
public:
    struct Insertion {
        // Valid until the next insert() or release().
        const ListingNode* node {nullptr};
        // nullptr when the node became a root.
        const ListingNode* parent {nullptr};
        // The parent had no children before this insertion.
        bool parent_became_folder {false};
    };

    Insertion insert(const ParsedItem& item);

    const Forest& forest() const { return m_forest; }
    Forest release();
    std::size_t size() const { return m_size; }

private:
    struct OpenAncestor {
        ListingNode* node {nullptr};
        int depth {};
    };

    Forest m_forest {};
    // Parsed depths strictly increase from bottom to top.
    std::vector<OpenAncestor> m_cursor {};
    std::size_t m_size {};
};

// Recursive descent: collects every item with depth >= min_depth as a list
// of siblings, each taking the deeper items that follow it as children.
// Runs on an explicit work stack, so the nesting depth of the input is not
// limited by the call stack. Stops early, returning what it has, once
// cancelled reports true.
std::vector<ListingNode> build_subforest(LookaheadSequence& items, int min_depth,
                                         ProgressReporter* progress = nullptr,
                                         std::size_t total = 0,
                                         const CancelCheck& cancelled = {});

// A cancelled build returns a partial forest and skips the final progress
// report; callers check cancelled themselves before using the result.
Forest build_forest(const std::vector<ParsedItem>& items, BuildStrategy strategy,
                    ProgressReporter* progress = nullptr,
                    const CancelCheck& cancelled = {});

#endif
