#include "forest_builder.hpp"

#include <utility>

const char* strategy_name(BuildStrategy strategy) {
    switch (strategy) {
    case BuildStrategy::Stack:
        return "stack";
    case BuildStrategy::Recursive:
        return "recursive";
    }
    return "unknown";
}

bool parse_strategy(const std::string& text, BuildStrategy& strategy) {
    if (text == "stack") {
        strategy = BuildStrategy::Stack;
        return true;
    }
    if (text == "recursive") {
        strategy = BuildStrategy::Recursive;
        return true;
    }
    return false;
}

StackForestBuilder::Insertion StackForestBuilder::insert(const ParsedItem& item) {
    while (!m_cursor.empty() && m_cursor.back().depth >= item.depth) {
        m_cursor.pop_back();
    }

    Insertion insertion {};
    ListingNode* node = nullptr;

    if (m_cursor.empty()) {
        m_forest.roots.emplace_back(item.name, 0);
        node = &m_forest.roots.back();
    }
    else {
        // Only the parent's own children can move here, and none of them
        // is still on the cursor.
        ListingNode* parent = m_cursor.back().node;
        insertion.parent = parent;
        insertion.parent_became_folder = parent->children.empty();
        parent->children.emplace_back(item.name, parent->depth + 1);
        node = &parent->children.back();
    }

    m_cursor.push_back(OpenAncestor {node, item.depth});
    ++m_size;

    insertion.node = node;
    return insertion;
}

Forest StackForestBuilder::release() {
    m_cursor.clear();
    m_size = 0;
    Forest out = std::move(m_forest);
    m_forest = Forest {};
    return out;
}

namespace {

bool should_stop(std::size_t built, const CancelCheck& cancelled) {
    return built % cancel_poll_interval == 0 && cancelled && cancelled();
}

}

std::vector<ListingNode> build_subforest(LookaheadSequence& items, int min_depth,
                                         ProgressReporter* progress, std::size_t total,
                                         const CancelCheck& cancelled)
{
    struct Frame {
        std::vector<ListingNode>* siblings {nullptr};
        int min_depth {};
        int node_depth {};
    };

    std::vector<ListingNode> top {};
    std::vector<Frame> frames {Frame {&top, min_depth, 0}};
    std::size_t built = 0;

    while (!frames.empty()) {
        const ParsedItem* next = items.peek();
        if (!next || next->depth < frames.back().min_depth) {
            frames.pop_back();
            continue;
        }

        ParsedItem item = items.advance();
        const Frame frame = frames.back();
        frame.siblings->emplace_back(std::move(item.name), frame.node_depth);

        ++built;
        if (progress) {
            progress->report(Phase::Building, built, total);
        }

        // The frames below this one point at ancestors' child lists, which
        // the push above cannot reallocate.
        frames.push_back(Frame {&frame.siblings->back().children, item.depth + 1, frame.node_depth + 1});

        if (should_stop(built, cancelled)) {
            break;
        }
    }

    return top;
}

Forest build_forest(const std::vector<ParsedItem>& items, BuildStrategy strategy,
                    ProgressReporter* progress, const CancelCheck& cancelled)
{
    const std::size_t total = items.size();
    Forest forest {};

    if (strategy == BuildStrategy::Stack) {
        StackForestBuilder builder {};
        for (const auto& item : items) {
            builder.insert(item);
            if (progress) {
                progress->report(Phase::Building, builder.size(), total);
            }
            if (should_stop(builder.size(), cancelled)) {
                return builder.release();
            }
        }
        forest = builder.release();
    }
    else {
        LookaheadSequence sequence {items};
        forest.roots = build_subforest(sequence, 0, progress, total, cancelled);
        if (!sequence.exhausted()) {
            return forest;
        }
    }

    if (progress) {
        progress->finish(Phase::Building, total);
    }
    return forest;
}
