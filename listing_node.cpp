#include "listing_node.hpp"

#include <algorithm>
#include <utility>
#include <vector>

ListingNode::ListingNode(const ListingNode& other)
    : name {other.name}, depth {other.depth}
{
    std::vector<std::pair<const ListingNode*, ListingNode*>> pending {{&other, this}};
    while (!pending.empty()) {
        auto [from, to] = pending.back();
        pending.pop_back();
        // Reserved up front, so the pointers pushed below stay valid.
        to->children.reserve(from->children.size());
        for (const auto& child : from->children) {
            to->children.emplace_back(child.name, child.depth);
            pending.emplace_back(&child, &to->children.back());
        }
    }
}

ListingNode& ListingNode::operator=(const ListingNode& other) {
    if (this != &other) {
        ListingNode copy {other};
        *this = std::move(copy);
    }
    return *this;
}

ListingNode::~ListingNode() {
    std::vector<ListingNode> pending = std::move(children);
    while (!pending.empty()) {
        ListingNode node = std::move(pending.back());
        pending.pop_back();
        for (auto& child : node.children) {
            pending.push_back(std::move(child));
        }
        node.children.clear();
    }
}

bool operator==(const ListingNode& lhs, const ListingNode& rhs) {
    std::vector<std::pair<const ListingNode*, const ListingNode*>> pending {{&lhs, &rhs}};
    while (!pending.empty()) {
        auto [a, b] = pending.back();
        pending.pop_back();
        if (a->name != b->name || a->depth != b->depth || a->children.size() != b->children.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a->children.size(); ++i) {
            pending.emplace_back(&a->children[i], &b->children[i]);
        }
    }
    return true;
}

bool operator!=(const ListingNode& lhs, const ListingNode& rhs) {
    return !(lhs == rhs);
}

bool operator==(const Forest& lhs, const Forest& rhs) {
    if (lhs.roots.size() != rhs.roots.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.roots.size(); ++i) {
        if (lhs.roots[i] != rhs.roots[i]) {
            return false;
        }
    }
    return true;
}

bool operator!=(const Forest& lhs, const Forest& rhs) {
    return !(lhs == rhs);
}

// The walks below use an explicit stack: listings can nest far deeper than
// the call stack allows.

std::size_t count_nodes(const Forest& forest) {
    std::size_t count = 0;
    std::vector<const ListingNode*> pending {};
    for (const auto& root : forest.roots) {
        pending.push_back(&root);
    }
    while (!pending.empty()) {
        const ListingNode* node = pending.back();
        pending.pop_back();
        ++count;
        for (const auto& child : node->children) {
            pending.push_back(&child);
        }
    }
    return count;
}

int max_depth(const Forest& forest) {
    int deepest = -1;
    std::vector<const ListingNode*> pending {};
    for (const auto& root : forest.roots) {
        pending.push_back(&root);
    }
    while (!pending.empty()) {
        const ListingNode* node = pending.back();
        pending.pop_back();
        deepest = std::max(deepest, node->depth);
        for (const auto& child : node->children) {
            pending.push_back(&child);
        }
    }
    return deepest;
}

void print_forest(const Forest& forest, std::ostream& out,
                  const std::string& folder_icon, const std::string& file_icon)
{
    std::vector<const ListingNode*> pending {};
    for (auto it = forest.roots.rbegin(); it != forest.roots.rend(); ++it) {
        pending.push_back(&*it);
    }

    while (!pending.empty()) {
        const ListingNode* node = pending.back();
        pending.pop_back();

        for (int i = 0; i < node->depth; ++i) {
            out << "  ";
        }
        out << (node->is_folder() ? folder_icon : file_icon) << " " << node->name << "\n";

        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            pending.push_back(&*it);
        }
    }
}
