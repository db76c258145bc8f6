#ifndef LISTING_NODE_H
#define LISTING_NODE_H

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

struct ListingNode {
    std::string name {};
    int depth {};
    std::vector<ListingNode> children {};

    ListingNode() = default;
    ListingNode(std::string node_name, int node_depth)
        : name {std::move(node_name)}, depth {node_depth} {}
    // Copying and teardown walk the subtree without recursing once per level.
    ListingNode(const ListingNode& other);
    ListingNode(ListingNode&&) noexcept = default;
    ListingNode& operator=(const ListingNode& other);
    ListingNode& operator=(ListingNode&&) noexcept = default;
    ~ListingNode();

    // The listing never says what is a folder; having children is the
    // only evidence. An empty folder reads as a leaf.
    bool is_folder() const {
        return !children.empty();
    }
};

bool operator==(const ListingNode& lhs, const ListingNode& rhs);
bool operator!=(const ListingNode& lhs, const ListingNode& rhs);

struct Forest {
    std::vector<ListingNode> roots {};

    bool empty() const { return roots.empty(); }
};

bool operator==(const Forest& lhs, const Forest& rhs);
bool operator!=(const Forest& lhs, const Forest& rhs);

std::size_t count_nodes(const Forest& forest);

int max_depth(const Forest& forest);

void print_forest(const Forest& forest, std::ostream& out,
                  const std::string& folder_icon, const std::string& file_icon);

#endif
