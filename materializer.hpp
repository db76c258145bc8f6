#ifndef MATERIALIZER_H
#define MATERIALIZER_H

#include "listing_node.hpp"
#include "progress.hpp"

#include <cstddef>
#include <memory>
#include <vector>

// Hands a built forest out one level at a time: roots first, a node's
// children only once somebody asks for them. Not thread safe; owned by the
// primary thread.
class TreeMaterializer
{
public:
    using NodeId = std::size_t;

    // Replaces the current forest and exposes its roots.
    void reset(std::shared_ptr<const Forest> forest, ProgressReporter* progress = nullptr);
    void clear();

    const std::vector<NodeId>& roots() const { return m_roots; }

    // Materializes the direct children of a node on first call; later calls
    // return the same ids. Returns false for an unknown id.
    bool expand(NodeId id, std::vector<NodeId>& children);

    bool expandable(NodeId id) const;
    bool is_expanded(NodeId id) const;
    const ListingNode* node(NodeId id) const;

    // Opening a node expands it. Closing keeps its children materialized.
    bool set_open(NodeId id, bool open);
    bool is_open(NodeId id) const;

    // Rows of a tree widget: roots, then the children of every open node,
    // depth first.
    void visible_nodes(std::vector<NodeId>& out) const;

    // Index of the parent in the table, or false for a root.
    bool parent_of(NodeId id, NodeId& parent) const;

    // Nodes exposed so far.
    std::size_t size() const { return m_slots.size(); }
    bool empty() const { return m_roots.empty(); }

private:
    struct Slot {
        const ListingNode* node {nullptr};
        NodeId parent {};
        bool has_parent {false};
        bool expanded {false};
        bool open {false};
        std::vector<NodeId> children {};
    };

    NodeId expose(const ListingNode& node, const NodeId* parent);

    std::shared_ptr<const Forest> m_forest {};
    std::vector<Slot> m_slots {};
    std::vector<NodeId> m_roots {};
};

#endif
