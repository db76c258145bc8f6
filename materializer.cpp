#include "materializer.hpp"

#include <utility>

void TreeMaterializer::clear() {
    m_slots.clear();
    m_roots.clear();
    m_forest.reset();
}

void TreeMaterializer::reset(std::shared_ptr<const Forest> forest, ProgressReporter* progress) {
    clear();
    m_forest = std::move(forest);
    if (!m_forest) {
        return;
    }

    const std::size_t total = m_forest->roots.size();
    if (progress) {
        progress->report(Phase::Populating, 0, total);
    }

    m_roots.reserve(total);
    for (const auto& root : m_forest->roots) {
        m_roots.push_back(expose(root, nullptr));
        if (progress) {
            progress->report(Phase::Populating, m_roots.size(), total);
        }
    }

    if (progress) {
        progress->finish(Phase::Populating, total);
    }
}

TreeMaterializer::NodeId TreeMaterializer::expose(const ListingNode& node, const NodeId* parent) {
    Slot slot {};
    slot.node = &node;
    if (parent) {
        slot.parent = *parent;
        slot.has_parent = true;
    }
    m_slots.push_back(std::move(slot));
    return m_slots.size() - 1;
}

bool TreeMaterializer::expand(NodeId id, std::vector<NodeId>& children) {
    if (id >= m_slots.size()) {
        return false;
    }

    if (!m_slots[id].expanded) {
        const ListingNode* node = m_slots[id].node;
        std::vector<NodeId> ids {};
        ids.reserve(node->children.size());
        for (const auto& child : node->children) {
            ids.push_back(expose(child, &id));
        }
        // expose() may have moved the slots; index again.
        m_slots[id].children = std::move(ids);
        m_slots[id].expanded = true;
    }

    children = m_slots[id].children;
    return true;
}

bool TreeMaterializer::expandable(NodeId id) const {
    return id < m_slots.size() && m_slots[id].node->is_folder();
}

bool TreeMaterializer::is_expanded(NodeId id) const {
    return id < m_slots.size() && m_slots[id].expanded;
}

const ListingNode* TreeMaterializer::node(NodeId id) const {
    if (id >= m_slots.size()) {
        return nullptr;
    }
    return m_slots[id].node;
}

bool TreeMaterializer::set_open(NodeId id, bool open) {
    if (id >= m_slots.size()) {
        return false;
    }
    if (open) {
        std::vector<NodeId> children {};
        expand(id, children);
    }
    m_slots[id].open = open;
    return true;
}

bool TreeMaterializer::is_open(NodeId id) const {
    return id < m_slots.size() && m_slots[id].open;
}

bool TreeMaterializer::parent_of(NodeId id, NodeId& parent) const {
    if (id >= m_slots.size() || !m_slots[id].has_parent) {
        return false;
    }
    parent = m_slots[id].parent;
    return true;
}

void TreeMaterializer::visible_nodes(std::vector<NodeId>& out) const {
    std::vector<NodeId> pending {};
    for (auto it = m_roots.rbegin(); it != m_roots.rend(); ++it) {
        pending.push_back(*it);
    }

    while (!pending.empty()) {
        const NodeId id = pending.back();
        pending.pop_back();
        out.push_back(id);

        const Slot& slot = m_slots[id];
        if (!slot.open || !slot.expanded) {
            continue;
        }
        for (auto it = slot.children.rbegin(); it != slot.children.rend(); ++it) {
            pending.push_back(*it);
        }
    }
}
