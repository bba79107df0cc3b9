#include "history_tree.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "operation_merge.hpp"

namespace cadhistory {

HistoryTree::HistoryTree(std::size_t max_nodes)
    : m_max_nodes(max_nodes == 0 ? 1 : max_nodes) {}

HistoryTree::HistoryTree(const HistoryConfig &config)
    : m_max_nodes(config.max_nodes == 0 ? 1 : config.max_nodes),
      m_auto_compress(config.auto_compress) {}

void HistoryTree::add_operation(Operation op) {
    const OperationId id = op.id();
    if (id.is_null()) {
        throw InvalidOperationError("operation has the null id");
    }
    if (m_nodes.contains(id)) {
        throw InvalidOperationError(
            fmt::format("operation {} is already recorded", id));
    }

    if (m_auto_compress && m_nodes.size() >= m_max_nodes) {
        compress_history();
        if (m_nodes.size() >= m_max_nodes) {
            LOG_WARN("History holds {} nodes after compression (limit {})",
                     m_nodes.size(), m_max_nodes);
        }
    }

    const std::optional<OperationId> parent = m_current;
    const std::size_t depth = parent ? node_at(*parent).depth + 1 : 0;
    const Operation::Timestamp timestamp = op.timestamp();

    LOG_DEBUG("Recording {} {} at depth {}", op.kind_name(), id, depth);
    m_nodes.emplace(id, HistoryNode(std::move(op), parent, depth));

    if (parent) {
        node_at(*parent).children.push_back(id);
    } else if (!m_root) {
        m_root = id;
    } else {
        // Everything was undone; the edit starts another top-level timeline.
        LOG_DEBUG("Operation {} starts a new top-level timeline", id);
    }

    set_current(id);
    m_undo_stack.push_back(id);
    m_redo_stack.clear();

    ++m_stats.total_operations;
    m_stats.last_operation_time = timestamp;

    check_consistency();
}

bool HistoryTree::can_undo() const {
    return m_current && !m_undo_stack.empty() &&
           node_at(m_undo_stack.back()).operation.undoable();
}

std::optional<Operation> HistoryTree::undo() {
    if (!m_current || m_undo_stack.empty())
        return std::nullopt;

    const OperationId id = m_undo_stack.back();
    const HistoryNode &node = node_at(id);
    if (!node.operation.undoable()) {
        LOG_DEBUG("Operation {} is not undoable", id);
        return std::nullopt;
    }

    m_undo_stack.pop_back();
    m_redo_stack.push_back(id);
    set_current(node.parent);

    check_consistency();
    return node.operation;
}

std::optional<Operation> HistoryTree::redo() {
    if (m_redo_stack.empty())
        return std::nullopt;

    const OperationId id = m_redo_stack.back();
    m_redo_stack.pop_back();
    m_undo_stack.push_back(id);
    set_current(id);

    check_consistency();
    return node_at(id).operation;
}

Operation HistoryTree::goto_operation(OperationId id) {
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        throw NotFoundError(id.value);
    }

    rebuild_stacks(id);
    set_current(id);

    check_consistency();
    return it->second.operation;
}

void HistoryTree::create_branch(const std::string &name,
                                OperationId from_operation) {
    if (!m_nodes.contains(from_operation)) {
        throw NotFoundError(from_operation.value);
    }
    if (m_branches.contains(name)) {
        throw DuplicateBranchError(name);
    }

    m_branches.emplace(name, from_operation);
    m_stats.branch_count = m_branches.size();
    LOG_DEBUG("Branch '{}' created at {}", name, from_operation);
}

Operation HistoryTree::switch_branch(const std::string &name) {
    auto it = m_branches.find(name);
    if (it == m_branches.end()) {
        throw UnknownBranchError(name);
    }
    LOG_DEBUG("Switching to branch '{}'", name);
    return goto_operation(it->second);
}

std::map<OperationId, std::vector<OperationId>>
HistoryTree::dependency_graph() const {
    std::map<OperationId, std::vector<OperationId>> graph;

    for (const auto &[id, node] : m_nodes) {
        std::vector<OperationId> edges;
        for (OperationId dependency : node.operation.dependencies()) {
            if (std::find(edges.begin(), edges.end(), dependency) ==
                edges.end())
                edges.push_back(dependency);
        }
        if (node.parent && std::find(edges.begin(), edges.end(),
                                     *node.parent) == edges.end())
            edges.push_back(*node.parent);
        graph.emplace(id, std::move(edges));
    }

    return graph;
}

std::size_t HistoryTree::compress_history() {
    std::size_t removed = 0;
    bool merged_any = true;

    while (merged_any) {
        merged_any = false;

        std::vector<OperationId> candidates;
        candidates.reserve(m_nodes.size());
        for (const auto &[id, node] : m_nodes) {
            if (node.parent)
                candidates.push_back(id);
        }

        for (OperationId child_id : candidates) {
            // Earlier merges in this pass may have removed or re-keyed it.
            const HistoryNode *child = find_node(child_id);
            if (!child || !child->parent)
                continue;
            const HistoryNode &parent = node_at(*child->parent);
            if (!can_compress(parent, *child))
                continue;

            auto merged = merge_operations(parent.operation, child->operation);
            if (!merged)
                continue;

            merge_into_parent(child_id, std::move(*merged));
            ++removed;
            merged_any = true;
        }
    }

    if (removed > 0) {
        m_stats.compression_savings += removed;
        m_stats.current_depth = m_current ? node_at(*m_current).depth : 0;
        LOG_INFO("History compression removed {} nodes ({} remain)", removed,
                 m_nodes.size());
    }

    check_consistency();
    return removed;
}

void HistoryTree::set_max_nodes(std::size_t n) {
    m_max_nodes = (n == 0 ? 1 : n);
    if (m_auto_compress && m_nodes.size() > m_max_nodes)
        compress_history();
}

std::vector<const Operation *> HistoryTree::current_operations() const {
    std::vector<const Operation *> operations;
    if (!m_current)
        return operations;

    for (OperationId id : path_to(*m_current))
        operations.push_back(&node_at(id).operation);
    return operations;
}

const Operation *HistoryTree::find_operation(OperationId id) const {
    const HistoryNode *node = find_node(id);
    return node ? &node->operation : nullptr;
}

const HistoryNode *HistoryTree::find_node(OperationId id) const {
    auto it = m_nodes.find(id);
    return it == m_nodes.end() ? nullptr : &it->second;
}

std::string HistoryTree::tree_string() const {
    std::string out;
    for (const auto &[id, node] : m_nodes) {
        if (!node.parent)
            append_tree_string(node, out);
    }
    return out;
}

void HistoryTree::append_tree_string(const HistoryNode &node,
                                     std::string &out) const {
    const bool on_path = std::find(m_undo_stack.begin(), m_undo_stack.end(),
                                   node.id()) != m_undo_stack.end();
    out += fmt::format("{:{}}{}{}: {}{}\n", "", node.depth * 2,
                       on_path ? "* " : "  ", node.id().value,
                       node.operation.description(),
                       node.is_active ? " <- current" : "");

    for (OperationId child : node.children)
        append_tree_string(node_at(child), out);
}

void HistoryTree::validate() const {
    if (m_nodes.empty()) {
        if (m_current || m_root || !m_undo_stack.empty() ||
            !m_redo_stack.empty() || !m_branches.empty())
            throw InvariantError("empty tree has a position or branches");
        return;
    }

    if (!m_root || !m_nodes.contains(*m_root))
        throw InvariantError("root is missing");
    if (node_at(*m_root).parent)
        throw InvariantError(fmt::format("root {} has a parent", *m_root));

    std::size_t active = 0;
    for (const auto &[id, node] : m_nodes) {
        if (id.is_null() || id != node.id())
            throw InvariantError(
                fmt::format("node key {} holds operation {}", id, node.id()));

        if (node.parent) {
            auto parent = m_nodes.find(*node.parent);
            if (parent == m_nodes.end())
                throw InvariantError(fmt::format("{} has missing parent {}",
                                                 id, *node.parent));
            const auto &siblings = parent->second.children;
            if (std::count(siblings.begin(), siblings.end(), id) != 1)
                throw InvariantError(fmt::format(
                    "{} is not listed once under its parent {}", id,
                    *node.parent));
            if (node.depth != parent->second.depth + 1)
                throw InvariantError(
                    fmt::format("{} has depth {}, expected {}", id, node.depth,
                                parent->second.depth + 1));
        } else if (node.depth != 0) {
            throw InvariantError(
                fmt::format("top-level node {} has depth {}", id, node.depth));
        }

        for (OperationId child : node.children) {
            const HistoryNode *child_node = find_node(child);
            if (!child_node || child_node->parent != id)
                throw InvariantError(
                    fmt::format("{} lists {} as a child", id, child));
        }

        if (node.is_active) {
            ++active;
            if (m_current != id)
                throw InvariantError(
                    fmt::format("{} is active but not current", id));
        }
    }

    if (m_current) {
        if (!m_nodes.contains(*m_current))
            throw InvariantError(
                fmt::format("current node {} is missing", *m_current));
        if (active != 1)
            throw InvariantError("current node is not the single active node");
        if (m_undo_stack != path_to(*m_current))
            throw InvariantError("undo stack is not the path to current");
    } else if (active != 0 || !m_undo_stack.empty()) {
        throw InvariantError("no current node but active path state remains");
    }

    // The redo stack is the undone chain: its top hangs off the current
    // node and each entry is the parent of the one below it.
    std::optional<OperationId> expected_parent = m_current;
    for (auto it = m_redo_stack.rbegin(); it != m_redo_stack.rend(); ++it) {
        const HistoryNode *node = find_node(*it);
        if (!node || node->parent != expected_parent)
            throw InvariantError(
                fmt::format("redo entry {} does not continue the chain", *it));
        expected_parent = *it;
    }

    for (const auto &[name, target] : m_branches) {
        if (!m_nodes.contains(target))
            throw InvariantError(fmt::format(
                "branch '{}' points at missing node {}", name, target));
    }
}

HistoryTree::Snapshot HistoryTree::snapshot() const {
    Snapshot snapshot;
    snapshot.nodes.reserve(m_nodes.size());
    for (const auto &[id, node] : m_nodes)
        snapshot.nodes.push_back(node);
    snapshot.root = m_root;
    snapshot.current = m_current;
    snapshot.branches = m_branches;
    snapshot.stats = m_stats;
    snapshot.max_nodes = m_max_nodes;
    snapshot.auto_compress = m_auto_compress;
    return snapshot;
}

HistoryTree HistoryTree::restore(Snapshot snapshot) {
    HistoryTree tree(snapshot.max_nodes);
    tree.m_auto_compress = snapshot.auto_compress;

    for (HistoryNode &node : snapshot.nodes) {
        const OperationId id = node.id();
        node.is_active = false;
        if (!tree.m_nodes.emplace(id, std::move(node)).second)
            throw InvariantError(fmt::format("duplicate node {}", id));
    }

    tree.m_root = snapshot.root;
    tree.m_branches = std::move(snapshot.branches);
    tree.m_stats = snapshot.stats;
    tree.m_stats.branch_count = tree.m_branches.size();

    if (snapshot.current) {
        auto it = tree.m_nodes.find(*snapshot.current);
        if (it == tree.m_nodes.end())
            throw InvariantError(
                fmt::format("current node {} is missing", *snapshot.current));
        it->second.is_active = true;
        tree.m_current = snapshot.current;
        tree.m_stats.current_depth = it->second.depth;
        tree.rebuild_stacks(*snapshot.current);
    } else {
        tree.m_stats.current_depth = 0;
    }

    tree.validate();
    return tree;
}

HistoryNode &HistoryTree::node_at(OperationId id) {
    auto it = m_nodes.find(id);
    if (it == m_nodes.end())
        throw InvariantError(fmt::format("dangling reference to {}", id));
    return it->second;
}

const HistoryNode &HistoryTree::node_at(OperationId id) const {
    auto it = m_nodes.find(id);
    if (it == m_nodes.end())
        throw InvariantError(fmt::format("dangling reference to {}", id));
    return it->second;
}

void HistoryTree::set_current(std::optional<OperationId> id) {
    if (m_current) {
        if (auto it = m_nodes.find(*m_current); it != m_nodes.end())
            it->second.is_active = false;
    }

    m_current = id;
    m_stats.current_depth = 0;

    if (m_current) {
        HistoryNode &node = node_at(*m_current);
        node.is_active = true;
        m_stats.current_depth = node.depth;
    }
}

void HistoryTree::rebuild_stacks(OperationId target) {
    m_undo_stack = path_to(target);
    m_redo_stack.clear();
}

std::vector<OperationId> HistoryTree::path_to(OperationId target) const {
    std::vector<OperationId> path;
    std::optional<OperationId> cursor = target;
    while (cursor) {
        const HistoryNode &node = node_at(*cursor);
        path.push_back(*cursor);
        if (path.size() > m_nodes.size())
            throw InvariantError(fmt::format("cycle above {}", target));
        cursor = node.parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

bool HistoryTree::is_branch_target(OperationId id) const {
    return std::any_of(m_branches.begin(), m_branches.end(),
                       [id](const auto &entry) { return entry.second == id; });
}

bool HistoryTree::can_compress(const HistoryNode &parent,
                               const HistoryNode &child) const {
    if (parent.children.size() != 1)
        return false;
    if (m_current == parent.id() || m_current == child.id())
        return false;
    if (is_branch_target(parent.id()) || is_branch_target(child.id()))
        return false;
    return can_merge(parent.operation, child.operation);
}

void HistoryTree::merge_into_parent(OperationId child_id, Operation merged) {
    auto child_handle = m_nodes.extract(child_id);
    HistoryNode &child = child_handle.mapped();
    const OperationId parent_id = *child.parent;
    const OperationId merged_id = merged.id();

    LOG_DEBUG("Merging {} into {} as {}", child_id, parent_id, merged_id);

    auto parent_handle = m_nodes.extract(parent_id);
    parent_handle.mapped().operation = std::move(merged);
    parent_handle.mapped().children = std::move(child.children);
    parent_handle.key() = merged_id;
    const std::optional<OperationId> grandparent =
        parent_handle.mapped().parent;
    m_nodes.insert(std::move(parent_handle));

    HistoryNode &node = node_at(merged_id);
    for (OperationId grandchild : node.children) {
        node_at(grandchild).parent = merged_id;
        shift_subtree_depth(grandchild);
    }

    if (grandparent) {
        auto &siblings = node_at(*grandparent).children;
        std::replace(siblings.begin(), siblings.end(), parent_id, merged_id);
    }
    if (m_root == parent_id)
        m_root = merged_id;

    for (auto *stack : {&m_undo_stack, &m_redo_stack}) {
        std::erase(*stack, child_id);
        std::replace(stack->begin(), stack->end(), parent_id, merged_id);
    }
}

void HistoryTree::shift_subtree_depth(OperationId id) {
    std::vector<OperationId> pending{id};
    while (!pending.empty()) {
        HistoryNode &node = node_at(pending.back());
        pending.pop_back();
        --node.depth;
        pending.insert(pending.end(), node.children.begin(),
                       node.children.end());
    }
}

void HistoryTree::check_consistency() const {
#ifndef NDEBUG
    validate();
#endif
}

} // namespace cadhistory
