#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "operation.hpp"

namespace cadhistory {

/**
 * @brief One operation plus its position in the history tree.
 *
 * Links are ids into the tree's node map, never pointers. A node with more
 * than one child is a branch point.
 */
struct HistoryNode {
    HistoryNode(Operation op, std::optional<OperationId> parent_id,
                std::size_t node_depth)
        : operation(std::move(op)), parent(parent_id), depth(node_depth) {}

    OperationId id() const noexcept { return operation.id(); }

    /** @brief The recorded edit */
    Operation operation;
    /** @brief Parent node, empty for a top-level node */
    std::optional<OperationId> parent;
    /** @brief Children in insertion order */
    std::vector<OperationId> children;
    /** @brief Distance from the top-level node (0 for the root) */
    std::size_t depth = 0;
    /** @brief Set only on the tree's current node */
    bool is_active = false;
};

} // namespace cadhistory
