#pragma once

#include <optional>

#include "operation.hpp"

namespace cadhistory {

/**
 * @brief Check if `later` can be folded into `earlier`.
 *
 * Two moves of the same entity set, or two changes of the same variable,
 * are mergeable. Every other pair, including mixed kinds, is not.
 * @param earlier Operation applied first (the parent in the tree)
 * @param later Operation applied right after it (the child)
 */
bool can_merge(const Operation &earlier, const Operation &later);

/**
 * @brief Fold two consecutive operations into one new operation.
 *
 * The result has a fresh id, the later description and timestamp, and the
 * union of both dependency and affected-entity lists.
 * @return The merged operation, or std::nullopt if the pair is not mergeable
 */
std::optional<Operation> merge_operations(const Operation &earlier,
                                          const Operation &later);

} // namespace cadhistory
