#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "history_config.hpp"
#include "history_node.hpp"
#include "operation.hpp"

namespace cadhistory {

/**
 * @brief Aggregate counters of a history tree.
 */
struct HistoryStats {
    /** @brief Operations accepted by add_operation over the tree's lifetime */
    std::size_t total_operations = 0;
    /** @brief Depth of the current node (0 when nothing is applied) */
    std::size_t current_depth = 0;
    /** @brief Number of named branches */
    std::size_t branch_count = 0;
    /** @brief Nodes removed by compression so far */
    std::size_t compression_savings = 0;
    /** @brief Timestamp of the most recently added operation */
    std::optional<Operation::Timestamp> last_operation_time;
};

/**
 * @brief Branching undo/redo history of a document.
 *
 * Every recorded edit becomes a node linked under the node that was current
 * when it was added, so making an edit after an undo forks the tree instead
 * of discarding the undone future. The undo and redo stacks are caches of
 * the root-to-current path and of the linear chain just undone; they are
 * patched by add_operation, undo and redo and rebuilt on every jump.
 *
 * A tree is owned by one editing session. It does no locking: const members
 * may run concurrently with each other, but not with mutations. Mutations
 * either complete with the tree consistent or throw before changing it.
 */
class HistoryTree {
  public:
    static constexpr std::size_t DEFAULT_MAX_NODES = 1000;

    /**
     * @brief Value form of a tree, used for persistence.
     *
     * The caches (undo stack, active flags, depth statistic) are not part of
     * it; restore() rebuilds them. The redo stack is not kept.
     */
    struct Snapshot {
        /** @brief All nodes, ordered by id */
        std::vector<HistoryNode> nodes;
        std::optional<OperationId> root;
        std::optional<OperationId> current;
        std::map<std::string, OperationId> branches;
        HistoryStats stats;
        std::size_t max_nodes = DEFAULT_MAX_NODES;
        bool auto_compress = true;
    };

    explicit HistoryTree(std::size_t max_nodes = DEFAULT_MAX_NODES);
    explicit HistoryTree(const HistoryConfig &config);

    /**
     * @brief Record a completed edit under the current node.
     *
     * Compresses first when the node count has reached max_nodes(). The new
     * node becomes current and the redo stack is cleared.
     * @param op Operation to record
     * @throws InvalidOperationError if the id is null or already recorded
     */
    void add_operation(Operation op);

    /**
     * @brief Step back to the parent of the current node.
     * @return The operation being undone, or std::nullopt if there is nothing
     * to undo or the current operation is not undoable
     */
    std::optional<Operation> undo();

    /**
     * @brief Re-apply the most recently undone operation.
     * @return The operation being redone, or std::nullopt if the redo stack is
     * empty
     */
    std::optional<Operation> redo();

    bool can_undo() const;
    bool can_redo() const { return !m_redo_stack.empty(); }

    /**
     * @brief Make any recorded node current.
     *
     * The undo stack is rebuilt from the root-to-target path and the redo
     * stack is cleared.
     * @return The operation now current
     * @throws NotFoundError if `id` is not in the tree
     */
    Operation goto_operation(OperationId id);

    /**
     * @brief Register a name for an existing node.
     * @throws NotFoundError if `from_operation` is not in the tree
     * @throws DuplicateBranchError if `name` is already registered
     */
    void create_branch(const std::string &name, OperationId from_operation);

    /**
     * @brief Jump to the node a branch name designates.
     * @return The operation now current
     * @throws UnknownBranchError if `name` is not registered
     */
    Operation switch_branch(const std::string &name);

    /**
     * @brief Explicit dependencies of every node plus its tree parent.
     */
    std::map<OperationId, std::vector<OperationId>> dependency_graph() const;

    /**
     * @brief Merge mergeable parent/child pairs until none are left.
     *
     * A child is folded into its parent only when the parent has no other
     * child and neither node is current or a branch target. The merged node
     * takes the new operation's id; the child's children move up to it.
     * @return Number of nodes removed
     */
    std::size_t compress_history();

    /**
     * @brief Change the node ceiling, compressing at once if it is exceeded.
     * @param n New ceiling (0 means 1)
     */
    void set_max_nodes(std::size_t n);

    /**
     * @brief Operations from the root to the current node, oldest first.
     */
    std::vector<const Operation *> current_operations() const;

    const Operation *find_operation(OperationId id) const;
    const HistoryNode *find_node(OperationId id) const;

    /**
     * @brief Indented dump of the whole tree.
     *
     * One line per node, "<indent><marker><id>: <description>". Nodes on the
     * root-to-current path are marked "* " and the current node ends with
     * " <- current".
     */
    std::string tree_string() const;

    /**
     * @brief Check every structural invariant.
     * @throws InvariantError describing the first violation found
     */
    void validate() const;

    Snapshot snapshot() const;

    /**
     * @brief Rebuild a tree from its value form.
     * @throws InvariantError if the snapshot does not describe a valid tree
     */
    static HistoryTree restore(Snapshot snapshot);

    const HistoryStats &stats() const noexcept { return m_stats; }
    const std::map<std::string, OperationId> &branches() const noexcept {
        return m_branches;
    }
    std::optional<OperationId> current_id() const noexcept { return m_current; }
    std::optional<OperationId> root_id() const noexcept { return m_root; }
    const std::vector<OperationId> &undo_stack() const noexcept {
        return m_undo_stack;
    }
    const std::vector<OperationId> &redo_stack() const noexcept {
        return m_redo_stack;
    }
    std::size_t size() const noexcept { return m_nodes.size(); }
    bool empty() const noexcept { return m_nodes.empty(); }
    std::size_t max_nodes() const noexcept { return m_max_nodes; }
    bool auto_compress() const noexcept { return m_auto_compress; }

  private:
    HistoryNode &node_at(OperationId id);
    const HistoryNode &node_at(OperationId id) const;

    void set_current(std::optional<OperationId> id);
    void rebuild_stacks(OperationId target);
    std::vector<OperationId> path_to(OperationId target) const;

    bool is_branch_target(OperationId id) const;
    bool can_compress(const HistoryNode &parent, const HistoryNode &child) const;
    void merge_into_parent(OperationId child_id, Operation merged);
    void shift_subtree_depth(OperationId id);

    void append_tree_string(const HistoryNode &node, std::string &out) const;

    /** @brief Runs validate() in debug builds */
    void check_consistency() const;

  private:
    std::map<OperationId, HistoryNode> m_nodes;
    std::optional<OperationId> m_current;
    std::optional<OperationId> m_root;
    std::vector<OperationId> m_undo_stack;
    std::vector<OperationId> m_redo_stack;
    std::map<std::string, OperationId> m_branches;
    HistoryStats m_stats;
    std::size_t m_max_nodes = DEFAULT_MAX_NODES;
    bool m_auto_compress = true;
};

} // namespace cadhistory
