#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "history/history_tree.hpp"
#include "history/operations.hpp"
#include "utility/exceptions.hpp"

using namespace cadhistory;

namespace {

Operation create_line(EntityId id, const std::string &description) {
    return operations::create_entity(
        Entity{id, 0, Geometry{"line", {0.0, 0.0, 10.0, 10.0}}}, description);
}

std::vector<OperationId> ids_of(const std::vector<const Operation *> &ops) {
    std::vector<OperationId> ids;
    for (const Operation *op : ops)
        ids.push_back(op->id());
    return ids;
}

} // namespace

TEST_CASE("HistoryTree - Basic operations", "[history_tree]") {
    OperationIdGenerator ids;
    ScopedIdGenerator scope(ids);
    HistoryTree tree;

    SECTION("Empty tree state") {
        REQUIRE(tree.empty());
        REQUIRE_FALSE(tree.current_id().has_value());
        REQUIRE_FALSE(tree.root_id().has_value());
        REQUIRE_FALSE(tree.can_undo());
        REQUIRE_FALSE(tree.can_redo());
        REQUIRE(tree.current_operations().empty());
        REQUIRE(tree.tree_string().empty());
        REQUIRE_NOTHROW(tree.validate());
    }

    SECTION("Undo and redo on an empty tree return nothing") {
        REQUIRE_FALSE(tree.undo().has_value());
        REQUIRE_FALSE(tree.redo().has_value());
        REQUIRE(tree.empty());
    }

    SECTION("First operation becomes the root") {
        Operation op = create_line(1, "Create line");
        const OperationId id = op.id();
        tree.add_operation(op);

        REQUIRE(tree.size() == 1);
        REQUIRE(tree.root_id() == id);
        REQUIRE(tree.current_id() == id);
        REQUIRE(tree.find_node(id)->depth == 0);
        REQUIRE(tree.find_node(id)->is_active);
        REQUIRE_FALSE(tree.find_node(id)->parent.has_value());
        REQUIRE(tree.stats().total_operations == 1);
        REQUIRE(tree.stats().last_operation_time == op.timestamp());
    }

    SECTION("Linear chain depth accounting") {
        std::vector<OperationId> added;
        for (EntityId e = 1; e <= 5; ++e) {
            Operation op = create_line(e, "Line " + std::to_string(e));
            added.push_back(op.id());
            tree.add_operation(std::move(op));
        }

        REQUIRE(tree.find_node(added[4])->depth == 4);
        REQUIRE(tree.stats().current_depth == 4);
        REQUIRE(tree.undo_stack() == added);
        REQUIRE(ids_of(tree.current_operations()) == added);

        for (size_t i = 0; i + 1 < added.size(); ++i) {
            REQUIRE(tree.find_node(added[i])->children ==
                    std::vector<OperationId>{added[i + 1]});
            REQUIRE_FALSE(tree.find_node(added[i])->is_active);
        }
    }

    SECTION("Recording the same operation twice is rejected") {
        Operation op = create_line(1, "Create line");
        tree.add_operation(op);
        REQUIRE_THROWS_AS(tree.add_operation(op), InvalidOperationError);
        REQUIRE(tree.size() == 1);

        Operation null_op(OperationId::null(), CreateEntity{},
                          Operation::Clock::now(), "null");
        REQUIRE_THROWS_AS(tree.add_operation(null_op), InvalidOperationError);
        REQUIRE(tree.size() == 1);
    }
}

TEST_CASE("HistoryTree - Undo and redo", "[history_tree]") {
    OperationIdGenerator ids;
    ScopedIdGenerator scope(ids);
    HistoryTree tree;

    SECTION("N undos empty the path and N redos restore it") {
        std::vector<OperationId> added;
        for (EntityId e = 1; e <= 6; ++e) {
            Operation op = create_line(e, "Line");
            added.push_back(op.id());
            tree.add_operation(std::move(op));
        }

        for (size_t i = added.size(); i > 0; --i) {
            auto undone = tree.undo();
            REQUIRE(undone.has_value());
            REQUIRE(undone->id() == added[i - 1]);
        }
        REQUIRE(tree.current_operations().empty());
        REQUIRE_FALSE(tree.current_id().has_value());
        REQUIRE(tree.stats().current_depth == 0);
        REQUIRE_FALSE(tree.undo().has_value());
        REQUIRE_NOTHROW(tree.validate());

        for (size_t i = 0; i < added.size(); ++i) {
            auto redone = tree.redo();
            REQUIRE(redone.has_value());
            REQUIRE(redone->id() == added[i]);
        }
        REQUIRE(ids_of(tree.current_operations()) == added);
        REQUIRE_FALSE(tree.redo().has_value());
        REQUIRE(tree.size() == added.size());
    }

    SECTION("A new edit clears the redo stack") {
        Operation a = create_line(1, "A");
        Operation b = create_line(2, "B");
        Operation c = create_line(3, "C");
        tree.add_operation(a);
        tree.add_operation(b);

        auto undone = tree.undo();
        REQUIRE(undone->id() == b.id());
        REQUIRE(tree.current_id() == a.id());
        REQUIRE(tree.redo_stack() == std::vector<OperationId>{b.id()});

        tree.add_operation(c);
        REQUIRE_FALSE(tree.can_redo());
        REQUIRE_FALSE(tree.redo().has_value());

        // B is still recorded; A is now a branch point.
        REQUIRE(tree.find_node(b.id()) != nullptr);
        REQUIRE(tree.find_node(a.id())->children ==
                std::vector<OperationId>{b.id(), c.id()});
        REQUIRE(tree.find_node(c.id())->depth == 1);
    }

    SECTION("Non-undoable operations stop undo") {
        Operation a = create_line(1, "A");
        Operation import =
            operations::custom("import", {0x1, 0x2}, "Import DXF")
                .with_undoable(false);
        Operation b = create_line(2, "B");
        tree.add_operation(a);
        tree.add_operation(import);
        tree.add_operation(b);

        REQUIRE(tree.undo()->id() == b.id());
        REQUIRE_FALSE(tree.can_undo());
        REQUIRE_FALSE(tree.undo().has_value());
        REQUIRE(tree.current_id() == import.id());
        REQUIRE(tree.redo_stack() == std::vector<OperationId>{b.id()});
    }

    SECTION("Editing after undoing everything starts a new top-level timeline") {
        Operation a = create_line(1, "A");
        Operation b = create_line(2, "B");
        tree.add_operation(a);
        tree.undo();
        tree.add_operation(b);

        REQUIRE(tree.root_id() == a.id());
        REQUIRE(tree.current_id() == b.id());
        REQUIRE_FALSE(tree.find_node(b.id())->parent.has_value());
        REQUIRE(tree.find_node(b.id())->depth == 0);
        REQUIRE(ids_of(tree.current_operations()) ==
                std::vector<OperationId>{b.id()});
        REQUIRE_NOTHROW(tree.validate());

        REQUIRE(tree.goto_operation(a.id()).id() == a.id());
        REQUIRE(tree.undo_stack() == std::vector<OperationId>{a.id()});
    }
}

TEST_CASE("HistoryTree - goto_operation", "[history_tree]") {
    OperationIdGenerator ids;
    ScopedIdGenerator scope(ids);
    HistoryTree tree;

    // root -> a -> b, and root -> c after undoing twice
    Operation root = create_line(1, "root");
    Operation a = create_line(2, "a");
    Operation b = create_line(3, "b");
    Operation c = create_line(4, "c");
    tree.add_operation(root);
    tree.add_operation(a);
    tree.add_operation(b);
    tree.undo();
    tree.undo();
    tree.add_operation(c);

    SECTION("Jumping across branches rebuilds the path") {
        Operation target = tree.goto_operation(b.id());
        REQUIRE(target.id() == b.id());
        REQUIRE(ids_of(tree.current_operations()) ==
                std::vector<OperationId>{root.id(), a.id(), b.id()});
        REQUIRE(tree.undo_stack() ==
                std::vector<OperationId>{root.id(), a.id(), b.id()});
        REQUIRE(tree.find_node(b.id())->is_active);
        REQUIRE_FALSE(tree.find_node(c.id())->is_active);
        REQUIRE(tree.stats().current_depth == 2);
    }

    SECTION("Jumping discards the cached redo chain") {
        tree.goto_operation(b.id());
        tree.undo();
        REQUIRE(tree.can_redo());

        tree.goto_operation(c.id());
        REQUIRE_FALSE(tree.can_redo());
        REQUIRE(ids_of(tree.current_operations()) ==
                std::vector<OperationId>{root.id(), c.id()});

        REQUIRE(tree.undo()->id() == c.id());
        REQUIRE(tree.undo()->id() == root.id());
        REQUIRE_FALSE(tree.undo().has_value());
    }

    SECTION("Unknown id fails and leaves the state unchanged") {
        const auto undo_before = tree.undo_stack();
        REQUIRE_THROWS_AS(tree.goto_operation(OperationId{999}),
                          NotFoundError);
        REQUIRE(tree.current_id() == c.id());
        REQUIRE(tree.undo_stack() == undo_before);
    }
}

TEST_CASE("HistoryTree - dependency graph", "[history_tree]") {
    OperationIdGenerator ids;
    ScopedIdGenerator scope(ids);
    HistoryTree tree;

    Operation base = create_line(1, "Base");
    Operation constraint =
        operations::add_constraint(Constraint{1, "horizontal", {1}, 0.0},
                                   "Horizontal")
            .with_dependencies({base.id()});
    Operation offset = create_line(2, "Offset copy")
                           .with_dependencies({base.id(), OperationId{77}});
    tree.add_operation(base);
    tree.add_operation(constraint);
    tree.add_operation(offset);

    auto graph = tree.dependency_graph();
    REQUIRE(graph.size() == 3);
    REQUIRE(graph[base.id()].empty());
    // Explicit dependency equal to the parent appears once.
    REQUIRE(graph[constraint.id()] == std::vector<OperationId>{base.id()});
    REQUIRE(graph[offset.id()] ==
            std::vector<OperationId>{base.id(), OperationId{77},
                                     constraint.id()});
}

TEST_CASE("HistoryTree - tree_string", "[history_tree]") {
    OperationIdGenerator ids;
    ScopedIdGenerator scope(ids);
    HistoryTree tree;

    tree.add_operation(create_line(1, "Create line"));
    tree.add_operation(
        operations::move_entities({1}, {5, 0}, {{0, 0}}, "Move line"));
    tree.undo();
    tree.add_operation(operations::delete_entity(1, std::nullopt, "Delete line"));

    REQUIRE(tree.tree_string() == "* 1: Create line\n"
                                  "    2: Move line\n"
                                  "  * 3: Delete line <- current\n");
}
