#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "history/operation.hpp"
#include "history/operation_id.hpp"
#include "history/operations.hpp"

using namespace cadhistory;

namespace {
Entity make_line(EntityId id) {
    return Entity{id, 0, Geometry{"line", {0.0, 0.0, 10.0, 10.0}}};
}
} // namespace

TEST_CASE("OperationId - null sentinel and ordering", "[operation_id]") {
    REQUIRE(OperationId::null().is_null());
    REQUIRE_FALSE(OperationId{1}.is_null());
    REQUIRE(OperationId{1} < OperationId{2});
    REQUIRE(OperationId{7} == OperationId{7});
}

TEST_CASE("OperationIdGenerator - fresh ids", "[operation_id]") {
    OperationIdGenerator ids;

    SECTION("Ids start at one and increase") {
        REQUIRE(ids.next() == OperationId{1});
        REQUIRE(ids.next() == OperationId{2});
        REQUIRE(ids.peek() == 3);
    }

    SECTION("Reset restarts the counter") {
        ids.next();
        ids.next();
        ids.reset();
        REQUIRE(ids.next() == OperationId{1});

        ids.reset(0); // 0 is the null id and is never handed out
        REQUIRE(ids.next() == OperationId{1});
    }

    SECTION("advance_past never moves backwards") {
        ids.advance_past(OperationId{41});
        REQUIRE(ids.next() == OperationId{42});

        ids.advance_past(OperationId{10});
        REQUIRE(ids.next() == OperationId{43});
    }
}

TEST_CASE("ScopedIdGenerator - redirects the current thread only",
          "[operation_id]") {
    OperationIdGenerator outer(100);
    OperationIdGenerator inner(500);

    {
        ScopedIdGenerator outer_scope(outer);
        REQUIRE(&OperationIdGenerator::current() == &outer);

        {
            ScopedIdGenerator inner_scope(inner);
            REQUIRE(operations::custom("x", {}, "x").id() == OperationId{500});
        }

        REQUIRE(&OperationIdGenerator::current() == &outer);
        REQUIRE(operations::custom("y", {}, "y").id() == OperationId{100});

        OperationIdGenerator *seen_on_other_thread = nullptr;
        std::thread other(
            [&] { seen_on_other_thread = &OperationIdGenerator::current(); });
        other.join();
        REQUIRE(seen_on_other_thread == &OperationIdGenerator::global());
    }

    REQUIRE(&OperationIdGenerator::current() == &OperationIdGenerator::global());
}

TEST_CASE("Operation - construction", "[operation]") {
    OperationIdGenerator ids;
    ScopedIdGenerator scope(ids);

    SECTION("Fresh id, timestamp and defaults") {
        const auto before = Operation::Clock::now();
        Operation op = operations::create_entity(make_line(5), "Create line");
        const auto after = Operation::Clock::now();

        REQUIRE(op.id() == OperationId{1});
        REQUIRE(op.description() == "Create line");
        REQUIRE(op.undoable());
        REQUIRE(op.dependencies().empty());
        REQUIRE(op.affected_entities().empty());
        REQUIRE(op.timestamp() >= before);
        REQUIRE(op.timestamp() <= after);
        REQUIRE(std::string(op.kind_name()) == "CreateEntity");

        REQUIRE(op.is<CreateEntity>());
        REQUIRE(op.payload_if<CreateEntity>()->entity == make_line(5));
        REQUIRE(op.payload_if<MoveEntities>() == nullptr);
    }

    SECTION("Builder calls keep the id") {
        Operation op =
            operations::move_entities({1, 2}, {3.0, 0.0}, {{0, 0}, {1, 1}},
                                      "Move")
                .with_dependencies({OperationId{9}})
                .with_affected_entities({1, 2})
                .with_undoable(false);

        REQUIRE(op.id() == OperationId{1});
        REQUIRE(op.dependencies() == std::vector<OperationId>{OperationId{9}});
        REQUIRE(op.affected_entities() == std::vector<EntityId>{1, 2});
        REQUIRE_FALSE(op.undoable());
    }

    SECTION("Every constructor produces its kind") {
        std::vector<Operation> ops;
        ops.push_back(operations::create_entity(make_line(1), "a"));
        ops.push_back(operations::delete_entity(1, make_line(1), "b"));
        ops.push_back(operations::modify_entity(
            1, Geometry{"line", {0, 0, 1, 1}}, Geometry{"line", {0, 0, 2, 2}},
            "c"));
        ops.push_back(operations::move_entities({1}, {1, 1}, {{0, 0}}, "d"));
        ops.push_back(
            operations::rotate_entities({1}, {0, 0}, 1.57, {0.0}, "e"));
        ops.push_back(operations::scale_entities({1}, {0, 0}, 2.0, {1.0}, "f"));
        ops.push_back(operations::boolean_operation(
            BooleanOp::Difference, 1, 2, {make_line(3)},
            {make_line(1), make_line(2)}, "g"));
        ops.push_back(operations::add_constraint(
            Constraint{4, "parallel", {1, 2}, 0.0}, "h"));
        ops.push_back(operations::remove_constraint(4, std::nullopt, "i"));
        ops.push_back(operations::modify_variable(8, 1.0, 2.0, "j"));
        ops.push_back(operations::group_operation("k", {}, "k"));
        ops.push_back(operations::custom("plugin.tag", {1, 2, 3}, "l"));

        const std::vector<std::string> expected = {
            "CreateEntity",   "DeleteEntity",     "ModifyEntity",
            "MoveEntities",   "RotateEntities",   "ScaleEntities",
            "BooleanOperation", "AddConstraint",  "RemoveConstraint",
            "ModifyVariable", "GroupOperation",   "Custom"};

        REQUIRE(ops.size() == expected.size());
        for (size_t i = 0; i < ops.size(); ++i) {
            REQUIRE(ops[i].kind_name() == expected[i]);
            REQUIRE(ops[i].id() == OperationId{i + 1});
        }

        auto *rotate = ops[4].payload_if<RotateEntities>();
        REQUIRE(rotate != nullptr);
        REQUIRE(rotate->angle == Catch::Approx(1.57));

        auto *boolean = ops[6].payload_if<BooleanOperation>();
        REQUIRE(boolean->op == BooleanOp::Difference);
        REQUIRE(boolean->previous_entities.size() == 2);

        auto *variable = ops[9].payload_if<ModifyVariable>();
        REQUIRE(variable->previous_value == Catch::Approx(1.0));
        REQUIRE(variable->new_value == Catch::Approx(2.0));
    }

    SECTION("Group operation nests whole operations") {
        Operation first = operations::create_entity(make_line(1), "Line 1");
        Operation second = operations::create_entity(make_line(2), "Line 2");
        Operation group = operations::group_operation(
            "Paste", {first, second}, "Paste 2 entities");

        auto *payload = group.payload_if<GroupOperation>();
        REQUIRE(payload != nullptr);
        REQUIRE(payload->name == "Paste");
        REQUIRE(payload->operations.size() == 2);
        REQUIRE(payload->operations[0].id() == first.id());
        REQUIRE(payload->operations[1].description() == "Line 2");
        REQUIRE(group.id() > second.id());

        Operation copy = group;
        REQUIRE(copy.payload_if<GroupOperation>()->operations.size() == 2);
    }
}
