#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../document/types.hpp"

namespace cadhistory {

class Operation;

// Each payload keeps what the edit changed from, so the editor can undo it
// without recomputing anything. `kind_name` is stable: it is written to saved
// histories.

struct CreateEntity {
    static constexpr const char *kind_name = "CreateEntity";
    Entity entity;
};

struct DeleteEntity {
    static constexpr const char *kind_name = "DeleteEntity";
    EntityId entity_id = 0;
    std::optional<Entity> previous_entity;
};

struct ModifyEntity {
    static constexpr const char *kind_name = "ModifyEntity";
    EntityId entity_id = 0;
    Geometry previous_geometry;
    Geometry new_geometry;
};

struct MoveEntities {
    static constexpr const char *kind_name = "MoveEntities";
    std::vector<EntityId> entity_ids;
    Vector2 offset;
    std::vector<Point2> previous_positions;
};

struct RotateEntities {
    static constexpr const char *kind_name = "RotateEntities";
    std::vector<EntityId> entity_ids;
    Point2 center;
    double angle = 0.0;
    std::vector<double> previous_angles;
};

struct ScaleEntities {
    static constexpr const char *kind_name = "ScaleEntities";
    std::vector<EntityId> entity_ids;
    Point2 center;
    double scale = 1.0;
    std::vector<double> previous_scales;
};

struct BooleanOperation {
    static constexpr const char *kind_name = "BooleanOperation";
    BooleanOp op = BooleanOp::Union;
    EntityId entity1 = 0;
    EntityId entity2 = 0;
    std::vector<Entity> result_entities;
    std::vector<Entity> previous_entities;
};

struct AddConstraint {
    static constexpr const char *kind_name = "AddConstraint";
    Constraint constraint;
};

struct RemoveConstraint {
    static constexpr const char *kind_name = "RemoveConstraint";
    ConstraintId constraint_id = 0;
    std::optional<Constraint> previous_constraint;
};

struct ModifyVariable {
    static constexpr const char *kind_name = "ModifyVariable";
    VariableId variable_id = 0;
    double previous_value = 0.0;
    double new_value = 0.0;
};

/**
 * @brief Several sub-operations recorded as a single undo step.
 */
struct GroupOperation {
    static constexpr const char *kind_name = "GroupOperation";
    std::string name;
    std::vector<Operation> operations;
};

/**
 * @brief Edit kind defined outside the engine, with an opaque payload.
 */
struct Custom {
    static constexpr const char *kind_name = "Custom";
    std::string name;
    std::vector<std::uint8_t> data;
};

using OperationType =
    std::variant<CreateEntity, DeleteEntity, ModifyEntity, MoveEntities,
                 RotateEntities, ScaleEntities, BooleanOperation,
                 AddConstraint, RemoveConstraint, ModifyVariable,
                 GroupOperation, Custom>;

/**
 * @brief Stable name of the alternative held by `type`.
 */
const char *kind_name(const OperationType &type);

} // namespace cadhistory
