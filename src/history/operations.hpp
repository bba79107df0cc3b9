#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "operation.hpp"

/**
 * @brief One constructor per edit kind.
 *
 * Every constructor takes its id from OperationIdGenerator::current() and
 * stamps the current time. Dependencies, affected entities and the undoable
 * flag are set afterwards with the Operation `with_*` calls:
 *
 *     auto op = operations::move_entities({7}, {3, 0}, {}, "Nudge right")
 *                   .with_affected_entities({7});
 */
namespace cadhistory::operations {

Operation create_entity(Entity entity, std::string description);

Operation delete_entity(EntityId entity_id,
                        std::optional<Entity> previous_entity,
                        std::string description);

Operation modify_entity(EntityId entity_id, Geometry previous_geometry,
                        Geometry new_geometry, std::string description);

Operation move_entities(std::vector<EntityId> entity_ids, Vector2 offset,
                        std::vector<Point2> previous_positions,
                        std::string description);

Operation rotate_entities(std::vector<EntityId> entity_ids, Point2 center,
                          double angle, std::vector<double> previous_angles,
                          std::string description);

Operation scale_entities(std::vector<EntityId> entity_ids, Point2 center,
                         double scale, std::vector<double> previous_scales,
                         std::string description);

Operation boolean_operation(BooleanOp op, EntityId entity1, EntityId entity2,
                            std::vector<Entity> result_entities,
                            std::vector<Entity> previous_entities,
                            std::string description);

Operation add_constraint(Constraint constraint, std::string description);

Operation remove_constraint(ConstraintId constraint_id,
                            std::optional<Constraint> previous_constraint,
                            std::string description);

Operation modify_variable(VariableId variable_id, double previous_value,
                          double new_value, std::string description);

/**
 * @brief Composite recording `nested` as one undo step.
 */
Operation group_operation(std::string name, std::vector<Operation> nested,
                          std::string description);

Operation custom(std::string name, std::vector<std::uint8_t> data,
                 std::string description);

} // namespace cadhistory::operations
