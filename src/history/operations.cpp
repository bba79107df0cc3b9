#include "operations.hpp"

#include <utility>

namespace cadhistory::operations {

Operation create_entity(Entity entity, std::string description) {
    return Operation(CreateEntity{std::move(entity)}, std::move(description));
}

Operation delete_entity(EntityId entity_id,
                        std::optional<Entity> previous_entity,
                        std::string description) {
    return Operation(DeleteEntity{entity_id, std::move(previous_entity)},
                     std::move(description));
}

Operation modify_entity(EntityId entity_id, Geometry previous_geometry,
                        Geometry new_geometry, std::string description) {
    return Operation(ModifyEntity{entity_id, std::move(previous_geometry),
                                  std::move(new_geometry)},
                     std::move(description));
}

Operation move_entities(std::vector<EntityId> entity_ids, Vector2 offset,
                        std::vector<Point2> previous_positions,
                        std::string description) {
    return Operation(MoveEntities{std::move(entity_ids), offset,
                                  std::move(previous_positions)},
                     std::move(description));
}

Operation rotate_entities(std::vector<EntityId> entity_ids, Point2 center,
                          double angle, std::vector<double> previous_angles,
                          std::string description) {
    return Operation(RotateEntities{std::move(entity_ids), center, angle,
                                    std::move(previous_angles)},
                     std::move(description));
}

Operation scale_entities(std::vector<EntityId> entity_ids, Point2 center,
                         double scale, std::vector<double> previous_scales,
                         std::string description) {
    return Operation(ScaleEntities{std::move(entity_ids), center, scale,
                                   std::move(previous_scales)},
                     std::move(description));
}

Operation boolean_operation(BooleanOp op, EntityId entity1, EntityId entity2,
                            std::vector<Entity> result_entities,
                            std::vector<Entity> previous_entities,
                            std::string description) {
    return Operation(BooleanOperation{op, entity1, entity2,
                                      std::move(result_entities),
                                      std::move(previous_entities)},
                     std::move(description));
}

Operation add_constraint(Constraint constraint, std::string description) {
    return Operation(AddConstraint{std::move(constraint)},
                     std::move(description));
}

Operation remove_constraint(ConstraintId constraint_id,
                            std::optional<Constraint> previous_constraint,
                            std::string description) {
    return Operation(
        RemoveConstraint{constraint_id, std::move(previous_constraint)},
        std::move(description));
}

Operation modify_variable(VariableId variable_id, double previous_value,
                          double new_value, std::string description) {
    return Operation(ModifyVariable{variable_id, previous_value, new_value},
                     std::move(description));
}

Operation group_operation(std::string name, std::vector<Operation> nested,
                          std::string description) {
    return Operation(GroupOperation{std::move(name), std::move(nested)},
                     std::move(description));
}

Operation custom(std::string name, std::vector<std::uint8_t> data,
                 std::string description) {
    return Operation(Custom{std::move(name), std::move(data)},
                     std::move(description));
}

} // namespace cadhistory::operations
