#include "history_serializer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <type_traits>
#include <utility>
#include <vector>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

namespace cadhistory {

namespace {

std::int64_t to_epoch_us(Operation::Timestamp timestamp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               timestamp.time_since_epoch())
        .count();
}

Operation::Timestamp from_epoch_us(std::int64_t us) {
    return Operation::Timestamp(
        std::chrono::duration_cast<Operation::Clock::duration>(
            std::chrono::microseconds(us)));
}

json ids_to_json(const std::vector<OperationId> &ids) {
    json out = json::array();
    for (OperationId id : ids)
        out.push_back(id.value);
    return out;
}

std::vector<OperationId> json_to_ids(const json &j) {
    std::vector<OperationId> ids;
    for (const auto &value : j)
        ids.push_back(OperationId{value.get<std::uint64_t>()});
    return ids;
}

OperationId max_operation_id(const Operation &op) {
    OperationId highest = op.id();
    if (auto *group = op.payload_if<GroupOperation>()) {
        for (const Operation &nested : group->operations)
            highest = std::max(highest, max_operation_id(nested));
    }
    return highest;
}

} // namespace

void HistorySerializer::save(const std::string &filepath,
                             const HistoryTree &tree) const {
    LOG_INFO("Saving history to: {}", filepath);

    try {
        json j = to_json(tree);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            throw IOError("Failed to open file for writing: " + filepath);
        }

        file << j.dump(2);
        file.close();
        if (file.fail()) {
            throw IOError("Failed to write file: " + filepath);
        }

        LOG_INFO("History saved successfully ({} nodes)", tree.size());
    } catch (const IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON serialization error: {}", e.what());
        throw IOError("JSON serialization failed: " + std::string(e.what()));
    }
}

HistoryTree HistorySerializer::load(const std::string &filepath) const {
    LOG_INFO("Loading history from: {}", filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw IOError("Failed to open file for reading: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: {}", e.what());
        throw IOError("JSON parsing failed: " + std::string(e.what()));
    }

    HistoryTree tree = from_json(j);
    LOG_INFO("History loaded successfully ({} nodes)", tree.size());
    return tree;
}

json HistorySerializer::to_json(const HistoryTree &tree) const {
    const HistoryTree::Snapshot snapshot = tree.snapshot();

    json nodes = json::array();
    for (const HistoryNode &node : snapshot.nodes)
        nodes.push_back(node_to_json(node));

    json branches = json::object();
    for (const auto &[name, id] : snapshot.branches)
        branches[name] = id.value;

    return json{{"format", FORMAT_NAME},
                {"version", FORMAT_VERSION},
                {"max_nodes", snapshot.max_nodes},
                {"auto_compress", snapshot.auto_compress},
                {"root", id_to_json(snapshot.root)},
                {"current", id_to_json(snapshot.current)},
                {"branches", branches},
                {"stats", stats_to_json(snapshot.stats)},
                {"nodes", nodes}};
}

HistoryTree HistorySerializer::from_json(const json &j) const {
    HistoryTree::Snapshot snapshot;
    OperationId highest = OperationId::null();

    try {
        if (!j.is_object() || j.value("format", "") != FORMAT_NAME) {
            throw IOError("not a history document");
        }
        const int version = j.at("version").get<int>();
        if (version != FORMAT_VERSION) {
            throw IOError("unsupported history version " +
                          std::to_string(version));
        }

        snapshot.max_nodes = j.at("max_nodes").get<std::size_t>();
        snapshot.auto_compress = j.value("auto_compress", true);
        snapshot.root = json_to_id(j.at("root"));
        snapshot.current = json_to_id(j.at("current"));

        for (const auto &[name, id] : j.at("branches").items())
            snapshot.branches.emplace(name, OperationId{id.get<std::uint64_t>()});

        if (j.contains("stats"))
            snapshot.stats = json_to_stats(j["stats"]);

        for (const auto &node_json : j.at("nodes")) {
            HistoryNode node = json_to_node(node_json);
            highest = std::max(highest, max_operation_id(node.operation));
            snapshot.nodes.push_back(std::move(node));
        }
    } catch (const IOError &) {
        throw;
    } catch (const json::exception &e) {
        LOG_ERROR("Malformed history document: {}", e.what());
        throw IOError("Malformed history document: " + std::string(e.what()));
    }

    HistoryTree tree = HistoryTree::restore(std::move(snapshot));
    OperationIdGenerator::current().advance_past(highest);
    return tree;
}

json HistorySerializer::operation_to_json(const Operation &op) const {
    return json{{"id", op.id().value},
                {"type", op.kind_name()},
                {"timestamp_us", to_epoch_us(op.timestamp())},
                {"description", op.description()},
                {"undoable", op.undoable()},
                {"dependencies", ids_to_json(op.dependencies())},
                {"affected_entities", op.affected_entities()},
                {"payload", payload_to_json(op.type())}};
}

Operation HistorySerializer::json_to_operation(const json &j) const {
    const OperationId id{j.at("id").get<std::uint64_t>()};
    if (id.is_null()) {
        throw IOError("operation has the null id");
    }

    return Operation(
        id, json_to_payload(j.at("type").get<std::string>(), j.at("payload")),
        from_epoch_us(j.at("timestamp_us").get<std::int64_t>()),
        j.at("description").get<std::string>(), j.value("undoable", true),
        json_to_ids(j.value("dependencies", json::array())),
        j.value("affected_entities", std::vector<EntityId>{}));
}

json HistorySerializer::payload_to_json(const OperationType &type) const {
    return std::visit(
        [this](const auto &p) -> json {
            using T = std::decay_t<decltype(p)>;

            if constexpr (std::is_same_v<T, CreateEntity>) {
                return json{{"entity", entity_to_json(p.entity)}};
            } else if constexpr (std::is_same_v<T, DeleteEntity>) {
                return json{{"entity_id", p.entity_id},
                            {"previous_entity",
                             p.previous_entity
                                 ? entity_to_json(*p.previous_entity)
                                 : json(nullptr)}};
            } else if constexpr (std::is_same_v<T, ModifyEntity>) {
                return json{{"entity_id", p.entity_id},
                            {"previous_geometry",
                             geometry_to_json(p.previous_geometry)},
                            {"new_geometry", geometry_to_json(p.new_geometry)}};
            } else if constexpr (std::is_same_v<T, MoveEntities>) {
                json positions = json::array();
                for (const Point2 &point : p.previous_positions)
                    positions.push_back(point_to_json(point));
                return json{{"entity_ids", p.entity_ids},
                            {"offset", {{"x", p.offset.x}, {"y", p.offset.y}}},
                            {"previous_positions", positions}};
            } else if constexpr (std::is_same_v<T, RotateEntities>) {
                return json{{"entity_ids", p.entity_ids},
                            {"center", point_to_json(p.center)},
                            {"angle", p.angle},
                            {"previous_angles", p.previous_angles}};
            } else if constexpr (std::is_same_v<T, ScaleEntities>) {
                return json{{"entity_ids", p.entity_ids},
                            {"center", point_to_json(p.center)},
                            {"scale", p.scale},
                            {"previous_scales", p.previous_scales}};
            } else if constexpr (std::is_same_v<T, BooleanOperation>) {
                json results = json::array();
                for (const Entity &entity : p.result_entities)
                    results.push_back(entity_to_json(entity));
                json previous = json::array();
                for (const Entity &entity : p.previous_entities)
                    previous.push_back(entity_to_json(entity));
                return json{{"op", static_cast<int>(p.op)},
                            {"entity1", p.entity1},
                            {"entity2", p.entity2},
                            {"result_entities", results},
                            {"previous_entities", previous}};
            } else if constexpr (std::is_same_v<T, AddConstraint>) {
                return json{{"constraint", constraint_to_json(p.constraint)}};
            } else if constexpr (std::is_same_v<T, RemoveConstraint>) {
                return json{{"constraint_id", p.constraint_id},
                            {"previous_constraint",
                             p.previous_constraint
                                 ? constraint_to_json(*p.previous_constraint)
                                 : json(nullptr)}};
            } else if constexpr (std::is_same_v<T, ModifyVariable>) {
                return json{{"variable_id", p.variable_id},
                            {"previous_value", p.previous_value},
                            {"new_value", p.new_value}};
            } else if constexpr (std::is_same_v<T, GroupOperation>) {
                json nested = json::array();
                for (const Operation &op : p.operations)
                    nested.push_back(operation_to_json(op));
                return json{{"name", p.name}, {"operations", nested}};
            } else {
                static_assert(std::is_same_v<T, Custom>);
                return json{{"name", p.name}, {"data", p.data}};
            }
        },
        type);
}

OperationType HistorySerializer::json_to_payload(const std::string &kind,
                                                 const json &j) const {
    if (kind == CreateEntity::kind_name) {
        return CreateEntity{json_to_entity(j.at("entity"))};
    }
    if (kind == DeleteEntity::kind_name) {
        DeleteEntity p;
        p.entity_id = j.at("entity_id").get<EntityId>();
        if (j.contains("previous_entity") && !j["previous_entity"].is_null())
            p.previous_entity = json_to_entity(j["previous_entity"]);
        return p;
    }
    if (kind == ModifyEntity::kind_name) {
        return ModifyEntity{j.at("entity_id").get<EntityId>(),
                            json_to_geometry(j.at("previous_geometry")),
                            json_to_geometry(j.at("new_geometry"))};
    }
    if (kind == MoveEntities::kind_name) {
        MoveEntities p;
        p.entity_ids = j.at("entity_ids").get<std::vector<EntityId>>();
        p.offset = {j.at("offset").at("x").get<double>(),
                    j.at("offset").at("y").get<double>()};
        for (const auto &point : j.at("previous_positions"))
            p.previous_positions.push_back(json_to_point(point));
        return p;
    }
    if (kind == RotateEntities::kind_name) {
        return RotateEntities{j.at("entity_ids").get<std::vector<EntityId>>(),
                              json_to_point(j.at("center")),
                              j.at("angle").get<double>(),
                              j.at("previous_angles").get<std::vector<double>>()};
    }
    if (kind == ScaleEntities::kind_name) {
        return ScaleEntities{j.at("entity_ids").get<std::vector<EntityId>>(),
                             json_to_point(j.at("center")),
                             j.at("scale").get<double>(),
                             j.at("previous_scales").get<std::vector<double>>()};
    }
    if (kind == BooleanOperation::kind_name) {
        const int op = j.at("op").get<int>();
        if (op < 0 || op > static_cast<int>(BooleanOp::Difference)) {
            throw IOError("unknown boolean op " + std::to_string(op));
        }
        BooleanOperation p;
        p.op = static_cast<BooleanOp>(op);
        p.entity1 = j.at("entity1").get<EntityId>();
        p.entity2 = j.at("entity2").get<EntityId>();
        for (const auto &entity : j.at("result_entities"))
            p.result_entities.push_back(json_to_entity(entity));
        for (const auto &entity : j.at("previous_entities"))
            p.previous_entities.push_back(json_to_entity(entity));
        return p;
    }
    if (kind == AddConstraint::kind_name) {
        return AddConstraint{json_to_constraint(j.at("constraint"))};
    }
    if (kind == RemoveConstraint::kind_name) {
        RemoveConstraint p;
        p.constraint_id = j.at("constraint_id").get<ConstraintId>();
        if (j.contains("previous_constraint") &&
            !j["previous_constraint"].is_null())
            p.previous_constraint = json_to_constraint(j["previous_constraint"]);
        return p;
    }
    if (kind == ModifyVariable::kind_name) {
        return ModifyVariable{j.at("variable_id").get<VariableId>(),
                              j.at("previous_value").get<double>(),
                              j.at("new_value").get<double>()};
    }
    if (kind == GroupOperation::kind_name) {
        GroupOperation p;
        p.name = j.at("name").get<std::string>();
        for (const auto &nested : j.at("operations"))
            p.operations.push_back(json_to_operation(nested));
        return p;
    }
    if (kind == Custom::kind_name) {
        return Custom{j.at("name").get<std::string>(),
                      j.at("data").get<std::vector<std::uint8_t>>()};
    }

    throw IOError("unknown operation type '" + kind + "'");
}

json HistorySerializer::node_to_json(const HistoryNode &node) const {
    return json{{"id", node.id().value},
                {"parent", id_to_json(node.parent)},
                {"children", ids_to_json(node.children)},
                {"depth", node.depth},
                {"is_active", node.is_active},
                {"operation", operation_to_json(node.operation)}};
}

HistoryNode HistorySerializer::json_to_node(const json &j) const {
    Operation op = json_to_operation(j.at("operation"));
    if (op.id().value != j.at("id").get<std::uint64_t>()) {
        throw IOError("node id does not match its operation id");
    }

    HistoryNode node(std::move(op), json_to_id(j.at("parent")),
                     j.at("depth").get<std::size_t>());
    node.children = json_to_ids(j.at("children"));
    node.is_active = j.value("is_active", false);
    return node;
}

json HistorySerializer::stats_to_json(const HistoryStats &stats) const {
    return json{{"total_operations", stats.total_operations},
                {"current_depth", stats.current_depth},
                {"branch_count", stats.branch_count},
                {"compression_savings", stats.compression_savings},
                {"last_operation_time_us",
                 stats.last_operation_time
                     ? json(to_epoch_us(*stats.last_operation_time))
                     : json(nullptr)}};
}

HistoryStats HistorySerializer::json_to_stats(const json &j) const {
    HistoryStats stats;
    stats.total_operations = j.value("total_operations", std::size_t{0});
    stats.compression_savings = j.value("compression_savings", std::size_t{0});
    if (j.contains("last_operation_time_us") &&
        !j["last_operation_time_us"].is_null()) {
        stats.last_operation_time =
            from_epoch_us(j["last_operation_time_us"].get<std::int64_t>());
    }
    // current_depth and branch_count are recomputed by HistoryTree::restore.
    return stats;
}

json HistorySerializer::entity_to_json(const Entity &entity) const {
    return json{{"id", entity.id},
                {"layer_id", entity.layer_id},
                {"geometry", geometry_to_json(entity.geometry)}};
}

Entity HistorySerializer::json_to_entity(const json &j) const {
    return Entity{j.at("id").get<EntityId>(),
                  j.value("layer_id", std::uint32_t{0}),
                  json_to_geometry(j.at("geometry"))};
}

json HistorySerializer::geometry_to_json(const Geometry &geometry) const {
    return json{{"kind", geometry.kind}, {"params", geometry.params}};
}

Geometry HistorySerializer::json_to_geometry(const json &j) const {
    return Geometry{j.at("kind").get<std::string>(),
                    j.at("params").get<std::vector<double>>()};
}

json HistorySerializer::constraint_to_json(const Constraint &constraint) const {
    return json{{"id", constraint.id},
                {"kind", constraint.kind},
                {"entities", constraint.entities},
                {"value", constraint.value}};
}

Constraint HistorySerializer::json_to_constraint(const json &j) const {
    return Constraint{j.at("id").get<ConstraintId>(),
                      j.at("kind").get<std::string>(),
                      j.at("entities").get<std::vector<EntityId>>(),
                      j.value("value", 0.0)};
}

json HistorySerializer::point_to_json(const Point2 &point) const {
    return json{{"x", point.x}, {"y", point.y}};
}

Point2 HistorySerializer::json_to_point(const json &j) const {
    return Point2{j.at("x").get<double>(), j.at("y").get<double>()};
}

json HistorySerializer::id_to_json(const std::optional<OperationId> &id) const {
    return id ? json(id->value) : json(nullptr);
}

std::optional<OperationId> HistorySerializer::json_to_id(const json &j) const {
    if (j.is_null())
        return std::nullopt;
    return OperationId{j.get<std::uint64_t>()};
}

} // namespace cadhistory
