#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../document/types.hpp"
#include "../history/history_tree.hpp"
#include "../history/operation.hpp"

namespace cadhistory {

using json = nlohmann::json;

/**
 * @brief Saves and loads history trees as JSON.
 *
 * Operation ids are written as plain integers and timestamps as microseconds
 * since the Unix epoch. The redo stack is not written; a loaded tree starts
 * with an empty one. Loading advances OperationIdGenerator::current() past
 * every id it reads so new operations never reuse one.
 */
class HistorySerializer {
  public:
    static constexpr const char *FORMAT_NAME = "cadhistory-history";
    static constexpr int FORMAT_VERSION = 1;

    /**
     * @brief Save a history tree to the specified file path.
     * @param filepath Path where to save the history file
     * @param tree History to serialize
     * @throws IOError if file operations fail
     */
    void save(const std::string &filepath, const HistoryTree &tree) const;

    /**
     * @brief Load a history tree from the specified file path.
     * @param filepath Path to the history file to load
     * @return The restored tree
     * @throws IOError if file operations or parsing fail
     * @throws InvariantError if the file describes an inconsistent tree
     */
    HistoryTree load(const std::string &filepath) const;

    /**
     * @brief Convert a whole tree to JSON.
     */
    json to_json(const HistoryTree &tree) const;

    /**
     * @brief Rebuild a tree from JSON produced by to_json().
     * @throws IOError if the document is malformed
     * @throws InvariantError if it describes an inconsistent tree
     */
    HistoryTree from_json(const json &j) const;

    /**
     * @brief Convert one operation (nested group operations included) to JSON.
     */
    json operation_to_json(const Operation &op) const;

    /**
     * @brief Convert JSON to an operation, keeping its recorded id.
     * @throws json::exception or IOError on malformed input
     */
    Operation json_to_operation(const json &j) const;

  private:
    json payload_to_json(const OperationType &type) const;
    OperationType json_to_payload(const std::string &kind,
                                  const json &j) const;

    json node_to_json(const HistoryNode &node) const;
    HistoryNode json_to_node(const json &j) const;

    json stats_to_json(const HistoryStats &stats) const;
    HistoryStats json_to_stats(const json &j) const;

    json entity_to_json(const Entity &entity) const;
    Entity json_to_entity(const json &j) const;

    json geometry_to_json(const Geometry &geometry) const;
    Geometry json_to_geometry(const json &j) const;

    json constraint_to_json(const Constraint &constraint) const;
    Constraint json_to_constraint(const json &j) const;

    json point_to_json(const Point2 &point) const;
    Point2 json_to_point(const json &j) const;

    json id_to_json(const std::optional<OperationId> &id) const;
    std::optional<OperationId> json_to_id(const json &j) const;
};

} // namespace cadhistory
