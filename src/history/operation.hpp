#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "operation_id.hpp"
#include "operation_type.hpp"

namespace cadhistory {

/**
 * @brief Immutable record of one semantic edit.
 *
 * An Operation gets its id and timestamp when it is constructed and is never
 * changed afterwards. The `with_*` calls configure a freshly built value
 * before it is handed to the history tree; they keep the id.
 */
class Operation {
  public:
    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    /**
     * @brief Build an operation with a fresh id and the current time.
     * @param type Payload of the edit
     * @param description Human-readable description
     */
    Operation(OperationType type, std::string description);

    /**
     * @brief Build an operation from already known fields (loading, merging).
     */
    Operation(OperationId id, OperationType type, Timestamp timestamp,
              std::string description, bool undoable = true,
              std::vector<OperationId> dependencies = {},
              std::vector<EntityId> affected_entities = {});

    Operation with_dependencies(std::vector<OperationId> dependencies) &&;
    Operation with_affected_entities(std::vector<EntityId> entities) &&;
    Operation with_undoable(bool undoable) &&;

    OperationId id() const noexcept { return m_id; }
    const OperationType &type() const noexcept { return m_type; }
    Timestamp timestamp() const noexcept { return m_timestamp; }
    const std::string &description() const noexcept { return m_description; }
    bool undoable() const noexcept { return m_undoable; }

    const std::vector<OperationId> &dependencies() const noexcept {
        return m_dependencies;
    }

    const std::vector<EntityId> &affected_entities() const noexcept {
        return m_affected_entities;
    }

    const char *kind_name() const { return cadhistory::kind_name(m_type); }

    template <typename T>
    bool is() const noexcept {
        return std::holds_alternative<T>(m_type);
    }

    /**
     * @brief Typed access to the payload.
     * @return Pointer to the payload, or nullptr if the operation holds
     * another kind
     */
    template <typename T>
    const T *payload_if() const noexcept {
        return std::get_if<T>(&m_type);
    }

  private:
    OperationId m_id;
    OperationType m_type;
    Timestamp m_timestamp;
    std::string m_description;
    bool m_undoable = true;
    std::vector<OperationId> m_dependencies;
    std::vector<EntityId> m_affected_entities;
};

} // namespace cadhistory
