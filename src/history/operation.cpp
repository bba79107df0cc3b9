#include "operation.hpp"

#include <type_traits>

namespace cadhistory {

const char *kind_name(const OperationType &type) {
    return std::visit(
        [](const auto &payload) -> const char * {
            return std::decay_t<decltype(payload)>::kind_name;
        },
        type);
}

Operation::Operation(OperationType type, std::string description)
    : m_id(OperationIdGenerator::current().next()), m_type(std::move(type)),
      m_timestamp(Clock::now()), m_description(std::move(description)) {}

Operation::Operation(OperationId id, OperationType type, Timestamp timestamp,
                     std::string description, bool undoable,
                     std::vector<OperationId> dependencies,
                     std::vector<EntityId> affected_entities)
    : m_id(id), m_type(std::move(type)), m_timestamp(timestamp),
      m_description(std::move(description)), m_undoable(undoable),
      m_dependencies(std::move(dependencies)),
      m_affected_entities(std::move(affected_entities)) {}

Operation Operation::with_dependencies(std::vector<OperationId> dependencies) && {
    m_dependencies = std::move(dependencies);
    return std::move(*this);
}

Operation Operation::with_affected_entities(std::vector<EntityId> entities) && {
    m_affected_entities = std::move(entities);
    return std::move(*this);
}

Operation Operation::with_undoable(bool undoable) && {
    m_undoable = undoable;
    return std::move(*this);
}

} // namespace cadhistory
