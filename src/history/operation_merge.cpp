#include "operation_merge.hpp"

#include <algorithm>
#include <vector>

namespace cadhistory {

namespace {

bool same_entity_set(std::vector<EntityId> a, std::vector<EntityId> b) {
    std::sort(a.begin(), a.end());
    a.erase(std::unique(a.begin(), a.end()), a.end());
    std::sort(b.begin(), b.end());
    b.erase(std::unique(b.begin(), b.end()), b.end());
    return a == b;
}

template <typename T>
void append_missing(std::vector<T> &into, const std::vector<T> &from) {
    for (const T &value : from) {
        if (std::find(into.begin(), into.end(), value) == into.end())
            into.push_back(value);
    }
}

std::optional<OperationType> merge_payloads(const Operation &earlier,
                                            const Operation &later) {
    if (auto *first = earlier.payload_if<MoveEntities>()) {
        auto *second = later.payload_if<MoveEntities>();
        if (!second || !same_entity_set(first->entity_ids, second->entity_ids))
            return std::nullopt;
        // Positions before the first move are the state to return to.
        return MoveEntities{first->entity_ids, first->offset + second->offset,
                            first->previous_positions};
    }

    if (auto *first = earlier.payload_if<ModifyVariable>()) {
        auto *second = later.payload_if<ModifyVariable>();
        if (!second || first->variable_id != second->variable_id)
            return std::nullopt;
        return ModifyVariable{first->variable_id, first->previous_value,
                              second->new_value};
    }

    return std::nullopt;
}

} // namespace

bool can_merge(const Operation &earlier, const Operation &later) {
    if (auto *first = earlier.payload_if<MoveEntities>()) {
        auto *second = later.payload_if<MoveEntities>();
        return second && same_entity_set(first->entity_ids, second->entity_ids);
    }
    if (auto *first = earlier.payload_if<ModifyVariable>()) {
        auto *second = later.payload_if<ModifyVariable>();
        return second && first->variable_id == second->variable_id;
    }
    return false;
}

std::optional<Operation> merge_operations(const Operation &earlier,
                                          const Operation &later) {
    auto payload = merge_payloads(earlier, later);
    if (!payload)
        return std::nullopt;

    std::vector<OperationId> dependencies = earlier.dependencies();
    append_missing(dependencies, later.dependencies());
    std::erase_if(dependencies, [&](OperationId id) {
        return id == earlier.id() || id == later.id();
    });

    std::vector<EntityId> affected = earlier.affected_entities();
    append_missing(affected, later.affected_entities());

    return Operation(OperationIdGenerator::current().next(),
                     std::move(*payload), later.timestamp(),
                     later.description(),
                     earlier.undoable() && later.undoable(),
                     std::move(dependencies), std::move(affected));
}

} // namespace cadhistory
