#include "operation_id.hpp"

namespace cadhistory {

namespace {
thread_local OperationIdGenerator *t_scoped_generator = nullptr;
}

OperationIdGenerator::OperationIdGenerator(std::uint64_t first)
    : m_next(first == 0 ? 1 : first) {}

OperationId OperationIdGenerator::next() {
    return OperationId{m_next.fetch_add(1, std::memory_order_relaxed)};
}

std::uint64_t OperationIdGenerator::peek() const {
    return m_next.load(std::memory_order_relaxed);
}

void OperationIdGenerator::reset(std::uint64_t first) {
    m_next.store(first == 0 ? 1 : first, std::memory_order_relaxed);
}

void OperationIdGenerator::advance_past(OperationId id) {
    const std::uint64_t wanted = id.value + 1;
    std::uint64_t seen = m_next.load(std::memory_order_relaxed);
    while (seen < wanted &&
           !m_next.compare_exchange_weak(seen, wanted,
                                         std::memory_order_relaxed)) {
    }
}

OperationIdGenerator &OperationIdGenerator::global() {
    static OperationIdGenerator instance;
    return instance;
}

OperationIdGenerator &OperationIdGenerator::current() {
    return t_scoped_generator ? *t_scoped_generator : global();
}

ScopedIdGenerator::ScopedIdGenerator(OperationIdGenerator &generator)
    : m_previous(t_scoped_generator) {
    t_scoped_generator = &generator;
}

ScopedIdGenerator::~ScopedIdGenerator() { t_scoped_generator = m_previous; }

} // namespace cadhistory
