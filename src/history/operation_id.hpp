#pragma once

#include <atomic>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <fmt/format.h>

namespace cadhistory {

/**
 * @brief Identifier of one recorded operation.
 *
 * Ids are handed out in increasing order and never reused, so comparing two
 * ids also compares creation order. The value 0 is the null id.
 */
struct OperationId {
    std::uint64_t value = 0;

    static constexpr OperationId null() noexcept { return OperationId{}; }
    constexpr bool is_null() const noexcept { return value == 0; }

    auto operator<=>(const OperationId &) const = default;
};

/**
 * @brief Source of fresh operation ids.
 *
 * One process-wide instance backs normal use. Tests install their own
 * generator per thread with ScopedIdGenerator so that ids are deterministic
 * and suites can run in parallel.
 */
class OperationIdGenerator {
  public:
    explicit OperationIdGenerator(std::uint64_t first = 1);
    OperationIdGenerator(const OperationIdGenerator &) = delete;
    OperationIdGenerator &operator=(const OperationIdGenerator &) = delete;

    /**
     * @brief Take the next id.
     * @return A non-null id greater than every id handed out before
     */
    OperationId next();

    /**
     * @brief Value that the next call to next() will return.
     */
    std::uint64_t peek() const;

    /**
     * @brief Restart the counter.
     * @param first First value to hand out (0 is bumped to 1)
     */
    void reset(std::uint64_t first = 1);

    /**
     * @brief Make sure later ids are greater than `id`.
     *
     * Used after loading a saved history so ids already on disk are never
     * handed out again.
     */
    void advance_past(OperationId id);

    /** @brief The process-wide generator. */
    static OperationIdGenerator &global();

    /** @brief Generator in effect on the calling thread. */
    static OperationIdGenerator &current();

  private:
    std::atomic<std::uint64_t> m_next;
};

/**
 * @brief Redirects OperationIdGenerator::current() on this thread for the
 * lifetime of the object.
 */
class ScopedIdGenerator {
  public:
    explicit ScopedIdGenerator(OperationIdGenerator &generator);
    ~ScopedIdGenerator();
    ScopedIdGenerator(const ScopedIdGenerator &) = delete;
    ScopedIdGenerator &operator=(const ScopedIdGenerator &) = delete;

  private:
    OperationIdGenerator *m_previous;
};

} // namespace cadhistory

template <>
struct std::hash<cadhistory::OperationId> {
    std::size_t operator()(const cadhistory::OperationId &id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};

template <>
struct fmt::formatter<cadhistory::OperationId> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const cadhistory::OperationId &id, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "#{}", id.value);
    }
};
