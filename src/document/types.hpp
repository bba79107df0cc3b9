#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace cadhistory {

/** @brief Opaque reference to an entity in the external document. */
using EntityId = std::uint64_t;

/** @brief Opaque reference to a parametric constraint. */
using ConstraintId = std::uint64_t;

/** @brief Opaque reference to a parametric variable. */
using VariableId = std::uint64_t;

/**
 * @brief 2D displacement.
 */
struct Vector2 {
    double x = 0.0;
    double y = 0.0;

    Vector2 operator+(const Vector2 &o) const { return {x + o.x, y + o.y}; }
    bool operator==(const Vector2 &) const = default;
};

/**
 * @brief 2D position.
 */
struct Point2 {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point2 &) const = default;
};

/**
 * @brief Geometry snapshot. The history engine stores it without looking
 * inside; `kind` names the primitive ("line", "arc", ...) and `params` holds
 * its numeric definition in the document's own layout.
 */
struct Geometry {
    std::string kind;
    std::vector<double> params;

    bool operator==(const Geometry &) const = default;
};

/**
 * @brief Entity snapshot as captured from the document.
 */
struct Entity {
    EntityId id = 0;
    std::uint32_t layer_id = 0;
    Geometry geometry;

    bool operator==(const Entity &) const = default;
};

/**
 * @brief Boolean combination applied to two region entities.
 */
enum class BooleanOp : std::uint8_t { Union = 0, Intersection = 1, Difference = 2 };

/**
 * @brief Constraint snapshot (parallel, coincident, distance, ...).
 */
struct Constraint {
    ConstraintId id = 0;
    std::string kind;
    std::vector<EntityId> entities;
    double value = 0.0;

    bool operator==(const Constraint &) const = default;
};

} // namespace cadhistory

template <>
struct fmt::formatter<cadhistory::Vector2> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const cadhistory::Vector2 &v, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "({},{})", v.x, v.y);
    }
};
