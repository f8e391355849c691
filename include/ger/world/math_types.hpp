#pragma once

/// @file math_types.hpp
/// @brief Vector types for entity position and facing.

#include <cmath>
#include <compare>
#include <cstdint>

#include "ger/foundation/game_serializer.hpp"

namespace ger::world {

/// Three-component float vector (world coordinates).
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    constexpr auto operator<=>(const Vector3&) const = default;
};

/// Two-component float vector.  Used for the XZ-plane facing of an
/// entity; the default (1, 0) faces along +X.
struct Vector2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vector2() = default;
    constexpr Vector2(float x, float y) : x(x), y(y) {}

    [[nodiscard]] float Length() const noexcept { return std::sqrt(x * x + y * y); }

    /// Rotate counter-clockwise by @p radians.
    [[nodiscard]] Vector2 Rotated(float radians) const noexcept {
        const float c = std::cos(radians);
        const float s = std::sin(radians);
        return {x * c - y * s, x * s + y * c};
    }

    constexpr auto operator<=>(const Vector2&) const = default;
};

}  // namespace ger::world

GER_SERIALIZABLE(ger::world::Vector3, 1,
    field("x", &ger::world::Vector3::x),
    field("y", &ger::world::Vector3::y),
    field("z", &ger::world::Vector3::z)
);

GER_SERIALIZABLE(ger::world::Vector2, 1,
    field("x", &ger::world::Vector2::x),
    field("y", &ger::world::Vector2::y)
);
