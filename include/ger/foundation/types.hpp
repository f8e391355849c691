#pragma once

/// @file types.hpp
/// @brief Strong ID types for registry identifiers.

#include <compare>
#include <cstdint>
#include <functional>

namespace ger::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Unlike a bare integer there is no reserved sentinel: every value,
/// including 0, is a legitimate id.  "No id yet" is expressed with
/// std::optional<StrongId<...>> at the use site.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    using value_type = T;

    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EntityIdTag {};
struct ManagerIdTag {};

/// Identifier of an entity, unique within its owning manager.
using EntityId = StrongId<EntityIdTag, uint64_t>;

/// Identifier of an entity manager (one per world / room).
using ManagerId = StrongId<ManagerIdTag, uint32_t>;

} // namespace ger::foundation

template <typename Tag, typename T>
struct std::hash<ger::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const ger::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
