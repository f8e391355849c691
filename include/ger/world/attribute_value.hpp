#pragma once

/// @file attribute_value.hpp
/// @brief Closed value set for the per-entity attribute bag.

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace ger::world {

/// A single attribute: integer, floating point, boolean, or string.
///
/// Pass explicitly typed values (int64_t{5}, std::string("x")) when the
/// literal type would be ambiguous.
using AttributeValue = std::variant<int64_t, double, bool, std::string>;

/// Attribute bag keyed by name.  Ordered so that encodings are stable.
using AttributeMap = std::map<std::string, AttributeValue>;

/// Integer view of a value: integers, and finite doubles truncated toward
/// zero and saturated to the int64 range.  NaN, infinities, and
/// non-numeric values yield nullopt.
inline std::optional<int64_t> integerValue(const AttributeValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        if (!std::isfinite(*d)) {
            return std::nullopt;
        }
        // 2^63 is exactly representable; INT64_MAX is not.
        constexpr double kLimit = 9223372036854775808.0;
        if (*d >= kLimit) {
            return std::numeric_limits<int64_t>::max();
        }
        if (*d < -kLimit) {
            return std::numeric_limits<int64_t>::min();
        }
        return static_cast<int64_t>(*d);
    }
    return std::nullopt;
}

}  // namespace ger::world
