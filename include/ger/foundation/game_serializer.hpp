#pragma once

/// @file game_serializer.hpp
/// @brief GameSerializer: versioned binary encoding and JSON dumps with
///        compile-time field registration via GER_SERIALIZABLE.
///
/// Template-heavy header: encoding walks user-defined types through
/// SerializableTraits, so the logic has to be visible at the call site.
///
/// Binary layout of a registered object:
///
///     uint32 schema_version | uint32 field_count | field_0 ... field_n-1
///
/// A top-level blob is prefixed with the magic bytes "GERB".  Field values
/// use the following encodings (little-endian host order):
///
/// | C++ type                 | Encoding                                  |
/// |--------------------------|-------------------------------------------|
/// | bool                     | uint8 (0 / 1)                             |
/// | arithmetic               | raw bytes                                 |
/// | enum                     | underlying type                           |
/// | std::string              | uint32 length + bytes                     |
/// | std::optional<U>         | uint8 presence + U                        |
/// | std::vector<U>           | uint32 count + U...                       |
/// | std::array<U, N>         | U... (N elements)                         |
/// | std::map<K, V>           | uint32 count + (K, V)...                  |
/// | std::variant<Ts...>      | uint8 index + alternative                 |
/// | registered struct        | nested object (version + count + fields)  |

#include <array>
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "ger/foundation/game_result.hpp"

namespace ger::foundation {

/// Specialization point for compile-time field registration.
/// Users specialize this via the GER_SERIALIZABLE macro.
template <typename T>
struct SerializableTraits {
    static constexpr bool is_serializable = false;
};

/// A single serializable field: its name and pointer-to-member.
template <typename T, typename M>
struct FieldDescriptor {
    const char* name;
    M T::*pointer;
};

template <typename T, typename M>
constexpr FieldDescriptor<T, M> field(const char* name, M T::*ptr) {
    return {name, ptr};
}

namespace detail {

template <typename T, typename = void>
struct is_serializable : std::false_type {};

template <typename T>
struct is_serializable<
    T, std::void_t<decltype(SerializableTraits<T>::schema_version)>>
    : std::true_type {};

template <typename T>
inline constexpr bool is_serializable_v = is_serializable<T>::value;

template <typename T> struct is_vector : std::false_type {};
template <typename U, typename A> struct is_vector<std::vector<U, A>> : std::true_type {};

template <typename T> struct is_std_array : std::false_type {};
template <typename U, std::size_t N> struct is_std_array<std::array<U, N>> : std::true_type {};

template <typename T> struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename U> struct is_optional<std::optional<U>> : std::true_type {};

template <typename T> struct is_variant : std::false_type {};
template <typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template <typename T>
inline constexpr bool dependent_false_v = false;

// ── Tuple iteration ─────────────────────────────────────────────────────

template <typename Tuple, typename Func, std::size_t... Is>
void forEachFieldImpl(const Tuple& t, Func&& f, std::index_sequence<Is...>) {
    (f(std::get<Is>(t), Is), ...);
}

template <typename Tuple, typename Func>
void forEachField(const Tuple& t, Func&& f) {
    forEachFieldImpl(
        t, std::forward<Func>(f),
        std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

template <typename T>
constexpr uint32_t fieldCount() {
    return static_cast<uint32_t>(
        std::tuple_size_v<decltype(SerializableTraits<T>::fields())>);
}

// ── Binary write ────────────────────────────────────────────────────────

inline void writeBytes(std::vector<uint8_t>& buf, const void* data,
                       std::size_t n) {
    const auto* p = static_cast<const uint8_t*>(data);
    buf.insert(buf.end(), p, p + n);
}

template <typename T>
void writePrimitive(std::vector<uint8_t>& buf, const T& val) {
    writeBytes(buf, &val, sizeof(T));
}

void writeString(std::vector<uint8_t>& buf, std::string_view val);

template <typename T>
void writeValue(std::vector<uint8_t>& buf, const T& val) {
    if constexpr (is_serializable_v<T>) {
        writePrimitive(buf, static_cast<uint32_t>(SerializableTraits<T>::schema_version));
        writePrimitive(buf, fieldCount<T>());
        forEachField(SerializableTraits<T>::fields(),
                     [&](const auto& fd, std::size_t) {
                         writeValue(buf, val.*(fd.pointer));
                     });
    } else if constexpr (std::is_same_v<T, bool>) {
        writePrimitive(buf, static_cast<uint8_t>(val ? 1 : 0));
    } else if constexpr (std::is_same_v<T, std::string>) {
        writeString(buf, val);
    } else if constexpr (std::is_enum_v<T>) {
        writePrimitive(buf, static_cast<std::underlying_type_t<T>>(val));
    } else if constexpr (std::is_arithmetic_v<T>) {
        writePrimitive(buf, val);
    } else if constexpr (is_optional<T>::value) {
        writePrimitive(buf, static_cast<uint8_t>(val.has_value() ? 1 : 0));
        if (val) {
            writeValue(buf, *val);
        }
    } else if constexpr (is_vector<T>::value) {
        writePrimitive(buf, static_cast<uint32_t>(val.size()));
        for (const auto& elem : val) {
            writeValue(buf, elem);
        }
    } else if constexpr (is_std_array<T>::value) {
        for (const auto& elem : val) {
            writeValue(buf, elem);
        }
    } else if constexpr (is_map<T>::value) {
        writePrimitive(buf, static_cast<uint32_t>(val.size()));
        for (const auto& [key, mapped] : val) {
            writeValue(buf, key);
            writeValue(buf, mapped);
        }
    } else if constexpr (is_variant<T>::value) {
        static_assert(std::variant_size_v<T> <= 255, "variant too wide");
        writePrimitive(buf, static_cast<uint8_t>(val.index()));
        std::visit([&](const auto& alt) { writeValue(buf, alt); }, val);
    } else {
        static_assert(dependent_false_v<T>, "type is not serializable");
    }
}

// ── Binary read ─────────────────────────────────────────────────────────

/// Cursor over a binary blob.  On failure `failure` and `reason` describe
/// what went wrong.
struct BinaryReader {
    std::span<const uint8_t> data;
    std::size_t pos = 0;
    ErrorCode failure = ErrorCode::InvalidBinaryData;
    const char* reason = "truncated data";

    [[nodiscard]] bool canRead(std::size_t n) const {
        return n <= data.size() - pos;
    }

    [[nodiscard]] std::size_t remaining() const { return data.size() - pos; }

    template <typename T>
    bool readPrimitive(T& val) {
        if (!canRead(sizeof(T))) return false;
        std::memcpy(&val, data.data() + pos, sizeof(T));
        pos += sizeof(T);
        return true;
    }

    bool readString(std::string& val);

    /// Record a failure and return false, for use in return statements.
    bool fail(ErrorCode code, const char* why) {
        failure = code;
        reason = why;
        return false;
    }
};

template <typename T>
bool readValue(BinaryReader& reader, T& val);

template <std::size_t I, typename Variant>
bool readAlternative(BinaryReader& reader, Variant& v) {
    std::variant_alternative_t<I, Variant> alt{};
    if (!readValue(reader, alt)) return false;
    v.template emplace<I>(std::move(alt));
    return true;
}

template <typename Variant, std::size_t... Is>
bool readVariant(BinaryReader& reader, Variant& v, std::size_t index,
                 std::index_sequence<Is...>) {
    bool ok = false;
    static_cast<void>(
        ((index == Is ? (ok = readAlternative<Is>(reader, v), true) : false) || ...));
    return ok;
}

/// Read a registered object.  Data written by an older schema (fewer
/// fields) leaves the remaining fields at their defaults; data from a newer
/// schema is rejected because nested fields cannot be skipped.
template <typename T>
bool readObject(BinaryReader& reader, T& obj) {
    uint32_t version = 0;
    uint32_t storedCount = 0;
    if (!reader.readPrimitive(version) || !reader.readPrimitive(storedCount)) {
        return reader.fail(ErrorCode::InvalidBinaryData, "truncated object header");
    }
    if (version > SerializableTraits<T>::schema_version) {
        return reader.fail(ErrorCode::SchemaMismatch, "unsupported schema version");
    }
    if (storedCount > fieldCount<T>()) {
        return reader.fail(ErrorCode::SchemaMismatch, "unexpected field count");
    }

    bool ok = true;
    forEachField(SerializableTraits<T>::fields(),
                 [&](const auto& fd, std::size_t idx) {
                     if (ok && static_cast<uint32_t>(idx) < storedCount) {
                         ok = readValue(reader, obj.*(fd.pointer));
                     }
                 });
    return ok;
}

template <typename T>
bool readValue(BinaryReader& reader, T& val) {
    if constexpr (is_serializable_v<T>) {
        return readObject(reader, val);
    } else if constexpr (std::is_same_v<T, bool>) {
        uint8_t b = 0;
        if (!reader.readPrimitive(b)) return false;
        if (b > 1) return reader.fail(ErrorCode::InvalidBinaryData, "invalid bool");
        val = (b != 0);
        return true;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return reader.readString(val);
    } else if constexpr (std::is_enum_v<T>) {
        std::underlying_type_t<T> raw{};
        if (!reader.readPrimitive(raw)) return false;
        val = static_cast<T>(raw);
        return true;
    } else if constexpr (std::is_arithmetic_v<T>) {
        return reader.readPrimitive(val);
    } else if constexpr (is_optional<T>::value) {
        uint8_t present = 0;
        if (!reader.readPrimitive(present)) return false;
        if (present > 1) return reader.fail(ErrorCode::InvalidBinaryData, "invalid optional flag");
        if (present == 0) {
            val.reset();
            return true;
        }
        typename T::value_type inner{};
        if (!readValue(reader, inner)) return false;
        val = std::move(inner);
        return true;
    } else if constexpr (is_vector<T>::value) {
        uint32_t count = 0;
        if (!reader.readPrimitive(count)) return false;
        // Every element occupies at least one byte.
        if (count > reader.remaining()) {
            return reader.fail(ErrorCode::InvalidBinaryData, "element count exceeds data");
        }
        val.clear();
        val.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            typename T::value_type elem{};
            if (!readValue(reader, elem)) return false;
            val.push_back(std::move(elem));
        }
        return true;
    } else if constexpr (is_std_array<T>::value) {
        for (auto& elem : val) {
            if (!readValue(reader, elem)) return false;
        }
        return true;
    } else if constexpr (is_map<T>::value) {
        uint32_t count = 0;
        if (!reader.readPrimitive(count)) return false;
        if (count > reader.remaining()) {
            return reader.fail(ErrorCode::InvalidBinaryData, "entry count exceeds data");
        }
        val.clear();
        for (uint32_t i = 0; i < count; ++i) {
            typename T::key_type key{};
            typename T::mapped_type mapped{};
            if (!readValue(reader, key) || !readValue(reader, mapped)) return false;
            if (!val.emplace(std::move(key), std::move(mapped)).second) {
                return reader.fail(ErrorCode::InvalidBinaryData, "duplicate map key");
            }
        }
        return true;
    } else if constexpr (is_variant<T>::value) {
        uint8_t index = 0;
        if (!reader.readPrimitive(index)) return false;
        if (index >= std::variant_size_v<T>) {
            return reader.fail(ErrorCode::InvalidBinaryData, "unknown variant index");
        }
        return readVariant(reader, val, index,
                           std::make_index_sequence<std::variant_size_v<T>>{});
    } else {
        static_assert(dependent_false_v<T>, "type is not serializable");
        return false;
    }
}

// ── JSON write ──────────────────────────────────────────────────────────

std::string escapeJson(std::string_view sv);

template <typename T>
void writeJsonValue(std::ostringstream& out, const T& val) {
    if constexpr (is_serializable_v<T>) {
        out << "{\"__v\":" << SerializableTraits<T>::schema_version;
        forEachField(SerializableTraits<T>::fields(),
                     [&](const auto& fd, std::size_t) {
                         out << ",\"" << fd.name << "\":";
                         writeJsonValue(out, val.*(fd.pointer));
                     });
        out << '}';
    } else if constexpr (std::is_same_v<T, bool>) {
        out << (val ? "true" : "false");
    } else if constexpr (std::is_same_v<T, std::string>) {
        out << '"' << escapeJson(val) << '"';
    } else if constexpr (std::is_enum_v<T>) {
        out << static_cast<int64_t>(val);
    } else if constexpr (std::is_floating_point_v<T>) {
        out << val;
    } else if constexpr (std::is_signed_v<T>) {
        out << static_cast<int64_t>(val);
    } else if constexpr (std::is_unsigned_v<T>) {
        out << static_cast<uint64_t>(val);
    } else if constexpr (is_optional<T>::value) {
        if (val) {
            writeJsonValue(out, *val);
        } else {
            out << "null";
        }
    } else if constexpr (is_vector<T>::value || is_std_array<T>::value) {
        out << '[';
        bool first = true;
        for (const auto& elem : val) {
            if (!first) out << ',';
            first = false;
            writeJsonValue(out, elem);
        }
        out << ']';
    } else if constexpr (is_map<T>::value) {
        static_assert(std::is_same_v<typename T::key_type, std::string>,
                      "JSON objects need string keys");
        out << '{';
        bool first = true;
        for (const auto& [key, mapped] : val) {
            if (!first) out << ',';
            first = false;
            out << '"' << escapeJson(key) << "\":";
            writeJsonValue(out, mapped);
        }
        out << '}';
    } else if constexpr (is_variant<T>::value) {
        std::visit([&](const auto& alt) { writeJsonValue(out, alt); }, val);
    } else {
        static_assert(dependent_false_v<T>, "type is not serializable");
    }
}

}  // namespace detail

/// Magic bytes identifying a top-level GER binary blob.
inline constexpr uint8_t kBinaryMagic[4] = {'G', 'E', 'R', 'B'};

/// Serializer for registered types.
///
/// Binary output is compact (no field names) and versioned per object;
/// JSON output is a human-readable dump and is not read back.
///
/// Example:
/// @code
///   struct Stats {
///       int32_t health = 0;
///       std::string name;
///   };
///   GER_SERIALIZABLE(Stats, 1,
///       field("health", &Stats::health),
///       field("name", &Stats::name)
///   );
///
///   auto bin = GameSerializer::instance().serializeBinary(stats);
///   auto back = GameSerializer::instance().deserializeBinary<Stats>(bin);
/// @endcode
class GameSerializer {
public:
    GameSerializer() = default;

    GameSerializer(const GameSerializer&) = delete;
    GameSerializer& operator=(const GameSerializer&) = delete;

    template <typename T>
    [[nodiscard]] std::vector<uint8_t> serializeBinary(const T& obj) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with GER_SERIALIZABLE");

        std::vector<uint8_t> buf;
        buf.reserve(128);
        detail::writeBytes(buf, kBinaryMagic, 4);
        detail::writeValue(buf, obj);
        return buf;
    }

    /// Decode a blob produced by serializeBinary().
    ///
    /// Fails with InvalidBinaryData for bad magic, truncation or trailing
    /// bytes, and with SchemaMismatch for data from a newer schema.
    template <typename T>
    [[nodiscard]] GameResult<T> deserializeBinary(
        std::span<const uint8_t> data) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with GER_SERIALIZABLE");

        detail::BinaryReader reader{data};

        uint8_t magic[4]{};
        for (auto& m : magic) {
            if (!reader.readPrimitive(m)) {
                return GameResult<T>::err(GameError(
                    ErrorCode::InvalidBinaryData, "truncated binary header"));
            }
        }
        if (std::memcmp(magic, kBinaryMagic, 4) != 0) {
            return GameResult<T>::err(
                GameError(ErrorCode::InvalidBinaryData, "invalid magic bytes"));
        }

        T obj{};
        if (!detail::readValue(reader, obj)) {
            return GameResult<T>::err(GameError(reader.failure, reader.reason));
        }
        if (reader.remaining() != 0) {
            return GameResult<T>::err(
                GameError(ErrorCode::InvalidBinaryData, "trailing bytes after object"));
        }
        return GameResult<T>::ok(std::move(obj));
    }

    /// Render an object as JSON, including "__v" schema versions.
    template <typename T>
    [[nodiscard]] std::string serializeJson(const T& obj) const {
        static_assert(detail::is_serializable_v<T>,
                      "Type must be registered with GER_SERIALIZABLE");

        std::ostringstream out;
        detail::writeJsonValue(out, obj);
        return out.str();
    }

    static GameSerializer& instance();
};

}  // namespace ger::foundation

/// Register a type for serialization with field descriptors and version.
///
/// Must be used at global namespace scope.
///
/// @param Type     The struct/class type to register.
/// @param Version  Schema version number (uint32_t).
/// @param ...      field("name", &Type::member) descriptors, in wire order.
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define GER_SERIALIZABLE(Type, Version, ...)                                   \
    template <>                                                                \
    struct ger::foundation::SerializableTraits<Type> {                         \
        static constexpr bool is_serializable = true;                          \
        static constexpr uint32_t schema_version = Version;                    \
        static constexpr auto fields() {                                       \
            using ger::foundation::field;                                      \
            return std::make_tuple(__VA_ARGS__);                               \
        }                                                                      \
    }
