#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the entity registry.

#include <cstdint>
#include <string_view>

namespace ger::foundation {

/// Error codes grouped by subsystem in 256-value ranges (0x100), so the
/// source of an error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Registry (0x0100 - 0x01FF)
    EntityNotFound = 0x0100,
    AlreadyRegistered = 0x0101,
    PlayerRegistrationFailed = 0x0102,
    PlayerRegistryUnavailable = 0x0103,
    KindMismatch = 0x0104,

    // Serialization (0x0200 - 0x02FF)
    SerializationError = 0x0200,
    InvalidBinaryData = 0x0201,
    SchemaMismatch = 0x0202,
    InvalidRegistryState = 0x0203,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigKeyNotFound = 0x0301,
    ConfigTypeMismatch = 0x0302,
    ConfigInvalidValue = 0x0303,

    // Logger (0x0400 - 0x04FF)
    LoggerError = 0x0400,
    LoggerFlushFailed = 0x0401,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Registry";
        case 0x0200: return "Serialization";
        case 0x0300: return "Config";
        case 0x0400: return "Logger";
        default: return "Unknown";
    }
}

/// True for every code a corrupt or incompatible blob can produce.
constexpr bool isDecodeError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0200;
}

} // namespace ger::foundation
