#pragma once

/// @file registry_config.hpp
/// @brief Binds configuration keys to an entity manager and the logger.
///
/// Recognized keys:
/// | Key                   | Type   | Notes                               |
/// |-----------------------|--------|-------------------------------------|
/// | registry.manager_id   | uint32 | required                            |
/// | logging.<category>    | string | trace/debug/info/warning/error/... |
///
/// Example (YAML):
/// @code
///   registry:
///     manager_id: 7
///   logging:
///     registry: debug
///     serialization: warning
/// @endcode

#include <map>

#include "ger/foundation/config_manager.hpp"
#include "ger/foundation/game_logger.hpp"
#include "ger/foundation/game_result.hpp"
#include "ger/foundation/types.hpp"

namespace ger::world {

struct RegistryConfig {
    foundation::ManagerId managerId;
    std::map<foundation::LogCategory, foundation::LogLevel> logLevels;

    /// Read the registry settings from @p config.
    ///
    /// @return ConfigKeyNotFound / ConfigTypeMismatch for a missing or
    ///         malformed manager id, ConfigInvalidValue for an unknown
    ///         logging category or level name.
    static foundation::GameResult<RegistryConfig> load(const foundation::ConfigManager& config);

    /// Push every configured level into @p logger.
    void applyLogLevels(foundation::GameLogger& logger) const;
};

/// Re-apply `logging.<category>` whenever it is changed through
/// ConfigManager::set().  Both objects must outlive the watch.
void watchLogLevels(foundation::ConfigManager& config, foundation::GameLogger& logger);

}  // namespace ger::world
