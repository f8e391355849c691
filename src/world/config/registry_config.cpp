/// @file registry_config.cpp
/// @brief RegistryConfig loading and live log-level updates.

#include "ger/world/registry_config.hpp"

#include <cctype>
#include <string>

namespace ger::world {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameLogger;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogLevel;

namespace {

constexpr std::string_view kManagerIdKey = "registry.manager_id";
constexpr std::string_view kLoggingPrefix = "logging";

GameResult<LogLevel> readLevel(const ConfigManager& config, const std::string& key) {
    auto name = config.get<std::string>(key);
    if (!name) {
        return GameResult<LogLevel>::err(std::move(name).error());
    }
    auto level = foundation::parseLogLevel(name.value());
    if (!level) {
        return GameResult<LogLevel>::err(
            GameError(ErrorCode::ConfigInvalidValue,
                      "unknown log level '" + name.value() + "' for key: " + key));
    }
    return GameResult<LogLevel>::ok(*level);
}

}  // namespace

GameResult<RegistryConfig> RegistryConfig::load(const ConfigManager& config) {
    auto managerId = config.get<uint32_t>(kManagerIdKey);
    if (!managerId) {
        return GameResult<RegistryConfig>::err(std::move(managerId).error());
    }

    RegistryConfig result;
    result.managerId = foundation::ManagerId(managerId.value());

    const std::string prefix = std::string(kLoggingPrefix) + ".";
    for (const auto& key : config.keysUnder(kLoggingPrefix)) {
        auto category = foundation::parseLogCategory(key.substr(prefix.size()));
        if (!category) {
            return GameResult<RegistryConfig>::err(
                GameError(ErrorCode::ConfigInvalidValue, "unknown log category in key: " + key));
        }
        auto level = readLevel(config, key);
        if (!level) {
            return GameResult<RegistryConfig>::err(std::move(level).error());
        }
        result.logLevels[*category] = level.value();
    }

    return GameResult<RegistryConfig>::ok(std::move(result));
}

void RegistryConfig::applyLogLevels(GameLogger& logger) const {
    for (const auto& [category, level] : logLevels) {
        logger.setCategoryLevel(category, level);
    }
}

void watchLogLevels(ConfigManager& config, GameLogger& logger) {
    for (std::size_t i = 0; i < foundation::kLogCategoryCount; ++i) {
        const auto category = static_cast<LogCategory>(i);
        std::string key = std::string(kLoggingPrefix) + ".";
        for (char c : foundation::logCategoryName(category)) {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        config.watch(key, [&config, &logger, category](std::string_view changed) {
            auto level = readLevel(config, std::string(changed));
            if (!level) {
                GER_LOG_WARN(LogCategory::Config, level.error().message());
                return;
            }
            logger.setCategoryLevel(category, level.value());
        });
    }
}

}  // namespace ger::world
