#pragma once

/// @file ger.hpp
/// @brief Umbrella header for the game entity registry.

#include "ger/core/result.hpp"
#include "ger/version.hpp"

#include "ger/foundation/common_adapter.hpp"
#include "ger/foundation/container_adapter.hpp"
#include "ger/foundation/logger_adapter.hpp"

#include "ger/world/entity.hpp"
#include "ger/world/entity_manager.hpp"
#include "ger/world/player_registry.hpp"
#include "ger/world/registry_config.hpp"
