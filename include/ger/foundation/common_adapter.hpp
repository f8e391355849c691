#pragma once

/// @file common_adapter.hpp
/// @brief Aggregate header for error types, Result aliases, strong IDs,
///        and configuration management.

#include "ger/foundation/config_manager.hpp"
#include "ger/foundation/error_code.hpp"
#include "ger/foundation/game_error.hpp"
#include "ger/foundation/game_result.hpp"
#include "ger/foundation/types.hpp"
