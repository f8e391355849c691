#pragma once

/// @file logger_adapter.hpp
/// @brief Aggregate header for the logging layer (kcenon common_system).

#include "ger/foundation/game_logger.hpp"
