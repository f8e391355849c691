#pragma once

/// @file container_adapter.hpp
/// @brief Aggregate header for the serialization layer.

#include "ger/foundation/game_serializer.hpp"
