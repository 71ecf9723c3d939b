/**
 * Pokemon Battle Engine - C++ Implementation
 *
 * Deterministic-under-seed 1v1 battle resolution at level 50.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "errors.hpp"
#include "type_chart.hpp"
#include "random_source.hpp"

// Data
#include "pokedex.hpp"
#include "combatant.hpp"
#include "battle_state.hpp"

// Rules
#include "move_resolution.hpp"
#include "status_rules.hpp"
#include "turn_scheduler.hpp"

// Engine
#include "battle_config.hpp"
#include "battle_engine.hpp"
#include "battle_service.hpp"

namespace pokebattle {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace pokebattle
