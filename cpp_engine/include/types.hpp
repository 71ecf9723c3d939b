/**
 * Pokemon Battle Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 * String forms match the lowercase identifiers used by the Pokedex export.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>

namespace pokebattle {

// ============================================================================
// ENUMS
// ============================================================================

/**
 * Elemental types. Order matches the rows/columns of the type chart.
 */
enum class ElementType : uint8_t {
    NORMAL,
    FIRE,
    WATER,
    ELECTRIC,
    GRASS,
    ICE,
    FIGHTING,
    POISON,
    GROUND,
    FLYING,
    PSYCHIC,
    BUG,
    ROCK,
    GHOST,
    DRAGON,
    DARK,
    STEEL,
    FAIRY
};

constexpr int ELEMENT_TYPE_COUNT = 18;

enum class MoveCategory : uint8_t {
    PHYSICAL,
    SPECIAL,
    STATUS
};

enum class StatusKind : uint8_t {
    NONE,
    BURN,
    POISON,
    PARALYSIS,
    SLEEP,
    FREEZE,
    CONFUSION
};

enum class BattlePhase : uint8_t {
    INIT,
    TURN_LOOP,
    RESOLVED
};

enum class BattleOutcome : uint8_t {
    ONGOING,
    POKEMON_1_WIN,
    POKEMON_2_WIN,
    DRAW
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using SpeciesName = std::string;      // Lowercase identifier (e.g., "pikachu")
using MoveName = std::string;         // Lowercase identifier (e.g., "thunderbolt")
using SlotIndex = uint8_t;            // 0 or 1

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline const char* to_string(ElementType type) {
    switch (type) {
        case ElementType::NORMAL: return "normal";
        case ElementType::FIRE: return "fire";
        case ElementType::WATER: return "water";
        case ElementType::ELECTRIC: return "electric";
        case ElementType::GRASS: return "grass";
        case ElementType::ICE: return "ice";
        case ElementType::FIGHTING: return "fighting";
        case ElementType::POISON: return "poison";
        case ElementType::GROUND: return "ground";
        case ElementType::FLYING: return "flying";
        case ElementType::PSYCHIC: return "psychic";
        case ElementType::BUG: return "bug";
        case ElementType::ROCK: return "rock";
        case ElementType::GHOST: return "ghost";
        case ElementType::DRAGON: return "dragon";
        case ElementType::DARK: return "dark";
        case ElementType::STEEL: return "steel";
        case ElementType::FAIRY: return "fairy";
        default: return "unknown";
    }
}

inline const char* to_string(MoveCategory category) {
    switch (category) {
        case MoveCategory::PHYSICAL: return "physical";
        case MoveCategory::SPECIAL: return "special";
        case MoveCategory::STATUS: return "status";
        default: return "unknown";
    }
}

inline const char* to_string(StatusKind status) {
    switch (status) {
        case StatusKind::NONE: return "none";
        case StatusKind::BURN: return "burn";
        case StatusKind::POISON: return "poison";
        case StatusKind::PARALYSIS: return "paralysis";
        case StatusKind::SLEEP: return "sleep";
        case StatusKind::FREEZE: return "freeze";
        case StatusKind::CONFUSION: return "confusion";
        default: return "unknown";
    }
}

/**
 * Adjective form used in log lines ("Pikachu is now paralyzed!").
 */
inline const char* status_adjective(StatusKind status) {
    switch (status) {
        case StatusKind::BURN: return "burned";
        case StatusKind::POISON: return "poisoned";
        case StatusKind::PARALYSIS: return "paralyzed";
        case StatusKind::SLEEP: return "asleep";
        case StatusKind::FREEZE: return "frozen";
        case StatusKind::CONFUSION: return "confused";
        default: return "healthy";
    }
}

inline const char* to_string(BattlePhase phase) {
    switch (phase) {
        case BattlePhase::INIT: return "init";
        case BattlePhase::TURN_LOOP: return "turn_loop";
        case BattlePhase::RESOLVED: return "resolved";
        default: return "unknown";
    }
}

inline const char* to_string(BattleOutcome outcome) {
    switch (outcome) {
        case BattleOutcome::ONGOING: return "ongoing";
        case BattleOutcome::POKEMON_1_WIN: return "pokemon_1_win";
        case BattleOutcome::POKEMON_2_WIN: return "pokemon_2_win";
        case BattleOutcome::DRAW: return "draw";
        default: return "unknown";
    }
}

// Parsers return nullopt for unknown tokens; callers decide how to report it.

inline std::optional<ElementType> parse_element_type(const std::string& s) {
    const std::string t = to_lower(s);
    for (int i = 0; i < ELEMENT_TYPE_COUNT; ++i) {
        auto type = static_cast<ElementType>(i);
        if (t == to_string(type)) return type;
    }
    return std::nullopt;
}

inline std::optional<MoveCategory> parse_move_category(const std::string& s) {
    const std::string t = to_lower(s);
    if (t == "physical") return MoveCategory::PHYSICAL;
    if (t == "special") return MoveCategory::SPECIAL;
    if (t == "status") return MoveCategory::STATUS;
    return std::nullopt;
}

inline std::optional<StatusKind> parse_status_kind(const std::string& s) {
    const std::string t = to_lower(s);
    if (t == "burn") return StatusKind::BURN;
    if (t == "poison") return StatusKind::POISON;
    if (t == "paralysis") return StatusKind::PARALYSIS;
    if (t == "sleep") return StatusKind::SLEEP;
    if (t == "freeze") return StatusKind::FREEZE;
    if (t == "confusion") return StatusKind::CONFUSION;
    return std::nullopt;
}

} // namespace pokebattle
