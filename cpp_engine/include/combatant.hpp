/**
 * Pokemon Battle Engine - Combatant
 *
 * Battle-scoped mutable state for one Pokemon: level-50 stats, current HP,
 * the single status slot, and the moves it fights with.
 */

#pragma once

#include "types.hpp"
#include "pokedex.hpp"
#include <variant>

namespace pokebattle {

constexpr int BATTLE_LEVEL = 50;
constexpr size_t MAX_MOVE_SLOTS = 4;

// ============================================================================
// STATUS SLOT
// ============================================================================

namespace status {

struct None {};
struct Burn {};
struct Poison {};
struct Paralysis {};
struct Sleep { int turns_left = 0; };
struct Freeze {};
struct Confusion { int turns_left = 0; };

} // namespace status

/**
 * Exactly one status at a time; "at most one active" holds by construction.
 */
using StatusSlot = std::variant<
    status::None,
    status::Burn,
    status::Poison,
    status::Paralysis,
    status::Sleep,
    status::Freeze,
    status::Confusion
>;

StatusKind kind_of(const StatusSlot& slot);

// ============================================================================
// STATS
// ============================================================================

struct StatBlock {
    int hp = 0;
    int attack = 0;
    int defense = 0;
    int special_attack = 0;
    int special_defense = 0;
    int speed = 0;
};

/**
 * Level-50 scaling: floor((2 * base * 50) / 100) + 5; HP adds another 50.
 */
inline int scale_stat(int base) {
    return (2 * base * BATTLE_LEVEL) / 100 + 5;
}

inline int scale_hp(int base) {
    return scale_stat(base) + BATTLE_LEVEL;
}

// ============================================================================
// COMBATANT
// ============================================================================

struct Combatant {
    std::string name;
    std::vector<ElementType> types;
    std::vector<MoveDef> moves;

    StatBlock stats;
    int current_hp = 0;
    StatusSlot status = status::None{};

    int max_hp() const { return stats.hp; }
    bool is_fainted() const { return current_hp <= 0; }
    StatusKind status_kind() const { return kind_of(status); }
    bool has_status() const { return !std::holds_alternative<status::None>(status); }

    bool has_type(ElementType type) const {
        return std::find(types.begin(), types.end(), type) != types.end();
    }

    /**
     * Subtract damage, clamped at 0. Returns HP actually lost.
     */
    int take_damage(int amount) {
        int lost = std::min(std::max(amount, 0), current_hp);
        current_hp -= lost;
        return lost;
    }
};

/**
 * Build a fresh combatant from a profile.
 *
 * HP starts at max, status None. Throws DataIntegrityError if any of the six
 * base stats is missing or outside [1, 255], or if the profile has zero or more than
 * two types.
 */
Combatant derive_combatant(const PokemonProfile& profile, std::vector<MoveDef> moves = {});

} // namespace pokebattle
