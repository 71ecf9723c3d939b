/**
 * Pokemon Battle Engine - Battle State
 *
 * The root state object for one simulation: both combatants, the phase,
 * the turn counter and the accumulated per-turn log. Owned by a single
 * simulate call and never shared.
 */

#pragma once

#include "combatant.hpp"
#include <array>

namespace pokebattle {

/**
 * HP/status of one side at the end of a turn.
 */
struct CombatantSnapshot {
    std::string name;
    int hp = 0;
    int max_hp = 0;
    StatusKind status = StatusKind::NONE;
};

/**
 * One entry of the battle log.
 */
struct TurnRecord {
    int turn = 0;
    std::vector<std::string> actions;
    std::array<CombatantSnapshot, 2> end_state;
};

struct BattleState {
    std::array<Combatant, 2> combatants;

    BattlePhase phase = BattlePhase::INIT;
    int turn_count = 0;
    std::vector<TurnRecord> log;

    BattleOutcome outcome = BattleOutcome::ONGOING;
    bool reached_turn_cap = false;
    bool status_applied = false;

    // ========================================================================
    // COMBATANT ACCESS
    // ========================================================================

    Combatant& get_combatant(SlotIndex slot) { return combatants[slot]; }
    const Combatant& get_combatant(SlotIndex slot) const { return combatants[slot]; }

    Combatant& get_opponent(SlotIndex slot) { return combatants[1 - slot]; }
    const Combatant& get_opponent(SlotIndex slot) const { return combatants[1 - slot]; }

    bool any_fainted() const {
        return combatants[0].is_fainted() || combatants[1].is_fainted();
    }

    // ========================================================================
    // BATTLE STATUS
    // ========================================================================

    bool is_resolved() const { return phase == BattlePhase::RESOLVED; }

    std::optional<SlotIndex> winner_slot() const {
        if (outcome == BattleOutcome::POKEMON_1_WIN) return 0;
        if (outcome == BattleOutcome::POKEMON_2_WIN) return 1;
        return std::nullopt;
    }

    CombatantSnapshot snapshot(SlotIndex slot) const {
        const Combatant& c = combatants[slot];
        return {c.name, c.current_hp, c.max_hp(), c.status_kind()};
    }
};

/**
 * Outcome handed back to the caller.
 */
struct BattleResult {
    std::string pokemon1;
    std::string pokemon2;
    std::optional<std::string> winner;  // nullopt: draw
    BattleOutcome outcome = BattleOutcome::ONGOING;
    int total_turns = 0;
    std::string battle_summary;
    bool reached_turn_cap = false;
    bool status_effects_used = false;

    bool detailed = true;
    std::vector<TurnRecord> turns;  // Empty unless detailed

    bool is_draw() const { return outcome == BattleOutcome::DRAW; }
};

} // namespace pokebattle
