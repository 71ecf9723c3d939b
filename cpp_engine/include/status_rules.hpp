/**
 * Pokemon Battle Engine - Status Effect Rules
 *
 * Two evaluation points per combatant per turn:
 * - pre_action_gate(): may suppress the action (paralysis, sleep, freeze,
 *   confusion) and advances duration counters.
 * - post_action_tick(): damage over time (burn, poison).
 *
 * These are the only functions that write a combatant's status slot.
 */

#pragma once

#include "combatant.hpp"
#include "random_source.hpp"

namespace pokebattle {

constexpr double PARALYSIS_SKIP_CHANCE = 0.25;
constexpr double FREEZE_THAW_CHANCE = 0.20;
constexpr double CONFUSION_SELF_HIT_CHANCE = 0.50;
constexpr int CONFUSION_SELF_HIT_POWER = 40;
constexpr int BURN_TICK_DIVISOR = 16;
constexpr int POISON_TICK_DIVISOR = 8;
constexpr int SLEEP_MIN_TURNS = 1;
constexpr int SLEEP_MAX_TURNS = 3;
constexpr int CONFUSION_MIN_TURNS = 2;
constexpr int CONFUSION_MAX_TURNS = 5;

struct GateResult {
    bool can_act = true;
    int self_damage = 0;  // Confusion self-hit, already applied
    std::vector<std::string> messages;
};

struct TickResult {
    int damage = 0;  // Already applied
    std::string message;
};

/**
 * Pre-action gate. Draws at most one value (paralysis, freeze, confusion roll).
 */
GateResult pre_action_gate(Combatant& combatant, RandomSource& rng);

/**
 * End-of-turn damage over time. Never draws.
 */
TickResult post_action_tick(Combatant& combatant);

/**
 * Build a status slot for a freshly inflicted status.
 * Sleep and Confusion draw their duration; other kinds draw nothing.
 */
StatusSlot make_status(StatusKind kind, RandomSource& rng);

/**
 * Inflict a status if the target has none. Returns false (and draws nothing)
 * if the target is already afflicted or kind is NONE.
 */
bool try_inflict(Combatant& target, StatusKind kind, RandomSource& rng);

/**
 * Speed used for turn order: halved while paralyzed. Stored stats are untouched.
 */
int effective_speed(const Combatant& combatant);

/**
 * Confusion self-hit: the standard formula with the combatant attacking itself
 * using a typeless physical move of fixed power (no STAB, no crit).
 */
int confusion_self_damage(const Combatant& combatant);

} // namespace pokebattle
