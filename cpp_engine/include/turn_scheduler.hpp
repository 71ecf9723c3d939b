/**
 * Pokemon Battle Engine - Turn Scheduler
 *
 * Speed-based action ordering and the fixed move-selection heuristic.
 * Neither function draws from the random source.
 */

#pragma once

#include "combatant.hpp"
#include <utility>

namespace pokebattle {

/**
 * Returns (first, second) slot indices for the turn.
 *
 * Higher effective speed acts first. On an exact tie slot 0 (the first-listed
 * combatant) acts first.
 */
std::pair<SlotIndex, SlotIndex> order_actions(const Combatant& a, const Combatant& b);

/**
 * Expected damage score used by the heuristic:
 * power * accuracy/100 * STAB * type multiplier (0 for status moves).
 */
double expected_damage_score(const Combatant& attacker, const Combatant& defender,
                             const MoveDef& move);

/**
 * Deterministic move choice. Returns nullptr if the attacker has no moves.
 *
 * 1. Damaging move with the highest expected score (earliest on ties).
 * 2. If nothing scores above 0: first status-inflicting move, if the defender
 *    has no status.
 * 3. Otherwise the first move.
 */
const MoveDef* select_move(const Combatant& attacker, const Combatant& defender);

} // namespace pokebattle
