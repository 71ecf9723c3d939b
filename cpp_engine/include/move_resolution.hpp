/**
 * Pokemon Battle Engine - Move Resolution
 *
 * Accuracy, damage formula, STAB, critical hits, type effectiveness and the
 * secondary status roll for a single move use.
 *
 * Random draws, in order: accuracy; critical (damaging moves only, after a hit);
 * secondary status (only when the move hit, has a secondary effect, and the
 * defender is standing with no status).
 */

#pragma once

#include "combatant.hpp"
#include "random_source.hpp"

namespace pokebattle {

constexpr double CRITICAL_HIT_CHANCE = 1.0 / 16.0;
constexpr double CRITICAL_MULTIPLIER = 1.5;
constexpr double STAB_MULTIPLIER = 1.5;

struct MoveOutcome {
    bool hit = false;
    int damage = 0;
    bool critical = false;
    double effectiveness = 1.0;
    std::string effectiveness_label = "normal";
    std::optional<StatusKind> status_inflicted;  // Applied by the status rules, not here
};

/**
 * Level-50 damage base before modifiers:
 *   ((2 * 50 / 5 + 2) * power * (attack / defense)) / 50 + 2
 */
double base_damage(int power, int attack_stat, int defense_stat);

/**
 * Final damage from the base and multipliers.
 *
 * Returns 0 when type_multiplier is 0; otherwise floor(...) raised to at least 1.
 */
int final_damage(double base, double stab, double type_multiplier, double critical_multiplier);

/**
 * Attacker stat used for the move category (Burn halves physical Attack).
 */
int attack_stat_for(const Combatant& attacker, MoveCategory category);
int defense_stat_for(const Combatant& defender, MoveCategory category);

double stab_for(const Combatant& attacker, const MoveDef& move);

/**
 * Resolve one move use. Decrements defender HP (clamped at 0); never touches
 * either status slot.
 */
MoveOutcome resolve_move(const Combatant& attacker, Combatant& defender,
                         const MoveDef& move, RandomSource& rng);

/**
 * Log line for an outcome, e.g.
 * "pikachu used thunderbolt and dealt 117 damage to charizard (Critical hit!) It's super effective!".
 */
std::string describe_outcome(const Combatant& attacker, const Combatant& defender,
                             const MoveDef& move, const MoveOutcome& outcome);

} // namespace pokebattle
