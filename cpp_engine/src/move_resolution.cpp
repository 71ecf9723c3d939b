/**
 * Pokemon Battle Engine - Move Resolution Implementation
 */

#include "move_resolution.hpp"
#include "type_chart.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

namespace pokebattle {

double base_damage(int power, int attack_stat, int defense_stat) {
    const double level_factor = 2.0 * BATTLE_LEVEL / 5.0 + 2.0;
    const double ratio = static_cast<double>(attack_stat) / static_cast<double>(defense_stat);
    return (level_factor * power * ratio) / 50.0 + 2.0;
}

int final_damage(double base, double stab, double type_multiplier, double critical_multiplier) {
    if (type_multiplier == 0.0) {
        return 0;
    }
    double damage = std::floor(base * stab * type_multiplier * critical_multiplier);
    if (damage >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return std::max(1, static_cast<int>(damage));
}

int attack_stat_for(const Combatant& attacker, MoveCategory category) {
    if (category == MoveCategory::SPECIAL) {
        return attacker.stats.special_attack;
    }
    int attack = attacker.stats.attack;
    if (attacker.status_kind() == StatusKind::BURN) {
        attack /= 2;
    }
    return attack;
}

int defense_stat_for(const Combatant& defender, MoveCategory category) {
    return category == MoveCategory::SPECIAL ? defender.stats.special_defense
                                             : defender.stats.defense;
}

double stab_for(const Combatant& attacker, const MoveDef& move) {
    return attacker.has_type(move.type) ? STAB_MULTIPLIER : 1.0;
}

MoveOutcome resolve_move(const Combatant& attacker, Combatant& defender,
                         const MoveDef& move, RandomSource& rng) {
    MoveOutcome outcome;

    // Step 1: Accuracy
    double accuracy_roll = rng.next_uniform() * 100.0;
    if (accuracy_roll >= move.accuracy) {
        outcome.hit = false;
        return outcome;
    }
    outcome.hit = true;

    outcome.effectiveness = TypeChart::effectiveness(move.type, defender.types);
    outcome.effectiveness_label = TypeChart::label(outcome.effectiveness);

    // Step 2: Damage (damaging categories only)
    if (move.is_damaging()) {
        outcome.critical = rng.chance(CRITICAL_HIT_CHANCE);

        double base = base_damage(move.power,
                                  attack_stat_for(attacker, move.category),
                                  defense_stat_for(defender, move.category));
        outcome.damage = final_damage(base,
                                      stab_for(attacker, move),
                                      outcome.effectiveness,
                                      outcome.critical ? CRITICAL_MULTIPLIER : 1.0);
        defender.take_damage(outcome.damage);
    }

    // Step 3: Secondary status roll
    if (move.secondary.has_value() &&
        move.secondary->status != StatusKind::NONE &&
        outcome.effectiveness > 0.0 &&
        !defender.is_fainted() &&
        !defender.has_status()) {
        if (rng.chance(move.secondary->chance)) {
            outcome.status_inflicted = move.secondary->status;
        }
    }

    return outcome;
}

std::string describe_outcome(const Combatant& attacker, const Combatant& defender,
                             const MoveDef& move, const MoveOutcome& outcome) {
    std::ostringstream line;
    line << attacker.name << " used " << move.name;

    if (!outcome.hit) {
        line << " but it missed!";
        return line.str();
    }

    // Close the clause before a follow-up sentence
    auto end_sentence = [&line]() {
        const std::string text = line.str();
        if (std::isalnum(static_cast<unsigned char>(text.back()))) {
            line << ".";
        }
    };

    if (move.is_damaging()) {
        line << " and dealt " << outcome.damage << " damage to " << defender.name;
        if (outcome.critical) {
            line << " (Critical hit!)";
        }
        if (outcome.effectiveness == 0.0) {
            end_sentence();
            line << " It had no effect on " << defender.name << "...";
        } else if (outcome.effectiveness > 1.0) {
            end_sentence();
            line << " It's super effective!";
        } else if (outcome.effectiveness < 1.0) {
            end_sentence();
            line << " It's not very effective...";
        }
    } else if (outcome.effectiveness == 0.0) {
        line << " but it had no effect on " << defender.name << "...";
    } else if (!outcome.status_inflicted.has_value()) {
        line << " but nothing happened";
    }

    if (outcome.status_inflicted.has_value()) {
        end_sentence();
        line << " " << defender.name << " is now "
             << status_adjective(*outcome.status_inflicted) << "!";
    }

    return line.str();
}

} // namespace pokebattle
