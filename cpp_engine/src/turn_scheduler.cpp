/**
 * Pokemon Battle Engine - Turn Scheduler Implementation
 */

#include "turn_scheduler.hpp"
#include "status_rules.hpp"
#include "move_resolution.hpp"
#include "type_chart.hpp"

namespace pokebattle {

std::pair<SlotIndex, SlotIndex> order_actions(const Combatant& a, const Combatant& b) {
    if (effective_speed(b) > effective_speed(a)) {
        return {1, 0};
    }
    return {0, 1};
}

double expected_damage_score(const Combatant& attacker, const Combatant& defender,
                             const MoveDef& move) {
    if (!move.is_damaging()) {
        return 0.0;
    }
    return move.power * (move.accuracy / 100.0) *
           stab_for(attacker, move) *
           TypeChart::effectiveness(move.type, defender.types);
}

const MoveDef* select_move(const Combatant& attacker, const Combatant& defender) {
    if (attacker.moves.empty()) {
        return nullptr;
    }

    const MoveDef* best = nullptr;
    double best_score = 0.0;
    for (const auto& move : attacker.moves) {
        double score = expected_damage_score(attacker, defender, move);
        if (score > best_score) {
            best = &move;
            best_score = score;
        }
    }
    if (best) {
        return best;
    }

    if (!defender.has_status()) {
        for (const auto& move : attacker.moves) {
            if (move.secondary.has_value() && move.secondary->status != StatusKind::NONE) {
                return &move;
            }
        }
    }

    return &attacker.moves.front();
}

} // namespace pokebattle
