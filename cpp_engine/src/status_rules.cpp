/**
 * Pokemon Battle Engine - Status Effect Rules Implementation
 */

#include "status_rules.hpp"
#include "move_resolution.hpp"

namespace pokebattle {

GateResult pre_action_gate(Combatant& combatant, RandomSource& rng) {
    GateResult result;
    const std::string& name = combatant.name;

    if (std::holds_alternative<status::Paralysis>(combatant.status)) {
        if (rng.chance(PARALYSIS_SKIP_CHANCE)) {
            result.can_act = false;
            result.messages.push_back(name + " is fully paralyzed!");
        }
        return result;
    }

    if (auto* sleep = std::get_if<status::Sleep>(&combatant.status)) {
        if (sleep->turns_left <= 0) {
            combatant.status = status::None{};
            result.messages.push_back(name + " woke up!");
            return result;
        }

        // The waking turn is still lost
        result.can_act = false;
        result.messages.push_back(name + " is fast asleep!");
        if (--sleep->turns_left <= 0) {
            combatant.status = status::None{};
            result.messages.push_back(name + " woke up!");
        }
        return result;
    }

    if (std::holds_alternative<status::Freeze>(combatant.status)) {
        if (rng.chance(FREEZE_THAW_CHANCE)) {
            combatant.status = status::None{};
            result.messages.push_back(name + " thawed out!");
        } else {
            result.can_act = false;
            result.messages.push_back(name + " is frozen solid!");
        }
        return result;
    }

    if (auto* confusion = std::get_if<status::Confusion>(&combatant.status)) {
        if (--confusion->turns_left <= 0) {
            combatant.status = status::None{};
            result.messages.push_back(name + " snapped out of confusion!");
            return result;
        }

        result.messages.push_back(name + " is confused!");
        if (rng.chance(CONFUSION_SELF_HIT_CHANCE)) {
            result.can_act = false;
            result.self_damage = combatant.take_damage(confusion_self_damage(combatant));
            result.messages.push_back(name + " hurt itself in its confusion! (-" +
                                      std::to_string(result.self_damage) + " HP)");
        }
        return result;
    }

    return result;
}

TickResult post_action_tick(Combatant& combatant) {
    TickResult result;

    switch (combatant.status_kind()) {
        case StatusKind::BURN: {
            int amount = std::max(1, combatant.max_hp() / BURN_TICK_DIVISOR);
            result.damage = combatant.take_damage(amount);
            result.message = combatant.name + " is hurt by its burn! (-" +
                             std::to_string(result.damage) + " HP)";
            break;
        }
        case StatusKind::POISON: {
            int amount = std::max(1, combatant.max_hp() / POISON_TICK_DIVISOR);
            result.damage = combatant.take_damage(amount);
            result.message = combatant.name + " is hurt by poison! (-" +
                             std::to_string(result.damage) + " HP)";
            break;
        }
        default:
            break;
    }

    return result;
}

StatusSlot make_status(StatusKind kind, RandomSource& rng) {
    switch (kind) {
        case StatusKind::BURN: return status::Burn{};
        case StatusKind::POISON: return status::Poison{};
        case StatusKind::PARALYSIS: return status::Paralysis{};
        case StatusKind::SLEEP:
            return status::Sleep{rng.next_int(SLEEP_MIN_TURNS, SLEEP_MAX_TURNS)};
        case StatusKind::FREEZE: return status::Freeze{};
        case StatusKind::CONFUSION:
            return status::Confusion{rng.next_int(CONFUSION_MIN_TURNS, CONFUSION_MAX_TURNS)};
        default: return status::None{};
    }
}

bool try_inflict(Combatant& target, StatusKind kind, RandomSource& rng) {
    if (kind == StatusKind::NONE || target.has_status()) {
        return false;
    }
    target.status = make_status(kind, rng);
    return true;
}

int effective_speed(const Combatant& combatant) {
    int speed = combatant.stats.speed;
    if (std::holds_alternative<status::Paralysis>(combatant.status)) {
        speed /= 2;
    }
    return speed;
}

int confusion_self_damage(const Combatant& combatant) {
    double base = base_damage(CONFUSION_SELF_HIT_POWER,
                              attack_stat_for(combatant, MoveCategory::PHYSICAL),
                              defense_stat_for(combatant, MoveCategory::PHYSICAL));
    return final_damage(base, 1.0, 1.0, 1.0);
}

} // namespace pokebattle
