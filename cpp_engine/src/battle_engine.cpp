/**
 * Pokemon Battle Engine - Engine Implementation
 *
 * Core battle logic: Init, the turn loop and termination.
 */

#include "battle_engine.hpp"
#include "errors.hpp"
#include "move_resolution.hpp"
#include "status_rules.hpp"
#include "turn_scheduler.hpp"
#include "xray_logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>

using json = nlohmann::json;

namespace pokebattle {

BattleEngine::BattleEngine(const Pokedex& pokedex, BattleConfig config)
    : pokedex_(pokedex)
    , config_(std::move(config)) {
    config_.validate();
}

const std::vector<std::string>& BattleEngine::battle_mechanics() {
    static const std::vector<std::string> kMechanics = {
        "Type effectiveness calculations",
        "Damage formulas based on stats and move power",
        "Speed-based turn order",
        "Status effects: Burn, Poison, Paralysis, Sleep, Freeze, Confusion",
        "Critical hits and STAB bonuses",
        "Level 50 stat scaling",
    };
    return kMechanics;
}

// ============================================================================
// CORE API
// ============================================================================

BattleResult BattleEngine::simulate_battle(const std::string& pokemon1_name,
                                           const std::string& pokemon2_name,
                                           bool detailed) const {
    uint64_t seed = 0;
    if (config_.seed.has_value()) {
        seed = *config_.seed;
    } else {
        seed = static_cast<uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
    }

    Mt19937RandomSource rng(seed);
    return simulate_battle(pokemon1_name, pokemon2_name, detailed, rng);
}

BattleResult BattleEngine::simulate_battle(const std::string& pokemon1_name,
                                           const std::string& pokemon2_name,
                                           bool detailed,
                                           RandomSource& rng) const {
    BattleState state = create_battle(pokemon1_name, pokemon2_name);

    if (config_.verbose) {
        std::cout << "[BattleEngine] Battle ready: "
                  << state.combatants[0].name << " (HP: " << state.combatants[0].max_hp() << ") vs "
                  << state.combatants[1].name << " (HP: " << state.combatants[1].max_hp() << ")"
                  << std::endl;
    }

    if (config_.xray_dir.empty()) {
        run(state, rng);
    } else {
        XRayLogger xray(config_.xray_dir,
                        state.combatants[0].name + "_vs_" + state.combatants[1].name);
        run(state, rng, &xray);
    }

    BattleResult result = make_result(state, detailed);

    if (config_.verbose) {
        std::cout << "[BattleEngine] " << result.battle_summary << std::endl;
    }

    return result;
}

// ============================================================================
// INIT
// ============================================================================

BattleState BattleEngine::create_battle(const std::string& pokemon1_name,
                                        const std::string& pokemon2_name) const {
    if (pokemon1_name.empty() || pokemon2_name.empty()) {
        throw InvalidArgumentError("Both Pokemon names are required");
    }
    if (!config_.allow_mirror_match && to_lower(pokemon1_name) == to_lower(pokemon2_name)) {
        throw InvalidArgumentError("Mirror matches are disabled: " + pokemon1_name);
    }

    const PokemonProfile& profile1 = pokedex_.lookup_profile(pokemon1_name);
    const PokemonProfile& profile2 = pokedex_.lookup_profile(pokemon2_name);
    return create_battle(profile1, profile2);
}

BattleState BattleEngine::create_battle(const PokemonProfile& profile1,
                                        const PokemonProfile& profile2) const {
    BattleState state;
    state.combatants[0] = derive_combatant(profile1, resolve_moves(profile1));
    state.combatants[1] = derive_combatant(profile2, resolve_moves(profile2));
    state.phase = BattlePhase::INIT;
    return state;
}

std::vector<MoveDef> BattleEngine::resolve_moves(const PokemonProfile& profile) const {
    std::vector<MoveDef> moves;
    for (const auto& move_name : profile.moves) {
        if (moves.size() == MAX_MOVE_SLOTS) {
            break;
        }
        moves.push_back(pokedex_.lookup_move(move_name));
    }
    return moves;
}

// ============================================================================
// TURN LOOP
// ============================================================================

void BattleEngine::run(BattleState& state, RandomSource& rng, XRayLogger* xray) const {
    if (xray) {
        xray->log_battle_start(state);
    }

    while (!state.is_resolved()) {
        play_turn(state, rng);
        if (xray) {
            xray->log_turn(state.log.back(), state);
        }
    }

    if (xray) {
        xray->log_battle_end(make_result(state, false));
    }
}

void BattleEngine::play_turn(BattleState& state, RandomSource& rng) const {
    if (state.is_resolved()) {
        return;
    }

    state.phase = BattlePhase::TURN_LOOP;
    state.turn_count++;

    TurnRecord record;
    record.turn = state.turn_count;

    // Both sides commit before ordering
    std::array<const MoveDef*, 2> chosen = {
        select_move(state.combatants[0], state.combatants[1]),
        select_move(state.combatants[1], state.combatants[0]),
    };

    auto [first, second] = order_actions(state.combatants[0], state.combatants[1]);

    for (SlotIndex actor : {first, second}) {
        execute_action(state, actor, chosen[actor], rng, record);
        if (state.any_fainted()) {
            break;
        }
    }

    if (!state.any_fainted()) {
        apply_end_of_turn(state, record);
    }

    for (SlotIndex slot : {SlotIndex{0}, SlotIndex{1}}) {
        if (state.combatants[slot].is_fainted()) {
            record.actions.push_back(state.combatants[slot].name + " fainted!");
        }
    }

    record.end_state = {state.snapshot(0), state.snapshot(1)};
    state.log.push_back(std::move(record));

    check_termination(state);
}

void BattleEngine::execute_action(BattleState& state, SlotIndex actor, const MoveDef* move,
                                  RandomSource& rng, TurnRecord& record) const {
    Combatant& attacker = state.get_combatant(actor);
    Combatant& defender = state.get_opponent(actor);

    GateResult gate = pre_action_gate(attacker, rng);
    record.actions.insert(record.actions.end(), gate.messages.begin(), gate.messages.end());
    if (!gate.can_act) {
        return;
    }

    if (!move) {
        record.actions.push_back(attacker.name + " has no moves and cannot attack!");
        return;
    }

    MoveOutcome outcome = resolve_move(attacker, defender, *move, rng);
    if (outcome.status_inflicted.has_value()) {
        if (try_inflict(defender, *outcome.status_inflicted, rng)) {
            state.status_applied = true;
        } else {
            outcome.status_inflicted.reset();
        }
    }

    record.actions.push_back(describe_outcome(attacker, defender, *move, outcome));
}

void BattleEngine::apply_end_of_turn(BattleState& state, TurnRecord& record) const {
    for (auto& combatant : state.combatants) {
        if (combatant.is_fainted()) {
            continue;
        }
        TickResult tick = post_action_tick(combatant);
        if (!tick.message.empty()) {
            record.actions.push_back(tick.message);
        }
    }
}

void BattleEngine::check_termination(BattleState& state) const {
    const bool fainted1 = state.combatants[0].is_fainted();
    const bool fainted2 = state.combatants[1].is_fainted();

    if (fainted1 && fainted2) {
        state.outcome = BattleOutcome::DRAW;
    } else if (fainted1) {
        state.outcome = BattleOutcome::POKEMON_2_WIN;
    } else if (fainted2) {
        state.outcome = BattleOutcome::POKEMON_1_WIN;
    } else if (state.turn_count >= config_.max_turns) {
        state.outcome = BattleOutcome::DRAW;
        state.reached_turn_cap = true;
    } else {
        return;
    }

    state.phase = BattlePhase::RESOLVED;
}

// ============================================================================
// RESULT
// ============================================================================

std::string BattleEngine::make_summary(const BattleState& state) {
    if (auto winner = state.winner_slot()) {
        return state.combatants[*winner].name + " won in " +
               std::to_string(state.turn_count) + " turns";
    }
    if (state.reached_turn_cap) {
        return "Battle ended in a draw after reaching the " +
               std::to_string(state.turn_count) + "-turn limit";
    }
    return "Battle ended in a draw";
}

BattleResult BattleEngine::make_result(const BattleState& state, bool detailed) const {
    BattleResult result;
    result.pokemon1 = state.combatants[0].name;
    result.pokemon2 = state.combatants[1].name;
    result.outcome = state.outcome;
    if (auto winner = state.winner_slot()) {
        result.winner = state.combatants[*winner].name;
    }
    result.total_turns = state.turn_count;
    result.battle_summary = make_summary(state);
    result.reached_turn_cap = state.reached_turn_cap;
    result.status_effects_used = state.status_applied;
    result.detailed = detailed;
    if (detailed) {
        result.turns = state.log;
    }
    return result;
}

// ============================================================================
// SERIALIZATION
// ============================================================================

json to_json(const TurnRecord& record) {
    json sides = json::array();
    for (const auto& side : record.end_state) {
        sides.push_back({
            {"name", side.name},
            {"hp", side.hp},
            {"max_hp", side.max_hp},
            {"status", to_string(side.status)},
        });
    }
    return {
        {"turn", record.turn},
        {"actions", record.actions},
        {"state", sides},
    };
}

json to_json(const BattleResult& result) {
    json doc = {
        {"pokemon1", result.pokemon1},
        {"pokemon2", result.pokemon2},
        {"winner", result.winner.has_value() ? json(*result.winner) : json(nullptr)},
        {"outcome", to_string(result.outcome)},
        {"total_turns", result.total_turns},
        {"battle_summary", result.battle_summary},
        {"reached_turn_limit", result.reached_turn_cap},
        {"status_effects_used", result.status_effects_used},
        {"battle_mechanics", BattleEngine::battle_mechanics()},
    };

    if (result.detailed) {
        json turns = json::array();
        for (const auto& record : result.turns) {
            turns.push_back(to_json(record));
        }
        doc["detailed_turns"] = turns;
    }

    return doc;
}

} // namespace pokebattle
