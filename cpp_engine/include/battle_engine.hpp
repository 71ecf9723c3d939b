/**
 * Pokemon Battle Engine - Main Engine Interface
 *
 * Drives one battle from Init through the turn loop to Resolved.
 *
 * Thread-safe: simulate_battle() is const and every call owns its
 * BattleState and random source. The Pokedex must outlive the engine.
 */

#pragma once

#include "battle_state.hpp"
#include "battle_config.hpp"
#include "pokedex.hpp"
#include "random_source.hpp"
#include <nlohmann/json_fwd.hpp>

namespace pokebattle {

class XRayLogger;

class BattleEngine {
public:
    explicit BattleEngine(const Pokedex& pokedex, BattleConfig config = {});
    ~BattleEngine() = default;

    // ========================================================================
    // CORE API
    // ========================================================================

    /**
     * Run a full battle between two Pokedex entries.
     *
     * Uses config.seed when set, otherwise seeds from the clock.
     * Throws NotFoundError, DataIntegrityError or InvalidArgumentError.
     */
    BattleResult simulate_battle(const std::string& pokemon1_name,
                                 const std::string& pokemon2_name,
                                 bool detailed = true) const;

    /**
     * Same, drawing every random outcome from rng.
     */
    BattleResult simulate_battle(const std::string& pokemon1_name,
                                 const std::string& pokemon2_name,
                                 bool detailed,
                                 RandomSource& rng) const;

    // ========================================================================
    // STATE MACHINE STEPS
    // ========================================================================

    /**
     * Init: look up both profiles and their moves, derive both combatants.
     */
    BattleState create_battle(const std::string& pokemon1_name,
                              const std::string& pokemon2_name) const;

    BattleState create_battle(const PokemonProfile& profile1,
                              const PokemonProfile& profile2) const;

    /**
     * One turn: select, order, gate, resolve, tick, log, check termination.
     * No-op once the battle is resolved.
     */
    void play_turn(BattleState& state, RandomSource& rng) const;

    /**
     * Play turns until Resolved.
     */
    void run(BattleState& state, RandomSource& rng, XRayLogger* xray = nullptr) const;

    BattleResult make_result(const BattleState& state, bool detailed) const;

    const BattleConfig& get_config() const { return config_; }
    const Pokedex& get_pokedex() const { return pokedex_; }

    /**
     * Static list of mechanics the engine models.
     */
    static const std::vector<std::string>& battle_mechanics();

private:
    const Pokedex& pokedex_;
    BattleConfig config_;

    std::vector<MoveDef> resolve_moves(const PokemonProfile& profile) const;

    void execute_action(BattleState& state, SlotIndex actor, const MoveDef* move,
                        RandomSource& rng, TurnRecord& record) const;

    void apply_end_of_turn(BattleState& state, TurnRecord& record) const;

    void check_termination(BattleState& state) const;

    static std::string make_summary(const BattleState& state);
};

// ============================================================================
// SERIALIZATION
// ============================================================================

nlohmann::json to_json(const TurnRecord& record);

/**
 * Result document: pokemon1, pokemon2, winner (null on draw), total_turns,
 * battle_summary, status_effects_used, battle_mechanics, and detailed_turns
 * only when the result is detailed.
 */
nlohmann::json to_json(const BattleResult& result);

} // namespace pokebattle
