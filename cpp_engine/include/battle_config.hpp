/**
 * Pokemon Battle Engine - Configuration
 *
 * Settings are layered: defaults, then a JSON file, then environment
 * variables, then console flags.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pokebattle {

constexpr int DEFAULT_MAX_TURNS = 100;

struct BattleConfig {
    /**
     * Anti-stall guard, not a game rule: a battle still running after this
     * many turns resolves as a draw. Must be >= 1.
     */
    int max_turns = DEFAULT_MAX_TURNS;

    // Absent: seeded from the clock per simulation
    std::optional<uint64_t> seed;

    bool allow_mirror_match = true;
    bool verbose = false;

    // Non-empty: write an X-Ray trace per battle into this directory
    std::string xray_dir;

    std::string database_path = "data/pokedex.json";

    /**
     * Load overrides from a JSON file.
     * Returns false (and logs the cause) if the file is missing or malformed.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Apply overrides from a JSON object. Throws InvalidArgumentError on bad values.
     */
    void apply_json(const nlohmann::json& config_json);

    /**
     * POKEBATTLE_DATABASE_PATH, POKEBATTLE_MAX_TURNS.
     * Throws InvalidArgumentError on a non-numeric turn cap.
     */
    void apply_environment();

    /**
     * Throws InvalidArgumentError if any value is out of range.
     */
    void validate() const;
};

/**
 * Parse a decimal seed from text (console flags and commands).
 * Throws InvalidArgumentError unless the whole string is an unsigned integer
 * that fits in 64 bits.
 */
uint64_t parse_seed(const std::string& text);

} // namespace pokebattle
