/**
 * Pokemon Battle Engine - Pokedex
 *
 * Stores immutable Pokemon profiles and move definitions loaded from JSON.
 * Read-only after loading; shared by every simulation.
 */

#pragma once

#include "types.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace pokebattle {

// Accepted ranges for exported data
constexpr int MIN_BASE_STAT = 1;
constexpr int MAX_BASE_STAT = 255;
constexpr int MAX_MOVE_POWER = 250;

/**
 * Secondary effect of a move (e.g., flamethrower: 10% burn).
 */
struct SecondaryEffect {
    StatusKind status = StatusKind::NONE;
    double chance = 0.0;  // [0, 1]
};

/**
 * Move definition (immutable).
 */
struct MoveDef {
    int id = 0;
    MoveName name;
    ElementType type = ElementType::NORMAL;
    MoveCategory category = MoveCategory::PHYSICAL;
    int power = 0;          // 0 for status moves
    int accuracy = 100;     // 1-100
    std::optional<SecondaryEffect> secondary;

    bool is_damaging() const {
        return category != MoveCategory::STATUS && power > 0;
    }
};

struct AbilityEntry {
    std::string name;
    bool is_hidden = false;
    int slot = 1;
    std::string short_effect;
};

struct EvolutionLink {
    int species_id = 0;
    SpeciesName name;
    std::optional<int> evolves_from_species_id;
};

/**
 * Pokemon profile (immutable).
 *
 * Base stats are kept by name ("hp", "attack", "defense", "special-attack",
 * "special-defense", "speed") exactly as exported; the combatant model
 * validates that all six are present.
 */
struct PokemonProfile {
    int id = 0;
    SpeciesName name;
    std::unordered_map<std::string, int> base_stats;
    std::vector<ElementType> types;
    std::vector<MoveName> moves;  // Ordered; the first four are battle moves

    // Informational only (profile document)
    std::vector<AbilityEntry> abilities;
    int species_id = 0;
    std::optional<int> evolves_from_species_id;
    std::optional<int> evolution_chain_id;
    std::vector<EvolutionLink> evolution_chain;
};

/**
 * Built-in secondary effects for well-known moves.
 * Used when the export does not carry an effect for the move.
 */
std::optional<SecondaryEffect> builtin_secondary_effect(const MoveName& move_name);

/**
 * Pokedex - Central profile and move lookup.
 */
class Pokedex {
public:
    Pokedex();
    ~Pokedex() = default;

    /**
     * Load profiles and moves from a JSON file.
     * Returns false (and logs the cause) on I/O or data errors.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load from an in-memory JSON document.
     *
     * Throws DataIntegrityError on malformed entries.
     */
    void load_from_string(const std::string& text);
    void load(const nlohmann::json& data);

    /**
     * Insert definitions directly (fixtures, tools).
     */
    void add_move(MoveDef move);
    void add_profile(PokemonProfile profile);

    /**
     * Lookups are case-insensitive. Return nullptr if not found.
     */
    const PokemonProfile* find_profile(const std::string& name) const;
    const MoveDef* find_move(const std::string& name) const;

    /**
     * Throwing lookups used by the battle engine. Throw NotFoundError.
     */
    const PokemonProfile& lookup_profile(const std::string& name) const;
    const MoveDef& lookup_move(const std::string& name) const;

    /**
     * Full profile document (stats, types, abilities, moves, evolution).
     * Ids are stripped unless include_ids is set. Throws NotFoundError.
     */
    nlohmann::json get_profile_document(const std::string& name, bool include_ids = false) const;

    std::vector<SpeciesName> get_all_names() const;

    size_t profile_count() const { return profiles_.size(); }
    size_t move_count() const { return moves_.size(); }

private:
    std::unordered_map<SpeciesName, PokemonProfile> profiles_;
    std::unordered_map<MoveName, MoveDef> moves_;

    // Parse helpers
    MoveDef parse_move(const nlohmann::json& move_json) const;
    PokemonProfile parse_profile(const nlohmann::json& profile_json) const;
    AbilityEntry parse_ability(const nlohmann::json& ability_json) const;
    nlohmann::json move_document(const MoveName& move_name) const;
};

} // namespace pokebattle
