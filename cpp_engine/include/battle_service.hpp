/**
 * Pokemon Battle Engine - Battle Service
 *
 * JSON boundary for host agents: the two tools, argument validation and
 * the mapping of BattleError subclasses to {"error", "error_type"} payloads.
 * The only layer that converts exceptions into results.
 */

#pragma once

#include "battle_engine.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace pokebattle {

constexpr const char* TOOL_SIMULATE_BATTLE = "simulate_pokemon_battle";
constexpr const char* TOOL_GET_POKEMON_INFO = "get_pokemon_info";

class BattleService {
public:
    /**
     * Service over an already-loaded Pokedex (not owned; must outlive the service).
     */
    BattleService(const Pokedex& pokedex, BattleConfig config = {});

    /**
     * Load config.database_path into a Pokedex owned by the service.
     * Throws DataIntegrityError if the database cannot be loaded.
     */
    explicit BattleService(BattleConfig config);

    /**
     * Battle result document, or an error payload.
     * A seed overrides the configured one for this call only.
     */
    nlohmann::json simulate_battle(const std::string& pokemon1_name,
                                   const std::string& pokemon2_name,
                                   bool detailed = true,
                                   std::optional<uint64_t> seed = std::nullopt) const;

    /**
     * Profile document, or an error payload.
     */
    nlohmann::json get_pokemon_info(const std::string& name) const;

    /**
     * {"tool": <name>, "arguments": {...}} -> result or error payload.
     */
    nlohmann::json handle_tool_call(const nlohmann::json& request) const;

    /**
     * Tool descriptors (name, description, input schema) for host registration.
     */
    static nlohmann::json list_tools();

    static nlohmann::json error_payload(const BattleError& error);

    const Pokedex& get_pokedex() const { return *pokedex_; }
    const BattleEngine& get_engine() const { return *engine_; }

private:
    std::unique_ptr<Pokedex> owned_pokedex_;
    const Pokedex* pokedex_ = nullptr;
    std::unique_ptr<BattleEngine> engine_;

    nlohmann::json dispatch(const std::string& tool, const nlohmann::json& arguments) const;
    nlohmann::json internal_error(const std::exception& error) const;
};

} // namespace pokebattle
