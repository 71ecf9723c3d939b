/**
 * Pokemon Battle Engine - Battle Service Implementation
 */

#include "battle_service.hpp"
#include "errors.hpp"
#include <iostream>

using json = nlohmann::json;

namespace pokebattle {

namespace {

const json& require_argument(const json& arguments, const char* key) {
    if (!arguments.contains(key)) {
        throw InvalidArgumentError(std::string("Missing argument: ") + key);
    }
    return arguments[key];
}

std::string require_string(const json& arguments, const char* key) {
    const json& value = require_argument(arguments, key);
    if (!value.is_string()) {
        throw InvalidArgumentError(std::string("Argument '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace

BattleService::BattleService(const Pokedex& pokedex, BattleConfig config)
    : pokedex_(&pokedex)
    , engine_(std::make_unique<BattleEngine>(pokedex, std::move(config))) {}

BattleService::BattleService(BattleConfig config)
    : owned_pokedex_(std::make_unique<Pokedex>()) {
    if (!owned_pokedex_->load_from_json(config.database_path)) {
        throw DataIntegrityError("Failed to load Pokedex from " + config.database_path);
    }
    pokedex_ = owned_pokedex_.get();
    engine_ = std::make_unique<BattleEngine>(*pokedex_, std::move(config));
}

json BattleService::error_payload(const BattleError& error) {
    return {
        {"error", error.what()},
        {"error_type", error.error_type()},
    };
}

json BattleService::internal_error(const std::exception& error) const {
    std::cerr << "[BattleService] Internal error: " << error.what() << std::endl;
    return {
        {"error", error.what()},
        {"error_type", "internal"},
    };
}

// ============================================================================
// TOOLS
// ============================================================================

json BattleService::simulate_battle(const std::string& pokemon1_name,
                                    const std::string& pokemon2_name,
                                    bool detailed,
                                    std::optional<uint64_t> seed) const {
    const BattleConfig& config = engine_->get_config();
    if (config.verbose) {
        std::cout << "[BattleService] simulate_pokemon_battle: "
                  << pokemon1_name << " vs " << pokemon2_name << std::endl;
    }

    try {
        if (seed.has_value()) {
            Mt19937RandomSource rng(*seed);
            return to_json(engine_->simulate_battle(pokemon1_name, pokemon2_name, detailed, rng));
        }
        return to_json(engine_->simulate_battle(pokemon1_name, pokemon2_name, detailed));

    } catch (const BattleError& e) {
        if (config.verbose) {
            std::cout << "[BattleService] " << e.error_type() << ": " << e.what() << std::endl;
        }
        return error_payload(e);
    } catch (const std::exception& e) {
        return internal_error(e);
    }
}

json BattleService::get_pokemon_info(const std::string& name) const {
    if (engine_->get_config().verbose) {
        std::cout << "[BattleService] get_pokemon_info: " << name << std::endl;
    }

    try {
        if (name.empty()) {
            throw InvalidArgumentError("Pokemon name is required");
        }
        return pokedex_->get_profile_document(name);

    } catch (const BattleError& e) {
        return error_payload(e);
    } catch (const std::exception& e) {
        return internal_error(e);
    }
}

// ============================================================================
// DISPATCH
// ============================================================================

json BattleService::handle_tool_call(const json& request) const {
    try {
        if (!request.is_object()) {
            throw InvalidArgumentError("Tool call must be a JSON object");
        }
        const json& tool = require_argument(request, "tool");
        if (!tool.is_string()) {
            throw InvalidArgumentError("'tool' must be a string");
        }

        json arguments = request.value("arguments", json::object());
        if (!arguments.is_object()) {
            throw InvalidArgumentError("'arguments' must be an object");
        }

        return dispatch(tool.get<std::string>(), arguments);

    } catch (const BattleError& e) {
        return error_payload(e);
    }
}

json BattleService::dispatch(const std::string& tool, const json& arguments) const {
    if (tool == TOOL_SIMULATE_BATTLE) {
        std::string pokemon1 = require_string(arguments, "pokemon1_name");
        std::string pokemon2 = require_string(arguments, "pokemon2_name");

        bool detailed = true;
        if (arguments.contains("detailed")) {
            if (!arguments["detailed"].is_boolean()) {
                throw InvalidArgumentError("Argument 'detailed' must be a boolean");
            }
            detailed = arguments["detailed"].get<bool>();
        }

        std::optional<uint64_t> seed;
        if (arguments.contains("seed") && !arguments["seed"].is_null()) {
            const json& value = arguments["seed"];
            // Literals built in C++ are signed integers; parsed text is unsigned
            if (value.is_number_unsigned()) {
                seed = value.get<uint64_t>();
            } else if (value.is_number_integer() && value.get<int64_t>() >= 0) {
                seed = static_cast<uint64_t>(value.get<int64_t>());
            } else {
                throw InvalidArgumentError("Argument 'seed' must be a non-negative integer");
            }
        }

        return simulate_battle(pokemon1, pokemon2, detailed, seed);
    }

    if (tool == TOOL_GET_POKEMON_INFO) {
        return get_pokemon_info(require_string(arguments, "name"));
    }

    throw InvalidArgumentError("Unknown tool: " + tool);
}

json BattleService::list_tools() {
    return json::array({
        {
            {"name", TOOL_SIMULATE_BATTLE},
            {"description",
             "Simulate a battle between two Pokemon using level-50 stats, type "
             "effectiveness, speed order, critical hits, STAB and status effects."},
            {"input_schema", {
                {"type", "object"},
                {"properties", {
                    {"pokemon1_name", {{"type", "string"}}},
                    {"pokemon2_name", {{"type", "string"}}},
                    {"detailed", {{"type", "boolean"}, {"default", true}}},
                    {"seed", {{"type", "integer"}, {"minimum", 0}}},
                }},
                {"required", json::array({"pokemon1_name", "pokemon2_name"})},
            }},
        },
        {
            {"name", TOOL_GET_POKEMON_INFO},
            {"description",
             "Get stats, types, abilities, moves and evolution chain for a Pokemon."},
            {"input_schema", {
                {"type", "object"},
                {"properties", {
                    {"name", {{"type", "string"}}},
                }},
                {"required", json::array({"name"})},
            }},
        },
    });
}

} // namespace pokebattle
