/**
 * Pokemon Battle Engine - Pokedex Implementation
 *
 * Loads profile and move definitions from JSON files using nlohmann/json.
 * Builds the profile document served by the info query.
 */

#include "pokedex.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <limits>

using json = nlohmann::json;

namespace pokebattle {

namespace {

const char* const kStatOrder[] = {
    "hp", "attack", "defense", "special-attack", "special-defense", "speed"
};

// Removes every "id" key; foreign keys such as evolves_from_species_id stay.
json strip_ids(const json& obj) {
    if (obj.is_object()) {
        json out = json::object();
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (it.key() == "id") continue;
            out[it.key()] = strip_ids(it.value());
        }
        return out;
    }
    if (obj.is_array()) {
        json out = json::array();
        for (const auto& item : obj) {
            out.push_back(strip_ids(item));
        }
        return out;
    }
    return obj;
}

json optional_int(const std::optional<int>& value) {
    return value.has_value() ? json(*value) : json(nullptr);
}

std::optional<int> read_optional_int(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) {
        return std::nullopt;
    }
    const int64_t value = obj[key].get<int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw DataIntegrityError(std::string("Value out of range for '") + key + "'");
    }
    return static_cast<int>(value);
}

} // namespace

std::optional<SecondaryEffect> builtin_secondary_effect(const MoveName& move_name) {
    static const std::unordered_map<std::string, SecondaryEffect> kEffects = {
        // Fire
        {"flamethrower", {StatusKind::BURN, 0.1}},
        {"fire-blast", {StatusKind::BURN, 0.1}},
        {"ember", {StatusKind::BURN, 0.1}},
        {"fire-punch", {StatusKind::BURN, 0.1}},
        // Electric
        {"thunderbolt", {StatusKind::PARALYSIS, 0.1}},
        {"thunder-shock", {StatusKind::PARALYSIS, 0.1}},
        {"thunder", {StatusKind::PARALYSIS, 0.3}},
        {"nuzzle", {StatusKind::PARALYSIS, 1.0}},
        // Poison
        {"poison-sting", {StatusKind::POISON, 0.3}},
        {"toxic", {StatusKind::POISON, 0.9}},
        {"poison-jab", {StatusKind::POISON, 0.3}},
        {"sludge-bomb", {StatusKind::POISON, 0.3}},
        // Sleep
        {"sleep-powder", {StatusKind::SLEEP, 0.75}},
        {"spore", {StatusKind::SLEEP, 1.0}},
        {"hypnosis", {StatusKind::SLEEP, 0.6}},
        // Ice
        {"ice-beam", {StatusKind::FREEZE, 0.1}},
        {"blizzard", {StatusKind::FREEZE, 0.1}},
        // Confusion
        {"confusion", {StatusKind::CONFUSION, 0.1}},
        {"psybeam", {StatusKind::CONFUSION, 0.1}},
    };

    auto it = kEffects.find(to_lower(move_name));
    if (it == kEffects.end()) {
        return std::nullopt;
    }
    return it->second;
}

Pokedex::Pokedex() {}

bool Pokedex::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Pokedex] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        load(data);
        std::cout << "[Pokedex] Loaded " << profiles_.size() << " pokemon, "
                  << moves_.size() << " moves" << std::endl;
        return true;

    } catch (const json::parse_error& e) {
        std::cerr << "[Pokedex] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const DataIntegrityError& e) {
        std::cerr << "[Pokedex] Data error: " << e.what() << std::endl;
        return false;
    }
}

void Pokedex::load_from_string(const std::string& text) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DataIntegrityError(std::string("Pokedex JSON parse error: ") + e.what());
    }
    load(data);
}

void Pokedex::load(const json& data) {
    if (!data.is_object()) {
        throw DataIntegrityError("Pokedex document must be an object");
    }

    try {
        if (data.contains("moves")) {
            if (!data["moves"].is_array()) {
                throw DataIntegrityError("'moves' must be an array");
            }
            for (const auto& move_json : data["moves"]) {
                add_move(parse_move(move_json));
            }
        }

        if (!data.contains("pokemon") || !data["pokemon"].is_array()) {
            throw DataIntegrityError("No 'pokemon' array found");
        }
        for (const auto& profile_json : data["pokemon"]) {
            add_profile(parse_profile(profile_json));
        }
    } catch (const json::exception& e) {
        // type_error / out_of_range from malformed fields
        throw DataIntegrityError(std::string("Malformed Pokedex entry: ") + e.what());
    }
}

void Pokedex::add_move(MoveDef move) {
    move.name = to_lower(move.name);
    moves_[move.name] = std::move(move);
}

void Pokedex::add_profile(PokemonProfile profile) {
    profile.name = to_lower(profile.name);
    profiles_[profile.name] = std::move(profile);
}

MoveDef Pokedex::parse_move(const json& move_json) const {
    MoveDef move;

    move.id = move_json.value("id", 0);
    move.name = to_lower(move_json.value("name", ""));
    if (move.name.empty()) {
        throw DataIntegrityError("Move entry without a name");
    }

    const std::string type_str = move_json.value("type", "");
    auto type = parse_element_type(type_str);
    if (!type) {
        throw DataIntegrityError("Move '" + move.name + "' has unknown type: " + type_str);
    }
    move.type = *type;

    const std::string category_str = move_json.value("damage_class", "");
    auto category = parse_move_category(category_str);
    if (!category) {
        throw DataIntegrityError("Move '" + move.name + "' has unknown damage class: " + category_str);
    }
    move.category = *category;

    // Null power/accuracy are exported for status moves and never-miss moves
    move.power = read_optional_int(move_json, "power").value_or(0);
    move.accuracy = read_optional_int(move_json, "accuracy").value_or(100);
    if (move.power < 0 || move.power > MAX_MOVE_POWER ||
        move.accuracy < 1 || move.accuracy > 100) {
        throw DataIntegrityError("Move '" + move.name + "' has out-of-range power/accuracy");
    }

    if (move_json.contains("effect") && move_json["effect"].is_object()) {
        const auto& effect = move_json["effect"];
        const std::string status_str = effect.value("status", "");
        auto status = parse_status_kind(status_str);
        if (!status) {
            throw DataIntegrityError("Move '" + move.name + "' has unknown effect status: " + status_str);
        }
        // Chance is exported as a percentage, like move_effect_chance
        int chance = effect.value("chance", 100);
        if (chance < 0 || chance > 100) {
            throw DataIntegrityError("Move '" + move.name + "' has out-of-range effect chance");
        }
        move.secondary = SecondaryEffect{*status, chance / 100.0};
    } else {
        move.secondary = builtin_secondary_effect(move.name);
    }

    return move;
}

AbilityEntry Pokedex::parse_ability(const json& ability_json) const {
    AbilityEntry ability;
    ability.name = ability_json.value("name", "");
    ability.is_hidden = ability_json.value("is_hidden", false);
    ability.slot = ability_json.value("slot", 1);
    ability.short_effect = ability_json.value("short_effect", "");
    return ability;
}

PokemonProfile Pokedex::parse_profile(const json& profile_json) const {
    PokemonProfile profile;

    profile.id = profile_json.value("id", 0);
    profile.name = to_lower(profile_json.value("name", ""));
    if (profile.name.empty()) {
        throw DataIntegrityError("Pokemon entry without a name");
    }

    // Missing stats are reported at battle time; present ones must be in range
    if (profile_json.contains("stats") && profile_json["stats"].is_object()) {
        for (auto it = profile_json["stats"].begin(); it != profile_json["stats"].end(); ++it) {
            const int64_t value = it.value().get<int64_t>();
            if (value < MIN_BASE_STAT || value > MAX_BASE_STAT) {
                throw DataIntegrityError("Pokemon '" + profile.name + "' has out-of-range base stat: " +
                                         it.key() + " = " + std::to_string(value));
            }
            profile.base_stats[it.key()] = static_cast<int>(value);
        }
    }

    if (profile_json.contains("types") && profile_json["types"].is_array()) {
        for (const auto& t : profile_json["types"]) {
            const std::string type_str = t.get<std::string>();
            auto type = parse_element_type(type_str);
            if (!type) {
                throw DataIntegrityError("Pokemon '" + profile.name + "' has unknown type: " + type_str);
            }
            profile.types.push_back(*type);
        }
    }

    if (profile_json.contains("moves") && profile_json["moves"].is_array()) {
        for (const auto& m : profile_json["moves"]) {
            profile.moves.push_back(to_lower(m.get<std::string>()));
        }
    }

    if (profile_json.contains("abilities") && profile_json["abilities"].is_array()) {
        for (const auto& ability_json : profile_json["abilities"]) {
            profile.abilities.push_back(parse_ability(ability_json));
        }
    }

    profile.species_id = profile_json.value("species_id", profile.id);
    profile.evolves_from_species_id = read_optional_int(profile_json, "evolves_from_species_id");
    profile.evolution_chain_id = read_optional_int(profile_json, "evolution_chain_id");

    if (profile_json.contains("evolution_chain") && profile_json["evolution_chain"].is_array()) {
        for (const auto& link_json : profile_json["evolution_chain"]) {
            EvolutionLink link;
            link.species_id = link_json.value("id", 0);
            link.name = to_lower(link_json.value("name", ""));
            link.evolves_from_species_id = read_optional_int(link_json, "evolves_from_species_id");
            profile.evolution_chain.push_back(std::move(link));
        }
    }

    return profile;
}

const PokemonProfile* Pokedex::find_profile(const std::string& name) const {
    auto it = profiles_.find(to_lower(name));
    if (it == profiles_.end()) {
        return nullptr;
    }
    return &it->second;
}

const MoveDef* Pokedex::find_move(const std::string& name) const {
    auto it = moves_.find(to_lower(name));
    if (it == moves_.end()) {
        return nullptr;
    }
    return &it->second;
}

const PokemonProfile& Pokedex::lookup_profile(const std::string& name) const {
    const PokemonProfile* profile = find_profile(name);
    if (!profile) {
        throw NotFoundError("Pokemon not found: " + name);
    }
    return *profile;
}

const MoveDef& Pokedex::lookup_move(const std::string& name) const {
    const MoveDef* move = find_move(name);
    if (!move) {
        throw NotFoundError("Move not found: " + name);
    }
    return *move;
}

json Pokedex::move_document(const MoveName& move_name) const {
    const MoveDef* move = find_move(move_name);
    if (!move) {
        return json{{"move", {{"name", move_name}}}};
    }

    json entry = {
        {"id", move->id},
        {"name", move->name},
        {"power", move->power > 0 ? json(move->power) : json(nullptr)},
        {"accuracy", move->accuracy},
        {"move_effect_chance", nullptr},
        {"movedamageclass", {{"name", to_string(move->category)}}},
        {"type", {{"name", to_string(move->type)}}},
    };
    if (move->secondary.has_value()) {
        entry["move_effect_chance"] = static_cast<int>(move->secondary->chance * 100.0 + 0.5);
    }
    return json{{"move", entry}};
}

json Pokedex::get_profile_document(const std::string& name, bool include_ids) const {
    const PokemonProfile& profile = lookup_profile(name);

    json stats = json::array();
    for (const char* stat_name : kStatOrder) {
        auto it = profile.base_stats.find(stat_name);
        int base = (it != profile.base_stats.end()) ? it->second : 0;
        stats.push_back({{"base_stat", base}, {"stat", {{"name", stat_name}}}});
    }

    json types = json::array();
    for (ElementType type : profile.types) {
        types.push_back({{"type", {{"name", to_string(type)}}}});
    }

    json abilities = json::array();
    for (const auto& ability : profile.abilities) {
        json effect_texts = json::array();
        if (!ability.short_effect.empty()) {
            effect_texts.push_back({{"short_effect", ability.short_effect}});
        }
        abilities.push_back({
            {"is_hidden", ability.is_hidden},
            {"slot", ability.slot},
            {"ability", {{"name", ability.name}, {"abilityeffecttexts", effect_texts}}},
        });
    }

    json moves = json::array();
    for (const auto& move_name : profile.moves) {
        moves.push_back(move_document(move_name));
    }

    json chain_species = json::array();
    for (const auto& link : profile.evolution_chain) {
        chain_species.push_back({
            {"id", link.species_id},
            {"name", link.name},
            {"evolves_from_species_id", optional_int(link.evolves_from_species_id)},
        });
    }

    json pokemon = {
        {"id", profile.id},
        {"name", profile.name},
        {"pokemonstats", stats},
        {"pokemontypes", types},
        {"pokemonabilities", abilities},
        {"pokemonmoves", moves},
        {"pokemonspecy", {
            {"id", profile.species_id},
            {"name", profile.name},
            {"evolves_from_species_id", optional_int(profile.evolves_from_species_id)},
            {"evolutionchain", {
                {"id", optional_int(profile.evolution_chain_id)},
                {"pokemonspecies", chain_species},
            }},
        }},
    };

    json payload = {{"data", {{"pokemon", json::array({pokemon})}}}};
    return include_ids ? payload : strip_ids(payload);
}

std::vector<SpeciesName> Pokedex::get_all_names() const {
    std::vector<SpeciesName> names;
    names.reserve(profiles_.size());
    for (const auto& [name, _] : profiles_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace pokebattle
