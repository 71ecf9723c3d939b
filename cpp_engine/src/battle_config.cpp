/**
 * Pokemon Battle Engine - Configuration Implementation
 */

#include "battle_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

using json = nlohmann::json;

namespace pokebattle {

bool BattleConfig::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[BattleConfig] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        apply_json(data);
        return true;

    } catch (const json::parse_error& e) {
        std::cerr << "[BattleConfig] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const InvalidArgumentError& e) {
        std::cerr << "[BattleConfig] Invalid config: " << e.what() << std::endl;
        return false;
    }
}

void BattleConfig::apply_json(const json& config_json) {
    if (!config_json.is_object()) {
        throw InvalidArgumentError("Config must be a JSON object");
    }

    try {
        if (config_json.contains("max_turns")) {
            const json& value = config_json["max_turns"];
            if (!value.is_number_integer() ||
                value.get<double>() < std::numeric_limits<int>::min() ||
                value.get<double>() > std::numeric_limits<int>::max()) {
                throw InvalidArgumentError("max_turns must be an integer, got " + value.dump());
            }
            max_turns = value.get<int>();
        }
        if (config_json.contains("seed")) {
            const json& value = config_json["seed"];
            if (value.is_null()) {
                seed.reset();
            } else if (value.is_number_unsigned()) {
                seed = value.get<uint64_t>();
            } else if (value.is_number_integer() && value.get<int64_t>() >= 0) {
                seed = static_cast<uint64_t>(value.get<int64_t>());
            } else {
                throw InvalidArgumentError("seed must be a non-negative integer");
            }
        }
        if (config_json.contains("allow_mirror_match")) {
            allow_mirror_match = config_json["allow_mirror_match"].get<bool>();
        }
        if (config_json.contains("verbose")) {
            verbose = config_json["verbose"].get<bool>();
        }
        if (config_json.contains("xray_dir")) {
            xray_dir = config_json["xray_dir"].get<std::string>();
        }
        if (config_json.contains("database_path")) {
            database_path = config_json["database_path"].get<std::string>();
        }
    } catch (const json::type_error& e) {
        throw InvalidArgumentError(std::string("Config value has the wrong type: ") + e.what());
    }

    validate();
}

void BattleConfig::apply_environment() {
    if (const char* path = std::getenv("POKEBATTLE_DATABASE_PATH")) {
        database_path = path;
    }

    if (const char* turns = std::getenv("POKEBATTLE_MAX_TURNS")) {
        try {
            max_turns = std::stoi(turns);
        } catch (const std::exception&) {
            throw InvalidArgumentError(std::string("POKEBATTLE_MAX_TURNS is not a number: ") + turns);
        }
    }

    validate();
}

void BattleConfig::validate() const {
    if (max_turns < 1) {
        throw InvalidArgumentError("max_turns must be at least 1, got " + std::to_string(max_turns));
    }
}

uint64_t parse_seed(const std::string& text) {
    // std::stoull accepts "-1" and wraps it
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        throw InvalidArgumentError("Seed must be a non-negative integer: " + text);
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError("Seed does not fit in 64 bits: " + text);
    }
}

} // namespace pokebattle
