/**
 * Pokemon Battle Engine - Interactive Test Console
 *
 * Simple REPL for manual testing of battle mechanics.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <chrono>

#include <nlohmann/json.hpp>
#include "pokebattle.hpp"

using namespace pokebattle;
using json = nlohmann::json;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

// ============================================================================
// PRINT HELP
// ============================================================================

void print_usage() {
    std::cout << "Usage: pokebattle_console [--db PATH] [--config PATH] [--seed N]"
              << " [--max-turns N] [--xray DIR]" << std::endl;
}

void print_help() {
    std::cout << R"(
=== Pokemon Battle C++ Test Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Battles:
  battle <a> <b> [brief]  - Simulate a battle (brief: summary only)
  seed <n>                - Fix the seed for following battles
  seed clear              - Seed each battle from the clock

Pokedex:
  list                    - List all Pokemon
  info <name>             - Show the profile document
  chart <atk> <def> [def] - Type effectiveness lookup

Examples:
  battle pikachu charizard
  seed 42
  chart electric water flying
)" << std::endl;
}

// ============================================================================
// BATTLE DISPLAY
// ============================================================================

void show_result(const json& result) {
    if (result.contains("error")) {
        std::cout << "Error (" << result["error_type"].get<std::string>() << "): "
                  << result["error"].get<std::string>() << std::endl;
        return;
    }

    std::cout << "\n========== "
              << result["pokemon1"].get<std::string>() << " vs "
              << result["pokemon2"].get<std::string>() << " ==========" << std::endl;

    if (result.contains("detailed_turns")) {
        for (const auto& turn : result["detailed_turns"]) {
            std::cout << "\n[Turn " << turn["turn"].get<int>() << "]" << std::endl;
            for (const auto& action : turn["actions"]) {
                std::cout << "  " << action.get<std::string>() << std::endl;
            }
            for (const auto& side : turn["state"]) {
                std::cout << "    " << side["name"].get<std::string>()
                          << " HP: " << side["hp"].get<int>() << "/" << side["max_hp"].get<int>();
                const std::string status = side["status"].get<std::string>();
                if (status != "none") {
                    std::cout << " (" << status << ")";
                }
                std::cout << std::endl;
            }
        }
    }

    std::cout << "\n" << result["battle_summary"].get<std::string>() << std::endl;
    std::cout << "Status effects used: "
              << (result["status_effects_used"].get<bool>() ? "yes" : "no") << std::endl;
}

// ============================================================================
// CONSOLE CLASS
// ============================================================================

class Console {
public:
    BattleConfig config;
    Pokedex pokedex;
    std::unique_ptr<BattleService> service;

    explicit Console(BattleConfig cfg) : config(std::move(cfg)) {}

    bool init() {
        if (!pokedex.load_from_json(config.database_path)) {
            std::cerr << "Failed to load Pokedex: " << config.database_path << std::endl;
            return false;
        }
        rebuild_service();
        return true;
    }

    void rebuild_service() {
        service = std::make_unique<BattleService>(pokedex, config);
    }

    void cmd_battle(const std::vector<std::string>& args) {
        if (args.size() < 3) {
            std::cout << "Usage: battle <pokemon1> <pokemon2> [brief]" << std::endl;
            return;
        }
        bool detailed = !(args.size() > 3 && args[3] == "brief");
        show_result(service->simulate_battle(args[1], args[2], detailed));
    }

    void cmd_info(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Usage: info <name>" << std::endl;
            return;
        }
        std::cout << service->get_pokemon_info(args[1]).dump(2) << std::endl;
    }

    void cmd_chart(const std::vector<std::string>& args) {
        if (args.size() < 3 || args.size() > 4) {
            std::cout << "Usage: chart <attack_type> <defend_type> [defend_type]" << std::endl;
            return;
        }
        std::vector<std::string> defend(args.begin() + 2, args.end());
        try {
            double multiplier = TypeChart::effectiveness(args[1], defend);
            std::cout << args[1] << " -> " << args[2];
            if (defend.size() > 1) std::cout << "/" << args[3];
            std::cout << ": x" << multiplier << " (" << TypeChart::label(multiplier) << ")" << std::endl;
        } catch (const BattleError& e) {
            std::cout << "Error: " << e.what() << std::endl;
        }
    }

    void cmd_seed(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            if (config.seed.has_value()) {
                std::cout << "Seed: " << *config.seed << std::endl;
            } else {
                std::cout << "Seed: clock" << std::endl;
            }
            return;
        }
        if (args[1] == "clear") {
            config.seed.reset();
        } else {
            try {
                config.seed = parse_seed(args[1]);
            } catch (const InvalidArgumentError& e) {
                std::cout << "Invalid seed: " << e.what() << std::endl;
                return;
            }
        }
        rebuild_service();
    }

    void cmd_list() {
        auto names = pokedex.get_all_names();
        std::cout << "\n=== Pokedex (" << names.size() << ") ===" << std::endl;
        for (const auto& name : names) {
            std::cout << "  " << name << std::endl;
        }
    }

    void run() {
        std::cout << "Pokemon Battle C++ Test Console v" << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;
        if (!config.xray_dir.empty()) {
            std::cout << "[X-Ray Logger] Logging battles to: " << config.xray_dir << std::endl;
        }

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "battle" || cmd == "b") {
                cmd_battle(args);
            } else if (cmd == "info" || cmd == "i") {
                cmd_info(args);
            } else if (cmd == "chart") {
                cmd_chart(args);
            } else if (cmd == "seed") {
                cmd_seed(args);
            } else if (cmd == "list" || cmd == "ls") {
                cmd_list();
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    BattleConfig config;
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        // --config is applied first so the remaining flags override it
        for (size_t i = 0; i + 1 < args.size(); i++) {
            if (args[i] == "--config" && !config.load_from_json(args[i + 1])) {
                return 1;
            }
        }
        config.apply_environment();

        for (size_t i = 0; i < args.size(); i++) {
            const std::string& flag = args[i];
            if (flag == "--help" || flag == "-h") {
                print_usage();
                return 0;
            }
            if (i + 1 >= args.size()) {
                std::cerr << "Missing value for " << flag << std::endl;
                print_usage();
                return 1;
            }
            const std::string& value = args[++i];
            if (flag == "--db") {
                config.database_path = value;
            } else if (flag == "--seed") {
                config.seed = parse_seed(value);
            } else if (flag == "--max-turns") {
                config.max_turns = std::stoi(value);
            } else if (flag == "--xray") {
                config.xray_dir = value;
            } else if (flag != "--config") {
                std::cerr << "Unknown option: " << flag << std::endl;
                print_usage();
                return 1;
            }
        }
        config.validate();

    } catch (const BattleError& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    } catch (const std::logic_error& e) {
        // std::stoi on a bad --max-turns value
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 1;
    }

    Console console(config);
    if (!console.init()) {
        return 1;
    }
    console.run();
    return 0;
}
