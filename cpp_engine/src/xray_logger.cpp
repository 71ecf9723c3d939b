/**
 * Pokemon Battle Engine - X-Ray Logger Implementation
 */

#include "xray_logger.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace pokebattle {

XRayLogger::XRayLogger(const std::string& output_dir, const std::string& label) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[X-Ray Logger] Cannot create directory " << output_dir
                  << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    log_path_ = output_dir + "/xray_battle_" + timestamp("%Y%m%d_%H%M%S") + ".log";

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[X-Ray Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "X-RAY BATTLE LOG - LINEAR STATE TRACE\n";
    if (!label.empty()) {
        log_file_ << "Matchup: " << label << "\n";
    }
    log_file_ << "Started: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";
}

XRayLogger::~XRayLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string XRayLogger::timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

std::string XRayLogger::format_status(const StatusSlot& slot) {
    std::string text = status_adjective(kind_of(slot));
    if (auto* sleep = std::get_if<status::Sleep>(&slot)) {
        text += " (" + std::to_string(sleep->turns_left) + " turns left)";
    } else if (auto* confusion = std::get_if<status::Confusion>(&slot)) {
        text += " (" + std::to_string(confusion->turns_left) + " turns left)";
    }
    return text;
}

std::string XRayLogger::format_combatant_line(const Combatant& combatant,
                                              const std::string& label) const {
    std::ostringstream line;
    line << label << ":  " << combatant.name << " [";
    for (size_t i = 0; i < combatant.types.size(); i++) {
        if (i > 0) line << "/";
        line << to_string(combatant.types[i]);
    }
    line << "]";
    line << " | HP: " << combatant.current_hp << "/" << combatant.max_hp();
    line << " | Status: " << format_status(combatant.status);
    return line.str();
}

void XRayLogger::log_battle_start(const BattleState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    for (size_t slot = 0; slot < state.combatants.size(); slot++) {
        const Combatant& c = state.combatants[slot];
        log_file_ << "[POKEMON " << (slot + 1) << "]\n";
        log_file_ << format_combatant_line(c, "ACTIVE") << "\n";
        log_file_ << "STATS: Atk " << c.stats.attack
                  << " | Def " << c.stats.defense
                  << " | SpA " << c.stats.special_attack
                  << " | SpD " << c.stats.special_defense
                  << " | Spe " << c.stats.speed << "\n";

        log_file_ << "MOVES (" << c.moves.size() << "): [";
        for (size_t i = 0; i < c.moves.size(); i++) {
            if (i > 0) log_file_ << ", ";
            const MoveDef& m = c.moves[i];
            log_file_ << m.name << " (" << to_string(m.type) << "/" << to_string(m.category)
                      << " " << m.power << "/" << m.accuracy << ")";
        }
        log_file_ << "]\n\n";
    }

    log_file_.flush();
}

void XRayLogger::log_turn(const TurnRecord& record, const BattleState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << record.turn << "]\n";
    log_file_ << std::string(80, '#') << "\n";
    for (const auto& action : record.actions) {
        log_file_ << "  " << action << "\n";
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << format_combatant_line(state.combatants[0], "P1") << "\n";
    log_file_ << format_combatant_line(state.combatants[1], "P2") << "\n";
    log_file_ << "Phase: " << to_string(state.phase)
              << " | Turn: " << state.turn_count << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_battle_end(const BattleResult& result) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "BATTLE END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (result.winner.has_value()) {
        log_file_ << "Winner: " << *result.winner << "\n";
    } else {
        log_file_ << "Result: Draw\n";
    }

    log_file_ << "Summary: " << result.battle_summary << "\n";
    log_file_ << "Ended: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace pokebattle
