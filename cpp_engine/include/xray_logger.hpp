/**
 * Pokemon Battle Engine - X-Ray Logger
 *
 * Complete battle visibility for debugging.
 * Logs both combatants' scaled stats, moves and hidden status counters
 * (sleep and confusion turns left) after every turn.
 */

#pragma once

#include "battle_state.hpp"
#include <string>
#include <fstream>

namespace pokebattle {

/**
 * XRayLogger - Linear trace of one battle written to a timestamped file.
 *
 * Opening failures disable the logger instead of failing the battle.
 */
class XRayLogger {
public:
    /**
     * Constructor - creates the output directory and the log file
     * "<output_dir>/xray_battle_<YYYYmmdd_HHMMSS>.log".
     *
     * @param output_dir Directory for log files
     * @param label Matchup label written into the header
     */
    explicit XRayLogger(const std::string& output_dir = "xrays",
                        const std::string& label = "");

    ~XRayLogger();

    /**
     * Log both combatants as derived at Init.
     */
    void log_battle_start(const BattleState& state);

    /**
     * Log one turn's actions followed by the full state after it.
     */
    void log_turn(const TurnRecord& record, const BattleState& state);

    /**
     * Log the final result.
     */
    void log_battle_end(const BattleResult& result);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * "ACTIVE P1:  pikachu [electric] | HP: 110/110 | Status: asleep (2 turns left)"
     */
    std::string format_combatant_line(const Combatant& combatant, const std::string& label) const;

    static std::string format_status(const StatusSlot& slot);
    static std::string timestamp(const char* format);
};

} // namespace pokebattle
