/**
 * Tests for the X-Ray Logger
 */

#include <filesystem>
#include <fstream>
#include "xray_logger.hpp"

namespace {

std::filesystem::path fresh_xray_dir(const std::string& name) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / ("pokebattle_xray_" + name);
    std::filesystem::remove_all(dir);
    return dir;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

std::vector<std::filesystem::path> log_files_in(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    if (!std::filesystem::exists(dir)) {
        return files;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".log") {
            files.push_back(entry.path());
        }
    }
    return files;
}

} // namespace

TEST(XRayLogger, WritesFullTrace) {
    auto dir = fresh_xray_dir("trace");
    BattleEngine engine(shipped_pokedex());
    ScriptedRandomSource rng;
    BattleState state = engine.create_battle("pikachu", "charizard");

    std::string path;
    {
        XRayLogger xray(dir.string(), "pikachu_vs_charizard");
        TEST_ASSERT_TRUE(xray.is_enabled());
        path = xray.get_log_path();
        engine.run(state, rng, &xray);
    }

    TEST_ASSERT_TRUE(std::filesystem::exists(path));
    std::string trace = read_file(path);
    TEST_ASSERT_CONTAINS(trace, "X-RAY BATTLE LOG");
    TEST_ASSERT_CONTAINS(trace, "Matchup: pikachu_vs_charizard");
    TEST_ASSERT_CONTAINS(trace, "MOVES (4)");
    TEST_ASSERT_CONTAINS(trace, "[TURN 1]");
    TEST_ASSERT_CONTAINS(trace, "BATTLE END");
    TEST_ASSERT_CONTAINS(trace, "Winner: charizard");

    std::filesystem::remove_all(dir);
}

TEST(XRayLogger, DisabledLoggerWritesNothingMore) {
    auto dir = fresh_xray_dir("disabled");
    BattleEngine engine(shipped_pokedex());
    ScriptedRandomSource rng;
    BattleState state = engine.create_battle("pikachu", "charizard");

    std::string path;
    {
        XRayLogger xray(dir.string());
        xray.set_enabled(false);
        path = xray.get_log_path();
        engine.run(state, rng, &xray);
    }

    std::string trace = read_file(path);
    TEST_ASSERT_CONTAINS(trace, "X-RAY BATTLE LOG");
    TEST_ASSERT_TRUE(trace.find("[TURN 1]") == std::string::npos);

    std::filesystem::remove_all(dir);
}

TEST(XRayLogger, EngineWritesTraceWhenConfigured) {
    auto dir = fresh_xray_dir("engine");
    BattleConfig config;
    config.xray_dir = dir.string();
    BattleEngine engine(shipped_pokedex(), config);
    ScriptedRandomSource rng;

    BattleResult result = engine.simulate_battle("pikachu", "charizard", false, rng);
    TEST_ASSERT_TRUE(result.winner.has_value());

    auto files = log_files_in(dir);
    TEST_ASSERT_EQ(static_cast<size_t>(1), files.size());
    TEST_ASSERT_CONTAINS(read_file(files[0].string()), "Summary: " + result.battle_summary);

    std::filesystem::remove_all(dir);
}
