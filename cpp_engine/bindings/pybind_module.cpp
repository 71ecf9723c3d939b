/**
 * Pokemon Battle Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * The agent host passes tool calls as JSON strings and gets JSON strings back.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <nlohmann/json.hpp>
#include "pokebattle.hpp"

namespace py = pybind11;
using json = nlohmann::json;

PYBIND11_MODULE(pokebattle_cpp, m) {
    m.doc() = "Pokemon battle resolution engine";
    m.attr("__version__") = pokebattle::get_version();

    // ========================================================================
    // EXCEPTIONS
    // ========================================================================

    auto battle_error = py::register_exception<pokebattle::BattleError>(m, "BattleError");
    py::register_exception<pokebattle::NotFoundError>(m, "NotFoundError", battle_error.ptr());
    py::register_exception<pokebattle::DataIntegrityError>(m, "DataIntegrityError", battle_error.ptr());
    py::register_exception<pokebattle::InvalidArgumentError>(m, "InvalidArgumentError", battle_error.ptr());

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<pokebattle::ElementType>(m, "ElementType")
        .value("NORMAL", pokebattle::ElementType::NORMAL)
        .value("FIRE", pokebattle::ElementType::FIRE)
        .value("WATER", pokebattle::ElementType::WATER)
        .value("ELECTRIC", pokebattle::ElementType::ELECTRIC)
        .value("GRASS", pokebattle::ElementType::GRASS)
        .value("ICE", pokebattle::ElementType::ICE)
        .value("FIGHTING", pokebattle::ElementType::FIGHTING)
        .value("POISON", pokebattle::ElementType::POISON)
        .value("GROUND", pokebattle::ElementType::GROUND)
        .value("FLYING", pokebattle::ElementType::FLYING)
        .value("PSYCHIC", pokebattle::ElementType::PSYCHIC)
        .value("BUG", pokebattle::ElementType::BUG)
        .value("ROCK", pokebattle::ElementType::ROCK)
        .value("GHOST", pokebattle::ElementType::GHOST)
        .value("DRAGON", pokebattle::ElementType::DRAGON)
        .value("DARK", pokebattle::ElementType::DARK)
        .value("STEEL", pokebattle::ElementType::STEEL)
        .value("FAIRY", pokebattle::ElementType::FAIRY)
        .export_values();

    py::enum_<pokebattle::StatusKind>(m, "StatusKind")
        .value("NONE", pokebattle::StatusKind::NONE)
        .value("BURN", pokebattle::StatusKind::BURN)
        .value("POISON", pokebattle::StatusKind::POISON)
        .value("PARALYSIS", pokebattle::StatusKind::PARALYSIS)
        .value("SLEEP", pokebattle::StatusKind::SLEEP)
        .value("FREEZE", pokebattle::StatusKind::FREEZE)
        .value("CONFUSION", pokebattle::StatusKind::CONFUSION)
        .export_values();

    // ========================================================================
    // TYPE CHART
    // ========================================================================

    m.def("effectiveness",
          py::overload_cast<const std::string&, const std::vector<std::string>&>(
              &pokebattle::TypeChart::effectiveness),
          py::arg("attack_type"), py::arg("defend_types"),
          "Type multiplier of an attacking type against one or two defending types");

    m.def("type_multiplier", &pokebattle::TypeChart::multiplier,
          py::arg("attack_type"), py::arg("defend_type"));

    // ========================================================================
    // CONFIG
    // ========================================================================

    py::class_<pokebattle::BattleConfig>(m, "BattleConfig")
        .def(py::init<>())
        .def_readwrite("max_turns", &pokebattle::BattleConfig::max_turns)
        .def_readwrite("seed", &pokebattle::BattleConfig::seed)
        .def_readwrite("allow_mirror_match", &pokebattle::BattleConfig::allow_mirror_match)
        .def_readwrite("verbose", &pokebattle::BattleConfig::verbose)
        .def_readwrite("xray_dir", &pokebattle::BattleConfig::xray_dir)
        .def_readwrite("database_path", &pokebattle::BattleConfig::database_path)
        .def("load_from_json", &pokebattle::BattleConfig::load_from_json)
        .def("apply_environment", &pokebattle::BattleConfig::apply_environment)
        .def("validate", &pokebattle::BattleConfig::validate);

    // ========================================================================
    // POKEDEX
    // ========================================================================

    py::class_<pokebattle::Pokedex>(m, "Pokedex")
        .def(py::init<>())
        .def("load_from_json", &pokebattle::Pokedex::load_from_json)
        .def("load_from_string", &pokebattle::Pokedex::load_from_string)
        .def("get_all_names", &pokebattle::Pokedex::get_all_names)
        .def("profile_count", &pokebattle::Pokedex::profile_count)
        .def("move_count", &pokebattle::Pokedex::move_count)
        .def("has_pokemon", [](const pokebattle::Pokedex& self, const std::string& name) {
            return self.find_profile(name) != nullptr;
        })
        .def("get_profile_document", [](const pokebattle::Pokedex& self,
                                        const std::string& name, bool include_ids) {
            return self.get_profile_document(name, include_ids).dump();
        }, py::arg("name"), py::arg("include_ids") = false);

    // ========================================================================
    // SERVICE
    // ========================================================================

    py::class_<pokebattle::BattleService>(m, "BattleService")
        .def(py::init<pokebattle::BattleConfig>(), py::arg("config"))
        .def(py::init<const pokebattle::Pokedex&, pokebattle::BattleConfig>(),
             py::arg("pokedex"), py::arg("config") = pokebattle::BattleConfig{},
             py::keep_alive<1, 2>())
        .def("simulate_battle", [](const pokebattle::BattleService& self,
                                   const std::string& pokemon1_name,
                                   const std::string& pokemon2_name,
                                   bool detailed,
                                   std::optional<uint64_t> seed) {
            json result;
            {
                py::gil_scoped_release release;
                result = self.simulate_battle(pokemon1_name, pokemon2_name, detailed, seed);
            }
            return result.dump();
        }, py::arg("pokemon1_name"), py::arg("pokemon2_name"),
           py::arg("detailed") = true, py::arg("seed") = py::none())
        .def("get_pokemon_info", [](const pokebattle::BattleService& self, const std::string& name) {
            return self.get_pokemon_info(name).dump();
        }, py::arg("name"))
        .def("handle_tool_call", [](const pokebattle::BattleService& self, const std::string& request) {
            json parsed = json::parse(request, nullptr, false);
            if (parsed.is_discarded()) {
                return pokebattle::BattleService::error_payload(
                    pokebattle::InvalidArgumentError("Tool call is not valid JSON")).dump();
            }
            return self.handle_tool_call(parsed).dump();
        }, py::arg("request"))
        .def_static("list_tools", []() {
            return pokebattle::BattleService::list_tools().dump();
        });
}
