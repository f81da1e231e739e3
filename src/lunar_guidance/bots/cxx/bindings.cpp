#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "LunarBot.hpp"
#include "LunarLander.hpp"

namespace py = pybind11;

namespace {

// Reads the state of one player object from the simulation: any object with
// position, velocity (2-sequences) and heading attributes.
PlayerState to_player_state(const py::handle& obj) {
    if (py::isinstance<PlayerState>(obj)) return obj.cast<PlayerState>();
    auto position = obj.attr("position").cast<std::vector<float>>();
    auto velocity = obj.attr("velocity").cast<std::vector<float>>();
    if (position.size() != 2 || velocity.size() != 2) {
        throw py::value_error("player position and velocity must have two components");
    }
    return {position[0], position[1], velocity[0], velocity[1], obj.attr("heading").cast<float>()};
}

LunarBot make_bot(const std::string& preset, const std::map<std::string, float>& overrides) {
    Config world;
    GuidanceConfig guidance = make_preset(preset, world);
    apply_overrides(world, guidance, overrides);
    return LunarBot(guidance, world);
}

} // namespace

PYBIND11_MODULE(lunar_guidance_cpp, m) {
    py::class_<Instructions>(m, "Instructions")
        .def(py::init<>())
        .def_readwrite("main", &Instructions::main)
        .def_readwrite("left", &Instructions::left)
        .def_readwrite("right", &Instructions::right);

    py::class_<PlayerState>(m, "PlayerState")
        .def(py::init([](std::vector<float> position, std::vector<float> velocity, float heading) {
                 if (position.size() != 2 || velocity.size() != 2) {
                     throw py::value_error("position and velocity must have two components");
                 }
                 return PlayerState{position[0], position[1], velocity[0], velocity[1], heading};
             }),
             py::arg("position"), py::arg("velocity"), py::arg("heading"))
        .def_property_readonly("position", [](const PlayerState& p) { return std::vector<float>{p.x, p.y}; })
        .def_property_readonly("velocity", [](const PlayerState& p) { return std::vector<float>{p.vx, p.vy}; })
        .def_readonly("heading", &PlayerState::heading);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("gravity", &Config::gravity)
        .def_readwrite("thrust", &Config::thrust)
        .def_readwrite("nx", &Config::nx)
        .def_readwrite("ny", &Config::ny)
        .def_readwrite("main_engine_burn_rate", &Config::main_engine_burn_rate)
        .def_readwrite("rotation_engine_burn_rate", &Config::rotation_engine_burn_rate);

    py::class_<GuidanceConfig>(m, "GuidanceConfig")
        .def_readonly("team", &GuidanceConfig::team)
        .def_property_readonly("target_policy", [](const GuidanceConfig& c) { return policy_name(c.target_policy); })
        .def_property_readonly("control_mode", [](const GuidanceConfig& c) { return mode_name(c.control_mode); })
        .def_readonly("min_site_width", &GuidanceConfig::min_site_width)
        .def_readonly("hover_altitude", &GuidanceConfig::hover_altitude)
        .def_readonly("approach_radius", &GuidanceConfig::approach_radius)
        .def_readonly("bank_angle", &GuidanceConfig::bank_angle);

    m.def("apollo11", &apollo11_preset);
    m.def("firefly", &firefly_preset);
    m.def("feedback", [](const Config& world) { return feedback_preset(world); }, py::arg("world") = Config());

    m.def("find_landing_site", &find_landing_site, py::arg("terrain"), py::arg("min_width") = 40);
    m.def("decide_rotation", [](float current, float target) -> py::object {
        switch (decide_rotation(current, target)) {
            case Rotation::Left: return py::str("left");
            case Rotation::Right: return py::str("right");
            case Rotation::None: break;
        }
        return py::none();
    }, py::arg("current"), py::arg("target"));

    py::class_<LunarBot>(m, "Bot")
        .def(py::init(&make_bot), py::arg("preset") = "apollo11",
             py::arg("overrides") = std::map<std::string, float>())
        .def_property_readonly("team", [](const LunarBot& b) { return b.config().team; })
        .def_property_readonly("avatar", [](const LunarBot& b) { return b.config().avatar; })
        .def_property_readonly("flag", [](const LunarBot& b) { return b.config().flag; })
        .def_property_readonly("phase", [](const LunarBot& b) { return phase_name(b.guidance().phase); })
        .def_property_readonly("target_site", [](const LunarBot& b) { return b.guidance().target_site; })
        .def("run", [](LunarBot& bot, float t, float dt, const std::vector<float>& terrain,
                       const py::dict& players, const py::object& asteroids) {
                 (void)asteroids;
                 std::map<std::string, PlayerState> states;
                 for (auto item : players) {
                     states.emplace(item.first.cast<std::string>(), to_player_state(item.second));
                 }
                 return bot.run(t, dt, terrain, states);
             },
             py::arg("t"), py::arg("dt"), py::arg("terrain"), py::arg("players"), py::arg("asteroids") = py::list());

    py::class_<LunarLander>(m, "LunarLander")
        .def(py::init<>())
        .def("reset", &LunarLander::reset, py::arg("seed"), py::arg("task_dict") = std::map<std::string, float>())
        .def("step", &LunarLander::step)
        .def("get_obs", &LunarLander::get_obs)
        .def("player_state", &LunarLander::player_state)
        .def_property("terrain", &LunarLander::terrain, &LunarLander::set_terrain);
}
