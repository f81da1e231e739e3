#include "Config.hpp"
#include <stdexcept>

namespace {

// Gains shared by every preset. Only the feedback mode builds controllers.
void default_gains(GuidanceConfig& cfg) {
    cfg.gains_for(Axis::Heading) = {1.0f, 0.0f, 0.05f, -1.0f, 1.0f};
    cfg.gains_for(Axis::Y) = {0.05f, 0.002f, 0.8f, -1.0f, 1.0f};
    cfg.gains_for(Axis::VY) = {1.0f, 0.0f, 0.0f, -1.0f, 1.0f};
    cfg.gains_for(Axis::X) = {0.01f, 0.0f, 0.2f, -1.0f, 1.0f};
    cfg.gains_for(Axis::VX) = {0.5f, 0.0f, 0.0f, -1.0f, 1.0f};
}

bool set_gain(GuidanceConfig& cfg, const std::string& key, float value) {
    auto sep = key.find('_');
    if (sep == std::string::npos) return false;
    std::string term = key.substr(0, sep);
    std::string axis = key.substr(sep + 1);

    for (int i = 0; i < NUM_AXES; ++i) {
        if (axis != axis_name(static_cast<Axis>(i))) continue;
        PidGains& g = cfg.gains[i];
        if (term == "kp") g.kp = value;
        else if (term == "ki") g.ki = value;
        else if (term == "kd") g.kd = value;
        else if (term == "min") g.output_min = value;
        else if (term == "max") g.output_max = value;
        else return false;
        return true;
    }
    return false;
}

} // namespace

GuidanceConfig apollo11_preset() {
    GuidanceConfig cfg;
    default_gains(cfg);
    return cfg;
}

GuidanceConfig firefly_preset() {
    GuidanceConfig cfg;
    default_gains(cfg);
    cfg.team = "Firefly";
    cfg.avatar = "icon.png";
    cfg.flag = "gb";
    cfg.target_policy = TargetPolicy::PreferCloser;
    cfg.hover_altitude = 980.0f;
    return cfg;
}

GuidanceConfig feedback_preset(const Config& world) {
    GuidanceConfig cfg = firefly_preset();
    cfg.team = "Firefly PID";
    cfg.control_mode = ControlMode::Feedback;
    cfg.hover_altitude = 0.9f * world.ny;
    cfg.bank_angle = 70.0f;
    cfg.approach_radius = 150.0f;
    return cfg;
}

GuidanceConfig make_preset(const std::string& name, const Config& world) {
    if (name == "apollo11") return apollo11_preset();
    if (name == "firefly") return firefly_preset();
    if (name == "feedback") return feedback_preset(world);
    throw std::invalid_argument("Unknown guidance preset '" + name + "' (expected apollo11, firefly or feedback)");
}

void apply_overrides(Config& world, GuidanceConfig& guidance, const std::map<std::string, float>& task_dict) {
    for (const auto& kv : task_dict) {
        const std::string& key = kv.first;
        float value = kv.second;

        // World
        if (key == "gravity") world.gravity = value;
        else if (key == "thrust") world.thrust = value;
        else if (key == "nx") world.nx = static_cast<int>(value);
        else if (key == "ny") world.ny = static_cast<int>(value);
        else if (key == "main_engine_burn_rate") world.main_engine_burn_rate = value;
        else if (key == "rotation_engine_burn_rate") world.rotation_engine_burn_rate = value;
        // Guidance
        else if (key == "target_policy") guidance.target_policy = value != 0.0f ? TargetPolicy::PreferCloser : TargetPolicy::CacheFirst;
        else if (key == "control_mode") guidance.control_mode = value != 0.0f ? ControlMode::Feedback : ControlMode::Threshold;
        else if (key == "min_site_width") guidance.min_site_width = static_cast<int>(value);
        else if (key == "rotation_deadband") guidance.rotation_deadband = value;
        else if (key == "orient_tolerance") guidance.orient_tolerance = value;
        else if (key == "drift_limit") guidance.drift_limit = value;
        else if (key == "hover_altitude") guidance.hover_altitude = value;
        else if (key == "approach_radius") guidance.approach_radius = value;
        else if (key == "bank_angle") guidance.bank_angle = value;
        else if (key == "still_speed") guidance.still_speed = value;
        else if (key == "slow_speed") guidance.slow_speed = value;
        else if (key == "max_descent_rate") guidance.max_descent_rate = value;
        else if (key == "verbose") guidance.verbose = value != 0.0f;
        else if (!set_gain(guidance, key, value)) {
            throw std::invalid_argument("Unknown configuration key '" + key + "'");
        }
    }

    if (world.nx < 2 || world.ny <= 0) {
        throw std::invalid_argument("Config: screen must be at least 2 cells wide and have a positive height");
    }
    if (guidance.rotation_deadband <= 0.0f) {
        throw std::invalid_argument("Config: rotation_deadband must be positive");
    }
}

const char* policy_name(TargetPolicy policy) {
    switch (policy) {
        case TargetPolicy::CacheFirst: return "cache_first";
        case TargetPolicy::PreferCloser: return "prefer_closer";
    }
    return "unknown";
}

const char* mode_name(ControlMode mode) {
    switch (mode) {
        case ControlMode::Threshold: return "threshold";
        case ControlMode::Feedback: return "feedback";
    }
    return "unknown";
}
