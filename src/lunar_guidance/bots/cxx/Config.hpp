#pragma once
#include "PID.hpp"
#include <array>
#include <map>
#include <string>

// World parameters shared with the simulation. Fixed for a match.
struct Config {
    float gravity = 1.62f;
    float thrust = 4.0f;   // main engine acceleration along the heading
    int nx = 1920;         // screen width, also the terrain length
    int ny = 1080;         // screen height

    // Informational only, the guidance never reads them
    float main_engine_burn_rate = 0.1f;
    float rotation_engine_burn_rate = 0.01f;
};

// How the cached landing site is refreshed after orientation.
enum class TargetPolicy {
    CacheFirst,    // search until a site is found, then keep it
    PreferCloser,  // search every tick, switch when the new site compares closer
};

enum class ControlMode {
    Threshold,
    Feedback,
};

struct GuidanceConfig {
    // Identity (cosmetic)
    std::string team = "Apollo 11";
    std::string avatar = "0";
    std::string flag = "fr";

    TargetPolicy target_policy = TargetPolicy::CacheFirst;
    ControlMode control_mode = ControlMode::Threshold;

    int min_site_width = 40;         // cells, a run must be strictly wider
    float rotation_deadband = 0.5f;  // degrees
    float orient_tolerance = 1.0f;   // degrees, feedback initial orientation exit
    float drift_limit = 10.0f;       // vx above which orientation only bleeds speed
    float hover_altitude = 900.0f;   // fallback hold when no site is known
    float approach_radius = 50.0f;   // |target - x| below which the final descent starts
    float bank_angle = 90.0f;        // degrees, used to cancel horizontal drift
    float still_speed = 0.1f;        // |vx| considered stopped
    float slow_speed = 0.5f;         // |vx| allowing the terminal descent brake
    float max_descent_rate = 3.0f;   // vy below -this fires the main engine near the pad

    // Indexed by Axis
    std::array<PidGains, NUM_AXES> gains{};

    bool verbose = false;

    const PidGains& gains_for(Axis axis) const { return gains[static_cast<int>(axis)]; }
    PidGains& gains_for(Axis axis) { return gains[static_cast<int>(axis)]; }
};

// Presets. The hover altitude is the main difference between them:
// 900 (canonical), 980 (firefly) and 0.9 * ny (feedback).
GuidanceConfig apollo11_preset();
GuidanceConfig firefly_preset();
GuidanceConfig feedback_preset(const Config& world);
GuidanceConfig make_preset(const std::string& name, const Config& world);

// Applies a task dictionary. Keys name either a world or a guidance field
// ("gravity", "hover_altitude", "kp_heading", ...). Unknown keys throw.
void apply_overrides(Config& world, GuidanceConfig& guidance, const std::map<std::string, float>& task_dict);

const char* policy_name(TargetPolicy policy);
const char* mode_name(ControlMode mode);
