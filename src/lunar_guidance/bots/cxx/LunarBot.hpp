#pragma once
#include "Config.hpp"
#include "PID.hpp"
#include "Terrain.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

// Kinematics of one lander as reported by the simulation for this tick.
struct PlayerState {
    float x, y;      // position
    float vx, vy;    // velocity
    float heading;   // degrees, 0 = upright, positive = rotated left
};

// Engine commands for one tick. left and right are never both set.
struct Instructions {
    bool main = false;
    bool left = false;
    bool right = false;
};

enum class Rotation {
    None,
    Left,
    Right,
};

// Rotation needed to bring current toward target. None inside the dead-band
// (|current - target| < deadband, strict).
Rotation decide_rotation(float current, float target, float deadband = 0.5f);

// Sets the rotation flags of ins from r, clearing the opposite one.
void apply_rotation(Instructions& ins, Rotation r);

enum class GuidancePhase {
    InitialOrient,  // bleed drift, rotate upright
    Searching,      // no landing site known, hold the hover altitude
    Approach,       // site known but far, hold altitude
    Descent,        // within the approach radius, cancel drift and land
};

const char* phase_name(GuidancePhase phase);

// Everything the bot remembers between ticks.
struct GuidanceState {
    GuidancePhase phase = GuidancePhase::InitialOrient;
    std::optional<int> target_site;
};

class LunarBot {
public:
    explicit LunarBot(GuidanceConfig config = apollo11_preset(), Config world = Config());

    // Custom controllers for the feedback mode.
    LunarBot(GuidanceConfig config, Config world, ControllerFactory factory);

    // Called once per simulation tick. players maps team names to their state;
    // the entry for this bot's team must be present.
    Instructions run(float t, float dt, const std::vector<float>& terrain,
                     const std::map<std::string, PlayerState>& players);

    // Same decision from this bot's own state.
    Instructions step(float dt, const std::vector<float>& terrain, const PlayerState& me);

    const GuidanceState& guidance() const { return state; }
    const GuidanceConfig& config() const { return cfg; }
    const Config& world() const { return world_; }
    const ControllerBank& controllers() const { return bank; }

private:
    Instructions initial_orient(const PlayerState& me, float dt);
    void update_target(const std::vector<float>& terrain, float x);
    void set_phase(GuidancePhase phase);

    Instructions threshold_decision(const PlayerState& me);
    Instructions feedback_decision(const std::vector<float>& terrain, const PlayerState& me, float dt);

    // Rotation and main engine for cancelling horizontal drift near the site.
    void cancel_drift(const PlayerState& me, Instructions& ins) const;

    GuidanceConfig cfg;
    Config world_;
    GuidanceState state;
    ControllerBank bank;
};
