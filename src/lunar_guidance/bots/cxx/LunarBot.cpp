#include "LunarBot.hpp"
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace {

ControllerFactory pid_factory(const GuidanceConfig& cfg) {
    auto gains = cfg.gains;
    return [gains](Axis axis, float setpoint) -> std::unique_ptr<FeedbackController> {
        return std::make_unique<PID>(gains[static_cast<int>(axis)], setpoint);
    };
}

bool finite_state(const PlayerState& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.vx) &&
           std::isfinite(p.vy) && std::isfinite(p.heading);
}

} // namespace

Rotation decide_rotation(float current, float target, float deadband) {
    if (std::abs(current - target) < deadband) return Rotation::None;
    return current < target ? Rotation::Left : Rotation::Right;
}

void apply_rotation(Instructions& ins, Rotation r) {
    ins.left = r == Rotation::Left;
    ins.right = r == Rotation::Right;
}

const char* phase_name(GuidancePhase phase) {
    switch (phase) {
        case GuidancePhase::InitialOrient: return "initial_orient";
        case GuidancePhase::Searching: return "searching";
        case GuidancePhase::Approach: return "approach";
        case GuidancePhase::Descent: return "descent";
    }
    return "unknown";
}

LunarBot::LunarBot(GuidanceConfig config, Config world)
    : LunarBot(config, world, pid_factory(config)) {}

LunarBot::LunarBot(GuidanceConfig config, Config world, ControllerFactory factory)
    : cfg(std::move(config)), world_(world), bank(std::move(factory)) {}

Instructions LunarBot::run(float t, float dt, const std::vector<float>& terrain,
                           const std::map<std::string, PlayerState>& players) {
    (void)t;
    auto it = players.find(cfg.team);
    if (it == players.end()) {
        throw std::out_of_range("LunarBot: no player entry for team '" + cfg.team + "'");
    }
    return step(dt, terrain, it->second);
}

Instructions LunarBot::step(float dt, const std::vector<float>& terrain, const PlayerState& me) {
    if (terrain.empty()) {
        throw std::invalid_argument("LunarBot: terrain profile is empty");
    }
    if (!finite_state(me)) {
        throw std::invalid_argument("LunarBot: non-finite vehicle state for team '" + cfg.team + "'");
    }

    // Orientation runs on its own and ends the tick
    if (state.phase == GuidancePhase::InitialOrient) {
        return initial_orient(me, dt);
    }

    update_target(terrain, me.x);

    if (!state.target_site) {
        set_phase(GuidancePhase::Searching);
    } else {
        float diff = *state.target_site - me.x;
        set_phase(std::abs(diff) < cfg.approach_radius ? GuidancePhase::Descent : GuidancePhase::Approach);
    }

    if (cfg.control_mode == ControlMode::Feedback) {
        return feedback_decision(terrain, me, dt);
    }
    return threshold_decision(me);
}

Instructions LunarBot::initial_orient(const PlayerState& me, float dt) {
    Instructions ins;

    // Too much drift for fine rotation, bleed it first
    if (me.vx > cfg.drift_limit) {
        ins.main = true;
        return ins;
    }

    if (cfg.control_mode == ControlMode::Feedback) {
        if (std::abs(me.heading) < cfg.orient_tolerance) {
            set_phase(GuidancePhase::Searching);
            return ins;
        }
        float correction = bank.ensure(Axis::Heading, 0.0f).update(me.heading, dt);
        ins.main = true;
        apply_rotation(ins, correction > 0.0f ? Rotation::Left : Rotation::Right);
        return ins;
    }

    Rotation r = decide_rotation(me.heading, 0.0f, cfg.rotation_deadband);
    if (r == Rotation::None) {
        set_phase(GuidancePhase::Searching);
    } else {
        apply_rotation(ins, r);
    }
    return ins;
}

void LunarBot::update_target(const std::vector<float>& terrain, float x) {
    if (cfg.target_policy == TargetPolicy::CacheFirst) {
        if (!state.target_site) {
            state.target_site = find_landing_site(terrain, cfg.min_site_width);
            if (state.target_site && cfg.verbose) {
                std::cout << "[" << cfg.team << "] Found landing site at " << *state.target_site << std::endl;
            }
        }
        return;
    }

    std::optional<int> found = find_landing_site(terrain, cfg.min_site_width);
    if (!found) return;

    // The right-hand side is signed on purpose: a cached site to the left of
    // the vehicle is never replaced by this comparison.
    if (!state.target_site || std::abs(*found - x) < (*state.target_site - x)) {
        if (cfg.verbose && found != state.target_site) {
            std::cout << "[" << cfg.team << "] Found landing site at " << *found << std::endl;
        }
        state.target_site = found;
    }
}

void LunarBot::set_phase(GuidancePhase phase) {
    if (phase == state.phase) return;
    if (cfg.verbose) {
        std::cout << "[" << cfg.team << "] " << phase_name(state.phase) << " -> " << phase_name(phase) << std::endl;
    }
    state.phase = phase;
}

void LunarBot::cancel_drift(const PlayerState& me, Instructions& ins) const {
    Rotation r;
    if (std::abs(me.vx) <= cfg.still_speed) {
        r = decide_rotation(me.heading, 0.0f, cfg.rotation_deadband);
    } else if (me.vx > cfg.still_speed) {
        // Banked left, the thrust pushes toward -x
        r = decide_rotation(me.heading, cfg.bank_angle, cfg.rotation_deadband);
        ins.main = true;
    } else {
        r = decide_rotation(me.heading, -cfg.bank_angle, cfg.rotation_deadband);
        ins.main = false;
    }
    apply_rotation(ins, r);
}

Instructions LunarBot::threshold_decision(const PlayerState& me) {
    Instructions ins;
    switch (state.phase) {
        case GuidancePhase::Searching:
            if (me.y < cfg.hover_altitude && me.vy < 0.0f) ins.main = true;
            break;

        case GuidancePhase::Approach:
            if (me.vy < 0.0f) ins.main = true;
            break;

        case GuidancePhase::Descent:
            cancel_drift(me, ins);
            if (std::abs(me.vx) < cfg.slow_speed && me.vy < -cfg.max_descent_rate) ins.main = true;
            break;

        case GuidancePhase::InitialOrient:
            break;
    }
    return ins;
}

Instructions LunarBot::feedback_decision(const std::vector<float>& terrain, const PlayerState& me, float dt) {
    Instructions ins;

    float setpoint = cfg.hover_altitude;
    if (state.phase == GuidancePhase::Descent) {
        setpoint = terrain.at(*state.target_site);
    }

    // Altitude first, lateral corrections only when it is satisfied
    float lift = bank.ensure(Axis::Y, setpoint).update(me.y, dt);
    if (lift > 0.0f) {
        ins.main = true;
        return ins;
    }

    if (state.phase == GuidancePhase::Descent) {
        cancel_drift(me, ins);
        float brake = bank.ensure(Axis::VY, -cfg.max_descent_rate).update(me.vy, dt);
        if (std::abs(me.vx) < cfg.slow_speed && brake > 0.0f) ins.main = true;
    }
    return ins;
}
