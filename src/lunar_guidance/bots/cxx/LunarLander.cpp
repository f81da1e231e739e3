#include "LunarLander.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

// Pi constant
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

LunarLander::LunarLander(Config world) : world(world), rng(42) {}

std::vector<float> LunarLander::reset(unsigned int seed, const std::map<std::string, float>& task_dict) {
    if (seed != 0) rng.seed(seed);

    // Parse Task
    if (task_dict.count("gravity")) world.gravity = task_dict.at("gravity");
    if (task_dict.count("thrust")) world.thrust = task_dict.at("thrust");
    if (task_dict.count("dt")) task.dt = task_dict.at("dt");
    if (task_dict.count("rotation_rate")) task.rotation_rate = task_dict.at("rotation_rate");
    if (task_dict.count("max_fuel")) task.max_fuel = task_dict.at("max_fuel");
    if (task_dict.count("start_y")) task.start_y = task_dict.at("start_y");
    if (task_dict.count("start_vy")) task.start_vy = task_dict.at("start_vy");
    if (task_dict.count("pad_width")) task.pad_width = task_dict.at("pad_width");
    if (task_dict.count("safe_speed")) task.safe_speed = task_dict.at("safe_speed");
    if (task_dict.count("safe_heading")) task.safe_heading = task_dict.at("safe_heading");
    if (task_dict.count("max_ticks")) task.max_ticks = static_cast<int>(task_dict.at("max_ticks"));

    if (!(task.dt > 0.0f)) {
        throw std::invalid_argument("LunarLander: dt must be positive");
    }

    // Start position, drift and attitude are randomized unless the task fixes them
    std::uniform_real_distribution<float> dist_x(0.1f * world.nx, 0.9f * world.nx);
    std::uniform_real_distribution<float> dist_vx(-5.0f, 5.0f);
    std::uniform_real_distribution<float> dist_heading(-30.0f, 30.0f);

    task.start_x = task_dict.count("start_x") ? task_dict.at("start_x") : dist_x(rng);
    task.start_vx = task_dict.count("start_vx") ? task_dict.at("start_vx") : dist_vx(rng);
    task.start_heading = task_dict.count("start_heading") ? task_dict.at("start_heading") : dist_heading(rng);

    state.x = task.start_x;
    state.y = task.start_y;
    state.vx = task.start_vx;
    state.vy = task.start_vy;
    state.heading = task.start_heading;
    state.fuel = task.max_fuel;
    ticks = 0;

    if (!fixed_terrain) generate_terrain();

    return get_obs();
}

std::tuple<std::vector<float>, float, bool, bool, std::map<std::string, float>> LunarLander::step(const Instructions& ins) {
    if (ins.left && ins.right) {
        throw std::invalid_argument("LunarLander: left and right rotation requested in the same tick");
    }
    if (terrain_.empty()) {
        throw std::logic_error("LunarLander: step() called before reset()");
    }

    float dt = task.dt;
    ++ticks;

    // Engines
    bool main = ins.main && state.fuel > 0.0f;
    bool rotating = (ins.left || ins.right) && state.fuel > 0.0f;

    if (rotating) {
        state.heading += (ins.left ? 1.0f : -1.0f) * task.rotation_rate * dt;
        state.fuel -= world.rotation_engine_burn_rate * dt;
    }
    if (main) {
        state.fuel -= world.main_engine_burn_rate * dt;
    }
    state.fuel = std::max(0.0f, state.fuel);

    // Physics
    float rad = state.heading * (M_PI / 180.0f);
    float ax = main ? -world.thrust * std::sin(rad) : 0.0f;
    float ay = (main ? world.thrust * std::cos(rad) : 0.0f) - world.gravity;

    state.x += state.vx * dt + 0.5f * ax * dt * dt;
    state.y += state.vy * dt + 0.5f * ay * dt * dt;
    state.vx += ax * dt;
    state.vy += ay * dt;

    // Termination
    bool landed = false;
    bool crashed = false;

    if (state.x < 0.0f || state.x >= static_cast<float>(terrain_.size()) || state.y > world.ny) {
        crashed = true;  // lost
    } else {
        int ix = static_cast<int>(state.x);
        if (state.y <= terrain_[ix]) {
            bool safe_speed = (std::abs(state.vx) < task.safe_speed) && (std::abs(state.vy) < task.safe_speed);
            bool safe_angle = std::abs(state.heading) < task.safe_heading;
            if (on_flat_ground(ix) && safe_speed && safe_angle) {
                landed = true;
            } else {
                crashed = true;
            }
            state.y = terrain_[ix];
        }
    }

    bool done = landed || crashed;
    bool truncated = !done && ticks >= task.max_ticks;
    float reward = landed ? 1.0f : 0.0f;

    std::map<std::string, float> info = {
        {"landed", landed ? 1.0f : 0.0f},
        {"crashed", crashed ? 1.0f : 0.0f},
        {"fuel", state.fuel},
        {"ticks", static_cast<float>(ticks)},
    };
    return {get_obs(), reward, done, truncated, info};
}

std::vector<float> LunarLander::get_obs() const {
    return {
        state.x / world.nx,
        state.y / world.ny,
        state.vx / 100.0f,
        state.vy / 100.0f,
        state.heading / 90.0f,
        task.max_fuel > 0.0f ? state.fuel / task.max_fuel : 0.0f,
    };
}

PlayerState LunarLander::player_state() const {
    return {state.x, state.y, state.vx, state.vy, state.heading};
}

void LunarLander::set_terrain(std::vector<float> terrain) {
    if (terrain.size() < 2) {
        throw std::invalid_argument("LunarLander: terrain needs at least two cells");
    }
    terrain_ = std::move(terrain);
    fixed_terrain = true;
}

void LunarLander::clear_terrain() {
    fixed_terrain = false;
    terrain_.clear();
}

void LunarLander::generate_terrain() {
    // Rough ground made of narrow flat steps, plus one pad wide enough to land on
    int n = world.nx;
    int pad = std::max(1, std::min(n / 2, static_cast<int>(task.pad_width)));

    std::uniform_int_distribution<int> dist_alt(100, 400);
    std::uniform_int_distribution<int> dist_step(5, 30);
    std::uniform_int_distribution<int> dist_pad(0, n - pad);

    terrain_.assign(n, 0.0f);
    int i = 0;
    float prev = -1.0f;
    while (i < n) {
        int w = std::min(dist_step(rng), n - i);
        // Neighbouring steps never share an altitude, or they would merge into a wider run
        float alt;
        do {
            alt = static_cast<float>(dist_alt(rng));
        } while (alt == prev);
        std::fill(terrain_.begin() + i, terrain_.begin() + i + w, alt);
        prev = alt;
        i += w;
    }

    int pad_start = dist_pad(rng);
    float pad_alt = static_cast<float>(dist_alt(rng));
    std::fill(terrain_.begin() + pad_start, terrain_.begin() + pad_start + pad, pad_alt);
}

bool LunarLander::on_flat_ground(int ix) const {
    int n = static_cast<int>(terrain_.size());
    if (ix <= 0 || ix >= n - 1) return false;
    return terrain_[ix - 1] == terrain_[ix] && terrain_[ix + 1] == terrain_[ix];
}
