#pragma once
#include "Config.hpp"
#include "LunarBot.hpp"
#include <map>
#include <random>
#include <string>
#include <tuple>
#include <vector>

// Minimal lunar lander environment for flying a bot closed-loop.
class LunarLander {
public:
    // State: x, y, vx, vy, heading, fuel
    struct State {
        float x, y, vx, vy, heading, fuel;
    };

    struct Task {
        float dt = 0.05f;
        float rotation_rate = 10.0f;  // degrees per second
        float max_fuel = 100.0f;
        float start_x = 960.0f;
        float start_y = 900.0f;
        float start_vx = 0.0f;
        float start_vy = 0.0f;
        float start_heading = 0.0f;
        float pad_width = 80.0f;       // width of the flat pad in generated terrain
        float safe_speed = 5.0f;       // max |vx| and |vy| at touchdown
        float safe_heading = 5.0f;     // max |heading| at touchdown
        int max_ticks = 20000;
    };

    explicit LunarLander(Config world = Config());

    // Core env methods
    std::vector<float> reset(unsigned int seed, const std::map<std::string, float>& task_dict);
    // Returns obs, reward (1 on landing), done, truncated, info
    std::tuple<std::vector<float>, float, bool, bool, std::map<std::string, float>> step(const Instructions& ins);

    // Getters
    std::vector<float> get_obs() const;
    PlayerState player_state() const;
    const std::vector<float>& terrain() const { return terrain_; }

    // Replaces the generated terrain, kept across resets until cleared
    void set_terrain(std::vector<float> terrain);
    void clear_terrain();

    // Public State for debugging
    State state;
    Task task;
    Config world;
    int ticks = 0;

private:
    void generate_terrain();
    bool on_flat_ground(int ix) const;

    std::mt19937 rng;
    std::vector<float> terrain_;
    bool fixed_terrain = false;
};
