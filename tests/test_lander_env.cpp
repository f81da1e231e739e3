#include <gtest/gtest.h>
#include "LunarBot.hpp"
#include "LunarLander.hpp"
#include "Terrain.hpp"
#include <cmath>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Fixed start: no randomized drift or attitude
std::map<std::string, float> still_start(float x = 500.0f, float y = 600.0f) {
    return {{"start_x", x}, {"start_y", y}, {"start_vx", 0.0f}, {"start_heading", 0.0f}};
}

Instructions command(bool main, bool left = false, bool right = false) {
    Instructions ins;
    ins.main = main;
    ins.left = left;
    ins.right = right;
    return ins;
}

} // namespace

TEST(LunarLander, ResetPlacesVehicle) {
    LunarLander env;
    auto obs = env.reset(7, still_start(480.0f, 540.0f));
    ASSERT_EQ(obs.size(), 6u);
    EXPECT_FLOAT_EQ(obs[0], 480.0f / env.world.nx);
    EXPECT_FLOAT_EQ(obs[1], 540.0f / env.world.ny);
    EXPECT_FLOAT_EQ(obs[5], 1.0f);
    EXPECT_EQ(env.ticks, 0);

    PlayerState p = env.player_state();
    EXPECT_FLOAT_EQ(p.x, 480.0f);
    EXPECT_FLOAT_EQ(p.y, 540.0f);
    EXPECT_FLOAT_EQ(p.heading, 0.0f);
}

TEST(LunarLander, GeneratedTerrainHasOneLandingSite) {
    LunarLander env;
    for (unsigned int seed : {1u, 2u, 3u, 99u}) {
        env.reset(seed, still_start());
        ASSERT_EQ(static_cast<int>(env.terrain().size()), env.world.nx);
        auto site = find_landing_site(env.terrain());
        ASSERT_TRUE(site.has_value());

        // The pad is the only run wide enough
        int wide = 0;
        for (const auto& run : find_runs(env.terrain())) wide += run.length > 40;
        EXPECT_EQ(wide, 1);
    }
}

TEST(LunarLander, SameSeedSameTerrain) {
    LunarLander a, b;
    a.reset(11, still_start());
    b.reset(11, still_start());
    EXPECT_EQ(a.terrain(), b.terrain());
}

TEST(LunarLander, GravityWithoutThrust) {
    LunarLander env;
    env.reset(1, still_start());
    env.step(command(false));
    float dt = env.task.dt;
    EXPECT_NEAR(env.state.vy, -env.world.gravity * dt, 1e-5f);
    EXPECT_NEAR(env.state.y, 600.0f - 0.5f * env.world.gravity * dt * dt, 1e-3f);
    EXPECT_FLOAT_EQ(env.state.vx, 0.0f);
}

TEST(LunarLander, UprightThrustLifts) {
    LunarLander env;
    env.reset(1, still_start());
    env.step(command(true));
    EXPECT_NEAR(env.state.vy, (env.world.thrust - env.world.gravity) * env.task.dt, 1e-5f);
    EXPECT_LT(env.state.fuel, env.task.max_fuel);
}

TEST(LunarLander, BankedLeftThrustPushesTowardNegativeX) {
    LunarLander env;
    auto task = still_start();
    task["start_heading"] = 90.0f;
    env.reset(1, task);
    env.step(command(true));
    EXPECT_NEAR(env.state.vx, -env.world.thrust * env.task.dt, 1e-4f);
    EXPECT_NEAR(env.state.vy, -env.world.gravity * env.task.dt, 1e-4f);
}

TEST(LunarLander, RotationEngines) {
    LunarLander env;
    env.reset(1, still_start());
    float step = env.task.rotation_rate * env.task.dt;
    env.step(command(false, true));
    EXPECT_NEAR(env.state.heading, step, 1e-5f);
    env.step(command(false, false, true));
    env.step(command(false, false, true));
    EXPECT_NEAR(env.state.heading, -step, 1e-5f);

    EXPECT_THROW(env.step(command(false, true, true)), std::invalid_argument);
}

TEST(LunarLander, NoFuelNoThrust) {
    LunarLander env;
    auto task = still_start();
    task["max_fuel"] = 0.0f;
    env.reset(1, task);
    env.step(command(true, true));
    EXPECT_FLOAT_EQ(env.state.heading, 0.0f);
    EXPECT_LT(env.state.vy, 0.0f);
}

TEST(LunarLander, SoftTouchdownOnFlatGroundLands) {
    LunarLander env;
    env.set_terrain(std::vector<float>(env.world.nx, 100.0f));
    auto task = still_start(500.0f, 100.05f);
    task["start_vy"] = -1.0f;
    env.reset(1, task);

    auto result = env.step(command(false));
    EXPECT_TRUE(std::get<2>(result));
    EXPECT_FLOAT_EQ(std::get<1>(result), 1.0f);
    EXPECT_FLOAT_EQ(std::get<4>(result).at("landed"), 1.0f);
    EXPECT_FLOAT_EQ(env.state.y, 100.0f);
}

TEST(LunarLander, HardTouchdownCrashes) {
    LunarLander env;
    env.set_terrain(std::vector<float>(env.world.nx, 100.0f));
    auto task = still_start(500.0f, 100.5f);
    task["start_vy"] = -20.0f;
    env.reset(1, task);

    auto result = env.step(command(false));
    EXPECT_TRUE(std::get<2>(result));
    EXPECT_FLOAT_EQ(std::get<1>(result), 0.0f);
    EXPECT_FLOAT_EQ(std::get<4>(result).at("crashed"), 1.0f);
}

TEST(LunarLander, LeavingTheScreenCrashes) {
    LunarLander env;
    auto task = still_start(1.0f, 600.0f);
    task["start_vx"] = -100.0f;
    env.reset(1, task);
    auto result = env.step(command(false));
    EXPECT_TRUE(std::get<2>(result));
    EXPECT_FLOAT_EQ(std::get<4>(result).at("crashed"), 1.0f);
}

TEST(LunarLander, TruncatesAfterMaxTicks) {
    LunarLander env;
    auto task = still_start();
    task["max_ticks"] = 3.0f;
    task["gravity"] = 0.0f;
    env.reset(1, task);
    env.step(command(false));
    env.step(command(false));
    auto result = env.step(command(false));
    EXPECT_FALSE(std::get<2>(result));
    EXPECT_TRUE(std::get<3>(result));
}

TEST(LunarLander, StepBeforeResetThrows) {
    LunarLander env;
    EXPECT_THROW(env.step(command(false)), std::logic_error);
    EXPECT_THROW(env.set_terrain({1.0f}), std::invalid_argument);
}

TEST(ClosedLoop, BotsFlyWithoutConflictingCommands) {
    Config world;
    for (const std::string preset : {"apollo11", "firefly", "feedback"}) {
        LunarLander env(world);
        env.reset(5, {{"start_x", 900.0f}, {"start_vx", 2.0f}, {"start_heading", 20.0f}});
        GuidanceConfig cfg = make_preset(preset, world);
        LunarBot bot(cfg, world);

        float t = 0.0f;
        for (int i = 0; i < 3000; ++i) {
            std::map<std::string, PlayerState> players = {{cfg.team, env.player_state()}};
            Instructions ins = bot.run(t, env.task.dt, env.terrain(), players);
            ASSERT_FALSE(ins.left && ins.right) << preset << " tick " << i;
            auto result = env.step(ins);
            t += env.task.dt;
            if (std::get<2>(result) || std::get<3>(result)) break;
        }
        // Twenty degrees at 0.5 degree per tick takes 40 ticks
        EXPECT_NE(bot.guidance().phase, GuidancePhase::InitialOrient) << preset;
    }
}
