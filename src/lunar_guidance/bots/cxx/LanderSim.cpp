#include "LunarBot.hpp"
#include "LunarLander.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

// Defaults
const int EPISODES = 10;
const unsigned int SEED = 42;

struct Options {
    std::string preset = "apollo11";
    int episodes = EPISODES;
    unsigned int seed = SEED;
    bool verbose = false;
};

struct Outcome {
    bool landed = false;
    bool crashed = false;
    int ticks = 0;
    float fuel = 0.0f;
    std::string phase;
};

static void usage() {
    std::cout << "Usage: lander_sim [--preset apollo11|firefly|feedback] [--episodes N] [--seed S] [--verbose]" << std::endl;
}

static Options parse_args(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
            return argv[++i];
        };
        if (arg == "--preset") opt.preset = value();
        else if (arg == "--episodes") opt.episodes = std::stoi(value());
        else if (arg == "--seed") opt.seed = static_cast<unsigned int>(std::stoul(value()));
        else if (arg == "--verbose") opt.verbose = true;
        else throw std::invalid_argument("unknown argument " + arg);
    }
    if (opt.episodes <= 0) throw std::invalid_argument("--episodes must be positive");
    return opt;
}

// Flies one episode from a fresh bot
Outcome fly(const Options& opt, unsigned int seed) {
    Config world;
    GuidanceConfig guidance = make_preset(opt.preset, world);
    guidance.verbose = opt.verbose;

    LunarLander env(world);
    env.reset(seed, {});

    LunarBot bot(guidance, world);
    Outcome out;
    float t = 0.0f;

    while (true) {
        std::map<std::string, PlayerState> players = {{guidance.team, env.player_state()}};
        Instructions ins = bot.run(t, env.task.dt, env.terrain(), players);
        auto result = env.step(ins);
        t += env.task.dt;

        bool done = std::get<2>(result);
        bool truncated = std::get<3>(result);
        if (done || truncated) {
            const auto& info = std::get<4>(result);
            out.landed = info.at("landed") > 0.5f;
            out.crashed = info.at("crashed") > 0.5f;
            out.ticks = env.ticks;
            out.fuel = env.state.fuel;
            out.phase = phase_name(bot.guidance().phase);
            break;
        }
    }
    return out;
}

int main(int argc, char** argv) {
    Options opt;
    try {
        opt = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "lander_sim: " << e.what() << std::endl;
        usage();
        return EXIT_FAILURE;
    }

    std::cout << "Flying " << opt.episodes << " episodes with preset '" << opt.preset << "'" << std::endl;

    int landed = 0, crashed = 0, timeouts = 0;
    try {
        for (int episode = 0; episode < opt.episodes; ++episode) {
            Outcome out = fly(opt, opt.seed + episode);
            const char* result = out.landed ? "LANDED" : (out.crashed ? "CRASHED" : "TIMEOUT");
            if (out.landed) ++landed;
            else if (out.crashed) ++crashed;
            else ++timeouts;

            std::cout << "Episode " << episode << " | " << std::setw(7) << result
                      << " | ticks " << out.ticks
                      << " | fuel " << std::fixed << std::setprecision(1) << out.fuel
                      << " | phase " << out.phase << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "lander_sim: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "--- Summary ---" << std::endl;
    std::cout << "landed " << landed << " / crashed " << crashed << " / timeout " << timeouts << std::endl;
    return 0;
}
