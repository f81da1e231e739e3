#include "Terrain.hpp"
#include <stdexcept>

std::vector<TerrainRun> find_runs(const std::vector<float>& terrain) {
    if (terrain.empty()) {
        throw std::invalid_argument("find_runs: terrain profile is empty");
    }

    std::vector<TerrainRun> runs;
    int n = static_cast<int>(terrain.size());
    int start = 0;
    for (int i = 1; i <= n; ++i) {
        if (i == n || terrain[i] != terrain[i - 1]) {
            runs.push_back({start, i - start, terrain[start]});
            start = i;
        }
    }
    return runs;
}

std::optional<int> find_landing_site(const std::vector<float>& terrain, int min_width) {
    std::vector<TerrainRun> runs = find_runs(terrain);

    // Strict comparison keeps the first of equally wide runs
    const TerrainRun* best = &runs[0];
    for (const auto& run : runs) {
        if (run.length > best->length) best = &run;
    }

    if (best->length > min_width) {
        return best->start + best->length / 2;
    }
    return std::nullopt;
}
