#pragma once
#include <optional>
#include <vector>

// Maximal stretch of equal-altitude cells.
struct TerrainRun {
    int start;
    int length;
    float altitude;
};

// Run-length decomposition of the profile, in order. Empty terrain throws.
std::vector<TerrainRun> find_runs(const std::vector<float>& terrain);

// Midpoint of the widest flat run (first one on ties), if that run is
// strictly wider than min_width cells.
std::optional<int> find_landing_site(const std::vector<float>& terrain, int min_width = 40);
