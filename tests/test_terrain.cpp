#include <gtest/gtest.h>
#include "Terrain.hpp"
#include <stdexcept>
#include <vector>

namespace {

std::vector<float> two_halves(int w1, float h1, int w2, float h2) {
    std::vector<float> terrain(w1, h1);
    terrain.insert(terrain.end(), w2, h2);
    return terrain;
}

} // namespace

TEST(FindRuns, SplitsOnAltitudeChanges) {
    std::vector<float> terrain = {1, 1, 2, 2, 2, 1};
    auto runs = find_runs(terrain);
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0].start, 0);
    EXPECT_EQ(runs[0].length, 2);
    EXPECT_EQ(runs[1].start, 2);
    EXPECT_EQ(runs[1].length, 3);
    EXPECT_FLOAT_EQ(runs[1].altitude, 2.0f);
    EXPECT_EQ(runs[2].start, 5);
    EXPECT_EQ(runs[2].length, 1);
}

TEST(FindRuns, EmptyTerrainThrows) {
    EXPECT_THROW(find_runs({}), std::invalid_argument);
    EXPECT_THROW(find_landing_site({}), std::invalid_argument);
}

TEST(FindLandingSite, FlatTerrainGivesMidpoint) {
    EXPECT_EQ(find_landing_site(std::vector<float>(200, 100.0f)), 100);
    EXPECT_EQ(find_landing_site(std::vector<float>(41, 7.0f)), 20);
}

TEST(FindLandingSite, RunMustBeStrictlyWiderThanMinimum) {
    EXPECT_FALSE(find_landing_site(std::vector<float>(40, 5.0f)).has_value());
    EXPECT_FALSE(find_landing_site({3.0f}).has_value());
    EXPECT_EQ(find_landing_site(std::vector<float>(40, 5.0f), 39), 20);
}

TEST(FindLandingSite, RoughTerrainHasNoSite) {
    std::vector<float> terrain;
    for (int i = 0; i < 500; ++i) terrain.push_back(static_cast<float>((i / 10) % 7));
    EXPECT_FALSE(find_landing_site(terrain).has_value());
}

TEST(FindLandingSite, PicksWiderHalf) {
    EXPECT_EQ(find_landing_site(two_halves(50, 10, 90, 20)), 50 + 45);
    EXPECT_EQ(find_landing_site(two_halves(90, 10, 50, 20)), 45);
}

TEST(FindLandingSite, TiePicksEarlierRun) {
    EXPECT_EQ(find_landing_site(two_halves(60, 10, 60, 20)), 30);
}

TEST(FindLandingSite, SiteLiesInsideWinningRun) {
    std::vector<float> terrain(200, 100.0f);
    for (int i = 0; i < 200; i += 3) terrain[i] = static_cast<float>(i);
    for (int i = 80; i < 160; ++i) terrain[i] = 50.0f;

    auto site = find_landing_site(terrain);
    ASSERT_TRUE(site.has_value());
    EXPECT_EQ(*site, 120);
    EXPECT_GE(*site, 80);
    EXPECT_LT(*site, 160);
}

TEST(FindLandingSite, PlateauTiesWithValley) {
    // [0, 80) at 100 is as wide as the valley [80, 160) and comes first
    std::vector<float> terrain(200, 100.0f);
    for (int i = 80; i < 160; ++i) terrain[i] = 50.0f;
    EXPECT_EQ(find_landing_site(terrain), 40);
}

TEST(FindLandingSite, RepeatedCallsAgree) {
    std::vector<float> terrain = two_halves(70, 1, 45, 2);
    EXPECT_EQ(find_landing_site(terrain), find_landing_site(terrain));
}
