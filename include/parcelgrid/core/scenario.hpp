#pragma once

#include "parcelgrid/core/grid.hpp"
#include <random>
#include <optional>

namespace parcelgrid::core {

struct Scenario {
    std::vector<Robot> robots;
    std::vector<Package> packages;  // ids 1..P, ascending spawn_time
};

// Seeds robot start cells and package records for one episode.
//
// Every draw comes from a single mt19937_64 stream in a fixed order:
//   1. one draw per robot, picking from the shrinking pool of free cells
//   2. per package, in generation order: start cell, target cell (redrawn
//      until it differs from start), deadline slack, and spawn time for
//      packages past the first min(R, 20)
// Distributions are Boost.Random's so the sequence does not depend on the
// standard library in use. Calling generate() again continues the stream.
class ScenarioGenerator {
public:
    static constexpr int kImmediatePackageCap = 20;
    static constexpr int kBaseSlack = 10;

    explicit ScenarioGenerator(uint64_t seed) : rng_(seed), seed_(seed) {}

    ScenarioGenerator& with_robots(int n_robots);
    ScenarioGenerator& with_packages(int n_packages);
    ScenarioGenerator& with_horizon(Tick horizon);

    std::optional<Scenario> generate(const Grid& grid);

private:
    std::mt19937_64 rng_;
    uint64_t seed_;
    int n_robots_ = 0;
    int n_packages_ = 0;
    Tick horizon_ = 0;

    int uniform_int(int low, int high);
    std::vector<Robot> place_robots(const Grid& grid);
    std::vector<Package> draw_packages(const Grid& grid);
};

} // namespace parcelgrid::core
