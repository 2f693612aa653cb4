#include "parcelgrid/core/scenario.hpp"
#include <boost/random/uniform_int_distribution.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace parcelgrid::core {

ScenarioGenerator& ScenarioGenerator::with_robots(int n_robots) {
    n_robots_ = n_robots;
    return *this;
}

ScenarioGenerator& ScenarioGenerator::with_packages(int n_packages) {
    n_packages_ = n_packages;
    return *this;
}

ScenarioGenerator& ScenarioGenerator::with_horizon(Tick horizon) {
    horizon_ = horizon;
    return *this;
}

int ScenarioGenerator::uniform_int(int low, int high) {
    boost::random::uniform_int_distribution<int> dist(low, high);
    return dist(rng_);
}

std::vector<Robot> ScenarioGenerator::place_robots(const Grid& grid) {
    auto pool = grid.free_cells();
    std::vector<Robot> robots;
    robots.reserve(n_robots_);

    for (int i = 0; i < n_robots_; ++i) {
        int pick = uniform_int(0, static_cast<int>(pool.size()) - 1);
        robots.push_back(Robot{pool[pick], kNoPackage});
        pool.erase(pool.begin() + pick);
    }

    return robots;
}

std::vector<Package> ScenarioGenerator::draw_packages(const Grid& grid) {
    const auto free_cells = grid.free_cells();
    const int last_free = static_cast<int>(free_cells.size()) - 1;
    const int n_rows = grid.rows();
    const int immediate = std::min(n_robots_, kImmediatePackageCap);

    std::vector<Package> packages;
    packages.reserve(n_packages_);

    for (int i = 0; i < n_packages_; ++i) {
        Package pkg;
        pkg.start = free_cells[uniform_int(0, last_free)];
        do {
            pkg.target = free_cells[uniform_int(0, last_free)];
        } while (pkg.target == pkg.start);

        int slack = kBaseSlack + uniform_int(n_rows / 2, 3 * n_rows - 1);
        pkg.spawn_time = i < immediate ? 0 : uniform_int(1, horizon_ - 1);
        pkg.deadline = pkg.spawn_time + slack;
        packages.push_back(pkg);
    }

    std::stable_sort(packages.begin(), packages.end(),
        [](const Package& a, const Package& b) { return a.spawn_time < b.spawn_time; });

    for (std::size_t i = 0; i < packages.size(); ++i) {
        packages[i].id = static_cast<PackageId>(i + 1);
    }

    return packages;
}

std::optional<Scenario> ScenarioGenerator::generate(const Grid& grid) {
    if (n_robots_ < 0 || n_packages_ < 0) {
        spdlog::error("Robot and package counts must be non-negative");
        return std::nullopt;
    }

    auto free_count = grid.free_cell_count();
    if (free_count < static_cast<std::size_t>(n_robots_)) {
        spdlog::error("Not enough free cells for {} robots: {}", n_robots_, free_count);
        return std::nullopt;
    }

    if (n_packages_ > 0 && free_count < 2) {
        spdlog::error("Packages need at least two free cells, map has {}", free_count);
        return std::nullopt;
    }

    if (n_packages_ > std::min(n_robots_, kImmediatePackageCap) && horizon_ < 2) {
        spdlog::error("Horizon {} leaves no tick for delayed packages", horizon_);
        return std::nullopt;
    }

    Scenario scenario;
    scenario.robots = place_robots(grid);
    scenario.packages = draw_packages(grid);

    spdlog::debug("Generated scenario with {} robots and {} packages (seed {})",
                  scenario.robots.size(), scenario.packages.size(), seed_);
    return scenario;
}

} // namespace parcelgrid::core
