#pragma once

#include "parcelgrid/core/grid.hpp"
#include "parcelgrid/core/scenario.hpp"
#include "parcelgrid/core/movement.hpp"
#include "parcelgrid/core/packages.hpp"
#include "parcelgrid/core/snapshot.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace parcelgrid::core {

struct EpisodeParams {
    int num_robots = 5;
    int num_packages = 20;
    Tick horizon = 100;
    RewardParams rewards;
    uint64_t seed = 2025;
};

struct SimulationState {
    Tick tick = 0;
    double total_reward = 0.0;
    std::vector<Robot> robots;
    PackageLedger packages;
};

// Reported only once the episode has terminated.
struct EpisodeInfo {
    double total_reward = 0.0;
    Tick total_ticks = 0;
};

struct StepResult {
    Snapshot snapshot;
    double reward = 0.0;
    bool done = false;
    std::optional<EpisodeInfo> info;

    MovementOutcome movement;
    std::vector<PackageEvent> events;
};

// Owns the state of one episode and advances it a tick at a time.
class StepController {
public:
    // Throws ConfigError for a null grid, negative counts or a horizon below 1.
    StepController(std::shared_ptr<const Grid> grid, EpisodeParams params);

    // Draws the next scenario from the seeded stream. Throws ConfigError when
    // the grid cannot host it.
    Snapshot reset();

    // Starts an episode from a prepared scenario. Throws ConfigError when a
    // robot or package sits on a blocked cell, robots overlap, or package ids
    // are not 1..P in spawn order.
    Snapshot load(Scenario scenario);

    // Throws InvocationError when the action count does not match the robot
    // count or no episode is running; nothing is mutated in that case.
    StepResult step(const std::vector<Action>& actions);

    bool started() const noexcept { return started_; }
    bool done() const noexcept { return done_; }

    const SimulationState& state() const noexcept { return state_; }
    const Grid& grid() const noexcept { return *grid_; }
    std::shared_ptr<const Grid> shared_grid() const noexcept { return grid_; }
    const EpisodeParams& params() const noexcept { return params_; }

private:
    std::shared_ptr<const Grid> grid_;
    EpisodeParams params_;
    ScenarioGenerator generator_;
    MovementResolver resolver_;
    SimulationState state_;
    bool started_ = false;
    bool done_ = false;

    void validate_scenario(const Scenario& scenario) const;
    bool check_termination() const noexcept;
    Snapshot build_snapshot();
};

} // namespace parcelgrid::core
