#include "parcelgrid/core/step_controller.hpp"
#include "parcelgrid/core/errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <unordered_set>

namespace parcelgrid::core {

namespace {

std::shared_ptr<const Grid> require_grid(std::shared_ptr<const Grid> grid) {
    if (!grid) {
        throw ConfigError("Step controller needs a grid");
    }
    return grid;
}

} // namespace

StepController::StepController(std::shared_ptr<const Grid> grid, EpisodeParams params)
    : grid_(require_grid(std::move(grid)))
    , params_(params)
    , generator_(params.seed)
    , resolver_(*grid_) {
    if (params_.num_robots < 0 || params_.num_packages < 0) {
        throw ConfigError("Robot and package counts must be non-negative");
    }
    if (params_.horizon < 1) {
        throw ConfigError(fmt::format("Horizon must be at least 1, got {}", params_.horizon));
    }

    generator_.with_robots(params_.num_robots)
              .with_packages(params_.num_packages)
              .with_horizon(params_.horizon);
}

Snapshot StepController::reset() {
    auto scenario = generator_.generate(*grid_);
    if (!scenario) {
        throw ConfigError(fmt::format(
            "Cannot generate a scenario with {} robots and {} packages on a {}x{} map",
            params_.num_robots, params_.num_packages, grid_->rows(), grid_->cols()));
    }
    return load(std::move(*scenario));
}

Snapshot StepController::load(Scenario scenario) {
    validate_scenario(scenario);

    state_.tick = 0;
    state_.total_reward = 0.0;
    state_.robots = std::move(scenario.robots);
    state_.packages.clear();
    for (const auto& package : scenario.packages) {
        state_.packages.insert(package);
    }

    started_ = true;
    done_ = false;

    spdlog::info("Episode started: {} robots, {} packages, horizon {}",
                 state_.robots.size(), state_.packages.size(), params_.horizon);
    return build_snapshot();
}

void StepController::validate_scenario(const Scenario& scenario) const {
    std::unordered_set<Cell, CellHash> occupied;
    for (std::size_t i = 0; i < scenario.robots.size(); ++i) {
        const auto& robot = scenario.robots[i];
        if (!grid_->is_free(robot.position)) {
            throw ConfigError(fmt::format("Invalid robot position ({}, {}) for robot {}",
                                          robot.position.row, robot.position.col, i));
        }
        if (!occupied.insert(robot.position).second) {
            throw ConfigError(fmt::format("Robot {} shares cell ({}, {}) with another robot",
                                          i, robot.position.row, robot.position.col));
        }
        if (robot.is_carrying()) {
            throw ConfigError(fmt::format("Robot {} cannot start an episode carrying a package", i));
        }
    }

    Tick previous_spawn = 0;
    for (std::size_t i = 0; i < scenario.packages.size(); ++i) {
        const auto& package = scenario.packages[i];
        if (package.id != static_cast<PackageId>(i + 1)) {
            throw ConfigError(fmt::format("Package ids must be 1..P, found {} at position {}",
                                          package.id, i));
        }
        if (package.spawn_time < previous_spawn) {
            throw ConfigError(fmt::format("Package {} spawns before package {}", package.id, package.id - 1));
        }
        if (!grid_->is_free(package.start) || !grid_->is_free(package.target)) {
            throw ConfigError(fmt::format("Package {} has a blocked start or target cell", package.id));
        }
        if (package.start == package.target) {
            throw ConfigError(fmt::format("Package {} starts on its own target", package.id));
        }
        if (package.deadline <= package.spawn_time) {
            throw ConfigError(fmt::format("Package {} has deadline {} not after spawn time {}",
                                          package.id, package.deadline, package.spawn_time));
        }
        if (package.status != PackageStatus::Pending) {
            throw ConfigError(fmt::format("Package {} must start pending", package.id));
        }
        previous_spawn = package.spawn_time;
    }
}

StepResult StepController::step(const std::vector<Action>& actions) {
    if (!started_) {
        throw InvocationError("Episode has not been reset");
    }
    if (done_) {
        throw InvocationError("Episode has already terminated");
    }
    if (actions.size() != state_.robots.size()) {
        throw InvocationError(fmt::format("The number of actions ({}) must match the number of robots ({})",
                                          actions.size(), state_.robots.size()));
    }

    StepResult result;

    std::vector<Cell> positions;
    std::vector<Move> moves;
    positions.reserve(actions.size());
    moves.reserve(actions.size());
    for (std::size_t i = 0; i < actions.size(); ++i) {
        positions.push_back(state_.robots[i].position);
        moves.push_back(actions[i].move);
    }

    result.movement = resolver_.resolve(positions, moves);

    for (std::size_t i = 0; i < state_.robots.size(); ++i) {
        const auto& final_pos = result.movement.final_positions[i];
        if (is_directional(moves[i]) && final_pos != positions[i]) {
            result.reward += params_.rewards.move_cost;
        }
        state_.robots[i].position = final_pos;
    }

    PackageLifecycle lifecycle(state_.packages, params_.rewards);
    for (std::size_t i = 0; i < state_.robots.size(); ++i) {
        auto event = lifecycle.apply(i, state_.robots[i], actions[i].package_action, state_.tick);
        if (event) {
            result.reward += event->reward;
            result.events.push_back(*event);
        }
    }

    state_.tick++;
    state_.total_reward += result.reward;

    if (check_termination()) {
        done_ = true;
        result.done = true;
        result.info = EpisodeInfo{state_.total_reward, state_.tick};
        spdlog::info("Episode finished at tick {} with total reward {:.2f}",
                     state_.tick, state_.total_reward);
    }

    spdlog::debug("Tick {} -> reward {:.2f}, {} package events",
                  state_.tick, result.reward, result.events.size());

    result.snapshot = build_snapshot();
    return result;
}

bool StepController::check_termination() const noexcept {
    return state_.tick == params_.horizon || state_.packages.all_delivered();
}

Snapshot StepController::build_snapshot() {
    Snapshot snapshot;
    snapshot.tick = state_.tick;
    snapshot.grid = grid_;

    snapshot.robots.reserve(state_.robots.size());
    for (const auto& robot : state_.robots) {
        snapshot.robots.push_back(to_view(robot));
    }

    for (const auto& package : state_.packages.reveal(state_.tick)) {
        snapshot.packages.push_back(to_view(package));
    }

    return snapshot;
}

} // namespace parcelgrid::core
