#include "parcelgrid/simulation.hpp"
#include "parcelgrid/core/errors.hpp"
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>

namespace parcelgrid {

namespace {

core::EpisodeParams episode_params(const SimulationConfig& config) {
    core::EpisodeParams params;
    params.num_robots = config.num_robots;
    params.num_packages = config.num_packages;
    params.horizon = config.max_ticks;
    params.rewards = config.rewards;
    params.seed = config.seed;
    return params;
}

} // namespace

Simulation::Simulation(SimulationConfig config,
                       std::unique_ptr<ports::IMapLoader> map_loader,
                       ports::PolicyPtr policy,
                       ports::RendererPtr renderer)
    : config_(std::move(config))
    , map_loader_(std::move(map_loader))
    , policy_(std::move(policy))
    , renderer_(std::move(renderer)) {
}

Simulation::Simulation(SimulationConfig config, ports::PolicyPtr policy)
    : config_(std::move(config))
    , policy_(std::move(policy)) {
}

bool Simulation::initialize() {
    spdlog::info("Initializing simulation with seed {}", config_.seed);

    if (!config_.grid.has_value() && map_loader_) {
        // Load from file if grid not provided directly
        auto grid = map_loader_->load(config_.map_path);
        if (!grid) {
            spdlog::error("Failed to load grid from map");
            return false;
        }
        config_.grid = std::move(*grid);
    }

    if (!config_.grid.has_value()) {
        spdlog::error("No grid provided");
        return false;
    }

    if (!policy_) {
        spdlog::error("No policy provided");
        return false;
    }

    if (renderer_ && !renderer_->initialize()) {
        spdlog::error("Failed to initialize renderer");
        return false;
    }

    grid_ = std::make_shared<const core::Grid>(*config_.grid);

    try {
        controller_ = std::make_unique<core::StepController>(grid_, episode_params(config_));
        start_episode();
    } catch (const core::ConfigError& e) {
        spdlog::error("Invalid episode configuration: {}", e.what());
        controller_.reset();
        return false;
    }

    spdlog::info("Initialized {} robots and {} packages with policy '{}'",
                 config_.num_robots, config_.num_packages, policy_->name());
    initialized_ = true;
    return true;
}

void Simulation::start_episode() {
    metrics_collector_.reset();
    result_.reset();
    episode_id_ = boost::uuids::random_generator()();

    last_snapshot_ = controller_->reset();
    policy_->reset(last_snapshot_);

    spdlog::debug("Episode {} revealed {} packages at tick 0",
                  boost::uuids::to_string(episode_id_), last_snapshot_.packages.size());
}

bool Simulation::run() {
    if (!initialized_) {
        spdlog::error("Simulation not initialized");
        return false;
    }

    spdlog::info("Starting simulation");
    metrics_collector_.start_timer();
    draw_frame();

    try {
        while (!controller_->done()) {
            step_internal();
        }
    } catch (const core::InvocationError& e) {
        spdlog::error("Policy '{}' produced an invalid step: {}", policy_->name(), e.what());
        metrics_collector_.stop_timer();
        return false;
    }

    metrics_collector_.stop_timer();
    save_outputs();

    spdlog::info("Simulation completed in {} ticks with total reward {:.2f}",
                 result_ ? result_->total_ticks : get_current_tick(),
                 result_ ? result_->total_reward : 0.0);
    return true;
}

void Simulation::step_internal() {
    if (config_.verbose) {
        log_tick_state();
    }

    auto actions = policy_->get_actions(last_snapshot_);
    if (config_.verbose) {
        std::string encoded;
        for (const auto& action : actions) {
            encoded += core::to_char(action.move);
            encoded += core::to_char(action.package_action);
            encoded += ' ';
        }
        spdlog::debug("Tick {} actions: {}", last_snapshot_.tick, encoded);
    }
    auto result = controller_->step(actions);

    metrics_collector_.record_step(result);
    last_snapshot_ = std::move(result.snapshot);
    if (result.done) {
        result_ = result.info;
    }

    draw_frame();
}

void Simulation::draw_frame() {
    if (!renderer_) {
        return;
    }
    renderer_->render(get_render_state());
    renderer_->present();
}

void Simulation::log_tick_state() const {
    const auto& state = controller_->state();
    spdlog::debug("Tick {}: reward {:.2f}, {}/{} packages delivered",
                  state.tick, state.total_reward,
                  state.packages.count(core::PackageStatus::Delivered),
                  state.packages.size());
}

void Simulation::save_outputs() {
    core::EpisodeHeader header;
    header.episode_id = episode_id_;
    header.seed = config_.seed;
    header.num_robots = config_.num_robots;
    header.num_packages = config_.num_packages;
    header.horizon = config_.max_ticks;

    if (!config_.metrics_output.empty()) {
        try {
            emit_metrics_json(config_.metrics_output, header, metrics_collector_.get_snapshot());
            spdlog::info("Saved metrics to {}", config_.metrics_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save metrics: {}", e.what());
        }
    }

    if (!config_.trace_output.empty()) {
        try {
            emit_trace_csv(config_.trace_output, metrics_collector_.get_traces());
            spdlog::info("Saved trace to {}", config_.trace_output.string());
        } catch (const std::exception& e) {
            spdlog::error("Failed to save trace: {}", e.what());
        }
    }
}

// GUI interface methods
void Simulation::step() {
    if (!initialized_) {
        if (!initialize()) {
            return;
        }
    }

    if (is_complete()) {
        return;
    }

    try {
        step_internal();
    } catch (const core::InvocationError& e) {
        spdlog::error("Policy '{}' produced an invalid step: {}", policy_->name(), e.what());
    }
}

void Simulation::reset() {
    if (!initialized_) {
        return;
    }

    // A fresh controller restarts the seeded stream, so the same episode replays.
    controller_ = std::make_unique<core::StepController>(grid_, episode_params(config_));
    start_episode();
}

bool Simulation::is_complete() const {
    if (!controller_) {
        return false;
    }
    return controller_->done();
}

core::Tick Simulation::get_current_tick() const {
    return controller_ ? controller_->state().tick : 0;
}

const core::SimulationState& Simulation::get_state() const {
    if (!controller_) {
        throw core::InvocationError("Simulation not initialized");
    }
    return controller_->state();
}

ports::RenderState Simulation::get_render_state() const {
    ports::RenderState state;
    state.grid = grid_;
    state.metrics = metrics_collector_.get_snapshot();

    if (controller_) {
        const auto& sim_state = controller_->state();
        state.robots = sim_state.robots;
        state.packages = sim_state.packages.to_vector();
        state.packages.erase(
            std::remove_if(state.packages.begin(), state.packages.end(),
                [](const core::Package& p) { return p.status == core::PackageStatus::Pending; }),
            state.packages.end());
        state.current_tick = sim_state.tick;
        state.total_reward = sim_state.total_reward;
        state.simulation_complete = controller_->done();
        state.simulation_running = !controller_->done();
    }

    return state;
}

} // namespace parcelgrid
