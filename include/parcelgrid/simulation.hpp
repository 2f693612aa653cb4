#pragma once

#include "parcelgrid/core/step_controller.hpp"
#include "parcelgrid/core/metrics.hpp"
#include "parcelgrid/ports/imap_loader.hpp"
#include "parcelgrid/ports/policy.hpp"
#include "parcelgrid/ports/renderer.hpp"
#include <boost/uuid/uuid.hpp>
#include <memory>
#include <filesystem>
#include <optional>
#include <string>

namespace parcelgrid {

struct SimulationConfig {
    std::filesystem::path map_path;
    std::optional<core::Grid> grid;  // Used instead of map_path when set
    int num_robots = 5;
    int num_packages = 20;
    int max_ticks = 100;
    core::RewardParams rewards;
    uint64_t seed = 2025;
    std::filesystem::path trace_output;
    std::filesystem::path metrics_output;
    bool verbose = false;
};

// Drives episodes: map loading, the policy loop, rendering and output files.
class Simulation {
public:
    Simulation(SimulationConfig config,
               std::unique_ptr<ports::IMapLoader> map_loader,
               ports::PolicyPtr policy,
               ports::RendererPtr renderer = nullptr);

    // For callers that put the grid in the config.
    Simulation(SimulationConfig config, ports::PolicyPtr policy);

    bool initialize();
    bool run();

    // GUI interface methods
    void step();
    void reset();
    bool is_complete() const;
    core::Tick get_current_tick() const;

    core::MetricsSnapshot get_metrics() const { return metrics_collector_.get_snapshot(); }
    const core::SimulationState& get_state() const;
    std::optional<core::EpisodeInfo> get_result() const { return result_; }
    boost::uuids::uuid get_episode_id() const { return episode_id_; }
    ports::RenderState get_render_state() const;

private:
    SimulationConfig config_;
    std::unique_ptr<ports::IMapLoader> map_loader_;
    ports::PolicyPtr policy_;
    ports::RendererPtr renderer_;

    std::shared_ptr<const core::Grid> grid_;
    std::unique_ptr<core::StepController> controller_;
    core::MetricsCollector metrics_collector_;
    core::Snapshot last_snapshot_;
    std::optional<core::EpisodeInfo> result_;
    boost::uuids::uuid episode_id_{};
    bool initialized_ = false;

    void start_episode();
    void step_internal();
    void draw_frame();
    void log_tick_state() const;
    void save_outputs();
};

} // namespace parcelgrid
