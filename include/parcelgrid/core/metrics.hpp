#pragma once

#include "parcelgrid/core/types.hpp"
#include <boost/uuid/uuid.hpp>
#include <vector>
#include <chrono>
#include <filesystem>

namespace parcelgrid::core {

struct StepResult;

struct MetricsSnapshot {
    uint64_t moves = 0;
    uint64_t blocked_moves = 0;
    uint64_t cycle_stalls = 0;
    uint64_t pickups = 0;
    uint64_t on_time_deliveries = 0;
    uint64_t late_deliveries = 0;
    double total_reward = 0.0;
    Tick ticks = 0;
    std::chrono::milliseconds wall_time{0};

    uint64_t deliveries() const noexcept { return on_time_deliveries + late_deliveries; }
};

struct RobotTrace {
    Cell position;
    PackageId carrying;
};

struct TickTrace {
    Tick tick;
    std::vector<RobotTrace> robots;
    double step_reward;
};

struct EpisodeHeader {
    boost::uuids::uuid episode_id;
    uint64_t seed = 0;
    int num_robots = 0;
    int num_packages = 0;
    Tick horizon = 0;
};

class MetricsCollector {
public:
    MetricsCollector() = default;

    // Folds one step into the counters and appends a trace row.
    void record_step(const StepResult& result);

    MetricsSnapshot get_snapshot() const { return snapshot_; }
    const std::vector<TickTrace>& get_traces() const { return traces_; }

    void reset();

    void start_timer() { start_time_ = std::chrono::steady_clock::now(); }
    void stop_timer() {
        auto end_time = std::chrono::steady_clock::now();
        snapshot_.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_);
    }

private:
    MetricsSnapshot snapshot_;
    std::vector<TickTrace> traces_;
    std::chrono::steady_clock::time_point start_time_;
};

void emit_metrics_json(const std::filesystem::path& path,
                       const EpisodeHeader& header,
                       const MetricsSnapshot& metrics);
void emit_trace_csv(const std::filesystem::path& path, const std::vector<TickTrace>& traces);

} // namespace parcelgrid::core
