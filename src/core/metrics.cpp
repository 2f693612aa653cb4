#include "parcelgrid/core/metrics.hpp"
#include "parcelgrid/core/step_controller.hpp"
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace parcelgrid::core {

void MetricsCollector::record_step(const StepResult& result) {
    const auto& verdicts = result.movement.verdicts;
    for (std::size_t i = 0; i < verdicts.size(); ++i) {
        switch (verdicts[i]) {
            case MoveVerdict::Moved:
                ++snapshot_.moves;
                break;
            case MoveVerdict::Cycle:
                ++snapshot_.cycle_stalls;
                ++snapshot_.blocked_moves;
                break;
            case MoveVerdict::Invalid:
            case MoveVerdict::Bumped:
            case MoveVerdict::Blocked:
                ++snapshot_.blocked_moves;
                break;
            case MoveVerdict::Stayed:
                break;
        }
    }

    for (const auto& event : result.events) {
        switch (event.kind) {
            case PackageEventKind::PickedUp:        ++snapshot_.pickups; break;
            case PackageEventKind::DeliveredOnTime: ++snapshot_.on_time_deliveries; break;
            case PackageEventKind::DeliveredLate:   ++snapshot_.late_deliveries; break;
        }
    }

    snapshot_.total_reward += result.reward;
    snapshot_.ticks = result.snapshot.tick;

    TickTrace trace;
    trace.tick = result.snapshot.tick;
    trace.step_reward = result.reward;
    for (const auto& robot : result.snapshot.robots) {
        trace.robots.push_back({position_of(robot), robot.carrying});
    }
    traces_.push_back(std::move(trace));
}

void MetricsCollector::reset() {
    snapshot_ = MetricsSnapshot{};
    traces_.clear();
}

void emit_metrics_json(const std::filesystem::path& path,
                       const EpisodeHeader& header,
                       const MetricsSnapshot& metrics) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open metrics file: " + path.string());
    }

    file << "{\n";
    file << "  \"episode_id\": \"" << boost::uuids::to_string(header.episode_id) << "\",\n";
    file << "  \"seed\": " << header.seed << ",\n";
    file << "  \"robots\": " << header.num_robots << ",\n";
    file << "  \"packages\": " << header.num_packages << ",\n";
    file << "  \"horizon\": " << header.horizon << ",\n";
    file << "  \"ticks\": " << metrics.ticks << ",\n";
    file << "  \"moves\": " << metrics.moves << ",\n";
    file << "  \"blocked_moves\": " << metrics.blocked_moves << ",\n";
    file << "  \"cycle_stalls\": " << metrics.cycle_stalls << ",\n";
    file << "  \"pickups\": " << metrics.pickups << ",\n";
    file << "  \"on_time_deliveries\": " << metrics.on_time_deliveries << ",\n";
    file << "  \"late_deliveries\": " << metrics.late_deliveries << ",\n";
    file << "  \"wall_time_ms\": " << metrics.wall_time.count() << ",\n";

    double delivery_rate = header.num_packages > 0 ?
        static_cast<double>(metrics.deliveries()) / header.num_packages : 0.0;
    file << "  \"delivery_rate\": " << std::fixed << std::setprecision(4) << delivery_rate << ",\n";
    file << "  \"total_reward\": " << std::fixed << std::setprecision(4) << metrics.total_reward << "\n";
    file << "}\n";
}

void emit_trace_csv(const std::filesystem::path& path, const std::vector<TickTrace>& traces) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open trace file: " + path.string());
    }

    file << "tick,robot,row,col,carrying,step_reward\n";

    // Rows and columns are 1-based, as in snapshots.
    for (const auto& trace : traces) {
        for (std::size_t i = 0; i < trace.robots.size(); ++i) {
            const auto& robot = trace.robots[i];
            file << trace.tick << ","
                 << i << ","
                 << robot.position.row + 1 << ","
                 << robot.position.col + 1 << ","
                 << robot.carrying << ","
                 << trace.step_reward << "\n";
        }
    }
}

} // namespace parcelgrid::core
