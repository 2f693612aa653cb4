#include "parcelgrid/adapters/console_renderer.hpp"
#include <spdlog/fmt/fmt.h>
#include <ostream>

namespace parcelgrid::adapters {

using parcelgrid::core::PackageStatus;

ConsoleRenderer::ConsoleRenderer(std::ostream& out) : out_(out) {}

std::string ConsoleRenderer::draw_map(const parcelgrid::ports::RenderState& state) {
    const auto& grid = *state.grid;
    std::vector<std::string> rows(grid.rows(), std::string(grid.cols(), '.'));

    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            if (!grid.is_free({r, c})) {
                rows[r][c] = '#';
            }
        }
    }

    // Later layers win: targets, then waiting packages, then robots.
    for (const auto& package : state.packages) {
        if (package.status == PackageStatus::Delivered) continue;
        rows[package.target.row][package.target.col] = 'T';
    }
    for (const auto& package : state.packages) {
        if (package.status != PackageStatus::Waiting) continue;
        rows[package.start.row][package.start.col] = 'P';
    }
    for (std::size_t i = 0; i < state.robots.size(); ++i) {
        const auto& pos = state.robots[i].position;
        rows[pos.row][pos.col] = i < 10 ? static_cast<char>('0' + i) : 'R';
    }

    std::string map;
    for (const auto& row : rows) {
        map += row;
        map += '\n';
    }
    return map;
}

void ConsoleRenderer::render(const parcelgrid::ports::RenderState& state) {
    frame_ = fmt::format("Time step: {}\nTotal reward: {:.2f}\n", state.current_tick, state.total_reward);
    frame_ += draw_map(state);

    frame_ += "Robots:\n";
    for (std::size_t i = 0; i < state.robots.size(); ++i) {
        const auto& robot = state.robots[i];
        frame_ += fmt::format("  Robot {}: position ({}, {}), carrying {}\n",
                              i, robot.position.row + 1, robot.position.col + 1, robot.carrying);
    }

    frame_ += "Undelivered packages:\n";
    for (const auto& package : state.packages) {
        if (package.status == PackageStatus::Delivered) continue;
        frame_ += fmt::format("  Package {}: status={}, start=({}, {}), target=({}, {}), deadline={}\n",
                              package.id, core::to_string(package.status),
                              package.start.row + 1, package.start.col + 1,
                              package.target.row + 1, package.target.col + 1,
                              package.deadline);
    }

    if (state.simulation_complete) {
        frame_ += fmt::format("Episode complete: {} delivered ({} late)\n",
                              state.metrics.deliveries(), state.metrics.late_deliveries);
    }
}

void ConsoleRenderer::present() {
    out_ << frame_ << std::string(50, '-') << '\n';
    out_.flush();
}

} // namespace parcelgrid::adapters
