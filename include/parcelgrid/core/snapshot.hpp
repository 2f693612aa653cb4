#pragma once

#include "parcelgrid/core/grid.hpp"
#include <memory>
#include <vector>

namespace parcelgrid::core {

// Externally visible coordinates are 1-based.
struct RobotView {
    int row;
    int col;
    PackageId carrying;

    bool operator==(const RobotView& other) const noexcept = default;
};

struct PackageView {
    PackageId id;
    int start_row;
    int start_col;
    int target_row;
    int target_col;
    Tick spawn_time;
    Tick deadline;

    bool operator==(const PackageView& other) const noexcept = default;

    Cell start() const noexcept { return {start_row - 1, start_col - 1}; }
    Cell target() const noexcept { return {target_row - 1, target_col - 1}; }
};

// What policies and renderers see after a reset or step. `packages` holds only
// the packages revealed at this tick; consumers keep earlier ones themselves.
struct Snapshot {
    Tick tick = 0;
    std::shared_ptr<const Grid> grid;
    std::vector<RobotView> robots;
    std::vector<PackageView> packages;
};

inline RobotView to_view(const Robot& robot) noexcept {
    return {robot.position.row + 1, robot.position.col + 1, robot.carrying};
}

inline PackageView to_view(const Package& package) noexcept {
    return {package.id,
            package.start.row + 1, package.start.col + 1,
            package.target.row + 1, package.target.col + 1,
            package.spawn_time, package.deadline};
}

inline Cell position_of(const RobotView& robot) noexcept {
    return {robot.row - 1, robot.col - 1};
}

} // namespace parcelgrid::core
