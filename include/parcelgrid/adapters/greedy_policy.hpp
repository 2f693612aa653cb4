#pragma once

#include "parcelgrid/ports/policy.hpp"
#include "parcelgrid/core/route_map.hpp"
#include <map>
#include <memory>
#include <optional>
#include <unordered_set>

namespace parcelgrid::adapters {

// Each empty-handed robot claims the nearest open package and walks to it along
// a shortest path; a loaded robot walks to its target and drops. Paths route
// around the cells other robots stand on when such a detour exists. A robot
// that has been held in place for a few ticks sidesteps to break head-on
// standoffs, and a robot with nothing to do moves off package cells.
class GreedyPolicy : public parcelgrid::ports::IPolicy {
public:
    static constexpr int kStuckThreshold = 3;

    GreedyPolicy() = default;
    ~GreedyPolicy() override = default;

    void reset(const core::Snapshot& initial) override;
    std::vector<core::Action> get_actions(const core::Snapshot& snapshot) override;
    std::string_view name() const override { return "greedy"; }

    std::size_t known_packages() const noexcept { return known_.size(); }

private:
    struct KnownPackage {
        core::PackageView view;
        bool carried = false;
    };

    struct RobotMemory {
        std::optional<core::PackageId> assigned;
        core::Cell last_position{-1, -1};
        bool wanted_move = false;
        int stuck_ticks = 0;
    };

    std::shared_ptr<const core::Grid> grid_;
    std::unique_ptr<core::RouteMap> routes_;
    std::map<core::PackageId, KnownPackage> known_;
    std::vector<RobotMemory> robots_;

    void absorb(const core::Snapshot& snapshot);
    core::Action act_for(std::size_t index, const core::RobotView& robot,
                         const std::unordered_set<core::Cell, core::CellHash>& others);
    std::optional<core::PackageId> choose_package(std::size_t index, const core::Cell& from) const;
    core::Move step_towards(std::size_t index, const core::Cell& from, const core::Cell& to,
                            const std::unordered_set<core::Cell, core::CellHash>& others);
    core::Move clear_the_way(const core::Cell& from,
                             const std::unordered_set<core::Cell, core::CellHash>& others) const;
    bool on_package_cell(const core::Cell& cell) const;
};

} // namespace parcelgrid::adapters
