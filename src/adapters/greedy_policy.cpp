#include "parcelgrid/adapters/greedy_policy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <unordered_set>

namespace parcelgrid::adapters {

using core::Action;
using core::Cell;
using core::Move;
using core::PackageAction;
using core::PackageId;

void GreedyPolicy::reset(const core::Snapshot& initial) {
    known_.clear();
    robots_.clear();
    grid_.reset();
    routes_.reset();
    absorb(initial);
}

std::vector<Action> GreedyPolicy::get_actions(const core::Snapshot& snapshot) {
    absorb(snapshot);

    std::vector<Action> actions;
    actions.reserve(snapshot.robots.size());
    for (std::size_t i = 0; i < snapshot.robots.size(); ++i) {
        std::unordered_set<Cell, core::CellHash> others;
        for (std::size_t j = 0; j < snapshot.robots.size(); ++j) {
            if (j != i) {
                others.insert(core::position_of(snapshot.robots[j]));
            }
        }
        actions.push_back(act_for(i, snapshot.robots[i], others));
    }
    return actions;
}

void GreedyPolicy::absorb(const core::Snapshot& snapshot) {
    if (snapshot.grid && snapshot.grid != grid_) {
        grid_ = snapshot.grid;
        routes_ = std::make_unique<core::RouteMap>(*grid_);
    }

    robots_.resize(snapshot.robots.size());

    for (const auto& package : snapshot.packages) {
        known_.emplace(package.id, KnownPackage{package, false});
    }

    std::unordered_set<PackageId> carried_now;
    for (const auto& robot : snapshot.robots) {
        if (robot.carrying != core::kNoPackage) {
            carried_now.insert(robot.carrying);
        }
    }

    // A package can only leave a robot's hands by being delivered.
    for (auto it = known_.begin(); it != known_.end();) {
        if (carried_now.count(it->first) > 0) {
            it->second.carried = true;
            ++it;
        } else if (it->second.carried) {
            it = known_.erase(it);
        } else {
            ++it;
        }
    }
}

Action GreedyPolicy::act_for(std::size_t index, const core::RobotView& view,
                             const std::unordered_set<Cell, core::CellHash>& others) {
    auto& memory = robots_[index];
    const Cell pos = core::position_of(view);

    if (memory.wanted_move && memory.last_position == pos) {
        ++memory.stuck_ticks;
    } else {
        memory.stuck_ticks = 0;
    }
    memory.last_position = pos;

    Action action;
    if (view.carrying != core::kNoPackage) {
        memory.assigned.reset();
        auto it = known_.find(view.carrying);
        if (it == known_.end() || pos == it->second.view.target()) {
            action = {Move::Stay, PackageAction::Drop};
        } else {
            const Cell target = it->second.view.target();
            action.move = step_towards(index, pos, target, others);
            if (core::apply_move(pos, action.move) == target) {
                action.package_action = PackageAction::Drop;
            }
        }
    } else {
        if (memory.assigned) {
            auto it = known_.find(*memory.assigned);
            if (it == known_.end() || it->second.carried) {
                memory.assigned.reset();
            }
        }
        if (!memory.assigned) {
            memory.assigned = choose_package(index, pos);
        }

        if (memory.assigned) {
            const Cell start = known_.at(*memory.assigned).view.start();
            if (pos == start) {
                action = {Move::Stay, PackageAction::Pickup};
            } else {
                action.move = step_towards(index, pos, start, others);
                if (core::apply_move(pos, action.move) == start) {
                    action.package_action = PackageAction::Pickup;
                }
            }
        } else if (on_package_cell(pos)) {
            action.move = clear_the_way(pos, others);
        }
    }

    memory.wanted_move = core::is_directional(action.move);
    return action;
}

std::optional<PackageId> GreedyPolicy::choose_package(std::size_t index, const Cell& from) const {
    std::unordered_set<PackageId> claimed;
    for (std::size_t i = 0; i < robots_.size(); ++i) {
        if (i != index && robots_[i].assigned) {
            claimed.insert(*robots_[i].assigned);
        }
    }

    std::optional<PackageId> best;
    int best_distance = std::numeric_limits<int>::max();
    for (const auto& [id, package] : known_) {
        if (package.carried || claimed.count(id) > 0) continue;

        int d = routes_->distance(from, package.view.start());
        if (d == core::RouteMap::kUnreachable) continue;
        if (d < best_distance) {
            best_distance = d;
            best = id;
        }
    }

    if (best) {
        spdlog::debug("Robot {} heads for package {} ({} cells away)", index, *best, best_distance);
    }
    return best;
}

Move GreedyPolicy::step_towards(std::size_t index, const Cell& from, const Cell& to,
                               const std::unordered_set<Cell, core::CellHash>& others) {
    auto next = routes_->next_move_avoiding(from, to, others);
    if (!next) {
        next = routes_->next_move(from, to);
    }
    if (!next) {
        return Move::Stay;
    }

    auto& memory = robots_[index];
    if (memory.stuck_ticks >= kStuckThreshold) {
        auto options = routes_->open_moves(from);
        options.erase(std::remove(options.begin(), options.end(), *next), options.end());
        if (!options.empty()) {
            Move sidestep = options[(index + memory.stuck_ticks) % options.size()];
            spdlog::debug("Robot {} stuck for {} ticks, sidestepping", index, memory.stuck_ticks);
            memory.stuck_ticks = 0;
            return sidestep;
        }
    }

    return *next;
}

Move GreedyPolicy::clear_the_way(const Cell& from,
                                const std::unordered_set<Cell, core::CellHash>& others) const {
    for (Move move : routes_->open_moves(from)) {
        Cell next = core::apply_move(from, move);
        if (others.count(next) == 0 && !on_package_cell(next)) {
            return move;
        }
    }
    return Move::Stay;
}

bool GreedyPolicy::on_package_cell(const Cell& cell) const {
    for (const auto& [id, package] : known_) {
        if (package.view.target() == cell || (!package.carried && package.view.start() == cell)) {
            return true;
        }
    }
    return false;
}

} // namespace parcelgrid::adapters
