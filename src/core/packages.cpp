#include "parcelgrid/core/packages.hpp"
#include <boost/tuple/tuple.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace parcelgrid::core {

bool PackageLedger::insert(const Package& package) {
    auto [it, inserted] = table_.insert(package);
    if (inserted && package.status == PackageStatus::Delivered) {
        ++delivered_;
    }
    return inserted;
}

void PackageLedger::clear() {
    table_.clear();
    delivered_ = 0;
}

const Package* PackageLedger::find(PackageId id) const {
    auto& index = table_.get<by_id>();
    auto it = index.find(id);
    if (it == index.end()) {
        return nullptr;
    }
    return &*it;
}

std::optional<PackageId> PackageLedger::first_collectible_at(const Cell& cell, Tick tick) const {
    auto& index = table_.get<by_start>();
    auto [it, end] = index.equal_range(boost::make_tuple(cell));
    for (; it != end; ++it) {
        if (it->status == PackageStatus::Waiting && it->spawn_time <= tick) {
            return it->id;
        }
    }
    return std::nullopt;
}

bool PackageLedger::advance(PackageId id, PackageStatus status) {
    auto& index = table_.get<by_id>();
    auto it = index.find(id);
    if (it == index.end() || status <= it->status) {
        return false;
    }

    index.modify(it, [status](Package& p) { p.status = status; });
    if (status == PackageStatus::Delivered) {
        ++delivered_;
    }
    return true;
}

std::vector<Package> PackageLedger::reveal(Tick tick) {
    std::vector<Package> revealed;
    auto& index = table_.get<by_spawn>();
    auto [it, end] = index.equal_range(tick);
    for (; it != end; ++it) {
        if (it->status == PackageStatus::Pending) {
            index.modify(it, [](Package& p) { p.status = PackageStatus::Waiting; });
        }
        revealed.push_back(*it);
    }

    // Spawn-time ties keep their table order, which is not necessarily by id.
    std::sort(revealed.begin(), revealed.end(),
        [](const Package& a, const Package& b) { return a.id < b.id; });
    return revealed;
}

std::vector<Package> PackageLedger::spawning_at(Tick tick) const {
    std::vector<Package> spawning;
    auto& index = table_.get<by_spawn>();
    auto [it, end] = index.equal_range(tick);
    spawning.assign(it, end);
    std::sort(spawning.begin(), spawning.end(),
        [](const Package& a, const Package& b) { return a.id < b.id; });
    return spawning;
}

std::size_t PackageLedger::count(PackageStatus status) const {
    return std::count_if(table_.begin(), table_.end(),
        [status](const Package& p) { return p.status == status; });
}

std::vector<Package> PackageLedger::to_vector() const {
    auto& index = table_.get<by_id>();
    return std::vector<Package>(index.begin(), index.end());
}

std::optional<PackageEvent> PackageLifecycle::apply(std::size_t robot_index, Robot& robot,
                                                    PackageAction action, Tick tick) {
    switch (action) {
        case PackageAction::Pickup: return pickup(robot_index, robot, tick);
        case PackageAction::Drop:   return drop(robot_index, robot, tick);
        case PackageAction::None:   break;
    }
    return std::nullopt;
}

std::optional<PackageEvent> PackageLifecycle::pickup(std::size_t robot_index, Robot& robot, Tick tick) {
    if (robot.is_carrying()) {
        return std::nullopt;
    }

    auto id = ledger_.first_collectible_at(robot.position, tick);
    if (!id) {
        return std::nullopt;
    }

    if (!ledger_.advance(*id, PackageStatus::InTransit)) {
        return std::nullopt;
    }
    robot.carrying = *id;
    spdlog::debug("Robot {} picked up package {} at tick {}", robot_index, *id, tick);
    return PackageEvent{PackageEventKind::PickedUp, robot_index, *id, tick, 0.0};
}

std::optional<PackageEvent> PackageLifecycle::drop(std::size_t robot_index, Robot& robot, Tick tick) {
    if (!robot.is_carrying()) {
        return std::nullopt;
    }

    const Package* package = ledger_.find(robot.carrying);
    if (package == nullptr || package->target != robot.position) {
        return std::nullopt;
    }

    const PackageId id = package->id;
    const Tick deadline = package->deadline;
    if (!ledger_.advance(id, PackageStatus::Delivered)) {
        return std::nullopt;
    }
    robot.carrying = kNoPackage;

    PackageEvent event{PackageEventKind::DeliveredOnTime, robot_index, id, tick,
                       rewards_.delivery_reward};
    if (tick > deadline) {
        event.kind = PackageEventKind::DeliveredLate;
        event.reward = rewards_.delay_reward;
        spdlog::info("Package {} delivered late at tick {} (deadline {})", id, tick, deadline);
    } else {
        spdlog::debug("Robot {} delivered package {} at tick {}", robot_index, id, tick);
    }
    return event;
}

} // namespace parcelgrid::core
