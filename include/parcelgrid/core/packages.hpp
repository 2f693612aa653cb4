#pragma once

#include "parcelgrid/core/types.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/tag.hpp>
#include <vector>
#include <optional>

namespace parcelgrid::core {

namespace bmi = boost::multi_index;

struct by_id {};
struct by_start {};
struct by_spawn {};

using PackageTable = bmi::multi_index_container<
    Package,
    bmi::indexed_by<
        bmi::ordered_unique<
            bmi::tag<by_id>,
            bmi::member<Package, PackageId, &Package::id>
        >,
        // (start, id) so packages at one cell come out in ascending id order
        bmi::ordered_unique<
            bmi::tag<by_start>,
            bmi::composite_key<
                Package,
                bmi::member<Package, Cell, &Package::start>,
                bmi::member<Package, PackageId, &Package::id>
            >
        >,
        bmi::ordered_non_unique<
            bmi::tag<by_spawn>,
            bmi::member<Package, Tick, &Package::spawn_time>
        >
    >
>;

// All packages of an episode. Status only ever moves forward.
class PackageLedger {
public:
    PackageLedger() = default;

    bool insert(const Package& package);
    void clear();

    std::size_t size() const noexcept { return table_.size(); }
    bool empty() const noexcept { return table_.empty(); }

    const Package* find(PackageId id) const;

    // Lowest-id Waiting package starting at `cell` that has spawned by `tick`.
    std::optional<PackageId> first_collectible_at(const Cell& cell, Tick tick) const;

    // Returns false when the transition would not advance the status.
    bool advance(PackageId id, PackageStatus status);

    // Pending packages whose spawn time is exactly `tick` become Waiting.
    std::vector<Package> reveal(Tick tick);

    std::vector<Package> spawning_at(Tick tick) const;

    bool all_delivered() const noexcept { return delivered_ == table_.size(); }
    std::size_t count(PackageStatus status) const;

    // Ascending id order.
    std::vector<Package> to_vector() const;

private:
    PackageTable table_;
    std::size_t delivered_ = 0;
};

enum class PackageEventKind {
    PickedUp,
    DeliveredOnTime,
    DeliveredLate
};

struct PackageEvent {
    PackageEventKind kind;
    std::size_t robot;
    PackageId package;
    Tick tick;
    double reward = 0.0;
};

// Pickup and drop rules for a single robot, evaluated on its post-move cell.
class PackageLifecycle {
public:
    PackageLifecycle(PackageLedger& ledger, const RewardParams& rewards)
        : ledger_(ledger), rewards_(rewards) {}

    std::optional<PackageEvent> apply(std::size_t robot_index, Robot& robot,
                                      PackageAction action, Tick tick);

    std::optional<PackageEvent> pickup(std::size_t robot_index, Robot& robot, Tick tick);
    std::optional<PackageEvent> drop(std::size_t robot_index, Robot& robot, Tick tick);

private:
    PackageLedger& ledger_;
    const RewardParams& rewards_;
};

} // namespace parcelgrid::core
