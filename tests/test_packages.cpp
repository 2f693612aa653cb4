#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "parcelgrid/core/packages.hpp"

using namespace parcelgrid::core;
using Catch::Matchers::WithinAbs;

namespace {

Package make_package(PackageId id, Cell start, Cell target, Tick spawn, Tick deadline) {
    Package package;
    package.id = id;
    package.start = start;
    package.target = target;
    package.spawn_time = spawn;
    package.deadline = deadline;
    return package;
}

} // namespace

TEST_CASE("PackageLedger bookkeeping", "[packages]") {
    PackageLedger ledger;
    REQUIRE(ledger.empty());

    REQUIRE(ledger.insert(make_package(1, {0, 0}, {0, 2}, 0, 10)));
    REQUIRE(ledger.insert(make_package(2, {0, 0}, {1, 1}, 0, 12)));
    REQUIRE(ledger.insert(make_package(3, {1, 0}, {0, 0}, 4, 15)));
    REQUIRE(!ledger.insert(make_package(3, {1, 1}, {0, 0}, 5, 15)));
    REQUIRE(ledger.size() == 3);

    SECTION("Lookup by id") {
        const Package* package = ledger.find(2);
        REQUIRE(package != nullptr);
        REQUIRE(package->target == Cell{1, 1});
        REQUIRE(ledger.find(42) == nullptr);
    }

    SECTION("Reveal only touches packages spawning at that tick") {
        auto revealed = ledger.reveal(0);
        REQUIRE(revealed.size() == 2);
        REQUIRE(revealed[0].id == 1);
        REQUIRE(revealed[1].id == 2);
        REQUIRE(revealed[0].status == PackageStatus::Waiting);
        REQUIRE(ledger.find(3)->status == PackageStatus::Pending);
        REQUIRE(ledger.count(PackageStatus::Waiting) == 2);

        REQUIRE(ledger.reveal(1).empty());
        REQUIRE(ledger.spawning_at(4).size() == 1);
    }

    SECTION("Collectible packages come out lowest id first") {
        REQUIRE(!ledger.first_collectible_at({0, 0}, 0).has_value());

        ledger.reveal(0);
        REQUIRE(ledger.first_collectible_at({0, 0}, 0) == 1);

        REQUIRE(ledger.advance(1, PackageStatus::InTransit));
        REQUIRE(ledger.first_collectible_at({0, 0}, 0) == 2);
        REQUIRE(!ledger.first_collectible_at({1, 0}, 0).has_value());
    }

    SECTION("Status never moves backwards") {
        ledger.reveal(0);
        REQUIRE(ledger.advance(1, PackageStatus::InTransit));
        REQUIRE(!ledger.advance(1, PackageStatus::Waiting));
        REQUIRE(!ledger.advance(1, PackageStatus::InTransit));
        REQUIRE(ledger.find(1)->status == PackageStatus::InTransit);
        REQUIRE(!ledger.advance(99, PackageStatus::Delivered));
    }

    SECTION("All delivered tracks the delivered count") {
        REQUIRE(!ledger.all_delivered());
        for (PackageId id : {1, 2, 3}) {
            REQUIRE(ledger.advance(id, PackageStatus::Delivered));
        }
        REQUIRE(ledger.all_delivered());
        REQUIRE(ledger.count(PackageStatus::Delivered) == 3);

        ledger.clear();
        REQUIRE(ledger.empty());
        REQUIRE(ledger.all_delivered());
    }

    SECTION("Vector view is ordered by id") {
        auto all = ledger.to_vector();
        REQUIRE(all.size() == 3);
        REQUIRE(all[0].id == 1);
        REQUIRE(all[2].id == 3);
    }
}

TEST_CASE("Pickup rules", "[packages]") {
    PackageLedger ledger;
    RewardParams rewards;
    PackageLifecycle lifecycle(ledger, rewards);

    ledger.insert(make_package(1, {0, 0}, {0, 2}, 0, 10));
    ledger.insert(make_package(2, {0, 0}, {0, 1}, 0, 10));
    ledger.reveal(0);

    SECTION("Empty-handed robot takes the lowest id at its cell") {
        Robot robot{{0, 0}, kNoPackage};
        auto event = lifecycle.pickup(0, robot, 0);
        REQUIRE(event.has_value());
        REQUIRE(event->kind == PackageEventKind::PickedUp);
        REQUIRE(event->package == 1);
        REQUIRE(robot.carrying == 1);
        REQUIRE(ledger.find(1)->status == PackageStatus::InTransit);
        REQUIRE(ledger.find(2)->status == PackageStatus::Waiting);
    }

    SECTION("Two robots on the same cell take different packages") {
        Robot first{{0, 0}, kNoPackage};
        Robot second{{0, 0}, kNoPackage};
        REQUIRE(lifecycle.pickup(0, first, 0)->package == 1);
        REQUIRE(lifecycle.pickup(1, second, 0)->package == 2);
    }

    SECTION("A loaded robot cannot pick up again") {
        Robot robot{{0, 0}, kNoPackage};
        lifecycle.pickup(0, robot, 0);
        REQUIRE(!lifecycle.pickup(0, robot, 1).has_value());
        REQUIRE(robot.carrying == 1);
    }

    SECTION("Nothing to pick up away from a start cell") {
        Robot robot{{1, 1}, kNoPackage};
        REQUIRE(!lifecycle.apply(0, robot, PackageAction::Pickup, 0).has_value());
        REQUIRE(robot.carrying == kNoPackage);
    }

    SECTION("Unrevealed packages cannot be collected") {
        ledger.insert(make_package(3, {1, 0}, {0, 2}, 5, 20));
        Robot robot{{1, 0}, kNoPackage};
        REQUIRE(!lifecycle.pickup(0, robot, 2).has_value());
    }
}

TEST_CASE("Drop rules and deadline rewards", "[packages]") {
    PackageLedger ledger;
    RewardParams rewards;
    PackageLifecycle lifecycle(ledger, rewards);

    ledger.insert(make_package(1, {0, 0}, {0, 2}, 0, 4));
    ledger.reveal(0);

    Robot robot{{0, 0}, kNoPackage};
    REQUIRE(lifecycle.pickup(0, robot, 0).has_value());

    SECTION("Dropping away from the target does nothing") {
        robot.position = {0, 1};
        REQUIRE(!lifecycle.drop(0, robot, 2).has_value());
        REQUIRE(robot.carrying == 1);
        REQUIRE(ledger.find(1)->status == PackageStatus::InTransit);
    }

    SECTION("Delivery on the deadline tick is on time") {
        robot.position = {0, 2};
        auto event = lifecycle.apply(0, robot, PackageAction::Drop, 4);
        REQUIRE(event.has_value());
        REQUIRE(event->kind == PackageEventKind::DeliveredOnTime);
        REQUIRE_THAT(event->reward, WithinAbs(10.0, 1e-9));
        REQUIRE(robot.carrying == kNoPackage);
        REQUIRE(ledger.all_delivered());
    }

    SECTION("Delivery after the deadline earns the delay reward") {
        robot.position = {0, 2};
        auto event = lifecycle.drop(0, robot, 5);
        REQUIRE(event.has_value());
        REQUIRE(event->kind == PackageEventKind::DeliveredLate);
        REQUIRE_THAT(event->reward, WithinAbs(1.0, 1e-9));
        REQUIRE(ledger.find(1)->status == PackageStatus::Delivered);
    }

    SECTION("Empty-handed drop is ignored") {
        Robot idle{{0, 2}, kNoPackage};
        REQUIRE(!lifecycle.drop(1, idle, 3).has_value());
    }
}
