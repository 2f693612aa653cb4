#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "parcelgrid/core/step_controller.hpp"
#include "parcelgrid/core/errors.hpp"

using namespace parcelgrid::core;
using Catch::Matchers::WithinAbs;

namespace {

std::shared_ptr<const Grid> corridor() {
    // 0 0 0 0 0
    // 0 1 1 1 0
    return std::make_shared<const Grid>(std::vector<std::vector<int>>{
        {0, 0, 0, 0, 0},
        {0, 1, 1, 1, 0}});
}

Package make_package(PackageId id, Cell start, Cell target, Tick spawn, Tick deadline) {
    Package package;
    package.id = id;
    package.start = start;
    package.target = target;
    package.spawn_time = spawn;
    package.deadline = deadline;
    return package;
}

EpisodeParams params_with_horizon(Tick horizon) {
    EpisodeParams params;
    params.num_robots = 1;
    params.num_packages = 1;
    params.horizon = horizon;
    return params;
}

const Action kStay{};
const Action kPickup{Move::Stay, PackageAction::Pickup};
const Action kRight{Move::Right, PackageAction::None};
const Action kRightDrop{Move::Right, PackageAction::Drop};

} // namespace

TEST_CASE("StepController construction", "[step]") {
    SECTION("Rejects a missing grid") {
        REQUIRE_THROWS_AS(StepController(nullptr, EpisodeParams{}), ConfigError);
    }

    SECTION("Rejects a horizon below one") {
        REQUIRE_THROWS_AS(StepController(corridor(), params_with_horizon(0)), ConfigError);
    }

    SECTION("Rejects negative counts") {
        EpisodeParams params;
        params.num_robots = -1;
        REQUIRE_THROWS_AS(StepController(corridor(), params), ConfigError);
    }

    SECTION("Reset fails when the map is too small") {
        EpisodeParams params;
        params.num_robots = 20;
        StepController controller(corridor(), params);
        REQUIRE_THROWS_AS(controller.reset(), ConfigError);
        REQUIRE(!controller.started());
    }
}

TEST_CASE("Stepping outside an episode", "[step]") {
    StepController controller(corridor(), params_with_horizon(10));

    SECTION("Before reset") {
        REQUIRE_THROWS_AS(controller.step({kStay}), InvocationError);
    }

    SECTION("Wrong number of actions leaves the state untouched") {
        Scenario scenario;
        scenario.robots = {Robot{{0, 0}, kNoPackage}};
        scenario.packages = {make_package(1, {0, 0}, {0, 4}, 0, 20)};
        controller.load(scenario);

        REQUIRE_THROWS_AS(controller.step({kRight, kRight}), InvocationError);
        REQUIRE_THROWS_AS(controller.step({}), InvocationError);
        REQUIRE(controller.state().tick == 0);
        REQUIRE(controller.state().robots[0].position == Cell{0, 0});
        REQUIRE(controller.state().total_reward == 0.0);
    }
}

TEST_CASE("Scenario validation on load", "[step]") {
    StepController controller(corridor(), params_with_horizon(10));

    Scenario scenario;
    scenario.robots = {Robot{{0, 0}, kNoPackage}};
    scenario.packages = {make_package(1, {0, 1}, {0, 4}, 0, 20)};

    SECTION("Robot on an obstacle") {
        scenario.robots[0].position = {1, 2};
        REQUIRE_THROWS_AS(controller.load(scenario), ConfigError);
    }

    SECTION("Robot outside the grid") {
        scenario.robots[0].position = {5, 5};
        REQUIRE_THROWS_AS(controller.load(scenario), ConfigError);
    }

    SECTION("Two robots on one cell") {
        scenario.robots.push_back(Robot{{0, 0}, kNoPackage});
        REQUIRE_THROWS_AS(controller.load(scenario), ConfigError);
    }

    SECTION("Package on an obstacle") {
        scenario.packages[0].target = {1, 1};
        REQUIRE_THROWS_AS(controller.load(scenario), ConfigError);
    }

    SECTION("Package ids out of sequence") {
        scenario.packages[0].id = 2;
        REQUIRE_THROWS_AS(controller.load(scenario), ConfigError);
    }

    SECTION("Deadline not after spawn") {
        scenario.packages[0].deadline = 0;
        REQUIRE_THROWS_AS(controller.load(scenario), ConfigError);
    }

    SECTION("A valid scenario starts the episode") {
        auto snapshot = controller.load(scenario);
        REQUIRE(controller.started());
        REQUIRE(!controller.done());
        REQUIRE(snapshot.tick == 0);
        REQUIRE(snapshot.robots.size() == 1);
        REQUIRE(snapshot.robots[0].row == 1);
        REQUIRE(snapshot.robots[0].col == 1);
        REQUIRE(snapshot.packages.size() == 1);
        REQUIRE(snapshot.grid == controller.shared_grid());
    }
}

TEST_CASE("Move cost", "[step]") {
    StepController controller(corridor(), params_with_horizon(10));

    Scenario scenario;
    scenario.robots = {Robot{{0, 0}, kNoPackage}, Robot{{0, 4}, kNoPackage}};
    scenario.packages = {make_package(1, {1, 0}, {1, 4}, 0, 20)};
    controller.load(scenario);

    SECTION("Only successful moves cost") {
        // Robot 0 moves right, robot 1 walks into the boundary
        auto result = controller.step({kRight, kRight});
        REQUIRE(result.movement.moved(0));
        REQUIRE(result.movement.verdicts[1] == MoveVerdict::Invalid);
        REQUIRE_THAT(result.reward, WithinAbs(-0.01, 1e-9));
        REQUIRE_THAT(controller.state().total_reward, WithinAbs(-0.01, 1e-9));
    }

    SECTION("Staying is free") {
        auto result = controller.step({kStay, kStay});
        REQUIRE(result.reward == 0.0);
        REQUIRE(controller.state().tick == 1);
    }
}

TEST_CASE("Delivery against the deadline", "[step]") {
    // Robot picks up at tick 0, moves at ticks 1..3 and drops with the
    // fourth move, which is processed at tick 4.
    auto run_delivery = [](Tick deadline) {
        StepController controller(corridor(), params_with_horizon(20));
        Scenario scenario;
        scenario.robots = {Robot{{0, 0}, kNoPackage}};
        scenario.packages = {make_package(1, {0, 0}, {0, 4}, 0, deadline)};
        controller.load(scenario);

        auto pickup = controller.step({kPickup});
        REQUIRE(pickup.events.size() == 1);
        REQUIRE(pickup.events[0].kind == PackageEventKind::PickedUp);
        REQUIRE(pickup.snapshot.robots[0].carrying == 1);

        for (int i = 0; i < 3; ++i) {
            auto moved = controller.step({kRight});
            REQUIRE(!moved.done);
        }

        REQUIRE(controller.state().tick == 4);
        return controller.step({kRightDrop});
    };

    SECTION("Drop at the deadline tick pays the delivery reward") {
        auto result = run_delivery(4);
        REQUIRE(result.events.size() == 1);
        REQUIRE(result.events[0].kind == PackageEventKind::DeliveredOnTime);
        REQUIRE_THAT(result.reward, WithinAbs(10.0 - 0.01, 1e-9));
        REQUIRE(result.done);
        REQUIRE(result.info.has_value());
        REQUIRE(result.info->total_ticks == 5);
        REQUIRE_THAT(result.info->total_reward, WithinAbs(10.0 - 0.04, 1e-9));
    }

    SECTION("Drop one tick late pays the delay reward") {
        auto result = run_delivery(3);
        REQUIRE(result.events[0].kind == PackageEventKind::DeliveredLate);
        REQUIRE_THAT(result.reward, WithinAbs(1.0 - 0.01, 1e-9));
        REQUIRE(result.done);
    }
}

TEST_CASE("Progressive package reveal", "[step]") {
    StepController controller(corridor(), params_with_horizon(10));

    Scenario scenario;
    scenario.robots = {Robot{{0, 2}, kNoPackage}};
    scenario.packages = {make_package(1, {0, 0}, {0, 4}, 0, 20),
                         make_package(2, {0, 1}, {1, 0}, 2, 20),
                         make_package(3, {0, 3}, {1, 4}, 2, 25)};

    auto initial = controller.load(scenario);
    REQUIRE(initial.packages.size() == 1);
    REQUIRE(initial.packages[0].id == 1);
    REQUIRE(controller.state().packages.find(2)->status == PackageStatus::Pending);

    auto first = controller.step({kStay});
    REQUIRE(first.snapshot.tick == 1);
    REQUIRE(first.snapshot.packages.empty());

    auto second = controller.step({kStay});
    REQUIRE(second.snapshot.tick == 2);
    REQUIRE(second.snapshot.packages.size() == 2);
    REQUIRE(second.snapshot.packages[0].id == 2);
    REQUIRE(second.snapshot.packages[1].id == 3);
    REQUIRE(controller.state().packages.find(3)->status == PackageStatus::Waiting);

    SECTION("Pending packages cannot be picked up early") {
        StepController early(corridor(), params_with_horizon(10));
        Scenario s;
        s.robots = {Robot{{0, 1}, kNoPackage}};
        s.packages = {make_package(1, {0, 0}, {0, 4}, 0, 20),
                      make_package(2, {0, 1}, {1, 0}, 3, 20)};
        early.load(s);

        auto result = early.step({kPickup});
        REQUIRE(result.events.empty());
        REQUIRE(early.state().robots[0].carrying == kNoPackage);
    }
}

TEST_CASE("Episode termination", "[step]") {
    SECTION("Horizon ends the episode") {
        StepController controller(corridor(), params_with_horizon(3));
        Scenario scenario;
        scenario.robots = {Robot{{0, 0}, kNoPackage}};
        scenario.packages = {make_package(1, {0, 1}, {0, 4}, 0, 20)};
        controller.load(scenario);

        REQUIRE(!controller.step({kStay}).done);
        REQUIRE(!controller.step({kStay}).done);
        auto last = controller.step({kStay});
        REQUIRE(last.done);
        REQUIRE(last.info.has_value());
        REQUIRE(last.info->total_ticks == 3);
        REQUIRE(controller.done());

        REQUIRE_THROWS_AS(controller.step({kStay}), InvocationError);
        REQUIRE(controller.state().tick == 3);
    }

    SECTION("No info before the end") {
        StepController controller(corridor(), params_with_horizon(5));
        Scenario scenario;
        scenario.robots = {Robot{{0, 0}, kNoPackage}};
        scenario.packages = {make_package(1, {0, 1}, {0, 4}, 0, 20)};
        controller.load(scenario);

        auto result = controller.step({kStay});
        REQUIRE(!result.info.has_value());
    }

    SECTION("An episode without packages ends after the first step") {
        EpisodeParams params;
        params.num_robots = 1;
        params.num_packages = 0;
        params.horizon = 5;
        StepController controller(corridor(), params);
        controller.reset();

        auto result = controller.step({kStay});
        REQUIRE(result.done);
        REQUIRE(result.info->total_ticks == 1);
    }
}

TEST_CASE("Reset is seeded", "[step]") {
    EpisodeParams params;
    params.num_robots = 2;
    params.num_packages = 4;
    params.horizon = 30;
    params.seed = 99;

    StepController a(corridor(), params);
    StepController b(corridor(), params);
    auto snap_a = a.reset();
    auto snap_b = b.reset();

    REQUIRE(snap_a.robots == snap_b.robots);
    REQUIRE(snap_a.packages == snap_b.packages);

    SECTION("Reset restarts the clock") {
        a.step({kStay, kStay});
        a.reset();
        REQUIRE(a.state().tick == 0);
        REQUIRE(a.state().total_reward == 0.0);
        REQUIRE(!a.done());
    }
}
