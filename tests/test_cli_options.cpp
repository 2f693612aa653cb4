#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "parcelgrid/cli_options.hpp"
#include "parcelgrid/core/errors.hpp"
#include <filesystem>
#include <fstream>
#include <vector>

using namespace parcelgrid;
using Catch::Matchers::WithinAbs;
namespace fs = std::filesystem;

namespace {

cli::po::variables_map parse(const std::vector<const char*>& args) {
    cli::OptionSet options;
    return cli::parse_options(static_cast<int>(args.size()), args.data(), options);
}

} // namespace

TEST_CASE("Command line options", "[cli]") {
    SECTION("Defaults") {
        auto vm = parse({"parcelgrid_app", "--map", "grid.txt"});
        auto config = cli::to_simulation_config(vm);

        REQUIRE(config.map_path == fs::path("grid.txt"));
        REQUIRE(config.num_robots == 5);
        REQUIRE(config.num_packages == 20);
        REQUIRE(config.max_ticks == 100);
        REQUIRE(config.seed == 2025);
        REQUIRE_THAT(config.rewards.move_cost, WithinAbs(-0.01, 1e-12));
        REQUIRE(!config.verbose);
        REQUIRE(!vm["render"].as<bool>());
        REQUIRE(vm["policy"].as<std::string>() == "greedy");
    }

    SECTION("Switches") {
        auto vm = parse({"parcelgrid_app", "-v", "--render", "--robots", "3"});
        REQUIRE(vm["verbose"].as<bool>());
        REQUIRE(vm["render"].as<bool>());
        REQUIRE(!vm["quiet"].as<bool>());
        REQUIRE(cli::to_simulation_config(vm).num_robots == 3);
    }
}

TEST_CASE("Config file options", "[cli]") {
    fs::path ini = fs::temp_directory_path() / "parcelgrid_cli_test.ini";
    {
        std::ofstream file(ini);
        file << "map = warehouse.txt\n";
        file << "robots = 7\n";
        file << "seed = 99\n";
        file << "policy = idle\n";
        file << "verbose = true\n";
        file << "render = true\n";
        file << "quiet = false\n";
    }
    const std::string ini_path = ini.string();

    SECTION("Output and episode keys are read from the file") {
        auto vm = parse({"parcelgrid_app", "--config", ini_path.c_str()});
        auto config = cli::to_simulation_config(vm);

        REQUIRE(config.map_path == fs::path("warehouse.txt"));
        REQUIRE(config.num_robots == 7);
        REQUIRE(config.seed == 99);
        REQUIRE(config.verbose);
        REQUIRE(vm["render"].as<bool>());
        REQUIRE(!vm["quiet"].as<bool>());
        REQUIRE(vm["policy"].as<std::string>() == "idle");
        REQUIRE(config.num_packages == 20);
    }

    SECTION("Command line values win over the file") {
        auto vm = parse({"parcelgrid_app", "--robots", "2", "--policy", "random",
                         "--config", ini_path.c_str()});
        auto config = cli::to_simulation_config(vm);

        REQUIRE(config.num_robots == 2);
        REQUIRE(vm["policy"].as<std::string>() == "random");
        REQUIRE(config.seed == 99);
    }

    SECTION("Unknown keys are rejected") {
        {
            std::ofstream file(ini, std::ios::app);
            file << "drones = 4\n";
        }
        REQUIRE_THROWS_AS(parse({"parcelgrid_app", "--config", ini_path.c_str()}),
                          cli::po::error);
    }

    fs::remove(ini);

    SECTION("Missing config file") {
        REQUIRE_THROWS_AS(parse({"parcelgrid_app", "--config", "/nonexistent/parcelgrid.ini"}),
                          core::ConfigError);
    }
}
