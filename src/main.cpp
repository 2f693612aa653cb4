#include "parcelgrid/cli_options.hpp"
#include "parcelgrid/core/errors.hpp"
#include "parcelgrid/adapters/map_loader_file.hpp"
#include "parcelgrid/adapters/basic_policies.hpp"
#include "parcelgrid/adapters/console_renderer.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>

namespace po = boost::program_options;
namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    try {
        // Setup logging
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);

        parcelgrid::cli::OptionSet options;
        auto vm = parcelgrid::cli::parse_options(argc, argv, options);

        if (vm.count("help")) {
            std::cout << "Parcel Grid Simulator\n";
            std::cout << "Multi-robot package pickup and delivery on a grid\n\n";
            std::cout << options.all() << "\n";
            std::cout << "Example:\n";
            std::cout << "  ./parcelgrid_app --map maps/map5.txt --robots 5 --packages 10 \\\n";
            std::cout << "                   --max-steps 100 --seed 2025 --policy greedy\n";
            return 0;
        }

        // Set log level
        if (vm["verbose"].as<bool>()) {
            spdlog::set_level(spdlog::level::debug);
        } else if (vm["quiet"].as<bool>()) {
            spdlog::set_level(spdlog::level::warn);
        } else {
            spdlog::set_level(spdlog::level::info);
        }

        if (!vm.count("map")) {
            spdlog::error("A map file is required (--map or 'map' in the config file)");
            return 1;
        }

        auto config = parcelgrid::cli::to_simulation_config(vm);

        // Validate inputs
        if (!fs::exists(config.map_path)) {
            spdlog::error("Map file does not exist: {}", config.map_path.string());
            return 1;
        }

        if (config.num_robots <= 0) {
            spdlog::error("Number of robots must be positive");
            return 1;
        }

        if (config.num_packages < 0) {
            spdlog::error("Number of packages must not be negative");
            return 1;
        }

        if (config.max_ticks <= 0) {
            spdlog::error("Maximum steps must be positive");
            return 1;
        }

        auto policy_name = vm["policy"].as<std::string>();
        auto policy = parcelgrid::adapters::make_policy(policy_name, config.seed);
        if (!policy) {
            return 1;
        }

        // Create simulation components
        auto map_loader = std::make_unique<parcelgrid::adapters::MapLoaderFile>();
        parcelgrid::ports::RendererPtr renderer;
        if (vm["render"].as<bool>()) {
            renderer = std::make_unique<parcelgrid::adapters::ConsoleRenderer>(std::cout);
        }

        // Run simulation
        parcelgrid::Simulation sim(config, std::move(map_loader), std::move(policy), std::move(renderer));

        if (!sim.initialize()) {
            spdlog::error("Failed to initialize simulation");
            return 1;
        }

        spdlog::info("Starting simulation with {} robots, {} packages, seed {}",
                     config.num_robots, config.num_packages, config.seed);

        if (!sim.run()) {
            spdlog::error("Simulation failed");
            return 1;
        }

        // Print summary
        auto metrics = sim.get_metrics();
        auto result = sim.get_result();
        spdlog::info("=== Simulation Results ===");
        spdlog::info("Total reward: {:.2f}", result ? result->total_reward : metrics.total_reward);
        spdlog::info("Total time steps: {}", result ? result->total_ticks : metrics.ticks);
        spdlog::info("Delivered: {} on time, {} late, {} of {} packages",
                     metrics.on_time_deliveries, metrics.late_deliveries,
                     metrics.deliveries(), config.num_packages);
        spdlog::info("Moves: {} ({} blocked, {} in cycles)",
                     metrics.moves, metrics.blocked_moves, metrics.cycle_stalls);
        spdlog::info("Wall time: {}ms", metrics.wall_time.count());

        return 0;

    } catch (const parcelgrid::core::ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
