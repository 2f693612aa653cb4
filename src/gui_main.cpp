#include "parcelgrid/adapters/imgui_renderer.hpp"
#include "parcelgrid/adapters/basic_policies.hpp"
#include "parcelgrid/adapters/map_loader_file.hpp"
#include "parcelgrid/simulation.hpp"
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>
#include <iostream>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    po::options_description desc("Parcel Grid Simulator - GUI\nMulti-robot package delivery with real-time visualization\n\nOptions");
    desc.add_options()
        ("help,h", "Show help message")
        ("map,m", po::value<std::string>(), "Path to map file")
        ("robots,n", po::value<int>()->default_value(5), "Number of robots")
        ("packages,p", po::value<int>()->default_value(20), "Number of packages")
        ("max-steps,t", po::value<int>()->default_value(100), "Episode horizon in ticks")
        ("seed,s", po::value<uint64_t>()->default_value(2025), "Random seed")
        ("policy", po::value<std::string>()->default_value("greedy"), "Policy: greedy, random or idle")
        ("verbose,v", "Enable verbose logging")
        ("quiet,q", "Suppress info messages");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        std::cout << "\nExample:\n";
        std::cout << "  " << argv[0] << " --map maps/map5.txt --robots 5 --packages 20 --seed 2025" << std::endl;
        return 0;
    }

    if (!vm.count("map")) {
        std::cerr << "Error: Map file is required. Use --help for more information." << std::endl;
        return 1;
    }

    if (vm.count("quiet")) {
        spdlog::set_level(spdlog::level::warn);
    } else if (vm.count("verbose")) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    try {
        auto renderer = std::make_unique<parcelgrid::adapters::ImGuiRenderer>();
        if (!renderer->initialize()) {
            spdlog::error("Failed to initialize GUI renderer");
            return 1;
        }

        parcelgrid::SimulationConfig config;
        config.map_path = vm["map"].as<std::string>();
        config.num_robots = vm["robots"].as<int>();
        config.num_packages = vm["packages"].as<int>();
        config.max_ticks = vm["max-steps"].as<int>();
        config.seed = vm["seed"].as<uint64_t>();

        auto policy = parcelgrid::adapters::make_policy(vm["policy"].as<std::string>(), config.seed);
        if (!policy) {
            return 1;
        }

        // The GUI draws on its own schedule, so the simulation gets no renderer
        parcelgrid::Simulation simulation(config,
                                          std::make_unique<parcelgrid::adapters::MapLoaderFile>(),
                                          std::move(policy));

        if (!simulation.initialize()) {
            spdlog::error("Failed to initialize simulation");
            return 1;
        }

        spdlog::info("Starting GUI simulation with {} robots and {} packages",
                     config.num_robots, config.num_packages);

        auto last_step_time = std::chrono::steady_clock::now();
        const auto target_step_interval = std::chrono::milliseconds(200);

        while (!renderer->should_quit()) {
            auto current_time = std::chrono::steady_clock::now();
            auto elapsed = current_time - last_step_time;

            bool should_step = false;
            if (renderer->is_paused()) {
                should_step = renderer->step_requested();
            } else {
                float speed = renderer->get_speed_multiplier();
                auto adjusted_interval = std::chrono::duration_cast<std::chrono::milliseconds>(
                    target_step_interval / speed);
                should_step = elapsed >= adjusted_interval;
            }

            if (renderer->reset_requested()) {
                simulation.reset();
                last_step_time = current_time;
            } else if (should_step && !simulation.is_complete()) {
                simulation.step();
                last_step_time = current_time;
            }

            auto render_state = simulation.get_render_state();
            render_state.simulation_running = !renderer->is_paused() && !simulation.is_complete();

            renderer->render(render_state);
            renderer->present();

            // Cap framerate to ~60 FPS
            std::this_thread::sleep_for(std::chrono::milliseconds(16));
        }

        renderer->shutdown();
        spdlog::info("GUI application terminated normally");

    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    return 0;
}
