#include "parcelgrid/cli_options.hpp"
#include "parcelgrid/core/errors.hpp"
#include <spdlog/fmt/fmt.h>
#include <filesystem>

namespace parcelgrid::cli {

namespace fs = std::filesystem;

OptionSet::OptionSet() {
    generic.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(), "Read output and episode options from an INI-style file");

    output.add_options()
        ("verbose,v", po::bool_switch(), "Enable verbose logging")
        ("quiet,q", po::bool_switch(), "Suppress info messages")
        ("render", po::bool_switch(), "Print a text frame after every tick");

    episode.add_options()
        ("map,m", po::value<std::string>(), "Path to map file (rows of 0/1)")
        ("robots,n", po::value<int>()->default_value(5), "Number of robots")
        ("packages,p", po::value<int>()->default_value(20), "Number of packages")
        ("max-steps,t", po::value<int>()->default_value(100), "Episode horizon in ticks")
        ("seed,s", po::value<uint64_t>()->default_value(2025), "Random seed")
        ("move-cost", po::value<double>()->default_value(-0.01), "Reward added per successful move")
        ("delivery-reward", po::value<double>()->default_value(10.0), "Reward for an on-time delivery")
        ("delay-reward", po::value<double>()->default_value(1.0), "Reward for a late delivery")
        ("policy", po::value<std::string>()->default_value("greedy"), "Policy: greedy, random or idle")
        ("out-trace", po::value<std::string>()->default_value(""), "Output trace CSV file")
        ("out-metrics", po::value<std::string>()->default_value(""), "Output metrics JSON file");
}

po::options_description OptionSet::all() const {
    po::options_description desc("Parcel Grid Simulator - Options");
    desc.add(generic).add(output).add(episode);
    return desc;
}

po::options_description OptionSet::file_keys() const {
    po::options_description keys;
    keys.add(output).add(episode);
    return keys;
}

po::variables_map parse_options(int argc, const char* const argv[], const OptionSet& options) {
    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, options.all()), vm);

    if (vm.count("config") && !vm.count("help")) {
        fs::path config_path = vm["config"].as<std::string>();
        if (!fs::exists(config_path)) {
            throw core::ConfigError(fmt::format("Config file does not exist: {}", config_path.string()));
        }
        po::store(po::parse_config_file(config_path.string().c_str(), options.file_keys()), vm);
    }

    po::notify(vm);
    return vm;
}

SimulationConfig to_simulation_config(const po::variables_map& vm) {
    SimulationConfig config;
    if (vm.count("map")) {
        config.map_path = vm["map"].as<std::string>();
    }
    config.num_robots = vm["robots"].as<int>();
    config.num_packages = vm["packages"].as<int>();
    config.max_ticks = vm["max-steps"].as<int>();
    config.seed = vm["seed"].as<uint64_t>();
    config.rewards.move_cost = vm["move-cost"].as<double>();
    config.rewards.delivery_reward = vm["delivery-reward"].as<double>();
    config.rewards.delay_reward = vm["delay-reward"].as<double>();
    config.trace_output = vm["out-trace"].as<std::string>();
    config.metrics_output = vm["out-metrics"].as<std::string>();
    config.verbose = vm["verbose"].as<bool>();
    return config;
}

} // namespace parcelgrid::cli
