#pragma once

#include "parcelgrid/simulation.hpp"
#include <boost/program_options.hpp>
#include <string>

namespace parcelgrid::cli {

namespace po = boost::program_options;

// Option groups for parcelgrid_app. The config file accepts every key of
// the output and episode groups.
struct OptionSet {
    po::options_description generic{"Generic options"};
    po::options_description output{"Output options"};
    po::options_description episode{"Episode options"};

    OptionSet();

    po::options_description all() const;
    po::options_description file_keys() const;
};

// Command line first, then --config. Values given on the command line win
// over the file, file values win over defaults. Throws core::ConfigError
// when the config file is missing and po::error on bad options.
po::variables_map parse_options(int argc, const char* const argv[], const OptionSet& options);

SimulationConfig to_simulation_config(const po::variables_map& vm);

} // namespace parcelgrid::cli
