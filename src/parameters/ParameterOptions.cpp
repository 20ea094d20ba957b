#include "ParameterOptions.hpp"

#include <boost/program_options/options_description.hpp>
#include <string>

#include "Constants.hpp"

namespace cli = constants::cli;

auto ParameterOptions::getGeneralOptions() -> po::options_description {
    po::options_description general(cli::GENERAL_DESCRIPTION);
    general.add_options()("config,c", po::value<std::string>(),
                          "JSON configuration file, reloaded before every scan (required)");
    general.add_options()("loglevel",
                          po::value<std::string>()->default_value(cli::DEFAULT_LOG_LEVEL),
                          "log level [debug, info, warning, error] (default: info)");
    general.add_options()("once", "run a single scan and exit instead of scanning periodically");

    return general;
}

auto ParameterOptions::getOtherOptions() -> po::options_description {
    po::options_description other("Other");
    other.add_options()("version,v", "display the version number");
    other.add_options()("help,h", "display this help message");

    return other;
}
