#pragma once

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "GeneralParameters.hpp"

namespace po = boost::program_options;

class ParameterParser {
   public:
    /**
     * Parses the command line. Prints the help or version text and exits if requested.
     *
     * @throws po::error if an option is unknown, missing or invalid.
     */
    static auto getParameters(int argc, const char* const argv[]) -> GeneralParameters;  // NOLINT

    ParameterParser() = delete;

   private:
    static auto parseParameters(int argc, const char* const argv[]) -> po::variables_map;  // NOLINT

    static auto getCommandLineOptions() -> po::options_description;

    static void printVersion();
};
