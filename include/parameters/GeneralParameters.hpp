#pragma once

// Standard
#include <filesystem>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Logger.hpp"
#include "ParameterValidator.hpp"

namespace po = boost::program_options;

class GeneralParameters {
   public:
    std::filesystem::path configPath;
    LogLevel logLevel;
    bool singleCycle;

    GeneralParameters(const po::variables_map& params)
        : configPath(ParameterValidator::validateFilePath(params, "config")),
          logLevel(ParameterValidator::validateLogLevel(params, "loglevel")),
          singleCycle(params.count("once") != 0U) {};
};
