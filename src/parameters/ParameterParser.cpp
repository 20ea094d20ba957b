#include "ParameterParser.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

#include "Config.hpp"
#include "Logger.hpp"
#include "ParameterOptions.hpp"

auto ParameterParser::getParameters(int argc, const char *const argv[])  // NOLINT
    -> GeneralParameters {
    const auto params = parseParameters(argc, argv);

    return GeneralParameters{params};
}

auto ParameterParser::parseParameters(int argc,
                                      const char *const argv[]) -> po::variables_map {  // NOLINT
    const po::options_description commandLineOptions{getCommandLineOptions()};

    po::variables_map params;
    store(po::command_line_parser(argc, argv).options(commandLineOptions).run(), params);

    notify(params);

    printVersion();

    if (params.count("version") != 0U) {
        exit(EXIT_SUCCESS);
    }

    if (params.count("help") != 0U) {
        std::cout << commandLineOptions << std::endl;
        exit(EXIT_SUCCESS);
    }

    return params;
}

auto ParameterParser::getCommandLineOptions() -> po::options_description {
    const po::options_description generalOptions{ParameterOptions::getGeneralOptions()};
    const po::options_description otherOptions{ParameterOptions::getOtherOptions()};

    po::options_description commandLineOptions{"Command line options"};

    commandLineOptions.add(generalOptions).add(otherOptions);

    return commandLineOptions;
}

void ParameterParser::printVersion() {
    const std::string versionString =
        "AutoRun v" + std::to_string(AutoRun_VERSION_MAJOR) + "." +
        std::to_string(AutoRun_VERSION_MINOR) + "." + std::to_string(AutoRun_VERSION_PATCH) +
        " - " + "Launch analysis pipelines on completed sequencing runs.";

    Logger::log(LogLevel::INFO, versionString);
}
