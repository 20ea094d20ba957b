#include "Runner.hpp"

// Standard
#include <csignal>
#include <cstdlib>
#include <optional>
#include <utility>

// Boost
#include <boost/program_options/errors.hpp>

// Internal
#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include "ParameterParser.hpp"
#include "PipelineRegistry.hpp"
#include "ProcessExecutor.hpp"
#include "RunDiscovery.hpp"
#include "ScanLoop.hpp"

using namespace autorun;

auto Runner::run(int argc, const char *const argv[]) -> int {  // NOLINT
    std::optional<GeneralParameters> parameters;
    try {
        parameters.emplace(ParameterParser::getParameters(argc, argv));
    } catch (const po::error &e) {
        Logger::log(LogLevel::ERROR, e.what(), ". Run with --help to list the options.");
        return EXIT_FAILURE;
    }
    Logger::setLogLevel(parameters->logLevel);

    config::AnalysisConfig initialConfig;
    try {
        initialConfig = config::ConfigLoader::load(parameters->configPath);
    } catch (const config::ConfigurationError &e) {
        Logger::log(LogLevel::ERROR, "Cannot start without a valid configuration: ", e.what());
        return EXIT_FAILURE;
    }

    installSignalHandlers();

    dispatch::BoostProcessExecutor executor;
    const auto registry = pipelines::PipelineRegistry::withDefaultHooks();
    scan::ScanLoop scanLoop(parameters->configPath, executor, registry, drainToken());

    try {
        scanLoop.run(std::move(initialConfig), parameters->singleCycle);
    } catch (const discovery::ScanError &e) {
        Logger::log(LogLevel::ERROR, "Stopping: ", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

auto Runner::drainToken() -> scan::DrainToken & {
    static scan::DrainToken token;
    return token;
}

void Runner::installSignalHandlers() {
    drainToken();  // constructed before any signal can arrive
    std::signal(SIGINT, Runner::requestDrain);
    std::signal(SIGTERM, Runner::requestDrain);
}

void Runner::requestDrain(int /*sig*/) { drainToken().request(); }
