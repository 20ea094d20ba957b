#pragma once

// Standard
#include <filesystem>
#include <string>

// Boost
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

// Internal
#include "Logger.hpp"

namespace po = boost::program_options;

struct ParameterValidator {
    static auto validateFilePath(const po::variables_map& params,
                                 const std::string& paramName) -> std::filesystem::path {
        if (params.count(paramName) == 0U) {
            throw po::required_option(paramName);
        }

        const std::string filePathStr = params[paramName].as<std::string>();
        std::filesystem::path filePath = std::filesystem::path(filePathStr);

        if (!std::filesystem::exists(filePath) || std::filesystem::is_directory(filePath)) {
            const std::string message = "Check parameter '" + paramName + "': " + filePathStr +
                                        " is not a valid file path.";
            Logger::log(LogLevel::ERROR, message);
            throw po::error(message);
        }

        return filePath;
    }

    static auto validateLogLevel(const po::variables_map& params,
                                 const std::string& paramName) -> LogLevel {
        const std::string logLevelStr = params[paramName].as<std::string>();

        if (logLevelStr == "debug" || logLevelStr == "DEBUG") {
            return LogLevel::DEBUG;
        }
        if (logLevelStr == "info" || logLevelStr == "INFO") {
            return LogLevel::INFO;
        }
        if (logLevelStr == "warning" || logLevelStr == "WARNING") {
            return LogLevel::WARNING;
        }
        if (logLevelStr == "error" || logLevelStr == "ERROR") {
            return LogLevel::ERROR;
        }

        throw po::invalid_option_value(logLevelStr);
    }
};
