#pragma once

// Standard
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

// Boost
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

class Logger {
   public:
    Logger(Logger &&) = delete;
    auto operator=(Logger &&) -> Logger & = delete;
    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;
    ~Logger() = default;

    static auto getInstance() -> Logger & {
        static Logger instance;  // Singleton instance
        return instance;
    }

    static void setLogLevel(const std::string &logLevelString) {
        static const std::map<std::string, LogLevel> stringToLogLevelMap{
            {"debug", LogLevel::DEBUG},
            {"info", LogLevel::INFO},
            {"warning", LogLevel::WARNING},
            {"error", LogLevel::ERROR}};

        auto iterator = stringToLogLevelMap.find(logLevelString);
        if (iterator != stringToLogLevelMap.end()) {
            getInstance().logLevel = iterator->second;
        } else {
            log(LogLevel::ERROR, "Invalid log level: ", logLevelString);
        }
    }

    static void setLogLevel(LogLevel level) { getInstance().logLevel = level; }

    template <typename... Args>
    static void log(LogLevel level, Args &&...args) {
        std::lock_guard<std::mutex> lock(getInstance().logMutex);
        if (level >= getInstance().logLevel) {
            std::cerr << "[" << levelName(level) << "] " << getTime() << " ";
            (std::cerr << ... << std::forward<Args>(args)) << "\n";
        }
    }

    /**
     * Logs a structured event as a single JSON object. The event type is written first, followed
     * by the given fields in insertion order. Scalar field values are always written as JSON
     * strings, e.g. "true" or "1.5".
     */
    static void logEvent(LogLevel level, const std::string &eventType,
                         const boost::property_tree::ptree &fields = {}) {
        if (level < getInstance().logLevel) {
            return;
        }

        boost::property_tree::ptree event;
        event.put("event_type", eventType);
        for (const auto &field : fields) {
            event.push_back(field);
        }

        std::ostringstream eventStream;
        boost::property_tree::write_json(eventStream, event, false);

        std::string message = eventStream.str();
        if (!message.empty() && message.back() == '\n') {
            message.pop_back();
        }
        log(level, message);
    }

   private:
    Logger() = default;

    LogLevel logLevel{LogLevel::INFO};
    std::mutex logMutex;

    static auto levelName(LogLevel level) -> std::string {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARNING";
            case LogLevel::ERROR:
                return "ERROR";
        }
        return "INFO";
    }

    static auto getTime() -> std::string {
        const auto now = std::chrono::system_clock::now();
        const std::time_t current_time = std::chrono::system_clock::to_time_t(now);

        std::ostringstream time_stream;
        time_stream << std::put_time(std::localtime(&current_time), "[%Y-%m-%d %H:%M:%S]") << " ";

        return time_stream.str();
    };
};
