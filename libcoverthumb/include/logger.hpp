//
// Created by Giuseppe Francione on 20/10/25.
//

/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * The library never installs a sink on its own: with no sink registered,
 * every call is a no-op. Hosts (the CLI, a shell adapter, tests) add the
 * sinks they need.
 */

#ifndef COVERTHUMB_LOGGER_HPP
#define COVERTHUMB_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for coverthumb.
 *
 * Delegates log messages to all registered ILogSink implementations.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink to the logger.
     * The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "coverthumb").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "coverthumb");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @param level The enum value.
     * @return A constant string (e.g., "DEBUG", "INFO").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Converts a string to its LogLevel enum representation.
     * Case-insensitive. "NONE" (or anything unknown) yields std::nullopt.
     * @param level The string value (e.g., "DEBUG", "warning").
     * @return The corresponding LogLevel, or std::nullopt to disable logging.
     */
    static std::optional<LogLevel> string_to_level(std::string level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif //COVERTHUMB_LOGGER_HPP
