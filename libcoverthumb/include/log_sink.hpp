//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef COVERTHUMB_LOG_SINK_HPP
#define COVERTHUMB_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use them to filter and format the entries they receive.
 */
enum class LogLevel {
    Debug,   ///< Diagnostic detail (cache hits, chosen extractor, heuristics taken)
    Info,    ///< Normal operation
    Warning, ///< Recoverable problems (cache write failure, missing overlay)
    Error    ///< Failures that end a thumbnail request
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where log messages go (console, file, host
 * application log). The Logger delegates to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // COVERTHUMB_LOG_SINK_HPP
