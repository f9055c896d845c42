//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef COVERTHUMB_CONSOLE_LOG_SINK_HPP
#define COVERTHUMB_CONSOLE_LOG_SINK_HPP

#include "../../../libcoverthumb/include/log_sink.hpp"
#include "../../../libcoverthumb/include/logger.hpp"
#include <iostream>

/**
 * @brief Writes log lines to stderr, dropping anything below log_level.
 *
 * stdout stays reserved for --print-key output.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (static_cast<int>(level) < static_cast<int>(log_level)) return;
        std::cerr << "[" << Logger::level_to_string(level) << "][" << tag << "] " << message << std::endl;
    }
};

#endif // COVERTHUMB_CONSOLE_LOG_SINK_HPP
