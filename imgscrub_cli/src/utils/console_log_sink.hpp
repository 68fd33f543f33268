//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef IMGSCRUB_CONSOLE_LOG_SINK_HPP
#define IMGSCRUB_CONSOLE_LOG_SINK_HPP

#include "../../../libimgscrub/include/log_sink.hpp"
#include "../../../libimgscrub/include/logger.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes every message at or above log_level to stderr.
 *
 * stdout is reserved for command output (the sanitized data URL, the report).
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (static_cast<int>(level) < static_cast<int>(log_level)) return;

        std::lock_guard lock(mtx_);
        std::cerr << "[" << Logger::level_to_string(level) << "][" << tag << "] " << message << std::endl;
    }

private:
    std::mutex mtx_;
};

#endif // IMGSCRUB_CONSOLE_LOG_SINK_HPP
