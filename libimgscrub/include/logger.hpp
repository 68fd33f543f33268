//
// Created by Giuseppe Francione on 20/10/25.
//

/**
 * @file logger.hpp
 * @brief Process-wide log dispatcher shared by the pipeline stages.
 */

#ifndef IMGSCRUB_LOGGER_HPP
#define IMGSCRUB_LOGGER_HPP

#include "log_sink.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for imgscrub.
 *
 * Messages below the global threshold (set_min_level) are dropped before
 * any sink is visited; the rest go to every registered sink, each of which
 * may filter further. The library registers no sink itself, so a process
 * that never calls add_sink logs nothing.
 */
class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership; null is ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Drop every registered sink.
    static void clear_sinks();

    /// @brief Global threshold, LogLevel::Debug by default.
    static void set_min_level(LogLevel level) noexcept;
    static LogLevel min_level() noexcept;

    /// @return true if a message at @p level would reach at least one sink.
    static bool enabled(LogLevel level);

    /**
     * @brief Dispatch a message.
     * @param level Severity level.
     * @param msg Message text. Never file contents, at most a basename.
     * @param tag Component tag, e.g. "png_codec" or "output_anonymizer".
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "imgscrub");

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
     * @brief Parses a level name, ignoring case. "WARN" and "WARNING" both map
     * to Warning; anything unknown maps to Error.
     */
    static LogLevel string_to_level(std::string level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
    static std::atomic<LogLevel> min_level_;
};

#endif //IMGSCRUB_LOGGER_HPP
