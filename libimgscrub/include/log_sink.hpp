//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef IMGSCRUB_LOG_SINK_HPP
#define IMGSCRUB_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from the most verbose to the most severe, so sinks can filter
 * with a simple comparison against a threshold.
 */
enum class LogLevel {
    Debug,   ///< Pipeline internals (stage timings, chunk names, dimensions)
    Info,    ///< One line per completed sanitize/persist operation
    Warning, ///< Best-effort steps that failed (timestamp/permission reset, cleanup)
    Error    ///< Failures that abort the current operation
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a message ends up (console, file, a test
 * capture buffer). The Logger delegates to every installed sink.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "png_codec").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // IMGSCRUB_LOG_SINK_HPP
