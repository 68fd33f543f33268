//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef IMGSCRUB_FILE_LOG_SINK_HPP
#define IMGSCRUB_FILE_LOG_SINK_HPP

#include "../../../libimgscrub/include/log_sink.hpp"
#include "../../../libimgscrub/include/logger.hpp"
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

/**
 * @brief Appends one timestamped line per message to a log file.
 *
 * Line format: `2025-12-10T08:15:02Z [INFO][sanitizer] message`.
 */
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        const std::time_t now = std::time(nullptr);
        std::tm tm{};
#ifdef _WIN32
        gmtime_s(&tm, &now);
#else
        gmtime_r(&now, &tm);
#endif
        char stamp[24];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);

        std::lock_guard lock(mtx_);
        out_ << stamp << " [" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << '\n';
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // IMGSCRUB_FILE_LOG_SINK_HPP
