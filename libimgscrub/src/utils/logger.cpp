//
// Created by Giuseppe Francione on 20/10/25.
//

#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;
std::atomic<LogLevel> Logger::min_level_{LogLevel::Debug};

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::set_min_level(const LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::min_level() noexcept {
    return min_level_.load(std::memory_order_relaxed);
}

bool Logger::enabled(const LogLevel level) {
    if (static_cast<int>(level) < static_cast<int>(min_level())) return false;
    std::lock_guard lock(mtx_);
    return !sinks_.empty();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (static_cast<int>(level) < static_cast<int>(min_level())) return;

    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

LogLevel Logger::string_to_level(std::string level) {
    std::ranges::transform(level, level.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (level == "DEBUG") return LogLevel::Debug;
    if (level == "INFO") return LogLevel::Info;
    if (level == "WARNING" || level == "WARN") return LogLevel::Warning;
    return LogLevel::Error;
}
