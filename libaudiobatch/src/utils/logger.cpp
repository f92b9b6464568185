#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink) {
            sink->log(level, msg, tag);
        }
    }
}

LogLevel Logger::string_to_level(std::string level) {
    std::ranges::transform(level, level.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (level == "DEBUG")
        return LogLevel::Debug;
    if (level == "INFO")
        return LogLevel::Info;
    if (level == "WARNING" || level == "WARN")
        return LogLevel::Warning;
    return LogLevel::Error;
}
