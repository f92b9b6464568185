#ifndef AUDIOBATCH_CONSOLE_LOG_SINK_HPP
#define AUDIOBATCH_CONSOLE_LOG_SINK_HPP

#include "../../../libaudiobatch/include/log_sink.hpp"
#include "../../../libaudiobatch/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

// writes to stderr so log lines never mix with prompts on stdout
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error; ///< Minimum level printed

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (static_cast<int>(level) < static_cast<int>(log_level)) return;

        std::lock_guard lock(mtx_);
        const char* color = level == LogLevel::Error ? RED
                          : level == LogLevel::Warning ? YELLOW
                          : "";
        std::cerr << "\n" << color << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message << (*color ? RESET : "") << std::endl;
    }

private:
    std::mutex mtx_;
};

#endif // AUDIOBATCH_CONSOLE_LOG_SINK_HPP
