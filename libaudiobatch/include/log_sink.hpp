/**
 * @file log_sink.hpp
 * @brief Severity levels and the sink interface used by Logger.
 */

#ifndef AUDIOBATCH_LOG_SINK_HPP
#define AUDIOBATCH_LOG_SINK_HPP

#include <functional>
#include <string_view>
#include <utility>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (arguments, paths, timings)
    Info,    ///< Normal operation: run phases, counts, checkpoint activity
    Warning, ///< Recoverable oddities such as a stale checkpoint
    Error    ///< Failed conversions and fatal configuration problems
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, observer
 * bridge). Logger fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "orchestrator").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

/**
 * @brief Forwards every record to a function, e.g. to capture log output.
 */
class CallbackLogSink final : public ILogSink {
public:
    using Callback = std::function<void(LogLevel, std::string_view, std::string_view)>;

    explicit CallbackLogSink(Callback callback) : callback_(std::move(callback)) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (callback_) callback_(level, message, tag);
    }

private:
    Callback callback_;
};

#endif // AUDIOBATCH_LOG_SINK_HPP
