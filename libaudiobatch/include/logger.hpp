/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Every component of audiobatch logs through Logger, which delegates to
 * one or more registered ILogSink implementations. Worker threads log
 * concurrently, so sink dispatch is serialized.
 */

#ifndef AUDIOBATCH_LOGGER_HPP
#define AUDIOBATCH_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for audiobatch.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "audiobatch").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "audiobatch");

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
     * @brief Converts a string to its LogLevel enum representation.
     * Case-insensitive. Returns LogLevel::Error if not matched.
     * @param level The string value (e.g., "DEBUG", "warning").
     */
    static LogLevel string_to_level(std::string level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif // AUDIOBATCH_LOGGER_HPP
