/**
 * @file events.hpp
 * @brief Events published on the EventBus while a run progresses.
 *
 * Plain data carriers. Subscribers (progress bar, report collection, tests)
 * only observe them; nothing here can influence the run.
 */

#ifndef AUDIOBATCH_EVENTS_HPP
#define AUDIOBATCH_EVENTS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace audiobatch {

/**
 * @brief Phases of the run state machine.
 *
 * Scanning -> AwaitingConfirmation -> Running -> Completed | Cancelled.
 * Declining a detected checkpoint goes back to Scanning; declining the
 * start summary ends the run in Declined.
 */
enum class RunPhase : std::uint8_t {
    Scanning,
    AwaitingConfirmation,
    Running,
    Completed,
    Cancelled,
    Declined
};

[[nodiscard]] const char* phase_to_string(RunPhase phase) noexcept;

/**
 * @brief Emitted on every state machine transition.
 */
struct RunPhaseEvent {
    RunPhase phase;
};

/**
 * @brief Emitted when a worker starts the transcoder for a job.
 */
struct JobStartEvent {
    std::filesystem::path path; ///< Source file
};

/**
 * @brief Emitted when a job converted successfully.
 */
struct JobCompleteEvent {
    std::filesystem::path path;              ///< Source file
    std::filesystem::path destination;       ///< Written file
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a job failed; it will not be retried.
 */
struct JobErrorEvent {
    std::filesystem::path path;
    std::string error_message;
};

/**
 * @brief Emitted when a job was interrupted; it stays pending for resume.
 */
struct JobCancelledEvent {
    std::filesystem::path path;
};

/**
 * @brief Emitted after every job resolves, whatever the outcome.
 */
struct RunProgressEvent {
    std::size_t completed = 0;               ///< Jobs no longer pending (succeeded or failed)
    std::size_t total = 0;
    std::filesystem::path path;              ///< Job that just resolved
    std::chrono::milliseconds duration{0};   ///< Time spent on that job
    std::string error_message;               ///< Set if that job failed
};

} // namespace audiobatch

#endif // AUDIOBATCH_EVENTS_HPP
