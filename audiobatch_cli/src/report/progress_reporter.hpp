#ifndef AUDIOBATCH_PROGRESS_REPORTER_HPP
#define AUDIOBATCH_PROGRESS_REPORTER_HPP

#include "../../../libaudiobatch/include/event_bus.hpp"
#include "../../../libaudiobatch/include/events.hpp"
#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>

/**
 * @return "mm:ss" (minutes keep growing past 59).
 */
std::string format_duration(std::chrono::milliseconds duration);

/**
 * @brief Renders one line of the progress bar, without the leading '\r'.
 */
std::string render_progress_line(std::size_t done, std::size_t total, double elapsed_seconds,
                                 std::chrono::milliseconds last, std::chrono::milliseconds average,
                                 unsigned bar_width);

/**
 * @brief Single-line progress bar redrawn after every resolved job.
 *
 * Shows percentage, done/total, elapsed seconds and the last and average
 * job durations. Handlers run under the EventBus lock, so no extra locking.
 */
class ProgressReporter {
public:
    ProgressReporter(std::ostream& out, bool enabled);

    /// Subscribes to RunProgressEvent.
    void attach(audiobatch::EventBus& bus);

    void on_progress(const audiobatch::RunProgressEvent& event);

    /// Ends the progress line.
    void finish();

    [[nodiscard]] std::chrono::milliseconds average_duration() const;

private:
    std::ostream& out_;
    bool enabled_;
    bool drawn_ = false;
    std::chrono::steady_clock::time_point start_;
    std::chrono::milliseconds total_duration_{0};
    std::size_t timed_jobs_ = 0;
};

#endif // AUDIOBATCH_PROGRESS_REPORTER_HPP
