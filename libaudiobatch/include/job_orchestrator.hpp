/**
 * @file job_orchestrator.hpp
 * @brief Bounded-concurrency scheduler that runs every job of a run
 * through the transcoder.
 */

#ifndef AUDIOBATCH_JOB_ORCHESTRATOR_HPP
#define AUDIOBATCH_JOB_ORCHESTRATOR_HPP

#include "event_bus.hpp"
#include "job.hpp"
#include "thread_pool.hpp"
#include "transcoder.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <vector>

namespace audiobatch {

/**
 * @brief Outcome of JobOrchestrator::run().
 */
struct RunReport {
    bool cancelled = false;                   ///< Stopped with jobs still pending
    std::size_t completed = 0;                ///< Succeeded + failed, including earlier runs
    std::size_t total = 0;
    std::vector<ConversionJob> remaining;     ///< Jobs to carry into a checkpoint
    std::vector<FailureRecord> failures;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Runs a set of ConversionJobs with at most RunConfig::concurrency
 * transcoder invocations in flight.
 *
 * @details Every job is dispatched to a ThreadPool sized to the concurrency
 * cap; each worker resolves one job at a time, so the pool size is the only
 * throttle. A failed job is recorded and the run continues. request_stop()
 * discards the jobs still queued and fires the stop token seen by the
 * running invocations; those come back Cancelled and stay pending.
 *
 * Progress is published on the EventBus from the worker threads:
 * JobStartEvent, then one of JobCompleteEvent / JobErrorEvent /
 * JobCancelledEvent, then RunProgressEvent. A job discarded from the queue
 * by request_stop() publishes nothing. A subscriber that throws is logged
 * and does not change the job's outcome.
 *
 * An orchestrator runs once. Create a new one to resume.
 */
class JobOrchestrator {
public:
    /**
     * @param transcoder Shared by all workers; must outlive the orchestrator.
     * @param config Run parameters; config.concurrency sizes the pool.
     * @param bus EventBus used to publish progress and results.
     */
    JobOrchestrator(ITranscoder& transcoder, RunConfig config, EventBus& bus);

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    /**
     * @brief Runs @p jobs to exhaustion or cancellation. Blocks until every
     * worker is idle.
     * @param already_completed Jobs finished by an earlier, interrupted run.
     */
    RunReport run(const std::vector<ConversionJob>& jobs, std::size_t already_completed = 0);

    /**
     * @brief Request the orchestrator and its thread pool to stop.
     *
     * Thread-safe and idempotent. May be called before run(), in which case
     * nothing is dispatched.
     */
    void request_stop();

    [[nodiscard]] bool is_stopped() const {
        return stop_flag_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const RunConfig& config() const noexcept { return config_; }

private:
    ITranscoder& transcoder_;
    RunConfig config_;
    EventBus& event_bus_;
    ThreadPool pool_;                        ///< One worker per concurrent invocation
    std::atomic<bool> stop_flag_{false};     ///< Flag to signal interruption
};

} // namespace audiobatch

#endif // AUDIOBATCH_JOB_ORCHESTRATOR_HPP
