/**
 * @file session.hpp
 * @brief Public entry point: one conversion run from checkpoint detection
 * to the final outcome.
 */

#ifndef AUDIOBATCH_SESSION_HPP
#define AUDIOBATCH_SESSION_HPP

#include "checkpoint_store.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "job.hpp"
#include "job_scanner.hpp"
#include "transcoder.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

namespace audiobatch {

/**
 * @brief What is about to run, shown before the start confirmation.
 */
struct RunSummary {
    RunConfig config;
    ScanSummary scan;
    bool resumed = false;
    std::size_t already_completed = 0;
};

/**
 * @brief Terminal state of a session.
 */
struct SessionResult {
    RunPhase phase = RunPhase::Completed;    ///< Completed, Cancelled or Declined
    RunConfig config;
    std::size_t completed = 0;
    std::size_t total = 0;
    std::size_t remaining = 0;               ///< Jobs saved to the checkpoint when Cancelled
    std::vector<FailureRecord> failures;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Decisions the session delegates to the user interface.
 *
 * All methods are called on the thread that called Session::run().
 */
struct SessionDelegate {
    virtual ~SessionDelegate() = default;

    /// @return true to resume @p checkpoint, false to delete it and scan afresh.
    virtual bool confirm_resume(const Checkpoint& checkpoint) = 0;

    /**
     * @brief Supplies the parameters of a fresh run.
     * @throws ConfigurationError if no valid configuration can be obtained.
     */
    virtual RunConfig request_config() = 0;

    /// @return true to start the run described by @p summary.
    virtual bool confirm_start(const RunSummary& summary) = 0;
};

/**
 * @brief Drives the run state machine.
 *
 * @details Scanning -> AwaitingConfirmation -> Running -> Completed | Cancelled.
 * A stored checkpoint is offered first; accepting it adopts its remaining
 * list without rescanning, declining it deletes the checkpoint and returns
 * to Scanning. A checkpoint with no remaining files, an out-of-range quality
 * or an input directory that is gone is deleted as stale.
 *
 * When Running ends with jobs still pending because of stop(), the
 * checkpoint is saved; any other end of Running deletes it.
 * Every transition is published as a RunPhaseEvent.
 */
class Session {
public:
    /**
     * @param transcoder Shared by all workers; must outlive the session.
     * @param store Where the checkpoint lives.
     * @param bus Receives phase, job and progress events.
     * @param scan_options Filters applied when scanning afresh.
     */
    Session(ITranscoder& transcoder, CheckpointStore store, EventBus& bus, ScanOptions scan_options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Runs the state machine to a terminal phase. Blocks.
     * @throws ConfigurationError from the delegate or the scanner.
     * @throws CheckpointError if the checkpoint cannot be read, written or deleted.
     */
    SessionResult run(SessionDelegate& delegate);

    /**
     * @brief Requests cancellation. Thread-safe and idempotent. Takes effect
     * at the next Running phase if called earlier.
     */
    void stop();

    [[nodiscard]] bool stop_requested() const noexcept;

    [[nodiscard]] const CheckpointStore& checkpoint_store() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Rebuilds the run parameters stored in a checkpoint. The core count
 * is clamped to 1..hardware threads.
 */
[[nodiscard]] RunConfig config_from_checkpoint(const Checkpoint& checkpoint);

} // namespace audiobatch

#endif // AUDIOBATCH_SESSION_HPP
