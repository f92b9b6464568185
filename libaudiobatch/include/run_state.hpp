/**
 * @file run_state.hpp
 * @brief Mutable bookkeeping of one orchestrator run.
 */

#ifndef AUDIOBATCH_RUN_STATE_HPP
#define AUDIOBATCH_RUN_STATE_HPP

#include "job.hpp"
#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

namespace audiobatch {

/**
 * @brief Counters, pending set and failure list shared by the workers of a run.
 *
 * @details The completed counter is the only value every worker touches and
 * is a lock-free atomic. The pending set and the failure list share one
 * mutex, taken once per resolved job and never while a transcoder runs.
 *
 * Once every worker has drained, completed() + pending_count() == total().
 * A job leaves the pending set when its invocation succeeds or fails; jobs
 * interrupted by cancellation stay pending so a resumed run retries them.
 */
class RunState {
public:
    /**
     * @param jobs Jobs still to convert. Duplicate sources are merged.
     * @param already_completed Jobs finished by earlier runs (non-zero when
     * resuming), counted in both completed() and total().
     */
    explicit RunState(const std::vector<ConversionJob>& jobs, std::size_t already_completed = 0);

    RunState(const RunState&) = delete;
    RunState& operator=(const RunState&) = delete;

    /// @return The completed count after this job was counted.
    std::size_t mark_succeeded(const ConversionJob& job);

    /// @return The completed count after this job was counted.
    std::size_t mark_failed(const ConversionJob& job, std::string message);

    [[nodiscard]] std::size_t completed() const noexcept {
        return completed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::size_t total() const noexcept { return total_; }

    [[nodiscard]] std::size_t pending_count() const;

    /// @return Snapshot of the jobs not yet resolved, ordered by source path.
    [[nodiscard]] std::vector<ConversionJob> pending() const;

    /// @return Snapshot of the failures in the order they were recorded.
    [[nodiscard]] std::vector<FailureRecord> failures() const;

private:
    std::size_t total_ = 0;
    std::atomic<std::size_t> completed_{0};
    mutable std::mutex mtx_;                            ///< Guards pending_ and failures_
    std::map<std::filesystem::path, ConversionJob> pending_;
    std::vector<FailureRecord> failures_;
};

} // namespace audiobatch

#endif // AUDIOBATCH_RUN_STATE_HPP
