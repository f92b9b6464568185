#include "../../include/run_state.hpp"

namespace audiobatch {

    RunState::RunState(const std::vector<ConversionJob>& jobs, const std::size_t already_completed)
        : completed_(already_completed) {
        for (const auto& job : jobs) {
            pending_.emplace(job.source, job);
        }
        total_ = already_completed + pending_.size();
    }

    std::size_t RunState::mark_succeeded(const ConversionJob& job) {
        {
            std::lock_guard lock(mtx_);
            if (pending_.erase(job.source) == 0) {
                return completed();
            }
        }
        return completed_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    std::size_t RunState::mark_failed(const ConversionJob& job, std::string message) {
        {
            std::lock_guard lock(mtx_);
            if (pending_.erase(job.source) == 0) {
                return completed();
            }
            failures_.push_back(FailureRecord{job.source, std::move(message)});
        }
        return completed_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    std::size_t RunState::pending_count() const {
        std::lock_guard lock(mtx_);
        return pending_.size();
    }

    std::vector<ConversionJob> RunState::pending() const {
        std::lock_guard lock(mtx_);
        std::vector<ConversionJob> jobs;
        jobs.reserve(pending_.size());
        for (const auto& [source, job] : pending_) {
            jobs.push_back(job);
        }
        return jobs;
    }

    std::vector<FailureRecord> RunState::failures() const {
        std::lock_guard lock(mtx_);
        return failures_;
    }

} // namespace audiobatch
