#include "../../include/job_orchestrator.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/run_state.hpp"
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>

namespace audiobatch {

    namespace {
        // subscriber exceptions are logged here; the job's bookkeeping goes on
        template <typename Event>
        void publish_logged(EventBus &bus, const Event &event) {
            try {
                bus.publish(event);
            } catch (const std::exception &e) {
                Logger::log(LogLevel::Error, "event handler failed for " + event.path.string() + ": " + e.what(),
                            "orchestrator");
            }
        }
    } // namespace

    JobOrchestrator::JobOrchestrator(ITranscoder &transcoder, RunConfig config, EventBus &bus)
        : transcoder_(transcoder),
          config_(std::move(config)),
          event_bus_(bus),
          pool_(config_.concurrency) {
    }

    RunReport JobOrchestrator::run(const std::vector<ConversionJob> &jobs, const std::size_t already_completed) {
        const auto started = std::chrono::steady_clock::now();
        RunState state(jobs, already_completed);

        Logger::log(LogLevel::Info,
                    "Starting " + std::to_string(state.pending_count()) + " jobs with " +
                    std::to_string(pool_.size()) + " workers (" + std::string(transcoder_.get_name()) + ")",
                    "orchestrator");

        // RunState merges duplicate sources; dispatch the merged set so
        // each job is in flight at most once
        for (const auto &job : state.pending()) {
            if (stop_flag_.load(std::memory_order_relaxed)) break;
            try {
                pool_.enqueue([this, &state, job](const std::stop_token &st) {
                    if (st.stop_requested() || stop_flag_.load(std::memory_order_relaxed)) {
                        publish_logged(event_bus_, JobCancelledEvent{job.source});
                        publish_logged(event_bus_,
                                       RunProgressEvent{state.completed(), state.total(), job.source, {}, {}});
                        return;
                    }
                    publish_logged(event_bus_, JobStartEvent{job.source});

                    const auto start = std::chrono::steady_clock::now();
                    InvocationResult result;
                    try {
                        result = transcoder_.invoke(job, config_, st);
                    } catch (const std::exception &e) {
                        result = InvocationResult::failure(e.what());
                    }
                    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start);

                    switch (result.status) {
                        case InvocationStatus::Succeeded: {
                            const auto completed = state.mark_succeeded(job);
                            publish_logged(event_bus_, JobCompleteEvent{job.source,
                                                                        destination_for(job, config_.output_dir),
                                                                        duration});
                            publish_logged(event_bus_,
                                           RunProgressEvent{completed, state.total(), job.source, duration, {}});
                            break;
                        }
                        case InvocationStatus::Failed: {
                            Logger::log(LogLevel::Error, "error on " + job.source.string() + ": " + result.error,
                                        "orchestrator");
                            const auto completed = state.mark_failed(job, result.error);
                            publish_logged(event_bus_, JobErrorEvent{job.source, result.error});
                            publish_logged(event_bus_, RunProgressEvent{completed, state.total(), job.source,
                                                                        duration, result.error});
                            break;
                        }
                        case InvocationStatus::Cancelled:
                            Logger::log(LogLevel::Debug, "interrupted: " + job.source.string(), "orchestrator");
                            publish_logged(event_bus_, JobCancelledEvent{job.source});
                            publish_logged(event_bus_, RunProgressEvent{state.completed(), state.total(),
                                                                        job.source, duration, {}});
                            break;
                    }
                });
            } catch (const std::runtime_error &e) {
                // pool stopped between the flag check and the enqueue
                Logger::log(LogLevel::Debug, e.what(), "orchestrator");
                break;
            }
        }
        pool_.wait_idle();

        RunReport report;
        report.remaining = state.pending();
        report.failures = state.failures();
        report.completed = state.completed();
        report.total = state.total();
        report.cancelled = stop_flag_.load(std::memory_order_relaxed) && !report.remaining.empty();
        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        Logger::log(LogLevel::Info,
                    "Run " + std::string(report.cancelled ? "cancelled" : "finished") + ": " +
                    std::to_string(report.completed) + "/" + std::to_string(report.total) + " done, " +
                    std::to_string(report.failures.size()) + " failed",
                    "orchestrator");
        return report;
    }

    void JobOrchestrator::request_stop() {
        if (stop_flag_.exchange(true, std::memory_order_relaxed)) return;
        const auto discarded = pool_.request_stop();
        Logger::log(LogLevel::Info, "Stop requested, " + std::to_string(discarded) + " queued jobs discarded",
                    "orchestrator");
    }

} // namespace audiobatch
