#include "../../include/session.hpp"
#include "../../include/job_orchestrator.hpp"
#include "../../include/logger.hpp"
#include "../../include/quality_mapper.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace fs = std::filesystem;

namespace audiobatch {

const char* phase_to_string(const RunPhase phase) noexcept {
    switch (phase) {
        case RunPhase::Scanning: return "Scanning";
        case RunPhase::AwaitingConfirmation: return "AwaitingConfirmation";
        case RunPhase::Running: return "Running";
        case RunPhase::Completed: return "Completed";
        case RunPhase::Cancelled: return "Cancelled";
        case RunPhase::Declined: return "Declined";
    }
    return "Unknown";
}

RunConfig config_from_checkpoint(const Checkpoint& checkpoint) {
    RunConfig config;
    config.input_dir = checkpoint.input_dir;
    config.output_dir = checkpoint.output_dir;
    config.target_format = normalize_format(checkpoint.target_format);
    config.quality = checkpoint.quality;
    const unsigned limit = std::max(1U, std::thread::hardware_concurrency());
    config.concurrency = std::clamp(checkpoint.cores, 1U, limit);
    if (config.concurrency != checkpoint.cores) {
        Logger::log(LogLevel::Warning, "Checkpoint asks for " + std::to_string(checkpoint.cores) +
                    " cores, using " + std::to_string(config.concurrency), "session");
    }
    return config;
}

namespace {

bool is_stale(const Checkpoint& checkpoint, std::string& reason) {
    if (checkpoint.remaining_files.empty()) {
        reason = "no remaining files";
        return true;
    }
    if (!is_valid_transcoder_quality(checkpoint.quality)) {
        reason = "quality " + std::to_string(checkpoint.quality) + " out of range";
        return true;
    }
    std::error_code ec;
    if (!fs::is_directory(checkpoint.input_dir, ec)) {
        reason = "input directory " + checkpoint.input_dir.string() + " no longer exists";
        return true;
    }
    return false;
}

} // namespace

struct Session::Impl {
    ITranscoder& transcoder;
    CheckpointStore store;
    EventBus& eventBus;
    ScanOptions scanOptions;

    std::mutex mtx;                              ///< Guards currentOrchestrator
    JobOrchestrator* currentOrchestrator = nullptr;
    std::atomic<bool> stopRequested{false};

    Impl(ITranscoder& t, CheckpointStore s, EventBus& bus, ScanOptions options)
        : transcoder(t), store(std::move(s)), eventBus(bus), scanOptions(std::move(options)) {}

    void enter(const RunPhase phase) {
        Logger::log(LogLevel::Debug, std::string("phase ") + phase_to_string(phase), "session");
        eventBus.publish(RunPhaseEvent{phase});
    }

    // Scanning: offer the stored checkpoint, if any. Returns the accepted one.
    std::optional<Checkpoint> take_checkpoint(SessionDelegate& delegate) {
        auto checkpoint = store.load();
        if (!checkpoint) return std::nullopt;

        std::string reason;
        if (is_stale(*checkpoint, reason)) {
            Logger::log(LogLevel::Warning, "Discarding stale checkpoint (" + reason + ")", "session");
            store.remove();
            return std::nullopt;
        }

        enter(RunPhase::AwaitingConfirmation);
        if (delegate.confirm_resume(*checkpoint)) {
            Logger::log(LogLevel::Info, "Resuming checkpoint with " +
                        std::to_string(checkpoint->remaining_files.size()) + " remaining files", "session");
            return checkpoint;
        }

        Logger::log(LogLevel::Info, "Checkpoint declined, starting over", "session");
        store.remove();
        enter(RunPhase::Scanning);
        return std::nullopt;
    }
};

Session::Session(ITranscoder& transcoder, CheckpointStore store, EventBus& bus, ScanOptions scan_options)
    : impl_(std::make_unique<Impl>(transcoder, std::move(store), bus, std::move(scan_options))) {}

Session::~Session() {
    if (impl_) stop();
}

SessionResult Session::run(SessionDelegate& delegate) {
    impl_->enter(RunPhase::Scanning);

    RunSummary summary;
    std::vector<ConversionJob> jobs;

    if (const auto checkpoint = impl_->take_checkpoint(delegate)) {
        summary.config = config_from_checkpoint(*checkpoint);
        summary.resumed = true;
        jobs.reserve(checkpoint->remaining_files.size());
        for (const auto& file : checkpoint->remaining_files) {
            jobs.push_back(make_job(file, summary.config));
        }
        const auto remaining = checkpoint->remaining_files.size();
        summary.already_completed = checkpoint->total_files > remaining ? checkpoint->total_files - remaining : 0;
        summary.scan = summarize(jobs);
    } else {
        summary.config = delegate.request_config();
        summary.config.target_format = normalize_format(summary.config.target_format);
        if (summary.config.concurrency == 0) summary.config.concurrency = 1;
        jobs = scan_jobs(summary.config, impl_->scanOptions);
        summary.scan = summarize(jobs);

        if (!jobs.empty()) {
            impl_->enter(RunPhase::AwaitingConfirmation);
            if (!delegate.confirm_start(summary)) {
                Logger::log(LogLevel::Info, "Run declined", "session");
                impl_->enter(RunPhase::Declined);
                SessionResult result;
                result.phase = RunPhase::Declined;
                result.config = summary.config;
                result.total = jobs.size();
                return result;
            }
        } else {
            Logger::log(LogLevel::Info, "No supported files in " + summary.config.input_dir.string(), "session");
        }
    }

    impl_->enter(RunPhase::Running);
    JobOrchestrator orchestrator(impl_->transcoder, summary.config, impl_->eventBus);
    {
        std::lock_guard lock(impl_->mtx);
        impl_->currentOrchestrator = &orchestrator;
        if (impl_->stopRequested.load()) orchestrator.request_stop();
    }

    RunReport report;
    try {
        report = orchestrator.run(jobs, summary.already_completed);
    } catch (...) {
        std::lock_guard lock(impl_->mtx);
        impl_->currentOrchestrator = nullptr;
        throw;
    }
    {
        std::lock_guard lock(impl_->mtx);
        impl_->currentOrchestrator = nullptr;
    }

    SessionResult result;
    result.config = summary.config;
    result.completed = report.completed;
    result.total = report.total;
    result.failures = std::move(report.failures);
    result.elapsed = report.elapsed;

    if (report.cancelled) {
        Checkpoint checkpoint;
        checkpoint.input_dir = summary.config.input_dir;
        checkpoint.output_dir = summary.config.output_dir;
        checkpoint.target_format = summary.config.target_format;
        checkpoint.quality = summary.config.quality;
        checkpoint.cores = summary.config.concurrency;
        checkpoint.total_files = report.completed + report.remaining.size();
        checkpoint.remaining_files.reserve(report.remaining.size());
        for (const auto& job : report.remaining) {
            checkpoint.remaining_files.push_back(job.source);
        }
        impl_->store.save(checkpoint);
        result.phase = RunPhase::Cancelled;
        result.remaining = report.remaining.size();
    } else {
        impl_->store.remove();
        result.phase = RunPhase::Completed;
    }

    impl_->enter(result.phase);
    return result;
}

void Session::stop() {
    std::lock_guard lock(impl_->mtx);
    impl_->stopRequested.store(true);
    if (impl_->currentOrchestrator) impl_->currentOrchestrator->request_stop();
}

bool Session::stop_requested() const noexcept {
    return impl_->stopRequested.load();
}

const CheckpointStore& Session::checkpoint_store() const noexcept {
    return impl_->store;
}

} // namespace audiobatch
