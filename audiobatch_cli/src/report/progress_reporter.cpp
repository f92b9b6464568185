#include "progress_reporter.hpp"
#include "report_generator.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

std::string format_duration(const std::chrono::milliseconds duration) {
    const auto total_seconds = std::max<long long>(0, std::chrono::duration_cast<std::chrono::seconds>(duration).count());
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << total_seconds / 60 << ":" << std::setw(2) << total_seconds % 60;
    return oss.str();
}

std::string render_progress_line(const std::size_t done, const std::size_t total, const double elapsed_seconds,
                                 const std::chrono::milliseconds last, const std::chrono::milliseconds average,
                                 const unsigned bar_width) {
    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (done > 0 ? 1.0 : 0.0);
    const auto pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }
    if (done == total) {
        percent = 100.0;
    }

    std::ostringstream oss;
    oss << "[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) oss << "=";
        else if (i == pos && done < total) oss << ">";
        else if (i == pos && done == total) oss << "=";
        else oss << " ";
    }
    oss << "] "
        << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
        << " (" << done << "/" << total << ")"
        << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
        << " | Last " << format_duration(last) << " | Avg " << format_duration(average);
    return oss.str();
}

ProgressReporter::ProgressReporter(std::ostream& out, const bool enabled)
    : out_(out), enabled_(enabled), start_(std::chrono::steady_clock::now()) {}

void ProgressReporter::attach(audiobatch::EventBus& bus) {
    bus.subscribe<audiobatch::RunProgressEvent>([this](const audiobatch::RunProgressEvent& e) {
        on_progress(e);
    });
}

void ProgressReporter::on_progress(const audiobatch::RunProgressEvent& event) {
    if (event.duration.count() > 0) {
        total_duration_ += event.duration;
        ++timed_jobs_;
    }
    if (!enabled_) return;

    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 70u ? term_width - 70u : 10u);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();

    out_ << "\r" << render_progress_line(event.completed, event.total, elapsed, event.duration,
                                         average_duration(), bar_width)
         << std::flush;
    drawn_ = true;
}

void ProgressReporter::finish() {
    if (enabled_ && drawn_) {
        out_ << std::endl;
        drawn_ = false;
    }
}

std::chrono::milliseconds ProgressReporter::average_duration() const {
    if (timed_jobs_ == 0) return std::chrono::milliseconds{0};
    return total_duration_ / static_cast<long long>(timed_jobs_);
}
