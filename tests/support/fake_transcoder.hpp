#ifndef AUDIOBATCH_TESTS_FAKE_TRANSCODER_HPP
#define AUDIOBATCH_TESTS_FAKE_TRANSCODER_HPP

#include "transcoder.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace test_support {

// In-process transcoder with scripted outcomes. Records which jobs ran and
// the largest number of simultaneous invocations.
class FakeTranscoder final : public audiobatch::ITranscoder {
public:
    std::chrono::milliseconds work_time{5};
    std::set<std::string> failing_names;           ///< Source file names that fail
    std::function<void(const audiobatch::ConversionJob&)> on_finish; ///< Called after each non-cancelled invocation

    [[nodiscard]] std::string_view get_name() const noexcept override { return "fake"; }

    [[nodiscard]] audiobatch::InvocationResult invoke(const audiobatch::ConversionJob& job,
                                                      const audiobatch::RunConfig&,
                                                      const std::stop_token& st) override {
        const int now = ++in_flight_;
        int seen = max_in_flight_.load();
        while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {}
        ++calls_;

        const auto deadline = std::chrono::steady_clock::now() + work_time;
        bool cancelled = false;
        while (std::chrono::steady_clock::now() < deadline) {
            if (st.stop_requested()) {
                cancelled = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        --in_flight_;

        if (cancelled) return audiobatch::InvocationResult::cancelled();

        {
            std::lock_guard lock(mtx_);
            invoked_.insert(job.source.filename().string());
        }
        audiobatch::InvocationResult result = failing_names.contains(job.source.filename().string())
            ? audiobatch::InvocationResult::failure("ffmpeg exited with code 1")
            : audiobatch::InvocationResult::success();
        if (on_finish) on_finish(job);
        return result;
    }

    [[nodiscard]] int max_in_flight() const { return max_in_flight_.load(); }
    [[nodiscard]] int calls() const { return calls_.load(); }

    [[nodiscard]] std::set<std::string> invoked() const {
        std::lock_guard lock(mtx_);
        return invoked_;
    }

private:
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
    std::atomic<int> calls_{0};
    mutable std::mutex mtx_;
    std::set<std::string> invoked_;
};

} // namespace test_support

#endif // AUDIOBATCH_TESTS_FAKE_TRANSCODER_HPP
