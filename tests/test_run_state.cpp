#include <catch2/catch_test_macros.hpp>

#include "run_state.hpp"

#include <thread>
#include <vector>

using namespace audiobatch;

namespace
{
std::vector<ConversionJob> make_jobs(int n)
{
    std::vector<ConversionJob> jobs;
    for (int i = 0; i < n; ++i)
    {
        ConversionJob job;
        job.source = "/in/" + std::to_string(i) + ".wav";
        job.relative = std::to_string(i) + ".wav";
        job.target_format = ".mp3";
        jobs.push_back(job);
    }
    return jobs;
}
} // namespace

TEST_CASE("run_state_counts_success_and_failure_as_completed")
{
    const auto jobs = make_jobs(3);
    RunState state(jobs);

    REQUIRE(state.total() == 3);
    REQUIRE(state.mark_succeeded(jobs[0]) == 1);
    REQUIRE(state.mark_failed(jobs[1], "boom") == 2);

    REQUIRE(state.completed() == 2);
    REQUIRE(state.pending_count() == 1);
    REQUIRE(state.pending().front().source == jobs[2].source);
    REQUIRE(state.failures().size() == 1);
    REQUIRE(state.failures().front().message == "boom");
}

TEST_CASE("run_state_resolves_each_job_once")
{
    const auto jobs = make_jobs(1);
    RunState state(jobs);

    REQUIRE(state.mark_failed(jobs[0], "first") == 1);
    REQUIRE(state.mark_failed(jobs[0], "second") == 1);
    REQUIRE(state.mark_succeeded(jobs[0]) == 1);
    REQUIRE(state.failures().size() == 1);
}

TEST_CASE("run_state_resume_offsets_total")
{
    const auto jobs = make_jobs(6);
    RunState state(jobs, 4);

    REQUIRE(state.total() == 10);
    REQUIRE(state.completed() == 4);
    for (const auto &job : jobs)
    {
        state.mark_succeeded(job);
    }
    REQUIRE(state.completed() == 10);
    REQUIRE(state.pending_count() == 0);
}

TEST_CASE("run_state_merges_duplicate_sources")
{
    auto jobs = make_jobs(2);
    jobs.push_back(jobs[0]);
    RunState state(jobs);
    REQUIRE(state.total() == 2);
}

TEST_CASE("run_state_concurrent_updates")
{
    const auto jobs = make_jobs(400);
    RunState state(jobs);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&, t] {
            for (std::size_t i = t; i < jobs.size(); i += 4)
            {
                if (i % 10 == 0)
                    state.mark_failed(jobs[i], "x");
                else
                    state.mark_succeeded(jobs[i]);
            }
        });
    }
    for (auto &th : threads)
        th.join();

    REQUIRE(state.completed() == 400);
    REQUIRE(state.pending_count() == 0);
    REQUIRE(state.failures().size() == 40);
    REQUIRE(state.completed() + state.pending_count() == state.total());
}
