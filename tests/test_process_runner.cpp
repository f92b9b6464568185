#include <catch2/catch_test_macros.hpp>

#include "process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <string>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

using namespace audiobatch;

namespace
{
volatile std::sig_atomic_t interrupt_seen = 0;

void on_interrupt(int)
{
    interrupt_seen = 1;
}
} // namespace

TEST_CASE("process_runner_reports_exit_code_and_stderr")
{
    std::stop_source source;
    const auto result = run_process("/bin/sh", {"-c", "echo out; echo 'bad input' 1>&2; exit 3"}, source.get_token());

    REQUIRE_FALSE(result.cancelled);
    REQUIRE_FALSE(result.spawn_failed);
    REQUIRE(result.exit_code == 3);
    REQUIRE(result.diagnostics == "bad input\n");
}

TEST_CASE("process_runner_success")
{
    std::stop_source source;
    const auto result = run_process("/bin/sh", {"-c", "exit 0"}, source.get_token());
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.diagnostics.empty());
}

TEST_CASE("process_runner_passes_arguments_verbatim")
{
    std::stop_source source;
    const auto result = run_process("/bin/sh", {"-c", "printf '%s|' \"$@\" 1>&2", "sh", "a b", "\"q\"", ""},
                                    source.get_token());
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.diagnostics == "a b|\"q\"||");
}

TEST_CASE("process_runner_drains_large_stderr")
{
    std::stop_source source;
    const auto result = run_process(
        "/bin/sh", {"-c", "i=0; while [ $i -lt 2000 ]; do printf '%0100d' 0 1>&2; i=$((i+1)); done; exit 1"},
        source.get_token());
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.diagnostics.size() == 200000);
}

TEST_CASE("process_runner_missing_executable")
{
    std::stop_source source;
    const auto result = run_process("/nonexistent/ffmpeg", {"-version"}, source.get_token());
    REQUIRE(result.spawn_failed);
    REQUIRE_FALSE(result.diagnostics.empty());
    REQUIRE(result.exit_code != 0);
}

TEST_CASE("process_runner_signal_maps_to_128_plus_signal")
{
    std::stop_source source;
    const auto result = run_process("/bin/sh", {"-c", "kill -9 $$"}, source.get_token());
    REQUIRE(result.exit_code == 128 + 9);
}

TEST_CASE("process_runner_cancel_terminates_child")
{
    std::stop_source source;
    const auto start = std::chrono::steady_clock::now();
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        source.request_stop();
    });

    const auto result = run_process("/bin/sh", {"-c", "sleep 10"}, source.get_token());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.cancelled);
    REQUIRE(elapsed < std::chrono::seconds(6));
}

TEST_CASE("process_runner_already_cancelled_token")
{
    std::stop_source source;
    source.request_stop();
    const auto result = run_process("/bin/sh", {"-c", "sleep 10"}, source.get_token());
    REQUIRE(result.cancelled);
}

TEST_CASE("process_runner_child_has_its_own_process_group")
{
    std::stop_source source;
    const auto result = run_process(
        "/bin/sh", {"-c", "read -r _ _ _ _ pgrp _ < /proc/$$/stat; [ \"$pgrp\" = \"$$\" ] || exit 1; printf '%s' \"$pgrp\" 1>&2"},
        source.get_token());

    REQUIRE(result.exit_code == 0);
    REQUIRE_FALSE(result.diagnostics.empty());
    REQUIRE(result.diagnostics != std::to_string(::getpgrp()));
}

TEST_CASE("process_runner_terminal_interrupt_does_not_reach_child")
{
    // the forked copy leads a process group of its own, so the interrupt
    // sent to "our" group cannot reach the test runner
    const pid_t tester = ::fork();
    REQUIRE(tester >= 0);
    if (tester == 0)
    {
        ::setpgid(0, 0);
        struct sigaction sa{};
        sa.sa_handler = on_interrupt;
        sigemptyset(&sa.sa_mask);
        ::sigaction(SIGINT, &sa, nullptr);

        std::stop_source source;
        ProcessResult result;
        {
            std::jthread ctrl_c([] {
                std::this_thread::sleep_for(std::chrono::milliseconds(300));
                ::kill(0, SIGINT);
            });
            // behaves like ffmpeg: an interrupt ends it with 255
            result = run_process("/bin/sh",
                                 {"-c", "trap 'exit 255' INT; i=0; while [ $i -lt 10 ]; do sleep 0.1; i=$((i+1)); done"},
                                 source.get_token());
        }
        const bool ok = interrupt_seen == 1 && !result.cancelled && result.exit_code == 0;
        ::_exit(ok ? 0 : 1);
    }

    int status = 0;
    while (::waitpid(tester, &status, 0) < 0 && errno == EINTR)
    {
    }
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);
}
