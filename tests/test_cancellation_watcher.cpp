#include <catch2/catch_test_macros.hpp>

#include "cancellation_watcher.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <unistd.h>

using namespace audiobatch;
using namespace std::chrono_literals;

namespace
{
// both ends closed on destruction
struct Pipe
{
    int fds[2] = {-1, -1};

    Pipe()
    {
        REQUIRE(::pipe(fds) == 0);
    }

    ~Pipe()
    {
        close_write();
        if (fds[0] >= 0)
            ::close(fds[0]);
    }

    void send(const char *text) const
    {
        const auto len = std::char_traits<char>::length(text);
        REQUIRE(::write(fds[1], text, len) == static_cast<ssize_t>(len));
    }

    void close_write()
    {
        if (fds[1] >= 0)
            ::close(fds[1]);
        fds[1] = -1;
    }
};

template <typename Pred> bool wait_until(Pred pred, std::chrono::milliseconds timeout = 3s)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}
} // namespace

TEST_CASE("watcher_stop_key_fires_once")
{
    Pipe pipe;
    std::atomic<int> fired{0};
    CancellationWatcher watcher(pipe.fds[0], 'q', [&] { ++fired; });
    watcher.start();

    pipe.send("Q");
    REQUIRE(wait_until([&] { return fired.load() == 1; }));

    pipe.send("qqq");
    watcher.trigger();
    std::this_thread::sleep_for(50ms);
    watcher.stop();

    REQUIRE(fired == 1);
    REQUIRE(watcher.triggered());
}

TEST_CASE("watcher_ignores_other_keys")
{
    Pipe pipe;
    std::atomic<int> fired{0};
    CancellationWatcher watcher(pipe.fds[0], 'q', [&] { ++fired; });
    watcher.start();

    pipe.send("abc\n xyz");
    std::this_thread::sleep_for(250ms);
    REQUIRE(fired == 0);

    pipe.send("1q");
    REQUIRE(wait_until([&] { return fired.load() == 1; }));
}

TEST_CASE("watcher_custom_key_is_case_insensitive")
{
    Pipe pipe;
    std::atomic<int> fired{0};
    CancellationWatcher watcher(pipe.fds[0], 'S', [&] { ++fired; });
    watcher.start();

    pipe.send("q");
    std::this_thread::sleep_for(150ms);
    REQUIRE(fired == 0);

    pipe.send("s");
    REQUIRE(wait_until([&] { return fired.load() == 1; }));
}

TEST_CASE("watcher_interrupt_flag_fires")
{
    std::atomic<bool> interrupted{false};
    std::atomic<int> fired{0};
    CancellationWatcher watcher(-1, 'q', [&] { ++fired; }, &interrupted);
    watcher.start();

    std::this_thread::sleep_for(150ms);
    REQUIRE(fired == 0);

    interrupted = true;
    REQUIRE(wait_until([&] { return fired.load() == 1; }));
}

TEST_CASE("watcher_keeps_watching_flag_after_end_of_input")
{
    Pipe pipe;
    std::atomic<bool> interrupted{false};
    std::atomic<int> fired{0};
    CancellationWatcher watcher(pipe.fds[0], 'q', [&] { ++fired; }, &interrupted);
    watcher.start();

    pipe.close_write();
    std::this_thread::sleep_for(250ms);
    REQUIRE(fired == 0);

    interrupted = true;
    REQUIRE(wait_until([&] { return fired.load() == 1; }));
}

TEST_CASE("watcher_trigger_is_idempotent")
{
    std::atomic<int> fired{0};
    CancellationWatcher watcher(-1, 'q', [&] { ++fired; });

    REQUIRE_FALSE(watcher.triggered());
    watcher.trigger();
    watcher.trigger();
    REQUIRE(fired == 1);
    REQUIRE(watcher.triggered());
}

TEST_CASE("watcher_stop_without_trigger_does_not_fire")
{
    Pipe pipe;
    std::atomic<int> fired{0};
    {
        CancellationWatcher watcher(pipe.fds[0], 'q', [&] { ++fired; });
        watcher.start();
        watcher.start();
        std::this_thread::sleep_for(50ms);
        watcher.stop();
        watcher.stop();
    }
    REQUIRE(fired == 0);
}
