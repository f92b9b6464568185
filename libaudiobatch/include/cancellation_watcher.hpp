/**
 * @file cancellation_watcher.hpp
 * @brief Background listener that turns a key press or an interrupt signal
 * into a single stop request.
 */

#ifndef AUDIOBATCH_CANCELLATION_WATCHER_HPP
#define AUDIOBATCH_CANCELLATION_WATCHER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

struct termios;

namespace audiobatch {

/**
 * @brief Watches a file descriptor for the stop key and an optional flag set
 * by a signal handler. Calls on_stop exactly once, from the watcher thread or
 * from trigger(), then stops listening.
 *
 * @details If @p fd is a terminal it is switched to non-canonical, no-echo
 * mode while watching so a single key press is seen without Enter; the
 * previous mode is restored by stop(). At end of input only the flag is
 * watched. The watcher knows nothing about what it stops.
 */
class CancellationWatcher {
public:
    /**
     * @param fd Descriptor to read keys from (usually STDIN_FILENO); -1 to watch only the flag.
     * @param stop_key Key that requests the stop; matched case-insensitively.
     * @param on_stop Called once when the stop fires.
     * @param interrupt_flag Optional flag polled alongside the descriptor.
     */
    CancellationWatcher(int fd, char stop_key, std::function<void()> on_stop,
                        const std::atomic<bool>* interrupt_flag = nullptr);
    ~CancellationWatcher();

    CancellationWatcher(const CancellationWatcher&) = delete;
    CancellationWatcher& operator=(const CancellationWatcher&) = delete;

    /// Starts the listening thread. Calling it twice has no effect.
    void start();

    /// Stops listening and restores the terminal. Does not fire on_stop.
    void stop();

    /// Fires on_stop unless it already fired.
    void trigger();

    [[nodiscard]] bool triggered() const noexcept { return triggered_.load(); }

private:
    void watch_loop(const std::stop_token& st);
    void enter_raw_mode();
    void restore_mode();

    int fd_;
    char stop_key_;
    std::function<void()> on_stop_;
    const std::atomic<bool>* interrupt_flag_;
    std::atomic<bool> triggered_{false};
    bool raw_mode_ = false;
    std::unique_ptr<termios> saved_;    ///< Terminal attributes to restore
    std::jthread thread_;
};

} // namespace audiobatch

#endif // AUDIOBATCH_CANCELLATION_WATCHER_HPP
