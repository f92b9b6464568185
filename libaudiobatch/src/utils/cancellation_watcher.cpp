#include "../../include/cancellation_watcher.hpp"
#include "../../include/logger.hpp"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace audiobatch {

namespace {
constexpr int kPollIntervalMs = 100;
}

CancellationWatcher::CancellationWatcher(const int fd, const char stop_key, std::function<void()> on_stop,
                                         const std::atomic<bool>* interrupt_flag)
    : fd_(fd),
      stop_key_(static_cast<char>(std::tolower(static_cast<unsigned char>(stop_key)))),
      on_stop_(std::move(on_stop)),
      interrupt_flag_(interrupt_flag) {}

CancellationWatcher::~CancellationWatcher() {
    stop();
}

void CancellationWatcher::start() {
    if (thread_.joinable()) return;
    enter_raw_mode();
    thread_ = std::jthread([this](const std::stop_token& st) { watch_loop(st); });
    Logger::log(LogLevel::Debug, std::string("watching for '") + stop_key_ + "'", "watcher");
}

void CancellationWatcher::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    restore_mode();
}

void CancellationWatcher::trigger() {
    if (triggered_.exchange(true)) return;
    Logger::log(LogLevel::Info, "Stop requested", "watcher");
    if (on_stop_) on_stop_();
}

void CancellationWatcher::watch_loop(const std::stop_token& st) {
    bool input_open = fd_ >= 0;
    while (!st.stop_requested() && !triggered_.load()) {
        if (interrupt_flag_ && interrupt_flag_->load()) {
            trigger();
            return;
        }
        if (!input_open) {
            ::poll(nullptr, 0, kPollIntervalMs);
            continue;
        }

        pollfd pfd{fd_, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            Logger::log(LogLevel::Warning, std::string("poll failed: ") + std::strerror(errno), "watcher");
            input_open = false;
            continue;
        }
        if (rc == 0) continue;

        if (pfd.revents & (POLLIN | POLLHUP)) {
            char buf[64];
            const ssize_t n = ::read(fd_, buf, sizeof(buf));
            if (n <= 0) {
                if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
                Logger::log(LogLevel::Debug, "input closed, watching for interrupts only", "watcher");
                input_open = false;
                continue;
            }
            for (ssize_t i = 0; i < n; ++i) {
                if (std::tolower(static_cast<unsigned char>(buf[i])) == static_cast<unsigned char>(stop_key_)) {
                    trigger();
                    return;
                }
            }
        } else if (pfd.revents & (POLLERR | POLLNVAL)) {
            input_open = false;
        }
    }
}

void CancellationWatcher::enter_raw_mode() {
    if (fd_ < 0 || !::isatty(fd_) || raw_mode_) return;
    auto saved = std::make_unique<termios>();
    if (::tcgetattr(fd_, saved.get()) != 0) return;
    termios raw = *saved;
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(fd_, TCSANOW, &raw) != 0) {
        Logger::log(LogLevel::Warning, std::string("tcsetattr failed: ") + std::strerror(errno), "watcher");
        return;
    }
    saved_ = std::move(saved);
    raw_mode_ = true;
}

void CancellationWatcher::restore_mode() {
    if (!raw_mode_) return;
    if (::tcsetattr(fd_, TCSANOW, saved_.get()) != 0) {
        Logger::log(LogLevel::Warning, std::string("could not restore terminal: ") + std::strerror(errno), "watcher");
    }
    raw_mode_ = false;
}

} // namespace audiobatch
