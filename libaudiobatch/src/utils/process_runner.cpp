#include "../../include/process_runner.hpp"
#include "../../include/logger.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

    constexpr int kPollIntervalMs = 100;
    constexpr auto kReapInterval = std::chrono::milliseconds(20);
    constexpr auto kTerminateGrace = std::chrono::seconds(3);

    // closes the descriptor when the scope ends
    class FdGuard {
    public:
        explicit FdGuard(const int fd = -1) : fd_(fd) {}
        ~FdGuard() { reset(); }
        FdGuard(const FdGuard&) = delete;
        FdGuard& operator=(const FdGuard&) = delete;

        [[nodiscard]] int get() const noexcept { return fd_; }
        [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

        void reset() noexcept {
            if (fd_ >= 0) {
                ::close(fd_);
                fd_ = -1;
            }
        }

    private:
        int fd_;
    };

    std::string errno_text(const int err) {
        return std::strerror(err);
    }

    int decode_status(const int status) {
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    // non-blocking read of whatever is in the pipe; false once the writer side is closed
    bool drain(const int fd, std::string& out) {
        char buffer[4096];
        for (;;) {
            const ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                out.append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0) return false;
            if (errno == EINTR) continue;
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }

    void terminate_child(const pid_t pid) {
        int status = 0;
        ::kill(pid, SIGTERM);
        const auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
        while (std::chrono::steady_clock::now() < deadline) {
            const pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid || (r < 0 && errno != EINTR)) return;
            std::this_thread::sleep_for(kReapInterval);
        }
        Logger::log(LogLevel::Warning, "Child " + std::to_string(pid) + " ignored SIGTERM, killing it", "process");
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

} // namespace

namespace audiobatch {

    ProcessResult run_process(const std::filesystem::path& executable,
                              const std::vector<std::string>& args,
                              const std::stop_token& st) {
        ProcessResult result;

        int pipefd[2];
        if (::pipe2(pipefd, O_CLOEXEC) != 0) {
            result.spawn_failed = true;
            result.diagnostics = "cannot create pipe: " + errno_text(errno);
            return result;
        }
        FdGuard read_end(pipefd[0]);
        FdGuard write_end(pipefd[1]);
        ::fcntl(read_end.get(), F_SETFL, ::fcntl(read_end.get(), F_GETFL) | O_NONBLOCK);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_adddup2(&actions, write_end.get(), STDERR_FILENO);

        std::string program = executable.string();
        std::vector<std::string> storage(args);
        std::vector<char*> argv;
        argv.reserve(storage.size() + 2);
        argv.push_back(program.data());
        for (auto& a : storage) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        // own process group: a Ctrl-C on the terminal reaches us, not the child
        posix_spawnattr_t attr;
        posix_spawnattr_init(&attr);
        posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
        posix_spawnattr_setpgroup(&attr, 0);

        pid_t pid = 0;
        const int rc = ::posix_spawn(&pid, program.c_str(), &actions, &attr, argv.data(), environ);
        posix_spawnattr_destroy(&attr);
        posix_spawn_file_actions_destroy(&actions);
        write_end.reset();

        if (rc != 0) {
            result.spawn_failed = true;
            result.diagnostics = errno_text(rc);
            return result;
        }
        Logger::log(LogLevel::Debug, "Started " + program + " (pid " + std::to_string(pid) + ")", "process");

        int status = 0;
        for (;;) {
            if (st.stop_requested()) {
                terminate_child(pid);
                result.cancelled = true;
                return result;
            }

            if (read_end.valid()) {
                pollfd pfd{read_end.get(), POLLIN, 0};
                const int ready = ::poll(&pfd, 1, kPollIntervalMs);
                if (ready > 0 && !drain(read_end.get(), result.diagnostics)) {
                    read_end.reset();
                } else if (ready < 0 && errno != EINTR) {
                    Logger::log(LogLevel::Warning, "poll failed: " + errno_text(errno), "process");
                    read_end.reset();
                }
            } else {
                std::this_thread::sleep_for(kReapInterval);
            }

            const pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                break;
            }
            if (r < 0 && errno != EINTR) {
                result.diagnostics += "waitpid failed: " + errno_text(errno);
                return result;
            }
        }

        // the child is gone; pick up what it wrote just before exiting
        if (read_end.valid()) {
            drain(read_end.get(), result.diagnostics);
        }
        result.exit_code = decode_status(status);
        if (result.exit_code != 0 && st.stop_requested()) {
            // exited while the run was stopping; retry it on resume
            result.cancelled = true;
        }
        return result;
    }

} // namespace audiobatch
