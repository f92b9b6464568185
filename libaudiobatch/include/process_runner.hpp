/**
 * @file process_runner.hpp
 * @brief Runs one external program and collects its diagnostic output.
 */

#ifndef AUDIOBATCH_PROCESS_RUNNER_HPP
#define AUDIOBATCH_PROCESS_RUNNER_HPP

#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

namespace audiobatch {

/**
 * @brief Outcome of run_process().
 */
struct ProcessResult {
    int exit_code = -1;        ///< Exit status; 128 + signal number if the child was killed by a signal
    std::string diagnostics;   ///< Everything the child wrote to stderr
    bool cancelled = false;    ///< The stop token fired before the child exited
    bool spawn_failed = false; ///< The child never started; diagnostics holds the OS error
};

/**
 * @brief Starts @p executable with @p args and waits for it to exit.
 *
 * @details The child runs in a process group of its own, so terminal
 * signals such as Ctrl-C reach only the caller, which decides whether to
 * stop it. stdin and stdout of the child are bound to /dev/null and stderr is
 * a pipe that is drained while waiting, so a chatty child can never block
 * on a full pipe buffer. The stop token is checked on every poll tick; when
 * it fires the child is sent SIGTERM (SIGKILL if it lingers), reaped, and
 * the result is marked cancelled. A non-zero exit observed after the token
 * fired is also reported as cancelled.
 *
 * There is no timeout: a child that never exits keeps the caller waiting
 * until it is cancelled.
 *
 * @param executable Path of the program (not searched in PATH).
 * @param args Arguments, without argv[0].
 * @param st Cancellation token.
 */
[[nodiscard]] ProcessResult run_process(const std::filesystem::path& executable,
                                        const std::vector<std::string>& args,
                                        const std::stop_token& st);

} // namespace audiobatch

#endif // AUDIOBATCH_PROCESS_RUNNER_HPP
