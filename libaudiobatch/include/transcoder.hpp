/**
 * @file transcoder.hpp
 * @brief Interface of the component that converts one job.
 */

#ifndef AUDIOBATCH_TRANSCODER_HPP
#define AUDIOBATCH_TRANSCODER_HPP

#include "job.hpp"
#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>

namespace audiobatch {

/**
 * @brief How a single invocation ended.
 */
enum class InvocationStatus : std::uint8_t {
    Succeeded, ///< Output written, transcoder exited with 0
    Failed,    ///< Transcoder could not run or exited non-zero
    Cancelled  ///< The wait was abandoned because the run is stopping
};

/**
 * @brief Result of ITranscoder::invoke(). A cancelled invocation is not a failure:
 * the job stays pending and is retried when the run is resumed.
 */
struct InvocationResult {
    InvocationStatus status = InvocationStatus::Failed;
    std::string error; ///< Failure message, empty otherwise

    [[nodiscard]] static InvocationResult success() { return {InvocationStatus::Succeeded, {}}; }
    [[nodiscard]] static InvocationResult failure(std::string message) {
        return {InvocationStatus::Failed, std::move(message)};
    }
    [[nodiscard]] static InvocationResult cancelled() { return {InvocationStatus::Cancelled, {}}; }
};

/**
 * @brief Converts one ConversionJob.
 *
 * Implementations are shared by all workers of a run and must be safe to
 * call concurrently. invoke() never throws for per-file problems; it
 * reports them in the returned InvocationResult.
 */
class ITranscoder {
public:
    virtual ~ITranscoder() = default;

    /// @return Human-readable name of the transcoder (e.g. "ffmpeg").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @brief Converts @p job into its destination under config.output_dir.
     * @param st Fires when the run is cancelled; the wait is abandoned.
     */
    [[nodiscard]] virtual InvocationResult invoke(const ConversionJob& job,
                                                  const RunConfig& config,
                                                  const std::stop_token& st) = 0;
};

} // namespace audiobatch

#endif // AUDIOBATCH_TRANSCODER_HPP
