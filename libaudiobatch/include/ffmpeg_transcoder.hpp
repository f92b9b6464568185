/**
 * @file ffmpeg_transcoder.hpp
 * @brief ITranscoder backed by an external ffmpeg executable.
 */

#ifndef AUDIOBATCH_FFMPEG_TRANSCODER_HPP
#define AUDIOBATCH_FFMPEG_TRANSCODER_HPP

#include "transcoder.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace audiobatch {

/**
 * @brief Runs one ffmpeg process per job.
 *
 * @details Each process is started quiet (no banner, errors only), without
 * stdin interaction, overwriting existing output, dropping video/cover
 * streams, with the job's -q:a value and a single internal thread. The
 * worker pool is the only parallelism knob; letting every ffmpeg spawn its
 * own threads on top of it slows large batches down badly.
 */
class FfmpegTranscoder final : public ITranscoder {
public:
    /// Internal thread count handed to every ffmpeg process.
    static constexpr int kThreadsPerProcess = 1;

    /**
     * @param executable Resolved path of the ffmpeg binary.
     * @throws ConfigurationError if @p executable is not an existing regular file.
     */
    explicit FfmpegTranscoder(std::filesystem::path executable);

    [[nodiscard]] std::string_view get_name() const noexcept override { return "ffmpeg"; }

    [[nodiscard]] InvocationResult invoke(const ConversionJob& job,
                                          const RunConfig& config,
                                          const std::stop_token& st) override;

    [[nodiscard]] const std::filesystem::path& executable() const noexcept { return executable_; }

    /**
     * @brief Command line (without argv[0]) used to convert @p source into @p destination.
     */
    [[nodiscard]] static std::vector<std::string> build_arguments(const std::filesystem::path& source,
                                                                  const std::filesystem::path& destination,
                                                                  int quality);

private:
    std::filesystem::path executable_;
};

} // namespace audiobatch

#endif // AUDIOBATCH_FFMPEG_TRANSCODER_HPP
