#include "../../include/ffmpeg_transcoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"

namespace fs = std::filesystem;

namespace audiobatch {

    FfmpegTranscoder::FfmpegTranscoder(fs::path executable) : executable_(std::move(executable)) {
        std::error_code ec;
        if (!fs::is_regular_file(executable_, ec)) {
            throw ConfigurationError("ffmpeg executable not found: " + executable_.string());
        }
    }

    std::vector<std::string> FfmpegTranscoder::build_arguments(const fs::path& source,
                                                               const fs::path& destination,
                                                               const int quality) {
        return {
            "-hide_banner",
            "-loglevel", "error",
            "-nostdin",
            "-y",
            "-i", source.string(),
            "-vn",
            "-q:a", std::to_string(quality),
            "-threads", std::to_string(kThreadsPerProcess),
            destination.string()
        };
    }

    InvocationResult FfmpegTranscoder::invoke(const ConversionJob& job,
                                              const RunConfig& config,
                                              const std::stop_token& st) {
        const fs::path destination = destination_for(job, config.output_dir);

        std::error_code ec;
        if (!ensure_directory(destination.parent_path(), ec)) {
            return InvocationResult::failure("cannot create output directory " +
                                             destination.parent_path().string() + ": " + ec.message());
        }

        if (st.stop_requested()) {
            return InvocationResult::cancelled();
        }

        Logger::log(LogLevel::Debug, job.source.string() + " -> " + destination.string(), "ffmpeg");
        const auto proc = run_process(executable_, build_arguments(job.source, destination, job.quality), st);

        if (proc.cancelled) {
            Logger::log(LogLevel::Debug, "Interrupted: " + job.source.string(), "ffmpeg");
            return InvocationResult::cancelled();
        }
        if (proc.spawn_failed) {
            return InvocationResult::failure("failed to start " + executable_.string() + ": " + proc.diagnostics);
        }
        if (proc.exit_code != 0) {
            std::string message = trim_copy(proc.diagnostics);
            if (message.empty()) {
                message = "ffmpeg exited with code " + std::to_string(proc.exit_code);
            }
            return InvocationResult::failure(std::move(message));
        }
        return InvocationResult::success();
    }

} // namespace audiobatch
