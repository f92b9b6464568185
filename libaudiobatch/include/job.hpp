/**
 * @file job.hpp
 * @brief Value types describing a run and the files it converts.
 */

#ifndef AUDIOBATCH_JOB_HPP
#define AUDIOBATCH_JOB_HPP

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace audiobatch {

/**
 * @brief Extensions accepted both as scan input and as target format.
 */
inline constexpr std::array<std::string_view, 6> kSupportedExtensions{
    ".wav", ".mp3", ".m4a", ".flac", ".aac", ".ogg"
};

/**
 * @brief Parameters of one run. Fixed once the run starts; restored
 * verbatim from a checkpoint when resuming.
 */
struct RunConfig {
    std::filesystem::path input_dir;   ///< Root that was scanned
    std::filesystem::path output_dir;  ///< Root that mirrors input_dir's layout
    std::string target_format;         ///< Target extension with leading dot (".mp3")
    int quality = 0;                   ///< Transcoder quality value (already mapped)
    unsigned concurrency = 1;          ///< Maximum simultaneous invocations
};

/**
 * @brief One file slated for conversion.
 */
struct ConversionJob {
    std::filesystem::path source;    ///< Absolute path of the input file
    std::filesystem::path relative;  ///< source relative to the input root
    std::string target_format;       ///< Target extension with leading dot
    int quality = 0;                 ///< Transcoder quality value
};

/**
 * @brief A job whose invocation failed, with the transcoder's message.
 */
struct FailureRecord {
    std::filesystem::path path;
    std::string message;
};

/**
 * @brief Trims and lowercases a format and prepends the dot if missing (" FLAC" -> ".flac").
 */
[[nodiscard]] std::string normalize_format(std::string_view format);

/**
 * @return true if the extension or format name (dot optional, any case) is in kSupportedExtensions.
 */
[[nodiscard]] bool is_supported_extension(std::string_view extension);

/**
 * @brief Builds the job for @p source under the given run configuration.
 *
 * The relative part is computed against config.input_dir so the output
 * tree mirrors the input tree.
 */
[[nodiscard]] ConversionJob make_job(const std::filesystem::path& source, const RunConfig& config);

/**
 * @brief Destination of a job: the relative directory mirrored under
 * @p output_dir, file stem kept, extension replaced by the target format.
 */
[[nodiscard]] std::filesystem::path destination_for(const ConversionJob& job,
                                                    const std::filesystem::path& output_dir);

} // namespace audiobatch

#endif // AUDIOBATCH_JOB_HPP
