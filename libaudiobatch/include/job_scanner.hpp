/**
 * @file job_scanner.hpp
 * @brief Builds the job set of a fresh run from the input directory.
 */

#ifndef AUDIOBATCH_JOB_SCANNER_HPP
#define AUDIOBATCH_JOB_SCANNER_HPP

#include "job.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace audiobatch {

/**
 * @brief Optional path filters applied on top of the extension allow-list.
 */
struct ScanOptions {
    std::vector<std::string> include_patterns; ///< If non-empty, keep only paths matching one of these regexes
    std::vector<std::string> exclude_patterns; ///< Drop paths matching any of these regexes
};

/**
 * @brief What a scan found, for the confirmation summary.
 */
struct ScanSummary {
    std::size_t file_count = 0;
    std::vector<std::string> extensions; ///< Distinct lowercase extensions, sorted
};

/**
 * @brief Recursively walks config.input_dir and returns one job per supported file.
 *
 * Supported means the extension is in kSupportedExtensions (any case).
 * Junk files (AppleDouble "._*", .DS_Store, desktop.ini) are skipped, and
 * so is anything under config.output_dir when the output tree is nested
 * inside the input tree. Jobs are sorted by source path.
 *
 * @throws ConfigurationError if the input directory does not exist.
 */
[[nodiscard]] std::vector<ConversionJob> scan_jobs(const RunConfig& config, const ScanOptions& options = {});

[[nodiscard]] ScanSummary summarize(const std::vector<ConversionJob>& jobs);

} // namespace audiobatch

#endif // AUDIOBATCH_JOB_SCANNER_HPP
