/**
 * @file errors.hpp
 * @brief Exception types for fatal audiobatch conditions.
 *
 * Per-file conversion problems are never thrown; they travel as
 * InvocationResult values and end up as FailureRecord entries.
 */

#ifndef AUDIOBATCH_ERRORS_HPP
#define AUDIOBATCH_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace audiobatch {

/**
 * @brief Raised before any job runs when the run cannot be set up
 * (missing input directory, unusable transcoder, invalid parameters).
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised when the checkpoint file cannot be written, read or parsed.
 */
class CheckpointError : public std::runtime_error {
public:
    CheckpointError(const std::string& what, std::filesystem::path path)
        : std::runtime_error(what + ": " + path.string()), path_(std::move(path)) {}

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace audiobatch

#endif // AUDIOBATCH_ERRORS_HPP
