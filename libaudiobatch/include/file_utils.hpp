/**
 * @file file_utils.hpp
 * @brief Filesystem helpers shared by the transcoder and the record stores.
 */

#ifndef AUDIOBATCH_FILE_UTILS_HPP
#define AUDIOBATCH_FILE_UTILS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace audiobatch {

    /**
     * @brief Creates @p dir and its parents.
     *
     * Safe to call from several workers for the same directory: losing a
     * creation race is not an error as long as the directory exists afterwards.
     *
     * @return true if the directory exists on return; otherwise @p ec holds the cause.
     */
    bool ensure_directory(const std::filesystem::path& dir, std::error_code& ec);

    /**
     * @brief Replaces @p path with @p contents so readers see either the old
     * file or the complete new one.
     *
     * The data is written to a uniquely named sibling file first and then
     * renamed over the target.
     *
     * @throws std::system_error on any I/O failure; the sibling file is removed.
     */
    void write_file_atomically(const std::filesystem::path& path, std::string_view contents);

    /**
     * @brief Reads a whole file into memory.
     * @throws std::system_error if the file cannot be opened or read.
     */
    [[nodiscard]] std::string read_file(const std::filesystem::path& path);

    /**
     * @return @p text without leading and trailing whitespace.
     */
    [[nodiscard]] std::string trim_copy(std::string_view text);

    /**
     * @return A random decimal suffix for temporary file names (thread-local generator).
     */
    [[nodiscard]] std::string random_suffix();

    /**
     * @return true if @p path lies inside @p root (both made absolute and normalized).
     */
    [[nodiscard]] bool is_within(const std::filesystem::path& path, const std::filesystem::path& root);

} // namespace audiobatch

#endif // AUDIOBATCH_FILE_UTILS_HPP
