/**
 * @file checkpoint_store.hpp
 * @brief Durable record of an interrupted run.
 */

#ifndef AUDIOBATCH_CHECKPOINT_STORE_HPP
#define AUDIOBATCH_CHECKPOINT_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace audiobatch {

/**
 * @brief Snapshot of a run's configuration and the sources it did not finish.
 *
 * Stored as a flat JSON object with the keys inputDir, outputDir,
 * targetFormat, quality, cores, totalFiles and remainingFiles.
 */
struct Checkpoint {
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    std::string target_format;
    int quality = 0;                                     ///< Mapped transcoder value, not the percentage
    unsigned cores = 1;
    std::size_t total_files = 0;                         ///< Completed + remaining when the checkpoint was taken
    std::vector<std::filesystem::path> remaining_files;  ///< Absolute source paths
};

/**
 * @brief Saves, loads and deletes the checkpoint file.
 *
 * The store only (de)serializes; whether a checkpoint still makes sense is
 * decided by the session that resumes it.
 */
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path path);

    /**
     * @brief Writes @p checkpoint, replacing any previous one. Readers never
     * observe a partially written file.
     * @throws CheckpointError on I/O or encoding failure.
     */
    void save(const Checkpoint& checkpoint) const;

    /**
     * @return The stored checkpoint, or std::nullopt if there is none.
     * @throws CheckpointError if the file exists but cannot be read or parsed.
     */
    [[nodiscard]] std::optional<Checkpoint> load() const;

    /**
     * @brief Deletes the checkpoint. A missing file is not an error.
     * @throws CheckpointError if the file exists and cannot be removed.
     */
    void remove() const;

    [[nodiscard]] bool exists() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /**
     * @return ~/.local/share/audiobatch/checkpoint.json (or ./checkpoint.json without $HOME).
     */
    [[nodiscard]] static std::filesystem::path default_path();

private:
    std::filesystem::path path_;
};

} // namespace audiobatch

#endif // AUDIOBATCH_CHECKPOINT_STORE_HPP
