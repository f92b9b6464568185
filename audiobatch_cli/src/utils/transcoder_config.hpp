#ifndef AUDIOBATCH_TRANSCODER_CONFIG_HPP
#define AUDIOBATCH_TRANSCODER_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

/**
 * @brief Persistent user configuration: where the ffmpeg executable lives.
 *
 * Stored as {"ffmpegPath": "..."}.
 */
struct TranscoderConfig {
    std::filesystem::path ffmpeg_path;
};

/**
 * @return $XDG_CONFIG_HOME/audiobatch/config.json, falling back to
 * ~/.config/audiobatch/config.json.
 */
std::filesystem::path default_config_path();

/**
 * @brief Reads the config file.
 * @return std::nullopt if the file is missing, unreadable or malformed, or
 * if the stored executable no longer exists. Problems are logged.
 */
std::optional<TranscoderConfig> load_transcoder_config(const std::filesystem::path& path);

/**
 * @brief Writes the config file, creating its directory.
 * @throws audiobatch::ConfigurationError if it cannot be written.
 */
void save_transcoder_config(const std::filesystem::path& path, const TranscoderConfig& config);

/**
 * @brief Turns user input into an executable path.
 *
 * Accepts the executable itself, or a directory containing "ffmpeg" or
 * "bin/ffmpeg". Surrounding whitespace and quotes are ignored.
 * @return The absolute path, or std::nullopt if nothing matched.
 */
std::optional<std::filesystem::path> resolve_ffmpeg_path(const std::string& input);

#endif // AUDIOBATCH_TRANSCODER_CONFIG_HPP
