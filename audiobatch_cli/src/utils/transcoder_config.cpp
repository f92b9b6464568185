#include "transcoder_config.hpp"
#include "../../../libaudiobatch/include/errors.hpp"
#include "../../../libaudiobatch/include/file_utils.hpp"
#include "../../../libaudiobatch/include/logger.hpp"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string strip_quotes(std::string s) {
    s = audiobatch::trim_copy(s);
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

} // namespace

fs::path default_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "audiobatch" / "config.json";
    }
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / ".config" / "audiobatch" / "config.json";
}

std::optional<TranscoderConfig> load_transcoder_config(const fs::path& path) {
    if (!is_file(path)) return std::nullopt;

    TranscoderConfig config;
    try {
        const auto j = json::parse(audiobatch::read_file(path));
        config.ffmpeg_path = j.at("ffmpegPath").get<std::string>();
    } catch (const json::exception& e) {
        Logger::log(LogLevel::Warning, "Ignoring malformed config " + path.string() + ": " + e.what(), "config");
        return std::nullopt;
    } catch (const std::system_error& e) {
        Logger::log(LogLevel::Warning, "Cannot read config " + path.string() + ": " + e.what(), "config");
        return std::nullopt;
    }

    if (!is_file(config.ffmpeg_path)) {
        Logger::log(LogLevel::Warning, "Configured ffmpeg not found: " + config.ffmpeg_path.string(), "config");
        return std::nullopt;
    }
    return config;
}

void save_transcoder_config(const fs::path& path, const TranscoderConfig& config) {
    const json j{{"ffmpegPath", config.ffmpeg_path.string()}};
    try {
        audiobatch::write_file_atomically(path, j.dump(2) + "\n");
    } catch (const std::system_error& e) {
        throw audiobatch::ConfigurationError("cannot save config " + path.string() + ": " + e.what());
    }
    Logger::log(LogLevel::Info, "Saved ffmpeg path to " + path.string(), "config");
}

std::optional<fs::path> resolve_ffmpeg_path(const std::string& input) {
    const fs::path candidate = strip_quotes(input);
    if (candidate.empty()) return std::nullopt;

    std::error_code ec;
    if (is_file(candidate)) {
        return fs::absolute(candidate, ec).lexically_normal();
    }
    if (fs::is_directory(candidate, ec)) {
        for (const auto& p : {candidate / "ffmpeg", candidate / "bin" / "ffmpeg"}) {
            if (is_file(p)) return fs::absolute(p, ec).lexically_normal();
        }
    }
    return std::nullopt;
}
