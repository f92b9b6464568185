#include "cli_parser.hpp"
#include "../../../libaudiobatch/include/job.hpp"
#include "../../../libaudiobatch/include/quality_mapper.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cctype>
#include <thread>

namespace {
// normalizes the target format in place and checks it against the allow-list
struct AudioFormatValidator : CLI::Validator {
    AudioFormatValidator() {
        name_ = "AudioFormat";
        func_ = [](std::string& str) {
            str = audiobatch::normalize_format(str);
            if (!audiobatch::is_supported_extension(str)) {
                return std::string("Invalid format: '") + str +
                       "'. Must be one of: mp3, wav, flac, m4a, aac, ogg.";
            }
            return std::string(); // ok
        };
    }
};
} // namespace

unsigned max_cores() {
    return std::max(1U, std::thread::hardware_concurrency());
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Run parameters (prompted for when missing) ---
    app.add_option("-i,--input", settings.input_dir,
                   "Directory scanned recursively for audio files.")
                   ->check(CLI::ExistingDirectory);

    app.add_option("-o,--output", settings.output_dir,
                   "Directory that receives the converted files (same layout as the input).");

    app.add_option("-f,--format", settings.target_format,
                   "Target format: mp3, wav, flac, m4a, aac, ogg.")
                   ->transform(AudioFormatValidator());

    app.add_option("-q,--quality", settings.quality,
                   "Output quality in percent (30-100, default 70).")
                   ->check(CLI::Range(audiobatch::kMinQualityPercent, audiobatch::kMaxQualityPercent));

    app.add_option("-j,--cores", settings.cores,
                   "Conversions to run at the same time (1-" + std::to_string(max_cores()) + ").")
                   ->check(CLI::Range(1U, max_cores()));

    // --- Files ---
    app.add_option("--ffmpeg", settings.ffmpeg_path,
                   "ffmpeg executable, or a directory containing ffmpeg or bin/ffmpeg. Saved to the config file.");

    app.add_option("--config", settings.config_path,
                   "Config file (default: ~/.config/audiobatch/config.json).");

    app.add_option("--state-file", settings.state_file,
                   "Checkpoint file (default: ~/.local/share/audiobatch/checkpoint.json).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // --- Flags (booleans) ---
    app.add_flag("-y,--yes", settings.assume_yes,
                 "Answer yes to every confirmation, including resuming a checkpoint.");

    app.add_flag("--no-resume", settings.no_resume,
                 "Discard a saved checkpoint without asking and start over.");

    app.add_flag("--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, results).");

    app.add_option("--stop-key", settings.stop_key,
                   "Key that stops the run and saves progress.")
                   ->default_val("q")
                   ->check([](const std::string& str) {
                       if (str.size() != 1 || !std::isgraph(static_cast<unsigned char>(str[0]))) {
                           return std::string("Stop key must be a single printable character.");
                       }
                       return std::string(); // ok
                   });

    app.add_option("--include", settings.include_patterns,
                   "Convert only files matching regex PATTERN. (Can be used multiple times).");

    app.add_option("--exclude", settings.exclude_patterns,
                   "Do not convert files matching regex PATTERN. (Can be used multiple times).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (!settings.input_dir.empty() && !settings.output_dir.empty()) {
            std::error_code ec;
            if (std::filesystem::equivalent(settings.input_dir, settings.output_dir, ec)) {
                throw CLI::ValidationError("Input and output directories must differ.");
            }
        }
    });
}
