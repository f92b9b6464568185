#include "console_delegate.hpp"
#include "../utils/color.hpp"
#include "../../../libaudiobatch/include/errors.hpp"
#include "../../../libaudiobatch/include/job.hpp"
#include "../../../libaudiobatch/include/quality_mapper.hpp"

#include <ostream>

namespace fs = std::filesystem;
using namespace audiobatch;

ConsoleSessionDelegate::ConsoleSessionDelegate(ConsolePrompter& prompter, const Settings& settings, std::ostream& out)
    : prompter_(prompter), settings_(settings), out_(out) {}

bool ConsoleSessionDelegate::confirm_resume(const Checkpoint& checkpoint) {
    if (settings_.no_resume) return false;

    const auto done = checkpoint.total_files > checkpoint.remaining_files.size()
                          ? checkpoint.total_files - checkpoint.remaining_files.size()
                          : 0;
    out_ << YELLOW << "Unfinished conversion found" << RESET << "\n"
         << "  Input:     " << checkpoint.input_dir.string() << "\n"
         << "  Output:    " << checkpoint.output_dir.string() << "\n"
         << "  Format:    " << checkpoint.target_format << " (ffmpeg q=" << checkpoint.quality << ")\n"
         << "  Progress:  " << done << "/" << checkpoint.total_files << " done, "
         << checkpoint.remaining_files.size() << " remaining\n";

    if (settings_.assume_yes) return true;
    return prompter_.confirm("Resume previous conversion?", true);
}

RunConfig ConsoleSessionDelegate::request_config() {
    RunConfig config;

    config.input_dir = settings_.input_dir;
    if (config.input_dir.empty()) {
        config.input_dir = prompter_.ask_directory("INPUT directory:", true);
    } else {
        std::error_code ec;
        if (!fs::is_directory(config.input_dir, ec)) {
            throw ConfigurationError("input directory not found: " + config.input_dir.string());
        }
    }

    config.output_dir = settings_.output_dir;
    while (config.output_dir.empty()) {
        config.output_dir = prompter_.ask_directory("OUTPUT directory:", false);
        std::error_code ec;
        if (fs::equivalent(config.input_dir, config.output_dir, ec)) {
            out_ << RED << "Output directory must differ from the input directory" << RESET << "\n";
            config.output_dir.clear();
        }
    }

    const auto cores_limit = static_cast<int>(max_cores());
    if (settings_.cores) {
        config.concurrency = *settings_.cores;
    } else if (settings_.assume_yes) {
        config.concurrency = static_cast<unsigned>(cores_limit);
    } else {
        config.concurrency = static_cast<unsigned>(
            prompter_.ask_int("CPU cores to use", cores_limit, 1, cores_limit));
    }

    config.target_format = settings_.target_format;
    if (config.target_format.empty()) {
        config.target_format = prompter_.select(
            "Target output format:", {".mp3", ".wav", ".flac", ".m4a", ".aac", ".ogg"});
    }
    config.target_format = normalize_format(config.target_format);

    int percent = kDefaultQualityPercent;
    if (settings_.quality) {
        percent = *settings_.quality;
    } else if (!settings_.assume_yes) {
        percent = prompter_.ask_int("Output quality (30-100)", kDefaultQualityPercent,
                                    kMinQualityPercent, kMaxQualityPercent);
    }
    if (!is_valid_quality_percent(percent)) {
        throw ConfigurationError("quality must be between 30 and 100, got " + std::to_string(percent));
    }
    quality_percent_ = percent;
    config.quality = map_quality(percent);

    return config;
}

bool ConsoleSessionDelegate::confirm_start(const RunSummary& summary) {
    out_ << "Found " << GREEN << summary.scan.file_count << RESET << " audio files\n";
    out_ << "Convertible extensions: " << CYAN;
    for (std::size_t i = 0; i < summary.scan.extensions.size(); ++i) {
        out_ << (i ? ", " : "") << summary.scan.extensions[i];
    }
    out_ << RESET << "\n\n";

    out_ << YELLOW << "Conversion summary" << RESET << "\n"
         << "  Input:          " << summary.config.input_dir.string() << "\n"
         << "  Output:         " << summary.config.output_dir.string() << "\n"
         << "  Cores:          " << summary.config.concurrency << "\n";
    out_ << "  Quality:        ";
    if (quality_percent_) out_ << *quality_percent_ << " ";
    out_ << "(ffmpeg q=" << summary.config.quality << ")\n"
         << "  Target format:  " << summary.config.target_format << "\n"
         << "  Files:          " << summary.scan.file_count << "\n";

    if (settings_.assume_yes) return true;
    return prompter_.confirm("Start conversion?", true);
}
