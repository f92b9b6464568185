#include <algorithm>
#include <cctype>
#include <iostream>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <clocale>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/transcoder_config.hpp"
#include "cli/cli_parser.hpp"
#include "cli/console_delegate.hpp"
#include "cli/console_prompts.hpp"
#include "report/progress_reporter.hpp"
#include "report/report_generator.hpp"
#include "../../libaudiobatch/include/cancellation_watcher.hpp"
#include "../../libaudiobatch/include/checkpoint_store.hpp"
#include "../../libaudiobatch/include/errors.hpp"
#include "../../libaudiobatch/include/event_bus.hpp"
#include "../../libaudiobatch/include/events.hpp"
#include "../../libaudiobatch/include/ffmpeg_transcoder.hpp"
#include "../../libaudiobatch/include/logger.hpp"
#include "../../libaudiobatch/include/session.hpp"

using namespace audiobatch;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130; // standard exit code for SIGINT

std::atomic<bool> interrupted{false};
static_assert(std::atomic<bool>::is_always_lock_free);

// handle ctrl+c or termination signals; the watcher thread picks the flag up
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "main");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "main");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.", "main");
}

void setup_log_sinks(const Settings& settings) {
    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file.string(), true);
        if (!fileSink->is_open()) {
            std::cerr << YELLOW << "Cannot open log file " << settings.log_file.string() << RESET << std::endl;
        }
        Logger::add_sink(std::move(fileSink));
    }

    std::string level = settings.log_level;
    std::ranges::transform(level, level.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (!settings.quiet && level != "NONE") {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        consoleSink->log_level = Logger::string_to_level(level);
        Logger::add_sink(std::move(consoleSink));
    }
}

// --ffmpeg, else the config file, else ask; a newly given path is saved back
fs::path resolve_ffmpeg(const Settings& settings, ConsolePrompter& prompter) {
    const fs::path config_path = settings.config_path.empty() ? default_config_path() : settings.config_path;

    if (settings.ffmpeg_path.empty()) {
        if (const auto config = load_transcoder_config(config_path)) {
            return config->ffmpeg_path;
        }
    }

    const std::string input = settings.ffmpeg_path.empty()
                                  ? prompter.ask_string("FFmpeg path:")
                                  : settings.ffmpeg_path.string();
    const auto resolved = resolve_ffmpeg_path(input);
    if (!resolved) {
        throw ConfigurationError("Invalid FFmpeg path: " + input);
    }
    try {
        save_transcoder_config(config_path, TranscoderConfig{*resolved});
    } catch (const ConfigurationError& e) {
        // the run can go on; the path will be asked for again next time
        Logger::log(LogLevel::Warning, e.what(), "main");
    }
    return *resolved;
}

int run_cli(const Settings& settings) {
    ConsolePrompter prompter(std::cin, std::cout);

    const auto ffmpeg = resolve_ffmpeg(settings, prompter);
    FfmpegTranscoder transcoder(ffmpeg);
    if (!settings.quiet) {
        std::cout << GREEN << "FFmpeg loaded: " << RESET << ffmpeg.string() << "\n\n";
    }

    EventBus bus;
    CheckpointStore store(settings.state_file.empty() ? CheckpointStore::default_path() : settings.state_file);
    Session session(transcoder, store, bus, ScanOptions{settings.include_patterns, settings.exclude_patterns});

    ProgressReporter progress(std::cerr, !settings.quiet);
    progress.attach(bus);

    const char stop_key = settings.stop_key.empty() ? 'q' : settings.stop_key.front();
    CancellationWatcher watcher(STDIN_FILENO, stop_key, [&session, &settings] {
        if (!settings.quiet) {
            std::cerr << CYAN
                      << "\n[STOP] Stop requested. Waiting for running conversions to finish..."
                      << RESET << std::endl;
        }
        session.stop();
    }, &interrupted);

    bus.subscribe<RunPhaseEvent>([&](const RunPhaseEvent& e) {
        switch (e.phase) {
            case RunPhase::Running:
                std::signal(SIGINT, signal_handler);
                std::signal(SIGTERM, signal_handler);
                if (!settings.quiet) {
                    std::cout << "\nConverting. Press '" << stop_key << "' to stop and save progress.\n"
                              << std::flush;
                }
                watcher.start();
                break;
            case RunPhase::Completed:
            case RunPhase::Cancelled:
                watcher.stop();
                progress.finish();
                break;
            default:
                break;
        }
    });

    ConsoleSessionDelegate delegate(prompter, settings, std::cout);
    const auto result = session.run(delegate);
    watcher.stop();

    if (result.phase == RunPhase::Declined) {
        return kExitOk;
    }

    const auto rows = build_failure_rows(result.failures);
    if (!settings.quiet || result.phase == RunPhase::Cancelled) {
        print_console_report(std::cout, result, rows, isatty(STDOUT_FILENO) != 0);
    }
    if (result.phase == RunPhase::Cancelled) {
        Logger::log(LogLevel::Info, "Checkpoint: " + store.path().string(), "main");
    }

    // export CSV if requested
    if (!settings.report_path.empty()) {
        export_csv_report(result, rows, settings.report_path);
    }

    return result.phase == RunPhase::Cancelled ? kExitCancelled : kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {

    CLI::App app{"audiobatch: batch audio converter with resumable runs."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        app.exit(e);
        return kExitUsage;
    }

    setup_log_sinks(settings);
    init_utf8_locale();

    if (!settings.quiet) {
        std::cout << CYAN << "Batch Audio Converter" << RESET << "\n\n";
    }

    try {
        return run_cli(settings);
    } catch (const ConfigurationError& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return kExitError;
    } catch (const CheckpointError& e) {
        std::cerr << RED << "Checkpoint error: " << e.what() << RESET << std::endl;
        return kExitError;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Unexpected error: ") + e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return kExitError;
    }
}
