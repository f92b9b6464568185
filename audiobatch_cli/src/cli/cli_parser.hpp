#ifndef AUDIOBATCH_CLI_PARSER_HPP
#define AUDIOBATCH_CLI_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

// Unset optional values are asked for interactively.
struct Settings {
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    std::string target_format;               ///< Normalized (".mp3"), empty if not given
    std::optional<int> quality;              ///< Percentage, 30..100
    std::optional<unsigned> cores;

    std::filesystem::path ffmpeg_path;
    std::filesystem::path config_path;
    std::filesystem::path state_file;
    std::filesystem::path report_path;

    bool assume_yes = false;
    bool no_resume = false;
    bool quiet = false;
    std::string stop_key = "q";             ///< Single printable character

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
};

/**
 * @return Upper bound for --cores: the number of hardware threads, at least 1.
 */
unsigned max_cores();

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // AUDIOBATCH_CLI_PARSER_HPP
