#include "../../include/job_scanner.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace fs = std::filesystem;

namespace {

    bool is_junk(const fs::path& p) {
        auto name = p.filename().string();
        if (name.starts_with("._")) {
            return true;
        }
        std::ranges::transform(name, name.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return name == ".ds_store" || name == "desktop.ini";
    }

    std::vector<std::regex> compile(const std::vector<std::string>& patterns, const char* kind) {
        std::vector<std::regex> compiled;
        for (const auto& pattern : patterns) {
            try {
                compiled.emplace_back(pattern);
            } catch (const std::regex_error& e) {
                Logger::log(LogLevel::Warning,
                            std::string("Invalid ") + kind + " regex: " + pattern + " (" + e.what() + ")", "scanner");
            }
        }
        return compiled;
    }

    bool any_match(const std::vector<std::regex>& patterns, const std::string& text) {
        return std::ranges::any_of(patterns, [&](const std::regex& re) { return std::regex_search(text, re); });
    }

} // namespace

namespace audiobatch {

    std::vector<ConversionJob> scan_jobs(const RunConfig& config, const ScanOptions& options) {
        std::error_code ec;
        if (!fs::is_directory(config.input_dir, ec)) {
            throw ConfigurationError("Input directory not found: " + config.input_dir.string());
        }

        const auto includes = compile(options.include_patterns, "include");
        const auto excludes = compile(options.exclude_patterns, "exclude");
        const bool output_nested = !config.output_dir.empty() && is_within(config.output_dir, config.input_dir);

        std::vector<ConversionJob> jobs;
        try {
            for (const auto& entry : fs::recursive_directory_iterator(
                     config.input_dir, fs::directory_options::skip_permission_denied)) {
                const fs::path& path = entry.path();
                if (!entry.is_regular_file(ec) || is_junk(path)) {
                    continue;
                }
                if (!is_supported_extension(path.extension().string())) {
                    continue;
                }
                if (output_nested && is_within(path, config.output_dir)) {
                    Logger::log(LogLevel::Debug, "Skipping previous output: " + path.string(), "scanner");
                    continue;
                }
                const std::string path_str = path.string();
                if (any_match(excludes, path_str) || (!includes.empty() && !any_match(includes, path_str))) {
                    continue;
                }
                jobs.push_back(make_job(path, config));
            }
        } catch (const fs::filesystem_error& e) {
            throw ConfigurationError(std::string("Cannot scan input directory: ") + e.what());
        }

        std::ranges::sort(jobs, [](const ConversionJob& a, const ConversionJob& b) { return a.source < b.source; });

        Logger::log(LogLevel::Info,
                    "Scanner collected " + std::to_string(jobs.size()) + " files from " + config.input_dir.string(),
                    "scanner");
        return jobs;
    }

    ScanSummary summarize(const std::vector<ConversionJob>& jobs) {
        std::set<std::string> extensions;
        for (const auto& job : jobs) {
            extensions.insert(normalize_format(job.source.extension().string()));
        }
        return ScanSummary{jobs.size(), {extensions.begin(), extensions.end()}};
    }

} // namespace audiobatch
