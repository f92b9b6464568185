#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"
#include "job_scanner.hpp"
#include "support/temp_dir.hpp"

#include <algorithm>

namespace fs = std::filesystem;
using namespace audiobatch;
using test_support::TempDir;

namespace
{
RunConfig config_for(const TempDir &dir)
{
    RunConfig config;
    config.input_dir = dir / "in";
    config.output_dir = dir / "out";
    config.target_format = ".mp3";
    config.quality = 3;
    return config;
}

std::vector<std::string> relative_names(const std::vector<ConversionJob> &jobs)
{
    std::vector<std::string> names;
    for (const auto &job : jobs)
        names.push_back(job.relative.generic_string());
    return names;
}
} // namespace

TEST_CASE("scanner_keeps_supported_extensions_recursively")
{
    TempDir dir;
    dir.write("in/b.WAV");
    dir.write("in/a.flac");
    dir.write("in/sub/deeper/c.ogg");
    dir.write("in/notes.txt");
    dir.write("in/cover.jpg");
    dir.write("in/noext");

    const auto jobs = scan_jobs(config_for(dir));
    REQUIRE(relative_names(jobs) == std::vector<std::string>{"a.flac", "b.WAV", "sub/deeper/c.ogg"});
    REQUIRE(std::ranges::all_of(jobs, [](const auto &j) { return j.source.is_absolute(); }));
    REQUIRE(std::ranges::all_of(jobs, [](const auto &j) { return j.target_format == ".mp3" && j.quality == 3; }));
}

TEST_CASE("scanner_skips_junk_files")
{
    TempDir dir;
    dir.write("in/._a.mp3");
    dir.write("in/.DS_Store");
    dir.write("in/Desktop.ini");
    dir.write("in/real.mp3");

    REQUIRE(relative_names(scan_jobs(config_for(dir))) == std::vector<std::string>{"real.mp3"});
}

TEST_CASE("scanner_skips_nested_output_tree")
{
    TempDir dir;
    dir.write("in/a.wav");
    dir.write("in/converted/a.mp3");

    auto config = config_for(dir);
    config.output_dir = dir / "in" / "converted";
    REQUIRE(relative_names(scan_jobs(config)) == std::vector<std::string>{"a.wav"});
}

TEST_CASE("scanner_applies_regex_filters")
{
    TempDir dir;
    dir.write("in/live/a.wav");
    dir.write("in/studio/b.wav");
    dir.write("in/studio/c_demo.wav");

    ScanOptions options;
    options.include_patterns = {"studio"};
    options.exclude_patterns = {"_demo", "([invalid"};
    REQUIRE(relative_names(scan_jobs(config_for(dir), options)) == std::vector<std::string>{"studio/b.wav"});
}

TEST_CASE("scanner_empty_directory")
{
    TempDir dir;
    fs::create_directories(dir / "in");
    dir.write("in/readme.md");

    const auto jobs = scan_jobs(config_for(dir));
    REQUIRE(jobs.empty());
    REQUIRE(summarize(jobs).file_count == 0);
}

TEST_CASE("scanner_missing_input_directory_throws")
{
    TempDir dir;
    REQUIRE_THROWS_AS(scan_jobs(config_for(dir)), ConfigurationError);
}

TEST_CASE("scan_summary_lists_distinct_extensions")
{
    TempDir dir;
    dir.write("in/a.FLAC");
    dir.write("in/b.flac");
    dir.write("in/c.aac");

    const auto summary = summarize(scan_jobs(config_for(dir)));
    REQUIRE(summary.file_count == 3);
    REQUIRE(summary.extensions == std::vector<std::string>{".aac", ".flac"});
}

TEST_CASE("scanner_handles_non_ascii_names")
{
    TempDir dir;
    dir.write("in/Café del Mar.flac");
    dir.write("in/Björk/Jóga.MP3");
    dir.write("in/Björk/._Jóga.MP3");
    dir.write("in/Ñandú/Desktop.INI");

    const auto names = relative_names(scan_jobs(config_for(dir)));
    REQUIRE(names == std::vector<std::string>{"Björk/Jóga.MP3", "Café del Mar.flac"});
}
