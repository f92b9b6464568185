#include <catch2/catch_test_macros.hpp>

#include "errors.hpp"
#include "ffmpeg_transcoder.hpp"
#include "support/temp_dir.hpp"

#include <chrono>
#include <thread>

namespace fs = std::filesystem;
using namespace audiobatch;
using test_support::TempDir;

namespace
{
// stands in for ffmpeg: records its arguments next to the output and
// misbehaves depending on the input file name
constexpr const char *kFakeFfmpeg = R"(#!/bin/sh
src=""
prev=""
for a in "$@"; do
    if [ "$prev" = "-i" ]; then src="$a"; fi
    prev="$a"
    last="$a"
done
printf '%s\n' "$@" > "$last.args"
case "$src" in
    *bad*) echo "  Invalid data found when processing input  " 1>&2; exit 1 ;;
    *silent*) exit 2 ;;
    *slow*) sleep 10 ;;
esac
printf 'converted' > "$last"
)";

fs::path install_fake_ffmpeg(const TempDir &dir)
{
    const auto exe = dir.write("bin/ffmpeg", kFakeFfmpeg);
    fs::permissions(exe, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return exe;
}

RunConfig config_for(const TempDir &dir)
{
    RunConfig config;
    config.input_dir = dir / "in";
    config.output_dir = dir / "out";
    config.target_format = ".mp3";
    config.quality = 4;
    return config;
}
} // namespace

TEST_CASE("ffmpeg_arguments")
{
    const auto args = FfmpegTranscoder::build_arguments("/in/a b.flac", "/out/a b.mp3", 2);
    const std::vector<std::string> expected{"-hide_banner", "-loglevel", "error", "-nostdin", "-y",
                                            "-i", "/in/a b.flac", "-vn", "-q:a", "2",
                                            "-threads", "1", "/out/a b.mp3"};
    REQUIRE(args == expected);
}

TEST_CASE("ffmpeg_missing_executable_is_a_configuration_error")
{
    TempDir dir;
    REQUIRE_THROWS_AS(FfmpegTranscoder(dir / "nope"), ConfigurationError);
    REQUIRE_THROWS_AS(FfmpegTranscoder(dir.path()), ConfigurationError);
}

TEST_CASE("ffmpeg_success_writes_mirrored_destination")
{
    TempDir dir;
    FfmpegTranscoder transcoder(install_fake_ffmpeg(dir));
    const auto config = config_for(dir);
    const auto job = make_job(dir.write("in/album/01.flac"), config);

    std::stop_source source;
    const auto result = transcoder.invoke(job, config, source.get_token());

    REQUIRE(result.status == InvocationStatus::Succeeded);
    REQUIRE(result.error.empty());
    const auto dest = dir / "out" / "album" / "01.mp3";
    REQUIRE(test_support::read_text(dest) == "converted");

    const auto args = test_support::read_text(dest.string() + ".args");
    REQUIRE(args.find("-q:a\n4\n") != std::string::npos);
    REQUIRE(args.find("-threads\n1\n") != std::string::npos);
    REQUIRE(args.find("-i\n" + job.source.string() + "\n") != std::string::npos);
}

TEST_CASE("ffmpeg_failure_uses_trimmed_stderr")
{
    TempDir dir;
    FfmpegTranscoder transcoder(install_fake_ffmpeg(dir));
    const auto config = config_for(dir);
    const auto job = make_job(dir.write("in/bad.wav"), config);

    std::stop_source source;
    const auto result = transcoder.invoke(job, config, source.get_token());
    REQUIRE(result.status == InvocationStatus::Failed);
    REQUIRE(result.error == "Invalid data found when processing input");
}

TEST_CASE("ffmpeg_failure_without_stderr_reports_exit_code")
{
    TempDir dir;
    FfmpegTranscoder transcoder(install_fake_ffmpeg(dir));
    const auto config = config_for(dir);
    const auto job = make_job(dir.write("in/silent.wav"), config);

    std::stop_source source;
    const auto result = transcoder.invoke(job, config, source.get_token());
    REQUIRE(result.status == InvocationStatus::Failed);
    REQUIRE(result.error == "ffmpeg exited with code 2");
}

TEST_CASE("ffmpeg_cancel_abandons_invocation")
{
    TempDir dir;
    FfmpegTranscoder transcoder(install_fake_ffmpeg(dir));
    const auto config = config_for(dir);
    const auto job = make_job(dir.write("in/slow.wav"), config);

    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        source.request_stop();
    });
    const auto result = transcoder.invoke(job, config, source.get_token());
    REQUIRE(result.status == InvocationStatus::Cancelled);
    REQUIRE_FALSE(fs::exists(dir / "out" / "slow.mp3"));
}

TEST_CASE("ffmpeg_not_executable_fails_per_job")
{
    TempDir dir;
    const auto exe = dir.write("bin/ffmpeg", "not a program");
    fs::permissions(exe, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    FfmpegTranscoder transcoder(exe);
    const auto config = config_for(dir);
    const auto job = make_job(dir.write("in/a.wav"), config);

    std::stop_source source;
    const auto result = transcoder.invoke(job, config, source.get_token());
    REQUIRE(result.status == InvocationStatus::Failed);
    REQUIRE(result.error.starts_with("failed to start"));
}
