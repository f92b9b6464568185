#include <catch2/catch_test_macros.hpp>

#include "checkpoint_store.hpp"
#include "errors.hpp"
#include "support/temp_dir.hpp"

#include <nlohmann/json.hpp>
#include <limits>

namespace fs = std::filesystem;
using namespace audiobatch;
using test_support::TempDir;

namespace
{
Checkpoint sample_checkpoint()
{
    Checkpoint cp;
    cp.input_dir = "/music/in";
    cp.output_dir = "/music/out";
    cp.target_format = ".ogg";
    cp.quality = 2;
    cp.cores = 4;
    cp.total_files = 10;
    cp.remaining_files = {"/music/in/a.wav", "/music/in/sub/b, \"c\".flac"};
    return cp;
}
} // namespace

TEST_CASE("checkpoint_absent_loads_as_nullopt")
{
    TempDir dir;
    CheckpointStore store(dir / "state" / "checkpoint.json");
    REQUIRE_FALSE(store.exists());
    REQUIRE_FALSE(store.load().has_value());
    REQUIRE_NOTHROW(store.remove());
}

TEST_CASE("checkpoint_save_then_load")
{
    TempDir dir;
    CheckpointStore store(dir / "state" / "checkpoint.json");
    store.save(sample_checkpoint());
    REQUIRE(store.exists());

    const auto loaded = store.load();
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->input_dir == fs::path("/music/in"));
    REQUIRE(loaded->output_dir == fs::path("/music/out"));
    REQUIRE(loaded->target_format == ".ogg");
    REQUIRE(loaded->quality == 2);
    REQUIRE(loaded->cores == 4);
    REQUIRE(loaded->total_files == 10);
    REQUIRE(loaded->remaining_files == sample_checkpoint().remaining_files);

    // no temporary files left behind
    int entries = 0;
    for (const auto &e : fs::directory_iterator(dir / "state"))
    {
        (void)e;
        ++entries;
    }
    REQUIRE(entries == 1);
}

TEST_CASE("checkpoint_document_uses_flat_keys")
{
    TempDir dir;
    CheckpointStore store(dir / "checkpoint.json");
    store.save(sample_checkpoint());

    const auto j = nlohmann::json::parse(test_support::read_text(store.path()));
    REQUIRE(j.is_object());
    for (const char *key : {"inputDir", "outputDir", "targetFormat", "quality", "cores", "totalFiles", "remainingFiles"})
    {
        REQUIRE(j.contains(key));
    }
    REQUIRE(j.size() == 7);
    REQUIRE(j["remainingFiles"].size() == 2);
}

TEST_CASE("checkpoint_save_replaces_previous")
{
    TempDir dir;
    CheckpointStore store(dir / "checkpoint.json");
    store.save(sample_checkpoint());

    auto cp = sample_checkpoint();
    cp.remaining_files.resize(1);
    store.save(cp);
    REQUIRE(store.load()->remaining_files.size() == 1);
}

TEST_CASE("checkpoint_remove_deletes_file")
{
    TempDir dir;
    CheckpointStore store(dir / "checkpoint.json");
    store.save(sample_checkpoint());
    store.remove();
    REQUIRE_FALSE(store.exists());
    REQUIRE_FALSE(store.load().has_value());
}

TEST_CASE("checkpoint_corrupt_file_throws")
{
    TempDir dir;
    const auto path = dir.write("checkpoint.json", "{\"inputDir\": ");
    CheckpointStore store(path);
    REQUIRE_THROWS_AS(store.load(), CheckpointError);

    dir.write("checkpoint.json", "{\"inputDir\": \"/x\"}");
    REQUIRE_THROWS_AS(store.load(), CheckpointError);
}

TEST_CASE("checkpoint_error_carries_path")
{
    TempDir dir;
    const auto path = dir.write("checkpoint.json", "[]");
    CheckpointStore store(path);
    try
    {
        (void)store.load();
        FAIL("expected CheckpointError");
    }
    catch (const CheckpointError &e)
    {
        REQUIRE(e.path() == path);
    }
}

TEST_CASE("checkpoint_negative_cores_does_not_wrap")
{
    TempDir dir;
    auto doc = nlohmann::json::parse(R"({"inputDir": "/i", "outputDir": "/o", "targetFormat": ".mp3",
                                         "quality": 3, "cores": -1, "totalFiles": 1,
                                         "remainingFiles": ["/i/a.wav"]})");
    const auto path = dir.write("checkpoint.json", doc.dump());
    CheckpointStore store(path);

    REQUIRE(store.load()->cores == 0);

    doc["cores"] = 100000000000LL;
    dir.write("checkpoint.json", doc.dump());
    REQUIRE(store.load()->cores == std::numeric_limits<unsigned>::max());
}
