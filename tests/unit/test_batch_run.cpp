#include <catch2/catch.hpp>

#include "flac2opus/batch_run.hpp"
#include "flac2opus/errors.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

using namespace flac2opus;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

/// Source tree, destination and a counting fake encoder
struct Fixture {
    TempDir root;
    fs::path src = root.path() / "src";
    fs::path dst = root.path() / "dst";
    fs::path calls = root.path() / "encoder-calls.txt";
    fs::path encoder;

    Fixture() {
        fs::create_directories(src);
        encoder = write_fake_encoder(root.path(), calls);
    }

    RunSettings settings(int jobs = 2) const {
        RunSettings s;
        s.source_dir = src;
        s.dest_dir = dst;
        s.encoder = encoder.string();
        s.source_ext = ".src";
        s.target_ext = ".dst";
        s.bitrate = "96k";
        s.jobs = jobs;
        s.terminate_grace = 1000ms;
        return s;
    }
};

/// Files in the destination tree other than the run logs
size_t count_outputs(const fs::path& dir) {
    if (!fs::exists(dir)) {
        return 0;
    }
    size_t n = 0;
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() != ".log") {
            ++n;
        }
    }
    return n;
}

} // namespace

TEST_CASE("BatchRun transcodes and copies a mixed tree") {
    Fixture fx;
    write_file(fx.src / "a.src", "aaa");
    write_file(fx.src / "b.src", "bbb");
    write_file(fx.src / "c.src", "ccc");
    write_file(fx.src / "notes.txt", "liner notes\n");

    BatchRun batch(fx.settings(2));
    RunSummary summary = batch.run();

    CHECK(summary.transcode_found == 3);
    CHECK(summary.copy_found == 1);
    CHECK(summary.transcode[Outcome::Success] == 3);
    CHECK(summary.transcode.total() == 3);
    CHECK(summary.copy[Outcome::Success] == 1);
    CHECK(summary.copy.total() == 1);
    CHECK_FALSE(summary.cancelled);
    CHECK(summary.exit_code() == 0);

    for (const char* name : {"a.dst", "b.dst", "c.dst"}) {
        CHECK(fs::exists(fx.dst / name));
        CHECK(read_file(fx.dst / name) == "encoded at 96k\n");
    }
    CHECK(read_file(fx.dst / "notes.txt") == "liner notes\n");
    CHECK(fs::last_write_time(fx.dst / "notes.txt") ==
          fs::last_write_time(fx.src / "notes.txt"));
    CHECK(count_outputs(fx.dst) == 4);
    CHECK(count_lines(fx.calls) == 3);

    CHECK(fs::exists(summary.log_file));
    CHECK(fs::exists(summary.error_log_file));
    CHECK(summary.log_file.parent_path() == fs::absolute(fx.dst).lexically_normal());
    CHECK(batch.active_processes().size() == 0);
}

TEST_CASE("BatchRun skips up-to-date outputs on a second run") {
    Fixture fx;
    write_file(fx.src / "a.src");
    write_file(fx.src / "b.src");
    write_file(fx.src / "c.src");
    write_file(fx.src / "notes.txt");

    {
        BatchRun first(fx.settings(2));
        REQUIRE(first.run().transcode[Outcome::Success] == 3);
    }
    REQUIRE(count_lines(fx.calls) == 3);

    BatchRun second(fx.settings(2));
    RunSummary summary = second.run();

    CHECK(summary.transcode[Outcome::Skipped] == 3);
    CHECK(summary.transcode.total() == 3);
    CHECK(summary.copy[Outcome::Skipped] == 1);
    CHECK(count_lines(fx.calls) == 3);
}

TEST_CASE("BatchRun re-encodes a source that is newer than its output") {
    Fixture fx;
    write_file(fx.src / "a.src");
    write_file(fx.src / "b.src");
    {
        BatchRun first(fx.settings(1));
        REQUIRE(first.run().transcode[Outcome::Success] == 2);
    }

    fs::last_write_time(fx.src / "a.src",
                        fs::last_write_time(fx.dst / "a.dst") + std::chrono::seconds(5));

    BatchRun second(fx.settings(1));
    RunSummary summary = second.run();

    CHECK(summary.transcode[Outcome::Success] == 1);
    CHECK(summary.transcode[Outcome::Skipped] == 1);
    CHECK(count_lines(fx.calls) == 3);
}

TEST_CASE("BatchRun dry-run touches nothing in the destination tree") {
    Fixture fx;
    write_file(fx.src / "a.src");
    write_file(fx.src / "Disc 2" / "b.src");
    write_file(fx.src / "notes.txt");

    RunSettings settings = fx.settings(2);
    settings.dry_run = true;
    BatchRun batch(settings);
    RunSummary summary = batch.run();

    CHECK(summary.transcode[Outcome::DryRun] == 2);
    CHECK(summary.copy[Outcome::DryRun] == 1);
    CHECK(count_outputs(fx.dst) == 0);
    CHECK_FALSE(fs::exists(fx.dst / "Disc 2"));
    CHECK(count_lines(fx.calls) == 0);
}

TEST_CASE("BatchRun mirrors nested directories") {
    Fixture fx;
    write_file(fx.src / "Artist" / "Album" / "01.src");
    write_file(fx.src / "Artist" / "Album" / "cover.jpg", "jpeg");

    BatchRun batch(fx.settings(1));
    RunSummary summary = batch.run();

    CHECK(summary.transcode[Outcome::Success] == 1);
    CHECK(summary.copy[Outcome::Success] == 1);
    CHECK(fs::exists(fx.dst / "Artist" / "Album" / "01.dst"));
    CHECK(read_file(fx.dst / "Artist" / "Album" / "cover.jpg") == "jpeg");
}

TEST_CASE("BatchRun counts encoder failures without stopping") {
    Fixture fx;
    write_file(fx.src / "good1.src");
    write_file(fx.src / "fail.src");
    write_file(fx.src / "good2.src");

    BatchRun batch(fx.settings(2));
    RunSummary summary = batch.run();

    CHECK(summary.transcode[Outcome::Success] == 2);
    CHECK(summary.transcode[Outcome::Failed] == 1);
    CHECK(summary.exit_code() == 0);
    CHECK_FALSE(fs::exists(fx.dst / "fail.dst"));

    const std::string errors = read_file(summary.error_log_file);
    CHECK(errors.find("fail.src") != std::string::npos);
    CHECK(errors.find("cannot decode") != std::string::npos);
}

TEST_CASE("BatchRun results do not depend on the worker count") {
    Fixture fx;
    for (int i = 0; i < 8; ++i) {
        write_file(fx.src / ("track" + std::to_string(i) + ".src"));
    }
    write_file(fx.src / "fail.src");
    write_file(fx.src / "a.txt");

    RunSettings one = fx.settings(1);
    one.dest_dir = fx.root.path() / "dst1";
    RunSettings four = fx.settings(4);
    four.dest_dir = fx.root.path() / "dst4";

    BatchRun sequential(one);
    BatchRun parallel(four);
    const RunSummary a = sequential.run();
    const RunSummary b = parallel.run();

    CHECK(a.workers == 1);
    CHECK(b.workers == 4);
    CHECK(a.transcode.counts == b.transcode.counts);
    CHECK(a.copy.counts == b.copy.counts);
}

TEST_CASE("BatchRun rejects configuration errors before touching anything") {
    Fixture fx;
    write_file(fx.src / "a.src");

    SECTION("Malformed bitrate") {
        RunSettings settings = fx.settings();
        settings.bitrate = "abc";
        settings.source_dir = fx.root.path() / "does-not-exist";
        BatchRun batch(settings);
        CHECK_THROWS_WITH(batch.run(), Catch::Contains("bitrate"));
    }

    SECTION("Missing encoder") {
        RunSettings settings = fx.settings();
        settings.encoder = "flac2opus-missing-encoder";
        BatchRun batch(settings);
        CHECK_THROWS_AS(batch.run(), ConfigError);
    }

    SECTION("Missing source directory") {
        RunSettings settings = fx.settings();
        settings.source_dir = fx.root.path() / "does-not-exist";
        BatchRun batch(settings);
        CHECK_THROWS_AS(batch.run(), ConfigError);
    }

    CHECK_FALSE(fs::exists(fx.dst));
    CHECK(count_lines(fx.calls) == 0);
}

TEST_CASE("BatchRun cancellation stops encoders and accounts for every job") {
    Fixture fx;
    const fs::path markers = fx.root.path() / "markers";
    const fs::path slow = write_slow_encoder(fx.root.path(), markers);
    for (const char* name : {"a.src", "b.src", "c.src", "d.src", "e.src"}) {
        write_file(fx.src / name);
    }
    write_file(fx.src / "notes.txt");

    RunSettings settings = fx.settings(2);
    settings.encoder = slow.string();
    BatchRun batch(settings);

    RunSummary summary;
    std::thread runner([&] { summary = batch.run(); });

    const bool started = wait_until([&] { return batch.active_processes().size() == 2; });
    batch.cancel();
    runner.join();
    REQUIRE(started);

    CHECK(batch.cancelled());
    CHECK(summary.cancelled);
    CHECK(summary.exit_code() == 1);
    CHECK(summary.transcode.total() == 5);
    CHECK(summary.transcode[Outcome::Success] == 0);
    CHECK(summary.transcode[Outcome::Skipped] == 5);
    CHECK(summary.copy[Outcome::Skipped] == 1);
    CHECK(batch.active_processes().size() == 0);
    CHECK(count_outputs(fx.dst) == 0);

    const std::string activity = read_file(summary.log_file);
    CHECK(activity.find("Terminating subprocesses") != std::string::npos);
    CHECK(activity.find("All subprocesses terminated") != std::string::npos);
}

TEST_CASE("BatchRun cancelled before it starts schedules nothing") {
    Fixture fx;
    write_file(fx.src / "a.src");
    write_file(fx.src / "notes.txt");

    BatchRun batch(fx.settings(2));
    batch.cancel();
    RunSummary summary = batch.run();

    CHECK(summary.cancelled);
    CHECK(summary.transcode[Outcome::Skipped] == 1);
    CHECK(summary.copy[Outcome::Skipped] == 1);
    CHECK(count_lines(fx.calls) == 0);
}

TEST_CASE("plan_jobs counts unmappable files and plans the rest") {
    TempDir dir;
    RunSettings settings;
    settings.source_dir = "/music/src";
    settings.dest_dir = "/music/out";
    settings.target_ext = ".opus";

    Classification files;
    files.transcode = {"/music/src/a.flac", "/elsewhere/b.flac", "/music/src/Disc 2/c.flac"};
    files.copy = {"/music/src/notes.txt"};

    fs::path error_log;
    JobPlan plan;
    {
        RunLog log(dir.path(), false, "plan");
        error_log = log.error_log_file();
        plan = plan_jobs(files, settings, log);
    }

    CHECK(plan.transcode_path_errors == 1);
    CHECK(plan.copy_path_errors == 0);
    REQUIRE(plan.transcode.size() == 2);
    CHECK(plan.transcode[0].destination_path == fs::path("/music/out/a.opus"));
    CHECK(plan.transcode[1].destination_path == fs::path("/music/out/Disc 2/c.opus"));
    CHECK(plan.transcode[1].kind == JobKind::Transcode);
    REQUIRE(plan.copy.size() == 1);
    CHECK(plan.copy[0].destination_path == fs::path("/music/out/notes.txt"));
    CHECK(plan.copy[0].kind == JobKind::Copy);

    const std::string errors = read_file(error_log);
    CHECK(errors.find("Cannot map '/elsewhere/b.flac'") != std::string::npos);
}
