#include <catch2/catch.hpp>

#include "flac2opus/logging.hpp"
#include "TestHelpers.hpp"

#include <string>
#include <system_error>

using namespace flac2opus;

TEST_CASE("RunLog routes lines to the activity and error logs") {
    TempDir dir;
    {
        RunLog log(dir.path(), false, "unit");
        REQUIRE(std::filesystem::exists(log.log_file()));
        REQUIRE(std::filesystem::exists(log.error_log_file()));
        CHECK(log.log_file().parent_path() == dir.path());

        log.info("starting {} jobs", 3);
        log.warn("slow disk");
        log.error("encoder exited with code {}", 1);
    }

    std::string activity;
    std::string errors;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        const std::string name = entry.path().filename().string();
        if (name.find(".errors.log") != std::string::npos) {
            errors = read_file(entry.path());
        } else {
            activity = read_file(entry.path());
        }
    }

    CHECK(activity.find("INFO") != std::string::npos);
    CHECK(activity.find("starting 3 jobs") != std::string::npos);
    CHECK(activity.find("slow disk") != std::string::npos);
    CHECK(activity.find("encoder exited with code 1") != std::string::npos);

    CHECK(errors.find("encoder exited with code 1") != std::string::npos);
    CHECK(errors.find("starting 3 jobs") == std::string::npos);
    CHECK(errors.find("slow disk") == std::string::npos);
}

TEST_CASE("RunLog records failed jobs in the error log with their detail") {
    TempDir dir;
    std::filesystem::path error_log;
    {
        RunLog log(dir.path(), false, "unit");
        error_log = log.error_log_file();

        JobReport ok{Job{"/src/a.flac", "/dst/a.opus", JobKind::Transcode}, Outcome::Success};
        ok.source_bytes = 100;
        ok.dest_bytes = 10;
        log.record_job(ok);

        JobReport bad{Job{"/src/b.flac", "/dst/b.opus", JobKind::Transcode}, Outcome::Failed};
        bad.detail = "opusenc exited with code 1";
        log.record_job(bad);
    }

    const std::string errors = read_file(error_log);
    CHECK(errors.find("/src/b.flac") != std::string::npos);
    CHECK(errors.find("opusenc exited with code 1") != std::string::npos);
    CHECK(errors.find("/src/a.flac") == std::string::npos);
}

TEST_CASE("RunLog writes nothing to files after close") {
    TempDir dir;
    RunLog log(dir.path(), false, "unit");
    const auto path = log.log_file();
    log.info("before");
    log.close();
    log.info("after");

    const std::string activity = read_file(path);
    CHECK(activity.find("before") != std::string::npos);
    CHECK(activity.find("after") == std::string::npos);
}

TEST_CASE("RunLog throws when the log directory is missing") {
    TempDir dir;
    CHECK_THROWS_AS(RunLog(dir.path() / "missing", false), std::system_error);
}

TEST_CASE("RunLog prints progress without verbose but hides plain info") {
    TempDir dir;
    std::filesystem::path activity_log;
    std::string console;
    {
        RunLog log(dir.path(), false, "unit");
        activity_log = log.log_file();

        StdoutCapture capture;
        log.info("hidden detail");
        log.progress("Copying progress: {}/{}", 1, 2);
        console = capture.finish();
    }

    CHECK(console.find("Copying progress: 1/2") != std::string::npos);
    CHECK(console.find("hidden detail") == std::string::npos);

    const std::string activity = read_file(activity_log);
    CHECK(activity.find("Copying progress: 1/2") != std::string::npos);
    CHECK(activity.find("hidden detail") != std::string::npos);
}
