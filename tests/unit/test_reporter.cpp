#include <catch2/catch.hpp>

#include "flac2opus/reporter.hpp"
#include "flac2opus/system.hpp"

#include <regex>
#include <string>

using namespace flac2opus;

namespace {

bool has_row(const std::string& text, const std::string& label, size_t value) {
    const std::regex row(std::regex_replace(label, std::regex(R"([()])"), R"(\$&)") +
                         R"( +)" + std::to_string(value) + "\n");
    return std::regex_search(text, row);
}

} // namespace

TEST_CASE("render_summary lists every outcome") {
    RunSummary summary;
    summary.transcode_found = 6;
    summary.copy_found = 2;
    summary.transcode.add(Outcome::Success, 3);
    summary.transcode.add(Outcome::Failed, 1);
    summary.transcode.add(Outcome::Skipped, 2);
    summary.copy.add(Outcome::Success, 1);
    summary.copy.add(Outcome::Skipped, 1);
    summary.workers = 4;
    summary.wall_clock_sec = 3725;

    const std::string text = render_summary(summary);

    CHECK(text.find("TRANSCODING SUMMARY") != std::string::npos);
    CHECK(text.find("PASS-THROUGH COPY SUMMARY") != std::string::npos);
    CHECK(has_row(text, "Total source files found:", 6));
    CHECK(has_row(text, "Successfully transcoded:", 3));
    CHECK(has_row(text, "Failed to transcode:", 1));
    CHECK(has_row(text, "Skipped (already up-to-date):", 2));
    CHECK(has_row(text, "Parallel jobs:", 4));
    CHECK(has_row(text, "Total other files found:", 2));
    CHECK(has_row(text, "Copied:", 1));
    CHECK(has_row(text, "Skipped (up-to-date):", 1));
    CHECK(text.find("01:02:05") != std::string::npos);
    CHECK(text.find("INTERRUPTED") == std::string::npos);
    CHECK(summary.exit_code() == 0);
}

TEST_CASE("render_summary flags an interrupted run") {
    RunSummary summary;
    summary.cancelled = true;
    summary.log_file = "/tmp/out/run.log";
    summary.error_log_file = "/tmp/out/run.errors.log";

    const std::string text = render_summary(summary);

    CHECK(text.find("INTERRUPTED") != std::string::npos);
    CHECK(text.find("/tmp/out/run.log") != std::string::npos);
    CHECK(text.find("/tmp/out/run.errors.log") != std::string::npos);
    CHECK(summary.exit_code() == 1);
}

TEST_CASE("format_time renders HH:MM:SS") {
    CHECK(format_time(0) == "00:00:00");
    CHECK(format_time(59.9) == "00:00:59");
    CHECK(format_time(3600) == "01:00:00");
}

TEST_CASE("TallySnapshot totals its counts") {
    TallySnapshot tally;
    tally.add(Outcome::Success);
    tally.add(Outcome::DryRun, 4);
    CHECK(tally[Outcome::Success] == 1);
    CHECK(tally[Outcome::DryRun] == 4);
    CHECK(tally.total() == 5);
}
