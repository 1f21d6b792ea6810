#include <catch2/catch.hpp>

#include "flac2opus/cli_options.hpp"
#include "flac2opus/config.hpp"
#include "flac2opus/errors.hpp"

#include <string>
#include <vector>

using namespace flac2opus;

namespace {

CliOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "flac2opus");
    return parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("parse_args reads positionals and defaults") {
    CliOptions options = parse({"in", "out"});

    CHECK_FALSE(options.show_help);
    CHECK(options.settings.source_dir == "in");
    CHECK(options.settings.dest_dir == "out");
    CHECK(options.settings.bitrate == Config::default_bitrate());
    CHECK(options.settings.encoder == Config::encoder_binary());
    CHECK_FALSE(options.settings.dry_run);
    CHECK_FALSE(options.settings.verbose);
}

TEST_CASE("parse_args accepts flags in any position") {
    CliOptions options = parse({"-v", "in", "--bitrate", "128k", "out", "--dry-run"});

    CHECK(options.settings.verbose);
    CHECK(options.settings.dry_run);
    CHECK(options.settings.bitrate == "128k");
    CHECK(options.settings.source_dir == "in");
    CHECK(options.settings.dest_dir == "out");
}

TEST_CASE("parse_args handles the jobs option") {
    SECTION("Explicit count") {
        CHECK(parse({"in", "out", "-j", "4"}).settings.jobs == 4);
        CHECK(parse({"in", "out", "--jobs=3"}).settings.jobs == 3);
    }

    SECTION("Bare flag means auto-detect") {
        CliOptions options = parse({"in", "-j", "out"});
        CHECK(options.settings.jobs == 0);
        CHECK(options.settings.source_dir == "in");
        CHECK(options.settings.dest_dir == "out");
    }

    SECTION("Non-positive counts are rejected") {
        CHECK_THROWS_AS(parse({"in", "out", "-j", "0"}), ConfigError);
        CHECK_THROWS_AS(parse({"in", "out", "--jobs=-2"}), ConfigError);
        CHECK_THROWS_AS(parse({"in", "out", "--jobs=many"}), ConfigError);
    }
}

TEST_CASE("parse_args reports usage errors") {
    CHECK_THROWS_AS(parse({"in"}), ConfigError);
    CHECK_THROWS_AS(parse({"in", "out", "extra"}), ConfigError);
    CHECK_THROWS_AS(parse({"in", "out", "--frobnicate"}), ConfigError);
    CHECK_THROWS_AS(parse({"in", "out", "-b"}), ConfigError);
}

TEST_CASE("parse_args stops at help") {
    CliOptions options = parse({"--help", "--frobnicate"});
    CHECK(options.show_help);
}

TEST_CASE("validate_bitrate accepts only digits followed by k") {
    CHECK_NOTHROW(validate_bitrate("192k"));
    CHECK_NOTHROW(validate_bitrate("6k"));
    CHECK_THROWS_AS(validate_bitrate("abc"), ConfigError);
    CHECK_THROWS_AS(validate_bitrate("192"), ConfigError);
    CHECK_THROWS_AS(validate_bitrate("192K"), ConfigError);
    CHECK_THROWS_AS(validate_bitrate("k"), ConfigError);
    CHECK_THROWS_AS(validate_bitrate(""), ConfigError);
}

TEST_CASE("usage mentions every option") {
    const std::string text = usage("flac2opus");
    for (const char* flag : {"--bitrate", "--jobs", "--verbose", "--dry-run", "--help"}) {
        CHECK(text.find(flag) != std::string::npos);
    }
}
