#include <doctest/doctest.h>

#include "piestack/stats.hpp"

#include <filesystem>
#include <string>

using namespace ps;

namespace {

RunRecord sample_run() {
    RunRecord r;
    r.total_kills = 42;
    r.total_grazes = 310;
    r.best_combo = 27;
    r.best_score = 18450;
    r.best_stage = 3;
    r.total_runs = 1;
    return r;
}

} // namespace

TEST_SUITE("stats") {

TEST_CASE("merge adds totals and keeps bests") {
    RunRecord totals;
    totals.total_kills = 100;
    totals.total_grazes = 50;
    totals.best_combo = 40;
    totals.best_score = 9000;
    totals.best_stage = 2;
    totals.total_runs = 4;

    const RunRecord merged = merge_run(totals, sample_run());
    CHECK(merged.total_kills == 142);
    CHECK(merged.total_grazes == 360);
    CHECK(merged.best_combo == 40);
    CHECK(merged.best_score == 18450);
    CHECK(merged.best_stage == 3);
    CHECK(merged.total_runs == 5);
}

TEST_CASE("json text parses back") {
    const auto parsed = parse_run_record(to_json(sample_run()));
    REQUIRE(parsed.has_value());
    CHECK(parsed->total_kills == 42);
    CHECK(parsed->best_score == 18450);
    CHECK(parsed->best_stage == 3);
}

TEST_CASE("malformed records are rejected") {
    CHECK_FALSE(parse_run_record("").has_value());
    CHECK_FALSE(parse_run_record("not json").has_value());
    CHECK_FALSE(parse_run_record("{\"total_kills\": 3}").has_value());
    CHECK_FALSE(parse_run_record("{\"total_kills\": -1, \"total_grazes\": 0, \"best_combo\": 0, "
                                 "\"best_score\": 0, \"best_stage\": 1, \"total_runs\": 0}")
                    .has_value());
    CHECK_FALSE(parse_run_record("{\"total_kills\": 0, \"total_grazes\": 0, \"best_combo\": 0, "
                                 "\"best_score\": 0, \"best_stage\": 0, \"total_runs\": 0}")
                    .has_value());
    CHECK_FALSE(parse_run_record("{\"total_kills\": x, \"total_grazes\": 0, \"best_combo\": 0, "
                                 "\"best_score\": 0, \"best_stage\": 1, \"total_runs\": 0}")
                    .has_value());
}

TEST_CASE("missing file loads defaults") {
    const auto path = std::filesystem::temp_directory_path() / "piestack_stats_missing.json";
    std::filesystem::remove(path);
    const RunRecord r = load_run_record(path.string());
    CHECK(r.total_runs == 0);
    CHECK(r.best_stage == 1);
}

TEST_CASE("saved records load back") {
    const auto path = std::filesystem::temp_directory_path() / "piestack_stats_roundtrip.json";
    REQUIRE(save_run_record(path.string(), sample_run()));

    const RunRecord r = load_run_record(path.string());
    CHECK(r.total_kills == 42);
    CHECK(r.total_grazes == 310);
    CHECK(r.best_combo == 27);
    CHECK(r.total_runs == 1);

    std::filesystem::remove(path);
}

TEST_CASE("unwritable path reports failure") {
    const auto path = std::filesystem::temp_directory_path() / "piestack_no_such_dir" / "stats.json";
    CHECK_FALSE(save_run_record(path.string(), sample_run()));
}

} // TEST_SUITE("stats")
