#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ps {

// Lifetime totals kept across runs.
struct RunRecord {
    int64_t total_kills = 0;
    int64_t total_grazes = 0;
    int best_combo = 0;
    int64_t best_score = 0;
    int best_stage = 1;
    int64_t total_runs = 0;
};

// Totals add, bests take the maximum, one more run.
RunRecord merge_run(const RunRecord& totals, const RunRecord& run);

std::string to_json(const RunRecord& record);
std::optional<RunRecord> parse_run_record(const std::string& json);

// Missing or malformed files yield a fresh record.
RunRecord load_run_record(const std::string& path);
bool save_run_record(const std::string& path, const RunRecord& record);

} // namespace ps
