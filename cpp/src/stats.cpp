#include "piestack/stats.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

namespace ps {
namespace {

std::optional<int64_t> extract_json_int_field(const std::string& json, std::string_view field) {
    const std::string quoted_key = "\"" + std::string(field) + "\"";
    const std::size_t key_pos = json.find(quoted_key);
    if (key_pos == std::string::npos) {
        return std::nullopt;
    }
    std::size_t cursor = json.find(':', key_pos + quoted_key.size());
    if (cursor == std::string::npos) {
        return std::nullopt;
    }
    ++cursor;
    while (cursor < json.size() && std::isspace(static_cast<unsigned char>(json[cursor]))) {
        ++cursor;
    }

    errno = 0;
    char* end_ptr = nullptr;
    const long long parsed = std::strtoll(json.c_str() + cursor, &end_ptr, 10);
    if (end_ptr == json.c_str() + cursor || errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

} // namespace

RunRecord merge_run(const RunRecord& totals, const RunRecord& run) {
    RunRecord out = totals;
    out.total_kills += run.total_kills;
    out.total_grazes += run.total_grazes;
    out.best_combo = std::max(totals.best_combo, run.best_combo);
    out.best_score = std::max(totals.best_score, run.best_score);
    out.best_stage = std::max(totals.best_stage, run.best_stage);
    out.total_runs += 1;
    return out;
}

std::string to_json(const RunRecord& record) {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"total_kills\": " << record.total_kills << ",\n";
    oss << "  \"total_grazes\": " << record.total_grazes << ",\n";
    oss << "  \"best_combo\": " << record.best_combo << ",\n";
    oss << "  \"best_score\": " << record.best_score << ",\n";
    oss << "  \"best_stage\": " << record.best_stage << ",\n";
    oss << "  \"total_runs\": " << record.total_runs << "\n";
    oss << "}\n";
    return oss.str();
}

std::optional<RunRecord> parse_run_record(const std::string& json) {
    if (json.find('{') == std::string::npos) {
        return std::nullopt;
    }

    const auto kills = extract_json_int_field(json, "total_kills");
    const auto grazes = extract_json_int_field(json, "total_grazes");
    const auto combo = extract_json_int_field(json, "best_combo");
    const auto score = extract_json_int_field(json, "best_score");
    const auto stage = extract_json_int_field(json, "best_stage");
    const auto runs = extract_json_int_field(json, "total_runs");
    if (!kills || !grazes || !combo || !score || !stage || !runs) {
        return std::nullopt;
    }
    if (*kills < 0 || *grazes < 0 || *combo < 0 || *score < 0 || *stage < 1 || *runs < 0) {
        return std::nullopt;
    }

    RunRecord out{};
    out.total_kills = *kills;
    out.total_grazes = *grazes;
    out.best_combo = static_cast<int>(*combo);
    out.best_score = *score;
    out.best_stage = static_cast<int>(*stage);
    out.total_runs = *runs;
    return out;
}

RunRecord load_run_record(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return RunRecord{};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_run_record(buffer.str()).value_or(RunRecord{});
}

bool save_run_record(const std::string& path, const RunRecord& record) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return false;
    }
    out << to_json(record);
    out.flush();
    return static_cast<bool>(out);
}

} // namespace ps
