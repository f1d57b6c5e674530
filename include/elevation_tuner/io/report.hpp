#pragma once

#include "elevation_tuner/core/events.hpp"
#include "elevation_tuner/eval/scoring.hpp"
#include "elevation_tuner/search/search_harness.hpp"
#include "elevation_tuner/signal/incline.hpp"

#include <filesystem>
#include <string>

namespace elevation_tuner::io {

namespace fs = std::filesystem;

core::json params_to_json(const config::PipelineParams& p);
core::json score_to_json(const eval::AggregateScore& s);
core::json result_to_json(const eval::EvaluationResult& r);
core::json incline_to_json(const signal::InclineReport& r);

// Ranked summary; top_n limits the "ranking" array.
core::json report_to_json(const search::SearchReport& report, size_t top_n);

void write_report_json(const fs::path& path, const search::SearchReport& report, size_t top_n);

// One row per configuration in ranking order.
std::string scores_to_csv(const search::SearchReport& report);
void write_results_csv(const fs::path& path, const search::SearchReport& report);

} // namespace elevation_tuner::io
