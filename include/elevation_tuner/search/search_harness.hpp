#pragma once

#include "elevation_tuner/config/configuration.hpp"
#include "elevation_tuner/core/progress.hpp"
#include "elevation_tuner/core/types.hpp"
#include "elevation_tuner/eval/evaluator.hpp"
#include "elevation_tuner/eval/scoring.hpp"
#include "elevation_tuner/search/parameter_space.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace elevation_tuner::search {

namespace fs = std::filesystem;

struct HarnessOptions {
    int workers = 4;
    eval::ScoringMethod scoring = eval::ScoringMethod::Combined;
    std::string run_id;
    std::ostream* event_log = nullptr;   // JSON lines; none when null
    fs::path stop_file;                  // empty: no file check
    size_t progress_every = 5;
};

struct SearchReport {
    eval::ScoringMethod scoring = eval::ScoringMethod::Combined;
    std::vector<config::Configuration> configs;
    std::vector<eval::EvaluationResult> results;   // config-major, track order
    std::vector<eval::AggregateScore> scores;      // one per completed config
    std::vector<size_t> ranking;                   // positions into scores
    std::vector<size_t> pareto;                    // positions into scores
    size_t tasks_total = 0;
    size_t tasks_completed = 0;
    bool stopped = false;

    const eval::AggregateScore* best() const {
        return ranking.empty() ? nullptr : &scores[ranking.front()];
    }
};

// min(requested, hardware threads, tasks), at least 1
int compute_worker_count(int requested, size_t task_count);

class SearchHarness {
public:
    explicit SearchHarness(HarnessOptions options);

    // Evaluates every (configuration, track) pair on a worker pool, then
    // aggregates and ranks at the barrier. Stops taking tasks once
    // progress.request_stop() is called or the stop file exists.
    SearchReport run(const std::vector<config::Configuration>& configs,
                     const std::vector<NamedTrack>& corpus, const GroundTruthMap& truth,
                     core::SearchProgress& progress) const;

    SearchReport run(ConfigSequence& sequence, const std::vector<NamedTrack>& corpus,
                     const GroundTruthMap& truth, core::SearchProgress& progress) const;

    // Coarse scan of one knob followed by refinement rounds around the best
    // value, each shrinking the range. Configuration indices are unique
    // across rounds.
    SearchReport run_adaptive(const config::PipelineParams& base,
                              const config::AdaptiveConfig& adaptive,
                              const std::vector<NamedTrack>& corpus,
                              const GroundTruthMap& truth,
                              core::SearchProgress& progress) const;

    const HarnessOptions& options() const { return options_; }

private:
    bool stop_file_present() const;

    HarnessOptions options_;
};

} // namespace elevation_tuner::search
