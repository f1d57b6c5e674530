#pragma once

#include "elevation_tuner/config/configuration.hpp"
#include "elevation_tuner/eval/evaluator.hpp"

#include <optional>
#include <string>
#include <vector>

namespace elevation_tuner::eval {

// Each scoring function has exactly one direction; a ranking uses one
// function only.
enum class ScoringMethod {
    Combined,  // higher is better
    Error      // lower is better
};

std::string scoring_method_to_string(ScoringMethod m);
std::optional<ScoringMethod> string_to_scoring_method(const std::string& s);
bool higher_is_better(ScoringMethod m);

struct TerrainScores {
    double flat_rolling = 0.0;
    double hilly = 0.0;
    double mountainous = 0.0;
    size_t flat_rolling_count = 0;
    size_t hilly_count = 0;
    size_t mountainous_count = 0;
};

struct AggregateScore {
    size_t config_index = 0;
    std::string label;
    std::string description;

    size_t tracks = 0;      // results seen
    size_t usable = 0;      // not failed
    size_t with_truth = 0;  // usable and accuracy defined
    size_t failed = 0;
    size_t limited = 0;

    // Accuracy bands (percent of ground truth)
    size_t band_98_102 = 0;
    size_t band_95_105 = 0;
    size_t band_90_110 = 0;
    size_t band_85_115 = 0;
    size_t band_80_120 = 0;
    size_t outside_80_120 = 0;

    // Loss/gain ratio bands
    size_t balance_85_115 = 0;
    size_t balance_70_130 = 0;

    double mean_accuracy = 0.0;
    double median_accuracy = 0.0;
    double std_accuracy = 0.0;
    double best_accuracy = 0.0;   // closest to 100
    double worst_accuracy = 0.0;  // furthest from 100
    double mean_abs_error = 0.0;
    double max_abs_error = 0.0;
    double success_rate = 0.0;    // band_90_110 / with_truth * 100

    double median_ratio = 100.0;
    double avg_raw_gain = 0.0;
    double avg_raw_loss = 0.0;
    double avg_gain = 0.0;
    double avg_loss = 0.0;
    double gain_reduction_percent = 0.0;
    double loss_reduction_percent = 0.0;
    double avg_cutoff = 0.0;
    double avg_epsilon = 0.0;

    double weighted_accuracy = 0.0;
    double balance_score = 0.0;
    double loss_preservation = 0.0;
    double combined_score = 0.0;
    double error_score = 0.0;

    TerrainScores terrain;

    double score(ScoringMethod m) const {
        return m == ScoringMethod::Combined ? combined_score : error_score;
    }
};

// Builds the per-configuration summary. Results belonging to other
// configurations are ignored.
AggregateScore aggregate(const config::Configuration& cfg,
                         const std::vector<EvaluationResult>& results);

// Strict weak order: better score first, then lower configuration index.
// NaN scores sort last.
bool ranks_before(const AggregateScore& a, const AggregateScore& b, ScoringMethod m);

// Positions into `scores`, best first.
std::vector<size_t> rank(const std::vector<AggregateScore>& scores, ScoringMethod m);

// Non-dominated positions for (median accuracy up, median ratio up,
// loss reduction down), ordered by position.
std::vector<size_t> pareto_front(const std::vector<AggregateScore>& scores);

} // namespace elevation_tuner::eval
