#include "elevation_tuner/io/report.hpp"
#include "elevation_tuner/core/utils.hpp"

#include <cmath>
#include <sstream>

namespace elevation_tuner::io {

namespace {

// JSON has no infinity; unbounded scores are written as null.
core::json finite_or_null(double v) {
    return std::isfinite(v) ? core::json(v) : core::json(nullptr);
}

core::json segment_to_json(const signal::Segment& s) {
    return {
        {"start_index", s.start_index},
        {"end_index", s.end_index},
        {"start_distance_m", s.start_distance_m},
        {"end_distance_m", s.end_distance_m},
        {"length_m", s.length_m()},
        {"elevation_change_m", s.elevation_change_m()},
        {"average_grade_percent", s.average_grade_percent},
        {"max_grade_percent", s.max_grade_percent}
    };
}

core::json optional_segment(const std::optional<signal::Segment>& s) {
    return s ? segment_to_json(*s) : core::json(nullptr);
}

} // namespace

core::json params_to_json(const config::PipelineParams& p) {
    core::json j;
    j["smoothing"] = smoothing_method_to_string(p.smoothing);
    j["accumulation"] = accumulation_mode_to_string(p.accumulation);
    j["resample"] = p.resample;
    j["outlier_correction"] = p.outlier_correction;
    j["gradient_blending"] = p.gradient_blending;
    j["gradient_capping"] = p.gradient_capping;
    j["spike_removal"] = p.spike_removal;
    for (const auto& spec : config::PipelineParams::specs()) {
        j[spec.name] = p.get(spec.name);
    }
    return j;
}

core::json score_to_json(const eval::AggregateScore& s) {
    core::json j;
    j["config_index"] = s.config_index;
    j["label"] = s.label;
    j["description"] = s.description;
    j["tracks"] = s.tracks;
    j["usable"] = s.usable;
    j["with_truth"] = s.with_truth;
    j["failed"] = s.failed;
    j["limited"] = s.limited;
    j["bands"] = {
        {"98_102", s.band_98_102},
        {"95_105", s.band_95_105},
        {"90_110", s.band_90_110},
        {"85_115", s.band_85_115},
        {"80_120", s.band_80_120},
        {"outside_80_120", s.outside_80_120}
    };
    j["balance_bands"] = {
        {"85_115", s.balance_85_115},
        {"70_130", s.balance_70_130}
    };
    j["accuracy"] = {
        {"mean", s.mean_accuracy},
        {"median", s.median_accuracy},
        {"std", s.std_accuracy},
        {"best", s.best_accuracy},
        {"worst", s.worst_accuracy},
        {"mean_abs_error", s.mean_abs_error},
        {"max_abs_error", s.max_abs_error},
        {"success_rate", s.success_rate}
    };
    j["median_ratio"] = s.median_ratio;
    j["avg_raw_gain"] = s.avg_raw_gain;
    j["avg_raw_loss"] = s.avg_raw_loss;
    j["avg_gain"] = s.avg_gain;
    j["avg_loss"] = s.avg_loss;
    j["gain_reduction_percent"] = s.gain_reduction_percent;
    j["loss_reduction_percent"] = s.loss_reduction_percent;
    j["avg_cutoff"] = s.avg_cutoff;
    j["avg_epsilon"] = s.avg_epsilon;
    j["weighted_accuracy"] = s.weighted_accuracy;
    j["balance_score"] = s.balance_score;
    j["loss_preservation"] = s.loss_preservation;
    j["combined_score"] = finite_or_null(s.combined_score);
    j["error_score"] = finite_or_null(s.error_score);
    j["terrain_scores"] = {
        {"flat_rolling", s.terrain.flat_rolling},
        {"hilly", s.terrain.hilly},
        {"mountainous", s.terrain.mountainous}
    };
    return j;
}

core::json result_to_json(const eval::EvaluationResult& r) {
    core::json j;
    j["config_index"] = r.config_index;
    j["track"] = r.track;
    j["status"] = eval_status_to_string(r.status);
    if (!r.message.empty()) j["message"] = r.message;
    j["raw_gain"] = r.raw_gain;
    j["raw_loss"] = r.raw_loss;
    j["gain"] = r.gain;
    j["loss"] = r.loss;
    j["ratio"] = r.ratio;
    j["truth"] = r.truth ? core::json(*r.truth) : core::json(nullptr);
    j["accuracy"] = r.accuracy ? finite_or_null(*r.accuracy) : core::json(nullptr);
    j["terrain"] = terrain_class_to_string(r.terrain);
    j["samples"] = r.samples;
    j["outliers_corrected"] = r.outliers_corrected;
    j["spikes_removed"] = r.spikes_removed;
    j["window"] = r.window;
    j["cutoff"] = r.cutoff;
    j["epsilon"] = r.epsilon;
    return j;
}

core::json incline_to_json(const signal::InclineReport& r) {
    core::json j;
    j["climbs"] = r.climbs.size();
    j["descents"] = r.descents.size();
    j["longest_climb"] = optional_segment(r.longest_climb);
    j["steepest_climb"] = optional_segment(r.steepest_climb);
    j["largest_climb"] = optional_segment(r.largest_climb);
    j["longest_descent"] = optional_segment(r.longest_descent);
    j["steepest_descent"] = optional_segment(r.steepest_descent);
    j["largest_descent"] = optional_segment(r.largest_descent);
    j["climbing_distance_m"] = r.climbing_distance_m;
    j["descending_distance_m"] = r.descending_distance_m;
    j["climbing_gain_m"] = r.climbing_gain_m;
    j["descending_loss_m"] = r.descending_loss_m;
    j["climbing_percent"] = r.climbing_percent;
    j["descending_percent"] = r.descending_percent;
    return j;
}

core::json report_to_json(const search::SearchReport& report, size_t top_n) {
    core::json j;
    j["scoring"] = eval::scoring_method_to_string(report.scoring);
    j["higher_is_better"] = eval::higher_is_better(report.scoring);
    j["stopped"] = report.stopped;
    j["tasks_total"] = report.tasks_total;
    j["tasks_completed"] = report.tasks_completed;
    j["configs_ranked"] = report.scores.size();

    core::json ranking = core::json::array();
    for (size_t i = 0; i < report.ranking.size() && i < top_n; ++i) {
        core::json entry = score_to_json(report.scores[report.ranking[i]]);
        entry["rank"] = i + 1;
        const size_t idx = report.scores[report.ranking[i]].config_index;
        for (const auto& cfg : report.configs) {
            if (cfg.index() == idx) {
                entry["params"] = params_to_json(cfg.params());
                break;
            }
        }
        ranking.push_back(std::move(entry));
    }
    j["ranking"] = std::move(ranking);

    core::json pareto = core::json::array();
    for (size_t pos : report.pareto) {
        const auto& s = report.scores[pos];
        pareto.push_back({
            {"config_index", s.config_index},
            {"label", s.label},
            {"median_accuracy", s.median_accuracy},
            {"median_ratio", s.median_ratio},
            {"loss_reduction_percent", s.loss_reduction_percent}
        });
    }
    j["pareto_front"] = std::move(pareto);
    return j;
}

void write_report_json(const fs::path& path, const search::SearchReport& report, size_t top_n) {
    core::write_text(path, report_to_json(report, top_n).dump(2) + "\n");
}

std::string scores_to_csv(const search::SearchReport& report) {
    std::ostringstream out;
    out << "rank,config_index,label,combined_score,error_score,median_accuracy,mean_accuracy,"
           "band_98_102,band_95_105,band_90_110,outside_80_120,median_ratio,"
           "gain_reduction_percent,loss_reduction_percent,failed,limited\n";
    for (size_t i = 0; i < report.ranking.size(); ++i) {
        const auto& s = report.scores[report.ranking[i]];
        std::string label = s.label;
        for (char& c : label) {
            if (c == ',' || c == '"') c = ';';
        }
        out << (i + 1) << ',' << s.config_index << ',' << label << ','
            << s.combined_score << ',' << s.error_score << ','
            << s.median_accuracy << ',' << s.mean_accuracy << ','
            << s.band_98_102 << ',' << s.band_95_105 << ',' << s.band_90_110 << ','
            << s.outside_80_120 << ',' << s.median_ratio << ','
            << s.gain_reduction_percent << ',' << s.loss_reduction_percent << ','
            << s.failed << ',' << s.limited << '\n';
    }
    return out.str();
}

void write_results_csv(const fs::path& path, const search::SearchReport& report) {
    core::write_text(path, scores_to_csv(report));
}

} // namespace elevation_tuner::io
