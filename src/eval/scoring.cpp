#include "elevation_tuner/eval/scoring.hpp"
#include "elevation_tuner/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace elevation_tuner::eval {

std::string scoring_method_to_string(ScoringMethod m) {
    return m == ScoringMethod::Combined ? "combined" : "error";
}

std::optional<ScoringMethod> string_to_scoring_method(const std::string& s) {
    const std::string norm = core::to_lower(core::trim(s));
    if (norm == "combined") return ScoringMethod::Combined;
    if (norm == "error") return ScoringMethod::Error;
    return std::nullopt;
}

bool higher_is_better(ScoringMethod m) {
    return m == ScoringMethod::Combined;
}

static bool within(double v, double lo, double hi) {
    return v >= lo && v <= hi;
}

static double reduction_percent(double raw, double processed) {
    return raw > 0.0 ? (raw - processed) / raw * 100.0 : 0.0;
}

static double terrain_points(double accuracy) {
    return within(accuracy, 90.0, 110.0) ? 10.0 - std::fabs(accuracy - 100.0) : 0.0;
}

AggregateScore aggregate(const config::Configuration& cfg,
                         const std::vector<EvaluationResult>& results) {
    AggregateScore s;
    s.config_index = cfg.index();
    s.label = cfg.label();
    s.description = cfg.describe();

    std::vector<double> accuracies;
    std::vector<double> ratios;
    double raw_gain_sum = 0.0;
    double raw_loss_sum = 0.0;
    double gain_sum = 0.0;
    double loss_sum = 0.0;
    double cutoff_sum = 0.0;
    double epsilon_sum = 0.0;
    double fr_sum = 0.0, hilly_sum = 0.0, mtn_sum = 0.0;

    for (const auto& r : results) {
        if (r.config_index != cfg.index()) continue;
        ++s.tracks;
        if (!r.usable()) {
            ++s.failed;
            continue;
        }
        ++s.usable;
        if (r.status == EvalStatus::ResourceLimited) ++s.limited;

        ratios.push_back(r.ratio);
        if (within(r.ratio, 85.0, 115.0)) ++s.balance_85_115;
        if (within(r.ratio, 70.0, 130.0)) ++s.balance_70_130;
        raw_gain_sum += r.raw_gain;
        raw_loss_sum += r.raw_loss;
        gain_sum += r.gain;
        loss_sum += r.loss;
        cutoff_sum += r.cutoff;
        epsilon_sum += r.epsilon;

        if (!r.accuracy) continue;
        const double acc = *r.accuracy;
        if (!std::isfinite(acc)) continue;
        ++s.with_truth;
        accuracies.push_back(acc);

        if (within(acc, 98.0, 102.0)) ++s.band_98_102;
        if (within(acc, 95.0, 105.0)) ++s.band_95_105;
        if (within(acc, 90.0, 110.0)) ++s.band_90_110;
        if (within(acc, 85.0, 115.0)) ++s.band_85_115;
        if (within(acc, 80.0, 120.0)) ++s.band_80_120;
        else ++s.outside_80_120;

        switch (r.terrain) {
            case TerrainClass::Flat:
            case TerrainClass::Rolling:
                fr_sum += terrain_points(acc);
                ++s.terrain.flat_rolling_count;
                break;
            case TerrainClass::Hilly:
                hilly_sum += terrain_points(acc);
                ++s.terrain.hilly_count;
                break;
            case TerrainClass::Mountainous:
                mtn_sum += terrain_points(acc);
                ++s.terrain.mountainous_count;
                break;
        }
    }

    if (s.usable > 0) {
        const double n = static_cast<double>(s.usable);
        s.avg_raw_gain = raw_gain_sum / n;
        s.avg_raw_loss = raw_loss_sum / n;
        s.avg_gain = gain_sum / n;
        s.avg_loss = loss_sum / n;
        s.avg_cutoff = cutoff_sum / n;
        s.avg_epsilon = epsilon_sum / n;
        s.median_ratio = core::median_of(ratios);
    }
    s.gain_reduction_percent = reduction_percent(s.avg_raw_gain, s.avg_gain);
    s.loss_reduction_percent = reduction_percent(s.avg_raw_loss, s.avg_loss);

    if (s.terrain.flat_rolling_count > 0) {
        s.terrain.flat_rolling = fr_sum / static_cast<double>(s.terrain.flat_rolling_count);
    }
    if (s.terrain.hilly_count > 0) {
        s.terrain.hilly = hilly_sum / static_cast<double>(s.terrain.hilly_count);
    }
    if (s.terrain.mountainous_count > 0) {
        s.terrain.mountainous = mtn_sum / static_cast<double>(s.terrain.mountainous_count);
    }

    if (!accuracies.empty()) {
        s.mean_accuracy = core::mean_of(accuracies);
        s.std_accuracy = core::stddev_of(accuracies);

        double best_dev = std::numeric_limits<double>::infinity();
        double worst_dev = -1.0;
        double err_sum = 0.0;
        for (double acc : accuracies) {
            const double dev = std::fabs(acc - 100.0);
            if (dev < best_dev) {
                best_dev = dev;
                s.best_accuracy = acc;
            }
            if (dev > worst_dev) {
                worst_dev = dev;
                s.worst_accuracy = acc;
            }
            err_sum += dev;
            s.max_abs_error = std::max(s.max_abs_error, dev);
        }
        s.mean_abs_error = err_sum / static_cast<double>(accuracies.size());
        s.median_accuracy = core::median_of(accuracies);
        s.success_rate = static_cast<double>(s.band_90_110) /
                         static_cast<double>(s.with_truth) * 100.0;
    }

    auto diff = [](size_t wide, size_t narrow) {
        return static_cast<double>(wide) - static_cast<double>(narrow);
    };
    s.weighted_accuracy = 10.0 * static_cast<double>(s.band_98_102) +
                          6.0 * diff(s.band_95_105, s.band_98_102) +
                          3.0 * diff(s.band_90_110, s.band_95_105) +
                          1.5 * diff(s.band_85_115, s.band_90_110) +
                          1.0 * diff(s.band_80_120, s.band_85_115) -
                          5.0 * static_cast<double>(s.outside_80_120);
    s.balance_score = 10.0 * static_cast<double>(s.balance_85_115) +
                      5.0 * diff(s.balance_70_130, s.balance_85_115) -
                      2.0 * std::fabs(s.median_ratio - 100.0);
    s.loss_preservation =
        100.0 - std::fabs(s.loss_reduction_percent - s.gain_reduction_percent);
    s.combined_score =
        0.4 * s.weighted_accuracy + 0.4 * s.balance_score + 0.2 * s.loss_preservation;

    if (s.with_truth == 0) {
        s.error_score = std::numeric_limits<double>::infinity();
    } else {
        const double n = static_cast<double>(s.with_truth);
        s.error_score = s.mean_abs_error * 0.4 + s.max_abs_error * 0.25 +
                        (n - static_cast<double>(s.band_95_105)) * 3.0 +
                        (n - static_cast<double>(s.band_98_102)) * 1.0;
    }

    return s;
}

bool ranks_before(const AggregateScore& a, const AggregateScore& b, ScoringMethod m) {
    const double sa = a.score(m);
    const double sb = b.score(m);
    const bool na = std::isnan(sa);
    const bool nb = std::isnan(sb);
    if (na != nb) return nb;
    if (!na && sa != sb) {
        return higher_is_better(m) ? sa > sb : sa < sb;
    }
    return a.config_index < b.config_index;
}

std::vector<size_t> rank(const std::vector<AggregateScore>& scores, ScoringMethod m) {
    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (ranks_before(scores[a], scores[b], m)) return true;
        if (ranks_before(scores[b], scores[a], m)) return false;
        return a < b;
    });
    return order;
}

static bool dominates(const AggregateScore& a, const AggregateScore& b) {
    const bool no_worse = a.median_accuracy >= b.median_accuracy &&
                          a.median_ratio >= b.median_ratio &&
                          a.loss_reduction_percent <= b.loss_reduction_percent;
    const bool better = a.median_accuracy > b.median_accuracy ||
                        a.median_ratio > b.median_ratio ||
                        a.loss_reduction_percent < b.loss_reduction_percent;
    return no_worse && better;
}

std::vector<size_t> pareto_front(const std::vector<AggregateScore>& scores) {
    std::vector<size_t> front;
    for (size_t i = 0; i < scores.size(); ++i) {
        bool dominated = false;
        for (size_t j = 0; j < scores.size() && !dominated; ++j) {
            if (i != j && dominates(scores[j], scores[i])) dominated = true;
        }
        if (!dominated) front.push_back(i);
    }
    return front;
}

} // namespace elevation_tuner::eval
