#pragma once

#include "elevation_tuner/core/types.hpp"

namespace elevation_tuner::signal {

struct GainLoss {
    double gain = 0.0;
    double loss = 0.0;

    // loss / gain * 100, or 100 when there is no gain.
    double ratio() const { return gain > 0.0 ? loss / gain * 100.0 : 100.0; }
};

// Sum of positive and negative consecutive deltas.
GainLoss accumulate_naive(const VectorXd& elevation);

// Directional dead-zone. A baseline follows the trace only when a sample is
// more than gain_threshold above it or more than loss_threshold below it;
// each accepted move is accumulated.
GainLoss accumulate_dead_zone(const VectorXd& elevation, double gain_threshold,
                              double loss_threshold);

// Consecutive deltas count only when |delta| > epsilon.
GainLoss accumulate_symmetric(const VectorXd& elevation, double epsilon);

// Population std of first differences; 0.2 for fewer than five samples.
double local_noise(const VectorXd& elevation);

// min(max(0.05 + 0.02 * interval, 0.5 * noise), 0.5)
double adaptive_epsilon(double interval_m, double noise);

// Limits every step to cap_percent of its horizontal length. A cap of 0
// leaves the trace unchanged.
Trace cap_step_grades(const Trace& trace, double cap_percent);

struct AccumulationSettings {
    AccumulationMode mode = AccumulationMode::Naive;
    double gain_threshold = 0.0;
    double loss_threshold = 0.0;
    double epsilon = 0.0;
};

GainLoss accumulate(const VectorXd& elevation, const AccumulationSettings& settings);

} // namespace elevation_tuner::signal
