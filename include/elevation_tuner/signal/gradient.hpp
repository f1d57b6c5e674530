#pragma once

#include "elevation_tuner/core/types.hpp"

#include <vector>

namespace elevation_tuner::signal {

struct GradientOptions {
    bool blend = false;
    double blend_factor = 0.0;   // weight of the pre-smoothing gradient
    bool clamp = true;
    double gradient_min = -0.5;
    double gradient_max = 0.6;
};

// Blends smoothed gradients with the pre-smoothing ones, clamps the result
// and reintegrates from the first smoothed elevation. Traces must share the
// same distances; mismatched or short input returns `smoothed` unchanged.
Trace postprocess_gradients(const Trace& reference, const Trace& smoothed,
                            const GradientOptions& options);

// e[0] = start, e[i+1] = e[i] + g[i] * (d[i+1] - d[i])
VectorXd reintegrate(const VectorXd& distance, const std::vector<double>& gradients,
                     double start);

} // namespace elevation_tuner::signal
