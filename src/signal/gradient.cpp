#include "elevation_tuner/signal/gradient.hpp"
#include "elevation_tuner/signal/outlier.hpp"

#include <algorithm>

namespace elevation_tuner::signal {

VectorXd reintegrate(const VectorXd& distance, const std::vector<double>& gradients,
                     double start) {
    const Eigen::Index n = distance.size();
    VectorXd out(n);
    if (n == 0) return out;
    out[0] = start;
    for (Eigen::Index i = 0; i + 1 < n; ++i) {
        const double g = static_cast<size_t>(i) < gradients.size()
                             ? gradients[static_cast<size_t>(i)]
                             : 0.0;
        out[i + 1] = out[i] + g * (distance[i + 1] - distance[i]);
    }
    return out;
}

Trace postprocess_gradients(const Trace& reference, const Trace& smoothed,
                            const GradientOptions& options) {
    if (smoothed.size() < 2 || reference.size() != smoothed.size()) {
        return smoothed;
    }
    if (!options.blend && !options.clamp) {
        return smoothed;
    }

    std::vector<double> grads = segment_gradients(smoothed);

    if (options.blend) {
        const std::vector<double> raw = segment_gradients(reference);
        const double b = std::min(std::max(options.blend_factor, 0.0), 1.0);
        for (size_t i = 0; i < grads.size(); ++i) {
            grads[i] = b * raw[i] + (1.0 - b) * grads[i];
        }
    }

    if (options.clamp) {
        const double lo = std::min(options.gradient_min, options.gradient_max);
        const double hi = std::max(options.gradient_min, options.gradient_max);
        for (double& g : grads) {
            g = std::min(std::max(g, lo), hi);
        }
    }

    Trace out;
    out.distance = smoothed.distance;
    out.elevation = reintegrate(smoothed.distance, grads, smoothed.elevation[0]);
    return out;
}

} // namespace elevation_tuner::signal
