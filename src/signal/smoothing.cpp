#include "elevation_tuner/signal/smoothing.hpp"
#include "elevation_tuner/signal/biquad.hpp"
#include "elevation_tuner/config/configuration.hpp"
#include "elevation_tuner/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace elevation_tuner::signal {

int adaptive_window_size(const Trace& trace, double alpha, int window_min, int window_max) {
    const size_t n = trace.size();
    if (window_max < window_min) window_max = window_min;
    if (n < 2) {
        return (window_min % 2 == 0) ? window_min + 1 : window_min;
    }

    const double sigma = core::sample_stddev_of(core::diffs_of(trace.elevation));
    const double mu = std::max(trace.total_distance() - trace.distance[0], 0.0) /
                      static_cast<double>(n - 1);

    const double raw = alpha * (sigma / std::max(mu, 1e-10));
    int window = std::isfinite(raw)
                     ? static_cast<int>(std::min(std::round(raw), 1e9))
                     : window_max;
    window = std::min(std::max(window, window_min), window_max);
    if (window % 2 == 0) {
        window += 1;
    }
    return window;
}

VectorXd gaussian_weighted_average(const VectorXd& values, int window) {
    const Eigen::Index n = values.size();
    VectorXd out(n);
    if (n == 0) return out;

    const Eigen::Index half = std::max(window, 1) / 2;
    const double sigma = static_cast<double>(std::max(window, 1)) / 6.0;

    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Index start = i >= half ? i - half : 0;
        const Eigen::Index end = std::min(i + half, n - 1);
        const Eigen::Index center = (start + end) / 2;

        double weighted_sum = 0.0;
        double weight_sum = 0.0;
        for (Eigen::Index j = start; j <= end; ++j) {
            const double dist = static_cast<double>(j - center) / sigma;
            const double w = std::exp(-0.5 * dist * dist);
            weighted_sum += values[j] * w;
            weight_sum += w;
        }
        out[i] = weight_sum > 0.0 ? weighted_sum / weight_sum : values[i];
    }
    return out;
}

SmoothResult smooth_gaussian(const Trace& trace, double alpha, int window_min, int window_max) {
    SmoothResult result;
    result.trace = trace;
    result.method = SmoothingMethod::Gaussian;
    if (trace.size() < kMinGaussianSamples) {
        return result;
    }

    result.window = adaptive_window_size(trace, alpha, window_min, window_max);
    result.trace.elevation = gaussian_weighted_average(trace.elevation, result.window);
    result.applied = true;
    return result;
}

SmoothResult smooth_zero_phase(const Trace& trace, double interval_m) {
    SmoothResult result;
    result.trace = trace;
    result.method = SmoothingMethod::ZeroPhase;

    const size_t n = trace.size();
    if (n < kMinZeroPhaseSamples || !(interval_m > 0.0)) {
        return result;
    }

    const double spacing = (trace.total_distance() - trace.distance[0]) /
                           static_cast<double>(n - 1);
    if (!(spacing > 1e-10)) {
        return result;
    }
    result.sample_spacing = spacing;

    const double sample_rate = 1.0 / spacing;
    const double nyquist = 0.5 * sample_rate;
    const double wavelength = 2.0 * interval_m;
    const double cutoff = std::min(std::max(1.0 / wavelength, 0.01 * nyquist), 0.45 * nyquist);
    result.cutoff = cutoff;

    auto coeffs = design_lowpass(cutoff, sample_rate);
    if (!coeffs) {
        return result;
    }

    // Three cutoff periods of padding lets the start-up transient decay.
    const double period_samples = sample_rate / cutoff;
    const size_t pad = static_cast<size_t>(std::max(9.0, std::ceil(3.0 * period_samples)));

    VectorXd filtered = filtfilt(*coeffs, trace.elevation, pad);
    if (!filtered.allFinite()) {
        return result;
    }

    result.trace.elevation = std::move(filtered);
    result.applied = true;
    return result;
}

SmoothResult smooth(const Trace& trace, const config::PipelineParams& params) {
    switch (params.smoothing) {
        case SmoothingMethod::Gaussian:
            return smooth_gaussian(trace, params.window_alpha, params.window_min,
                                   params.window_max);
        case SmoothingMethod::ZeroPhase:
            return smooth_zero_phase(trace, params.cutoff_interval_m);
        case SmoothingMethod::None:
            break;
    }
    SmoothResult passthrough;
    passthrough.trace = trace;
    return passthrough;
}

} // namespace elevation_tuner::signal
