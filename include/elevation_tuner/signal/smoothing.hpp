#pragma once

#include "elevation_tuner/core/types.hpp"

namespace elevation_tuner::config {
struct PipelineParams;
}

namespace elevation_tuner::signal {

// Shortest trace each strategy will touch; shorter input passes through.
constexpr size_t kMinGaussianSamples = 5;
constexpr size_t kMinZeroPhaseSamples = 10;

struct SmoothResult {
    Trace trace;
    SmoothingMethod method = SmoothingMethod::None;
    bool applied = false;
    int window = 0;            // Gaussian: samples in the averaging window
    double cutoff = 0.0;       // zero-phase: cutoff in cycles per metre
    double sample_spacing = 0.0;
};

// window = round(alpha * sigma / mu) clamped to [window_min, window_max] and
// made odd. sigma is the sample std of elevation steps, mu the mean distance
// step.
int adaptive_window_size(const Trace& trace, double alpha, int window_min, int window_max);

// Gaussian-weighted moving average, sigma = window / 6. Near the ends the
// window is clipped to the trace and centred on the clipped range.
VectorXd gaussian_weighted_average(const VectorXd& values, int window);

SmoothResult smooth_gaussian(const Trace& trace, double alpha, int window_min, int window_max);

// Zero-phase 2nd-order low-pass. The preserved wavelength is 2 * interval_m;
// the cutoff is clamped to [0.01, 0.45] of Nyquist for the trace's mean
// spacing. Falls back to the input when the filter cannot be designed.
SmoothResult smooth_zero_phase(const Trace& trace, double interval_m);

// Dispatches on params.smoothing.
SmoothResult smooth(const Trace& trace, const config::PipelineParams& params);

} // namespace elevation_tuner::signal
