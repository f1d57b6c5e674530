#pragma once

#include "elevation_tuner/core/types.hpp"

namespace elevation_tuner::signal {

// Upper bound on resampled length; protects memory on long tracks with
// very small spacings.
constexpr size_t kMaxResampleSamples = 100000;

struct ResampleResult {
    Trace trace;
    ResampleStatus status = ResampleStatus::Ok;
};

// Linear interpolation of elevation at distance `target`. Targets at or past
// the last sample reuse the last elevation; zero-length segments use the
// left sample.
double interpolate_elevation(const Trace& trace, double target);

// Uniform resampling over [0, total distance]. Distances are i * spacing,
// except the final sample which sits at the total distance. On a status
// other than Ok the input trace is returned unchanged.
ResampleResult resample(const Trace& trace, double spacing_m,
                        size_t max_samples = kMaxResampleSamples);

} // namespace elevation_tuner::signal
