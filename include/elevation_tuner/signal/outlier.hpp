#pragma once

#include "elevation_tuner/core/types.hpp"

#include <vector>

namespace elevation_tuner::signal {

// Distance below which a segment counts as zero-length.
constexpr double kMinSegmentLength = 1e-10;

struct OutlierResult {
    Trace trace;
    size_t corrected = 0;
};

// Per-segment gradients de/dd, size n-1. Zero-length segments yield 0.
std::vector<double> segment_gradients(const VectorXd& distance, const VectorXd& elevation);
std::vector<double> segment_gradients(const Trace& trace);

// Flags sample i+1 when gradient i deviates from the median gradient by more
// than k * MAD and replaces it by distance-weighted interpolation between the
// nearest unflagged neighbours.
OutlierResult correct_outliers(const Trace& trace, double k = 3.0);

} // namespace elevation_tuner::signal
