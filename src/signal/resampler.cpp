#include "elevation_tuner/signal/resampler.hpp"

#include <algorithm>
#include <cmath>

namespace elevation_tuner::signal {

double interpolate_elevation(const Trace& trace, double target) {
    const Eigen::Index n = trace.distance.size();
    if (n == 0) return 0.0;

    const double* d = trace.distance.data();
    const double* first = d;
    const double* last = d + n;
    const double* it = std::lower_bound(first, last, target);

    // Exact match uses that sample, otherwise the predecessor.
    Eigen::Index idx;
    if (it != last && *it == target) {
        idx = static_cast<Eigen::Index>(it - first);
    } else {
        idx = it == first ? 0 : static_cast<Eigen::Index>(it - first) - 1;
    }

    if (idx >= n - 1) {
        return trace.elevation[n - 1];
    }

    const double d0 = trace.distance[idx];
    const double d1 = trace.distance[idx + 1];
    const double e0 = trace.elevation[idx];
    const double e1 = trace.elevation[idx + 1];
    const double span = d1 - d0;
    if (span < 1e-10) {
        return e0;
    }
    const double t = std::min(std::max((target - d0) / span, 0.0), 1.0);
    return e0 + t * (e1 - e0);
}

ResampleResult resample(const Trace& trace, double spacing_m, size_t max_samples) {
    ResampleResult result;
    result.trace = trace;

    if (!std::isfinite(spacing_m) || spacing_m <= 0.0) {
        result.status = ResampleStatus::InvalidSpacing;
        return result;
    }

    const double total = trace.total_distance();
    if (trace.size() < 2 || !(total > 0.0)) {
        result.status = ResampleStatus::Passthrough;
        return result;
    }

    // Tolerate floating error so an exact multiple does not get an extra step.
    const double steps = std::ceil(total / spacing_m - 1e-9);
    if (!(steps + 1.0 <= static_cast<double>(max_samples))) {
        result.status = ResampleStatus::SampleLimitExceeded;
        return result;
    }

    const Eigen::Index num = static_cast<Eigen::Index>(steps) + 1;
    Trace out;
    out.distance.resize(num);
    out.elevation.resize(num);
    for (Eigen::Index i = 0; i < num; ++i) {
        const double target = std::min(static_cast<double>(i) * spacing_m, total);
        out.distance[i] = target;
        out.elevation[i] = interpolate_elevation(trace, target);
    }

    result.trace = std::move(out);
    result.status = ResampleStatus::Ok;
    return result;
}

} // namespace elevation_tuner::signal
