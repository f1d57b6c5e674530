#include "elevation_tuner/signal/outlier.hpp"
#include "elevation_tuner/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace elevation_tuner::signal {

std::vector<double> segment_gradients(const VectorXd& distance, const VectorXd& elevation) {
    std::vector<double> grads;
    const Eigen::Index n = std::min(distance.size(), elevation.size());
    if (n < 2) return grads;
    grads.reserve(static_cast<size_t>(n - 1));
    for (Eigen::Index i = 0; i + 1 < n; ++i) {
        const double dx = distance[i + 1] - distance[i];
        if (std::fabs(dx) < kMinSegmentLength) {
            grads.push_back(0.0);
        } else {
            grads.push_back((elevation[i + 1] - elevation[i]) / dx);
        }
    }
    return grads;
}

std::vector<double> segment_gradients(const Trace& trace) {
    return segment_gradients(trace.distance, trace.elevation);
}

OutlierResult correct_outliers(const Trace& trace, double k) {
    OutlierResult result;
    result.trace = trace;

    const size_t n = trace.size();
    if (n < 3) return result;

    const std::vector<double> grads = segment_gradients(trace);
    std::vector<double> scratch = grads;
    const double median = core::median_of(scratch);
    const double mad = core::mad_of(grads);
    const double threshold = k * mad;

    std::vector<bool> flagged(n, false);
    bool any = false;
    for (size_t i = 0; i < grads.size(); ++i) {
        if (std::fabs(grads[i] - median) > threshold) {
            flagged[i + 1] = true;
            any = true;
        }
    }
    if (!any) return result;

    const VectorXd& d = trace.distance;
    const VectorXd& e = trace.elevation;
    VectorXd& out = result.trace.elevation;

    for (size_t i = 1; i < n; ++i) {
        if (!flagged[i]) continue;

        size_t lo = 0;
        for (size_t j = i; j-- > 0;) {
            if (!flagged[j]) {
                lo = j;
                break;
            }
        }
        size_t hi = n - 1;
        for (size_t j = i + 1; j < n; ++j) {
            if (!flagged[j]) {
                hi = j;
                break;
            }
        }
        if (lo == hi || hi == i) continue;

        const auto ilo = static_cast<Eigen::Index>(lo);
        const auto ihi = static_cast<Eigen::Index>(hi);
        const auto ii = static_cast<Eigen::Index>(i);
        const double span = d[ihi] - d[ilo];
        const double t = span < kMinSegmentLength ? 0.0 : (d[ii] - d[ilo]) / span;
        out[ii] = e[ilo] + t * (e[ihi] - e[ilo]);
        ++result.corrected;
    }

    return result;
}

} // namespace elevation_tuner::signal
