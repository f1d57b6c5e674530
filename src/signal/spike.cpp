#include "elevation_tuner/signal/spike.hpp"

#include <cmath>

namespace elevation_tuner::signal {

SpikeResult remove_spikes(const Trace& trace, double threshold_m, int max_passes) {
    SpikeResult result;
    result.trace = trace;
    if (!(threshold_m > 0.0) || trace.size() < 3) {
        return result;
    }

    VectorXd& e = result.trace.elevation;
    const Eigen::Index n = e.size();
    const double half = 0.5 * threshold_m;

    for (int pass = 0; pass < max_passes; ++pass) {
        size_t removed = 0;
        for (Eigen::Index i = 1; i + 1 < n; ++i) {
            const double up = e[i] - e[i - 1];
            const double down = e[i + 1] - e[i];
            const bool large = std::fabs(up) > threshold_m || std::fabs(down) > threshold_m;
            const bool reversal = (up > 0.0 && down < 0.0) || (up < 0.0 && down > 0.0);
            if (large && reversal && std::fabs(up) > half && std::fabs(down) > half) {
                e[i] = 0.5 * (e[i - 1] + e[i + 1]);
                ++removed;
            }
        }
        result.passes = pass + 1;
        result.removed += removed;
        if (removed == 0) break;
    }
    return result;
}

} // namespace elevation_tuner::signal
