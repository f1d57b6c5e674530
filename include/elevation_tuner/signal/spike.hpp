#pragma once

#include "elevation_tuner/core/types.hpp"

namespace elevation_tuner::signal {

struct SpikeResult {
    Trace trace;
    size_t removed = 0;
    int passes = 0;
};

// Repeated passes over interior samples. A sample is a spike when one of its
// two deltas exceeds threshold_m, the deltas have opposite signs and both
// exceed half the threshold; it is replaced by the mean of its neighbours.
// Stops after a pass that removes nothing or after max_passes.
SpikeResult remove_spikes(const Trace& trace, double threshold_m, int max_passes = 100);

} // namespace elevation_tuner::signal
