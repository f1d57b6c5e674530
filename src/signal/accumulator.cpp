#include "elevation_tuner/signal/accumulator.hpp"
#include "elevation_tuner/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace elevation_tuner::signal {

GainLoss accumulate_naive(const VectorXd& elevation) {
    GainLoss gl;
    for (Eigen::Index i = 1; i < elevation.size(); ++i) {
        const double delta = elevation[i] - elevation[i - 1];
        if (delta > 0.0) {
            gl.gain += delta;
        } else {
            gl.loss -= delta;
        }
    }
    return gl;
}

GainLoss accumulate_dead_zone(const VectorXd& elevation, double gain_threshold,
                              double loss_threshold) {
    GainLoss gl;
    if (elevation.size() < 2) return gl;

    const double up = std::max(gain_threshold, 0.0);
    const double down = std::max(loss_threshold, 0.0);
    double baseline = elevation[0];
    for (Eigen::Index i = 1; i < elevation.size(); ++i) {
        const double delta = elevation[i] - baseline;
        if (delta > up) {
            gl.gain += delta;
            baseline = elevation[i];
        } else if (delta < -down) {
            gl.loss -= delta;
            baseline = elevation[i];
        }
    }
    return gl;
}

GainLoss accumulate_symmetric(const VectorXd& elevation, double epsilon) {
    GainLoss gl;
    const double eps = std::max(epsilon, 0.0);
    for (Eigen::Index i = 1; i < elevation.size(); ++i) {
        const double delta = elevation[i] - elevation[i - 1];
        if (std::fabs(delta) > eps) {
            if (delta > 0.0) {
                gl.gain += delta;
            } else {
                gl.loss -= delta;
            }
        }
    }
    return gl;
}

double local_noise(const VectorXd& elevation) {
    if (elevation.size() < 5) {
        return 0.2;
    }
    return core::stddev_of(core::diffs_of(elevation));
}

double adaptive_epsilon(double interval_m, double noise) {
    const double base = 0.05 + 0.02 * interval_m;
    return std::min(std::max(base, 0.5 * noise), 0.5);
}

Trace cap_step_grades(const Trace& trace, double cap_percent) {
    if (!(cap_percent > 0.0) || trace.size() < 2) {
        return trace;
    }
    const double cap = cap_percent / 100.0;
    Trace out = trace;
    for (Eigen::Index i = 1; i < trace.elevation.size(); ++i) {
        const double run = std::fabs(trace.distance[i] - trace.distance[i - 1]);
        const double limit = cap * run;
        const double delta = trace.elevation[i] - trace.elevation[i - 1];
        out.elevation[i] = out.elevation[i - 1] + std::min(std::max(delta, -limit), limit);
    }
    return out;
}

GainLoss accumulate(const VectorXd& elevation, const AccumulationSettings& settings) {
    switch (settings.mode) {
        case AccumulationMode::DeadZone:
            return accumulate_dead_zone(elevation, settings.gain_threshold,
                                        settings.loss_threshold);
        case AccumulationMode::SymmetricDeadZone:
            return accumulate_symmetric(elevation, settings.epsilon);
        case AccumulationMode::Naive:
            break;
    }
    return accumulate_naive(elevation);
}

} // namespace elevation_tuner::signal
