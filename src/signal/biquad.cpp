#include "elevation_tuner/signal/biquad.hpp"

#include <algorithm>
#include <cmath>

namespace elevation_tuner::signal {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

std::optional<BiquadCoefficients> design_lowpass(double cutoff_hz, double sample_rate_hz,
                                                 double q) {
    if (!std::isfinite(cutoff_hz) || !std::isfinite(sample_rate_hz) || !std::isfinite(q)) {
        return std::nullopt;
    }
    if (sample_rate_hz <= 0.0 || q <= 0.0) return std::nullopt;
    if (cutoff_hz <= 0.0 || cutoff_hz >= 0.5 * sample_rate_hz) return std::nullopt;

    const double w0 = 2.0 * kPi * cutoff_hz / sample_rate_hz;
    const double cos_w0 = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * q);
    const double a0 = 1.0 + alpha;

    BiquadCoefficients c;
    c.b0 = ((1.0 - cos_w0) / 2.0) / a0;
    c.b1 = (1.0 - cos_w0) / a0;
    c.b2 = c.b0;
    c.a1 = (-2.0 * cos_w0) / a0;
    c.a2 = (1.0 - alpha) / a0;

    if (!std::isfinite(c.b0) || !std::isfinite(c.b1) || !std::isfinite(c.a1) ||
        !std::isfinite(c.a2)) {
        return std::nullopt;
    }
    return c;
}

double Biquad::process(double x) {
    const double y = c_.b0 * x + c_.b1 * x1_ + c_.b2 * x2_ - c_.a1 * y1_ - c_.a2 * y2_;
    x2_ = x1_;
    x1_ = x;
    y2_ = y1_;
    y1_ = y;
    return y;
}

void Biquad::prime(double x) {
    const double y = x * c_.dc_gain();
    x1_ = x2_ = x;
    y1_ = y2_ = y;
}

VectorXd filtfilt(const BiquadCoefficients& coeffs, const VectorXd& x, size_t pad) {
    const Eigen::Index n = x.size();
    if (n < 2) return x;

    const Eigen::Index p = std::min(static_cast<Eigen::Index>(pad), n - 1);
    const Eigen::Index m = n + 2 * p;

    // Odd extension: 2*x[0] - x[k] on the left, 2*x[n-1] - x[n-1-k] on the right.
    VectorXd ext(m);
    for (Eigen::Index k = 0; k < p; ++k) {
        ext[k] = 2.0 * x[0] - x[p - k];
        ext[p + n + k] = 2.0 * x[n - 1] - x[n - 2 - k];
    }
    ext.segment(p, n) = x;

    Biquad forward(coeffs);
    forward.prime(ext[0]);
    for (Eigen::Index i = 0; i < m; ++i) {
        ext[i] = forward.process(ext[i]);
    }

    Biquad backward(coeffs);
    backward.prime(ext[m - 1]);
    for (Eigen::Index i = m; i-- > 0;) {
        ext[i] = backward.process(ext[i]);
    }

    return ext.segment(p, n);
}

} // namespace elevation_tuner::signal
