#pragma once

#include "elevation_tuner/core/types.hpp"

#include <optional>

namespace elevation_tuner::signal {

// Q for a maximally flat 2nd-order response.
constexpr double kButterworthQ = 0.7071067811865476;

// Normalized coefficients (a0 == 1).
struct BiquadCoefficients {
    double b0 = 1.0;
    double b1 = 0.0;
    double b2 = 0.0;
    double a1 = 0.0;
    double a2 = 0.0;

    // Gain at DC, 1 for a low-pass design.
    double dc_gain() const { return (b0 + b1 + b2) / (1.0 + a1 + a2); }
};

// RBJ cookbook low-pass. Returns nullopt when the cutoff is not strictly
// inside (0, Nyquist) or any input is non-finite.
std::optional<BiquadCoefficients> design_lowpass(double cutoff_hz, double sample_rate_hz,
                                                 double q = kButterworthQ);

// Direct form I section.
class Biquad {
public:
    explicit Biquad(const BiquadCoefficients& coeffs) : c_(coeffs) {}

    double process(double x);

    // Sets the delay line to the steady state of a constant input x.
    void prime(double x);

private:
    BiquadCoefficients c_;
    double x1_ = 0.0;
    double x2_ = 0.0;
    double y1_ = 0.0;
    double y2_ = 0.0;
};

// Forward-backward filtering. The signal is extended by `pad` samples of odd
// reflection at both ends and each pass starts from steady state, so a
// linear input comes out unchanged.
VectorXd filtfilt(const BiquadCoefficients& coeffs, const VectorXd& x, size_t pad);

} // namespace elevation_tuner::signal
