#include "elevation_tuner/signal/accumulator.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using elevation_tuner::AccumulationMode;
using elevation_tuner::Trace;
using elevation_tuner::VectorXd;
namespace sig = elevation_tuner::signal;

namespace {

VectorXd vec(std::initializer_list<double> values) {
    VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) v[i++] = x;
    return v;
}

VectorXd wiggly(size_t n) {
    VectorXd v(static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i);
        v[static_cast<Eigen::Index>(i)] = 0.3 * x + 1.5 * std::sin(x * 1.7) + 0.4 * std::cos(x * 5.3);
    }
    return v;
}

} // namespace

TEST_CASE("naive_sums_positive_and_negative_deltas") {
    auto gl = sig::accumulate_naive(vec({100, 102, 105, 103, 107, 110}));
    REQUIRE(gl.gain == Catch::Approx(12.0));
    REQUIRE(gl.loss == Catch::Approx(2.0));
    REQUIRE(gl.ratio() == Catch::Approx(2.0 / 12.0 * 100.0));
}

TEST_CASE("ratio_sentinel_without_gain") {
    auto gl = sig::accumulate_naive(vec({10, 8, 5}));
    REQUIRE(gl.gain == 0.0);
    REQUIRE(gl.loss == Catch::Approx(5.0));
    REQUIRE(gl.ratio() == 100.0);

    auto single = sig::accumulate_naive(vec({10}));
    REQUIRE(single.gain == 0.0);
    REQUIRE(single.loss == 0.0);
}

TEST_CASE("dead_zone_with_zero_thresholds_matches_naive") {
    VectorXd e = wiggly(200);
    auto naive = sig::accumulate_naive(e);
    auto dz = sig::accumulate_dead_zone(e, 0.0, 0.0);
    REQUIRE(dz.gain == Catch::Approx(naive.gain));
    REQUIRE(dz.loss == Catch::Approx(naive.loss));
}

TEST_CASE("dead_zone_never_exceeds_naive") {
    VectorXd e = wiggly(500);
    auto naive = sig::accumulate_naive(e);
    for (double up : {0.1, 0.5, 2.0, 10.0}) {
        for (double down : {0.0, 0.3, 3.0}) {
            auto dz = sig::accumulate_dead_zone(e, up, down);
            REQUIRE(dz.gain <= naive.gain + 1e-9);
            REQUIRE(dz.loss <= naive.loss + 1e-9);
        }
    }
}

TEST_CASE("dead_zone_holds_baseline_until_threshold_is_crossed") {
    // 0.4 steps never cross a 1 m threshold one at a time, but the baseline
    // catches up after three of them
    auto gl = sig::accumulate_dead_zone(vec({0.0, 0.4, 0.8, 1.2, 1.0}), 1.0, 1.0);
    REQUIRE(gl.gain == Catch::Approx(1.2));
    REQUIRE(gl.loss == 0.0);
}

TEST_CASE("symmetric_dead_zone_drops_small_steps") {
    auto gl = sig::accumulate_symmetric(vec({0.0, 0.1, 0.2, 1.2, 1.1, 0.0}), 0.15);
    REQUIRE(gl.gain == Catch::Approx(1.0));
    REQUIRE(gl.loss == Catch::Approx(1.1));
}

TEST_CASE("adaptive_epsilon_bounds") {
    REQUIRE(sig::adaptive_epsilon(3.0, 0.0) == Catch::Approx(0.11));
    REQUIRE(sig::adaptive_epsilon(3.0, 0.5) == Catch::Approx(0.25));
    REQUIRE(sig::adaptive_epsilon(3.0, 10.0) == Catch::Approx(0.5));
    REQUIRE(sig::local_noise(vec({1, 2, 3})) == Catch::Approx(0.2));
    REQUIRE(sig::local_noise(vec({1, 2, 3, 4, 5, 6})) == Catch::Approx(0.0));
}

TEST_CASE("step_grade_cap_limits_every_step") {
    Trace t = Trace::from_vectors({0, 10, 20, 30}, {0.0, 5.0, 5.5, 0.0});
    Trace capped = sig::cap_step_grades(t, 20.0);
    REQUIRE(capped.elevation[1] == Catch::Approx(2.0));
    REQUIRE(capped.elevation[2] == Catch::Approx(2.5));
    REQUIRE(capped.elevation[3] == Catch::Approx(0.5));

    Trace same = sig::cap_step_grades(t, 0.0);
    REQUIRE(same.elevation == t.elevation);
}

TEST_CASE("accumulate_dispatches_on_mode") {
    VectorXd e = vec({0.0, 0.1, 0.2, 1.2});
    sig::AccumulationSettings s;
    s.mode = AccumulationMode::Naive;
    REQUIRE(sig::accumulate(e, s).gain == Catch::Approx(1.2));
    s.mode = AccumulationMode::SymmetricDeadZone;
    s.epsilon = 0.5;
    REQUIRE(sig::accumulate(e, s).gain == Catch::Approx(1.0));
    s.mode = AccumulationMode::DeadZone;
    s.gain_threshold = 0.15;
    REQUIRE(sig::accumulate(e, s).gain == Catch::Approx(1.2));
}
