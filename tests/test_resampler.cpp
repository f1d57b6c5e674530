#include "elevation_tuner/signal/resampler.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using elevation_tuner::ResampleStatus;
using elevation_tuner::Trace;
namespace sig = elevation_tuner::signal;

TEST_CASE("resample_uses_exact_spacing_and_keeps_first_elevation") {
    Trace t = Trace::from_vectors({0.0, 3.0, 7.5, 12.2}, {100.0, 101.5, 99.0, 104.0});
    auto r = sig::resample(t, 1.0);
    REQUIRE(r.status == ResampleStatus::Ok);

    const auto& d = r.trace.distance;
    REQUIRE(d.size() == 14); // ceil(12.2) + 1
    REQUIRE(d[0] == 0.0);
    REQUIRE(r.trace.elevation[0] == Catch::Approx(100.0));
    for (Eigen::Index i = 1; i + 1 < d.size(); ++i) {
        REQUIRE(d[i] - d[i - 1] == Catch::Approx(1.0));
    }
    // final sample sits at the total distance, less than one step after its predecessor
    REQUIRE(d[d.size() - 1] == Catch::Approx(12.2));
    REQUIRE(d[d.size() - 1] - d[d.size() - 2] <= 1.0);
    REQUIRE(r.trace.elevation[r.trace.elevation.size() - 1] == Catch::Approx(104.0));
}

TEST_CASE("resample_interpolates_linearly_between_brackets") {
    Trace t = Trace::from_vectors({0.0, 10.0}, {0.0, 20.0});
    auto r = sig::resample(t, 2.5);
    REQUIRE(r.trace.size() == 5);
    REQUIRE(r.trace.elevation[1] == Catch::Approx(5.0));
    REQUIRE(r.trace.elevation[2] == Catch::Approx(10.0));
    REQUIRE(r.trace.elevation[4] == Catch::Approx(20.0));
}

TEST_CASE("exact_multiple_does_not_add_extra_sample") {
    Trace t = Trace::from_vectors({0.0, 0.3, 1.0}, {0.0, 0.0, 0.0});
    auto r = sig::resample(t, 0.1);
    REQUIRE(r.trace.size() == 11);
}

TEST_CASE("zero_length_segment_uses_left_sample") {
    Trace t = Trace::from_vectors({0.0, 5.0, 5.0, 10.0}, {0.0, 10.0, 50.0, 20.0});
    REQUIRE(sig::interpolate_elevation(t, 5.0) == Catch::Approx(10.0));
    REQUIRE(std::isfinite(sig::interpolate_elevation(t, 7.5)));
    auto r = sig::resample(t, 1.0);
    REQUIRE(r.trace.elevation.allFinite());
}

TEST_CASE("targets_beyond_total_reuse_last_sample") {
    Trace t = Trace::from_vectors({0.0, 10.0}, {1.0, 2.0});
    REQUIRE(sig::interpolate_elevation(t, 25.0) == Catch::Approx(2.0));
    REQUIRE(sig::interpolate_elevation(t, -5.0) == Catch::Approx(1.0));
}

TEST_CASE("sample_ceiling_returns_unresampled_with_status") {
    Trace t = Trace::from_vectors({0.0, 50000.0}, {0.0, 100.0});
    auto r = sig::resample(t, 0.1);
    REQUIRE(r.status == ResampleStatus::SampleLimitExceeded);
    REQUIRE(r.trace.size() == 2);
    REQUIRE(r.trace.distance[1] == 50000.0);

    auto small = sig::resample(t, 1.0, 10);
    REQUIRE(small.status == ResampleStatus::SampleLimitExceeded);
}

TEST_CASE("degenerate_inputs_pass_through") {
    Trace single = Trace::from_vectors({0.0}, {42.0});
    auto r1 = sig::resample(single, 1.0);
    REQUIRE(r1.status == ResampleStatus::Passthrough);
    REQUIRE(r1.trace.size() == 1);

    Trace t = Trace::from_vectors({0.0, 10.0}, {1.0, 2.0});
    REQUIRE(sig::resample(t, 0.0).status == ResampleStatus::InvalidSpacing);
    REQUIRE(sig::resample(t, -1.0).status == ResampleStatus::InvalidSpacing);
    REQUIRE(sig::resample(t, std::nan("")).status == ResampleStatus::InvalidSpacing);
}
