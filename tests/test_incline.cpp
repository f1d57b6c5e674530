#include "elevation_tuner/signal/incline.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using elevation_tuner::Trace;
namespace sig = elevation_tuner::signal;

namespace {

// 0-500 flat, 500-1000 at +6 %, 1000-1500 flat, 1500-1800 at -10 %,
// 1800-1900 a short +8 % bump.
Trace profile() {
    std::vector<double> d, e;
    double elev = 100.0;
    for (int i = 0; i <= 190; ++i) {
        const double x = i * 10.0;
        if (i > 0) {
            const double prev = x - 10.0;
            if (prev >= 500.0 && prev < 1000.0) elev += 0.6;
            else if (prev >= 1500.0 && prev < 1800.0) elev -= 1.0;
            else if (prev >= 1800.0) elev += 0.8;
        }
        d.push_back(x);
        e.push_back(elev);
    }
    return Trace::from_vectors(d, e);
}

} // namespace

TEST_CASE("climbs_and_descents_are_detected") {
    auto report = sig::analyze_inclines(profile());

    REQUIRE(report.climbs.size() == 1);
    const auto& climb = report.climbs.front();
    REQUIRE(climb.start_index == 50);
    REQUIRE(climb.end_index == 100);
    REQUIRE(climb.length_m() == Catch::Approx(500.0));
    REQUIRE(climb.elevation_change_m() == Catch::Approx(30.0));
    REQUIRE(climb.average_grade_percent == Catch::Approx(6.0));
    REQUIRE(climb.max_grade_percent == Catch::Approx(6.0));

    REQUIRE(report.descents.size() == 1);
    const auto& descent = report.descents.front();
    REQUIRE(descent.length_m() == Catch::Approx(300.0));
    REQUIRE(descent.elevation_change_m() == Catch::Approx(-30.0));
    REQUIRE(descent.average_grade_percent == Catch::Approx(-10.0));
    REQUIRE(descent.max_grade_percent == Catch::Approx(-10.0));
}

TEST_CASE("summary_fields_cover_kept_segments") {
    auto report = sig::analyze_inclines(profile());
    REQUIRE(report.longest_climb.has_value());
    REQUIRE(report.steepest_descent.has_value());
    REQUIRE(report.largest_descent->elevation_change_m() == Catch::Approx(-30.0));
    REQUIRE(report.climbing_gain_m == Catch::Approx(30.0));
    REQUIRE(report.descending_loss_m == Catch::Approx(30.0));
    REQUIRE(report.climbing_percent == Catch::Approx(500.0 / 1900.0 * 100.0));
    REQUIRE(report.descending_percent == Catch::Approx(300.0 / 1900.0 * 100.0));
}

TEST_CASE("looser_thresholds_keep_short_bump") {
    sig::InclineOptions opts;
    opts.min_elevation_change_m = 5.0;
    opts.min_length_m = 50.0;
    auto report = sig::analyze_inclines(profile(), opts);
    REQUIRE(report.climbs.size() == 2);
    REQUIRE(report.steepest_climb->average_grade_percent == Catch::Approx(8.0));
    REQUIRE(report.largest_climb->elevation_change_m() == Catch::Approx(30.0));
}

TEST_CASE("flat_or_tiny_trace_has_no_segments") {
    auto empty = sig::analyze_inclines(Trace::from_vectors({0.0}, {1.0}));
    REQUIRE(empty.climbs.empty());
    REQUIRE_FALSE(empty.longest_climb.has_value());

    auto flat = sig::analyze_inclines(Trace::from_vectors({0, 100, 200}, {5, 5, 5}));
    REQUIRE(flat.climbs.empty());
    REQUIRE(flat.descents.empty());
    REQUIRE(flat.climbing_percent == 0.0);
}
