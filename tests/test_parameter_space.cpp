#include "elevation_tuner/core/errors.hpp"
#include "elevation_tuner/search/parameter_space.hpp"

#include <set>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using elevation_tuner::SmoothingMethod;
namespace cfg = elevation_tuner::config;
namespace search = elevation_tuner::search;

namespace {

search::ParameterSpace two_by_three() {
    search::ParameterSpace space;
    space.add("spacing_m", {1.0, 2.0});
    space.add("outlier_k", {3.0, 4.0, 5.0});
    return space;
}

} // namespace

TEST_CASE("grid_size_is_product_of_dimension_sizes") {
    REQUIRE(two_by_three().size() == 6);
    REQUIRE(search::ParameterSpace().size() == 1);
}

TEST_CASE("last_dimension_varies_fastest") {
    const auto space = two_by_three();
    const cfg::PipelineParams base;
    auto p0 = space.apply(base, 0);
    REQUIRE(p0.spacing_m == 1.0);
    REQUIRE(p0.outlier_k == 3.0);
    auto p1 = space.apply(base, 1);
    REQUIRE(p1.spacing_m == 1.0);
    REQUIRE(p1.outlier_k == 4.0);
    auto p4 = space.apply(base, 4);
    REQUIRE(p4.spacing_m == 2.0);
    REQUIRE(p4.outlier_k == 4.0);
}

TEST_CASE("grid_sequence_is_finite_and_restartable") {
    search::GridSequence seq(cfg::PipelineParams{}, two_by_three(), 100);
    REQUIRE(seq.size() == 6);

    cfg::Configuration c;
    std::set<size_t> indices;
    size_t count = 0;
    while (seq.next(c)) {
        indices.insert(c.index());
        ++count;
    }
    REQUIRE(count == 6);
    REQUIRE(*indices.begin() == 100);
    REQUIRE(*indices.rbegin() == 105);
    REQUIRE_FALSE(seq.next(c));

    seq.reset();
    REQUIRE(seq.next(c));
    REQUIRE(c.index() == 100);
    REQUIRE(c.label() == "spacing_m=1 outlier_k=3");

    auto all = search::collect(seq);
    REQUIRE(all.size() == 6);
    REQUIRE(all[5].params().spacing_m == 2.0);
    REQUIRE(all[5].params().outlier_k == 5.0);
}

TEST_CASE("selector_dimensions_use_labels") {
    search::ParameterSpace space;
    space.add("smoothing", {cfg::PipelineParams::encode_option("smoothing", "none"),
                            cfg::PipelineParams::encode_option("smoothing", "zero_phase")});
    search::GridSequence seq(cfg::PipelineParams{}, space);
    auto c = seq.at(1);
    REQUIRE(c.params().smoothing == SmoothingMethod::ZeroPhase);
    REQUIRE(c.label() == "smoothing=zero_phase");
}

TEST_CASE("grid_values_are_clamped_into_bounds") {
    search::ParameterSpace space;
    space.add("blend_factor", {-1.0, 0.5, 3.0});
    search::GridSequence seq(cfg::PipelineParams{}, space);
    REQUIRE(seq.at(0).params().blend_factor == 0.0);
    REQUIRE(seq.at(2).params().blend_factor == 1.0);
}

TEST_CASE("bad_dimensions_are_rejected") {
    search::ParameterSpace space;
    REQUIRE_THROWS_AS(space.add("bogus", {1.0}), elevation_tuner::ConfigError);
    REQUIRE_THROWS_AS(space.add("spacing_m", {}), elevation_tuner::ConfigError);
    space.add("spacing_m", {1.0});
    REQUIRE_THROWS_AS(space.add("spacing_m", {2.0}), elevation_tuner::ConfigError);
}

TEST_CASE("scan_covers_range_inclusive") {
    search::ScanSequence seq(cfg::PipelineParams{}, "cutoff_interval_m", 0.1, 7.0, 0.025);
    REQUIRE(seq.size() == 277);
    auto all = search::collect(seq);
    REQUIRE(all.size() == 277);
    REQUIRE(all.front().params().cutoff_interval_m == Catch::Approx(0.1));
    REQUIRE(all.back().params().cutoff_interval_m == Catch::Approx(7.0));
    REQUIRE(all.back().index() == 276);
}

TEST_CASE("scan_rejects_non_numeric_or_bad_step") {
    REQUIRE_THROWS_AS(search::ScanSequence(cfg::PipelineParams{}, "smoothing", 0.0, 2.0, 1.0),
                      elevation_tuner::ConfigError);
    REQUIRE_THROWS_AS(search::ScanSequence(cfg::PipelineParams{}, "spacing_m", 1.0, 2.0, 0.0),
                      elevation_tuner::ConfigError);
    search::ScanSequence empty(cfg::PipelineParams{}, "spacing_m", 5.0, 1.0, 1.0);
    REQUIRE(empty.size() == 0);
}

TEST_CASE("scan_keeps_to_parameter_bounds") {
    search::ScanSequence seq(cfg::PipelineParams{}, "blend_factor", -1.0, 2.0, 0.5);
    REQUIRE(seq.size() == 3);
    auto all = search::collect(seq);
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].params().blend_factor == Catch::Approx(0.0));
    REQUIRE(all[1].params().blend_factor == Catch::Approx(0.5));
    REQUIRE(all[2].params().blend_factor == Catch::Approx(1.0));
    REQUIRE(all[2].index() == 2);

    // off-grid start keeps its alignment
    search::ScanSequence shifted(cfg::PipelineParams{}, "blend_factor", -0.3, 1.0, 0.5);
    REQUIRE(shifted.size() == 2);
    REQUIRE(shifted.at(0).params().blend_factor == Catch::Approx(0.2));
    REQUIRE(shifted.at(1).params().blend_factor == Catch::Approx(0.7));

    search::ScanSequence outside(cfg::PipelineParams{}, "blend_factor", 1.5, 3.0, 0.5);
    REQUIRE(outside.size() == 0);
}

TEST_CASE("linspace_endpoints") {
    auto v = search::linspace(1.0, 2.0, 5);
    REQUIRE(v.size() == 5);
    REQUIRE(v.front() == 1.0);
    REQUIRE(v[1] == Catch::Approx(1.25));
    REQUIRE(v.back() == 2.0);
    REQUIRE(search::linspace(3.0, 9.0, 1) == std::vector<double>{3.0});
    REQUIRE(search::linspace(3.0, 9.0, 0).empty());
}
