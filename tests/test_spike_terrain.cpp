#include "elevation_tuner/config/configuration.hpp"
#include "elevation_tuner/signal/spike.hpp"
#include "elevation_tuner/signal/terrain.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using elevation_tuner::TerrainClass;
using elevation_tuner::Trace;
namespace sig = elevation_tuner::signal;

namespace {

Trace flat_with(size_t n, size_t at, double offset) {
    std::vector<double> d, e;
    for (size_t i = 0; i < n; ++i) {
        d.push_back(static_cast<double>(i) * 5.0);
        e.push_back(100.0);
    }
    e[at] += offset;
    return Trace::from_vectors(d, e);
}

} // namespace

TEST_CASE("isolated_spike_is_averaged_away") {
    Trace t = flat_with(12, 5, 15.0);
    auto r = sig::remove_spikes(t, 10.0);
    REQUIRE(r.removed == 1);
    REQUIRE(r.passes == 2);
    REQUIRE(r.trace.elevation[5] == Catch::Approx(100.0));
}

TEST_CASE("steps_without_reversal_are_kept") {
    Trace t = Trace::from_vectors({0, 1, 2, 3, 4}, {0.0, 0.0, 20.0, 20.0, 20.0});
    auto r = sig::remove_spikes(t, 10.0);
    REQUIRE(r.removed == 0);
    REQUIRE(r.trace.elevation == t.elevation);
}

TEST_CASE("small_reversals_below_threshold_are_kept") {
    Trace t = flat_with(8, 3, 4.0);
    auto r = sig::remove_spikes(t, 10.0);
    REQUIRE(r.removed == 0);
}

TEST_CASE("zero_threshold_disables_spike_removal") {
    Trace t = flat_with(8, 3, 50.0);
    auto r = sig::remove_spikes(t, 0.0);
    REQUIRE(r.removed == 0);
    REQUIRE(r.passes == 0);
    REQUIRE(r.trace.elevation[3] == 150.0);
}

TEST_CASE("terrain_class_from_gain_per_km") {
    REQUIRE(sig::classify_terrain(10.0, 1000.0) == TerrainClass::Flat);
    REQUIRE(sig::classify_terrain(20.0, 1000.0) == TerrainClass::Rolling);
    REQUIRE(sig::classify_terrain(100.0, 2000.0) == TerrainClass::Hilly);
    REQUIRE(sig::classify_terrain(70.0, 1000.0) == TerrainClass::Mountainous);
    REQUIRE(sig::classify_terrain(500.0, 0.0) == TerrainClass::Flat);
}

TEST_CASE("terrain_boundaries_follow_parameters") {
    elevation_tuner::config::PipelineParams p;
    p.terrain_flat_max_per_km = 5.0;
    p.terrain_rolling_max_per_km = 8.0;
    p.terrain_hilly_max_per_km = 12.0;
    auto th = sig::terrain_thresholds(p);
    REQUIRE(sig::classify_terrain(10.0, 1000.0, th) == TerrainClass::Hilly);

    Trace climb = Trace::from_vectors({0.0, 500.0, 1000.0}, {0.0, 10.0, 20.0});
    REQUIRE(sig::classify_terrain(climb, th) == TerrainClass::Mountainous);
    REQUIRE(sig::classify_terrain(climb) == TerrainClass::Rolling);
}

TEST_CASE("spike_threshold_selected_by_terrain") {
    elevation_tuner::config::PipelineParams p;
    p.spike_threshold_flat_m = 1.0;
    p.spike_threshold_rolling_m = 2.0;
    p.spike_threshold_hilly_m = 3.0;
    p.spike_threshold_mountainous_m = 4.0;
    REQUIRE(sig::spike_threshold_for(TerrainClass::Flat, p) == 1.0);
    REQUIRE(sig::spike_threshold_for(TerrainClass::Rolling, p) == 2.0);
    REQUIRE(sig::spike_threshold_for(TerrainClass::Hilly, p) == 3.0);
    REQUIRE(sig::spike_threshold_for(TerrainClass::Mountainous, p) == 4.0);
}
