#include "elevation_tuner/signal/terrain.hpp"
#include "elevation_tuner/signal/accumulator.hpp"
#include "elevation_tuner/config/configuration.hpp"

namespace elevation_tuner::signal {

TerrainThresholds terrain_thresholds(const config::PipelineParams& params) {
    TerrainThresholds t;
    t.flat_max = params.terrain_flat_max_per_km;
    t.rolling_max = params.terrain_rolling_max_per_km;
    t.hilly_max = params.terrain_hilly_max_per_km;
    return t;
}

TerrainClass classify_terrain(double gain_m, double distance_m,
                              const TerrainThresholds& thresholds) {
    if (!(distance_m > 0.0)) {
        return TerrainClass::Flat;
    }
    const double per_km = gain_m / (distance_m / 1000.0);
    if (per_km < thresholds.flat_max) return TerrainClass::Flat;
    if (per_km < thresholds.rolling_max) return TerrainClass::Rolling;
    if (per_km < thresholds.hilly_max) return TerrainClass::Hilly;
    return TerrainClass::Mountainous;
}

TerrainClass classify_terrain(const Trace& trace, const TerrainThresholds& thresholds) {
    if (trace.size() < 2) {
        return TerrainClass::Flat;
    }
    const double distance = trace.total_distance() - trace.distance[0];
    return classify_terrain(accumulate_naive(trace.elevation).gain, distance, thresholds);
}

double spike_threshold_for(TerrainClass terrain, const config::PipelineParams& params) {
    switch (terrain) {
        case TerrainClass::Flat: return params.spike_threshold_flat_m;
        case TerrainClass::Rolling: return params.spike_threshold_rolling_m;
        case TerrainClass::Hilly: return params.spike_threshold_hilly_m;
        case TerrainClass::Mountainous: return params.spike_threshold_mountainous_m;
    }
    return 0.0;
}

} // namespace elevation_tuner::signal
