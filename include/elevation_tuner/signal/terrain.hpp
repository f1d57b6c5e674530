#pragma once

#include "elevation_tuner/core/types.hpp"

namespace elevation_tuner::config {
struct PipelineParams;
}

namespace elevation_tuner::signal {

// Upper bounds of raw gain per kilometre for each class.
struct TerrainThresholds {
    double flat_max = 20.0;
    double rolling_max = 40.0;
    double hilly_max = 60.0;
};

TerrainThresholds terrain_thresholds(const config::PipelineParams& params);

TerrainClass classify_terrain(double gain_m, double distance_m,
                              const TerrainThresholds& thresholds = {});

// Uses the naive gain of the unprocessed trace.
TerrainClass classify_terrain(const Trace& trace, const TerrainThresholds& thresholds = {});

// Spike threshold configured for a terrain class.
double spike_threshold_for(TerrainClass terrain, const config::PipelineParams& params);

} // namespace elevation_tuner::signal
