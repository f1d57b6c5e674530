#pragma once

#include "elevation_tuner/config/configuration.hpp"
#include "elevation_tuner/core/types.hpp"
#include "elevation_tuner/signal/accumulator.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace elevation_tuner::eval {

// Intermediate products of one pipeline run.
struct PipelineOutput {
    Trace processed;
    ResampleStatus resample_status = ResampleStatus::Ok;
    TerrainClass terrain = TerrainClass::Flat;
    signal::GainLoss raw;
    signal::GainLoss result;
    size_t samples = 0;
    size_t outliers_corrected = 0;
    size_t spikes_removed = 0;
    int window = 0;
    double cutoff = 0.0;
    double epsilon = 0.0;
};

// raw trace -> resample -> spike removal -> outlier correction -> smoothing
// -> gradient post-processing -> step grade cap -> accumulation.
// Throws ValidationError for a trace that violates the Trace invariants.
PipelineOutput run_pipeline(const config::PipelineParams& params, const Trace& trace);

struct EvaluationResult {
    size_t config_index = 0;
    std::string track;
    EvalStatus status = EvalStatus::Ok;
    std::string message;

    double raw_gain = 0.0;
    double raw_loss = 0.0;
    double gain = 0.0;
    double loss = 0.0;
    double ratio = 100.0;                // loss / gain * 100
    std::optional<uint32_t> truth;       // absent when unknown
    std::optional<double> accuracy;      // gain / truth * 100

    TerrainClass terrain = TerrainClass::Flat;
    size_t samples = 0;
    size_t outliers_corrected = 0;
    size_t spikes_removed = 0;
    int window = 0;
    double cutoff = 0.0;
    double epsilon = 0.0;

    bool usable() const { return status != EvalStatus::Failed; }
};

// Ground truth for a track name; 0 or missing means unknown.
std::optional<uint32_t> lookup_truth(const GroundTruthMap& truth, const std::string& name);

// Never throws: failures come back as status Failed with a message.
EvaluationResult evaluate(const config::Configuration& cfg, const NamedTrack& track,
                          std::optional<uint32_t> truth);

} // namespace elevation_tuner::eval
