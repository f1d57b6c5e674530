#include "elevation_tuner/eval/evaluator.hpp"
#include "elevation_tuner/core/errors.hpp"
#include "elevation_tuner/signal/gradient.hpp"
#include "elevation_tuner/signal/outlier.hpp"
#include "elevation_tuner/signal/resampler.hpp"
#include "elevation_tuner/signal/smoothing.hpp"
#include "elevation_tuner/signal/spike.hpp"
#include "elevation_tuner/signal/terrain.hpp"

#include <cmath>

namespace elevation_tuner::eval {

static void check_trace(const Trace& trace) {
    if (trace.empty()) {
        throw ValidationError("trace is empty");
    }
    if (trace.distance.size() != trace.elevation.size()) {
        throw ValidationError("trace distance/elevation length mismatch");
    }
    if (!trace.distance.allFinite() || !trace.elevation.allFinite()) {
        throw ValidationError("trace contains non-finite values");
    }
    for (Eigen::Index i = 1; i < trace.distance.size(); ++i) {
        if (trace.distance[i] < trace.distance[i - 1]) {
            throw ValidationError("trace distance decreases at sample " + std::to_string(i));
        }
    }
}

PipelineOutput run_pipeline(const config::PipelineParams& params, const Trace& trace) {
    check_trace(trace);

    PipelineOutput out;
    out.raw = signal::accumulate_naive(trace.elevation);
    out.terrain = signal::classify_terrain(trace, signal::terrain_thresholds(params));

    Trace current = trace;
    if (params.resample) {
        auto rs = signal::resample(trace, params.spacing_m);
        out.resample_status = rs.status;
        current = std::move(rs.trace);
    } else {
        out.resample_status = ResampleStatus::Passthrough;
    }
    out.samples = current.size();

    if (params.spike_removal) {
        auto sr = signal::remove_spikes(current, signal::spike_threshold_for(out.terrain, params));
        out.spikes_removed = sr.removed;
        current = std::move(sr.trace);
    }

    if (params.outlier_correction) {
        auto oc = signal::correct_outliers(current, params.outlier_k);
        out.outliers_corrected = oc.corrected;
        current = std::move(oc.trace);
    }

    auto sm = signal::smooth(current, params);
    out.window = sm.window;
    out.cutoff = sm.cutoff;

    signal::GradientOptions gopt;
    gopt.blend = params.gradient_blending;
    gopt.blend_factor = params.blend_factor;
    gopt.clamp = params.gradient_capping;
    gopt.gradient_min = params.gradient_min;
    gopt.gradient_max = params.gradient_max;
    // Blending against an unsmoothed trace is a no-op; clamping still applies.
    Trace processed = signal::postprocess_gradients(current, sm.trace, gopt);

    processed = signal::cap_step_grades(processed, params.gradient_cap_percent);

    signal::AccumulationSettings acc;
    acc.mode = params.accumulation;
    acc.gain_threshold = params.gain_threshold_m;
    acc.loss_threshold = params.loss_threshold_m;
    if (acc.mode == AccumulationMode::SymmetricDeadZone) {
        acc.epsilon = signal::adaptive_epsilon(params.cutoff_interval_m,
                                               signal::local_noise(processed.elevation));
        out.epsilon = acc.epsilon;
    }
    out.result = signal::accumulate(processed.elevation, acc);

    if (!std::isfinite(out.result.gain) || !std::isfinite(out.result.loss)) {
        throw ValidationError("pipeline produced a non-finite gain/loss");
    }

    out.processed = std::move(processed);
    return out;
}

std::optional<uint32_t> lookup_truth(const GroundTruthMap& truth, const std::string& name) {
    auto it = truth.find(name);
    if (it == truth.end() || it->second == 0) {
        return std::nullopt;
    }
    return it->second;
}

EvaluationResult evaluate(const config::Configuration& cfg, const NamedTrack& track,
                          std::optional<uint32_t> truth) {
    EvaluationResult r;
    r.config_index = cfg.index();
    r.track = track.name;
    if (truth && *truth == 0) truth.reset();
    r.truth = truth;

    try {
        PipelineOutput out = run_pipeline(cfg.params(), track.trace);
        r.raw_gain = out.raw.gain;
        r.raw_loss = out.raw.loss;
        r.gain = out.result.gain;
        r.loss = out.result.loss;
        r.ratio = out.result.ratio();
        r.terrain = out.terrain;
        r.samples = out.samples;
        r.outliers_corrected = out.outliers_corrected;
        r.spikes_removed = out.spikes_removed;
        r.window = out.window;
        r.cutoff = out.cutoff;
        r.epsilon = out.epsilon;
        if (r.truth) {
            r.accuracy = r.gain / static_cast<double>(*r.truth) * 100.0;
        }
        if (out.resample_status == ResampleStatus::SampleLimitExceeded) {
            r.status = EvalStatus::ResourceLimited;
            r.message = "resample sample limit exceeded; evaluated unresampled trace";
        } else if (out.resample_status == ResampleStatus::InvalidSpacing) {
            r.status = EvalStatus::ResourceLimited;
            r.message = "invalid resample spacing; evaluated unresampled trace";
        }
    } catch (const std::exception& e) {
        r.status = EvalStatus::Failed;
        r.message = e.what();
        r.accuracy.reset();
    } catch (...) {
        r.status = EvalStatus::Failed;
        r.message = "unknown_error";
        r.accuracy.reset();
    }
    return r;
}

} // namespace elevation_tuner::eval
