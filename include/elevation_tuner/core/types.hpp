#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace elevation_tuner {

namespace fs = std::filesystem;

using VectorXd = Eigen::VectorXd;

// Ordered (distance, elevation) samples. Distance is cumulative metres and
// non-decreasing. Stages never modify a Trace in place.
struct Trace {
    VectorXd distance;
    VectorXd elevation;

    Trace() = default;
    Trace(VectorXd d, VectorXd e) : distance(std::move(d)), elevation(std::move(e)) {}

    static Trace from_vectors(const std::vector<double>& d, const std::vector<double>& e) {
        Trace t;
        const Eigen::Index n = static_cast<Eigen::Index>(std::min(d.size(), e.size()));
        t.distance.resize(n);
        t.elevation.resize(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            t.distance[i] = d[static_cast<size_t>(i)];
            t.elevation[i] = e[static_cast<size_t>(i)];
        }
        return t;
    }

    size_t size() const { return static_cast<size_t>(elevation.size()); }
    bool empty() const { return elevation.size() == 0; }
    double total_distance() const {
        return distance.size() == 0 ? 0.0 : distance[distance.size() - 1];
    }
};

// Smoother strategy selector
enum class SmoothingMethod {
    None,
    Gaussian,
    ZeroPhase
};

inline std::string smoothing_method_to_string(SmoothingMethod m) {
    switch (m) {
        case SmoothingMethod::Gaussian: return "gaussian";
        case SmoothingMethod::ZeroPhase: return "zero_phase";
        default: return "none";
    }
}

inline std::optional<SmoothingMethod> string_to_smoothing_method(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (norm == "none") return SmoothingMethod::None;
    if (norm == "gaussian") return SmoothingMethod::Gaussian;
    if (norm == "zero_phase" || norm == "butterworth") return SmoothingMethod::ZeroPhase;
    return std::nullopt;
}

// Gain/loss accumulation mode
enum class AccumulationMode {
    Naive,
    DeadZone,           // directional: separate uphill / downhill thresholds
    SymmetricDeadZone   // adaptive epsilon from local noise
};

inline std::string accumulation_mode_to_string(AccumulationMode m) {
    switch (m) {
        case AccumulationMode::DeadZone: return "dead_zone";
        case AccumulationMode::SymmetricDeadZone: return "symmetric_dead_zone";
        default: return "naive";
    }
}

inline std::optional<AccumulationMode> string_to_accumulation_mode(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (norm == "naive") return AccumulationMode::Naive;
    if (norm == "dead_zone") return AccumulationMode::DeadZone;
    if (norm == "symmetric_dead_zone") return AccumulationMode::SymmetricDeadZone;
    return std::nullopt;
}

enum class TerrainClass {
    Flat,
    Rolling,
    Hilly,
    Mountainous
};

inline std::string terrain_class_to_string(TerrainClass t) {
    switch (t) {
        case TerrainClass::Flat: return "flat";
        case TerrainClass::Rolling: return "rolling";
        case TerrainClass::Hilly: return "hilly";
        case TerrainClass::Mountainous: return "mountainous";
    }
    return "flat";
}

enum class ResampleStatus {
    Ok,
    Passthrough,          // fewer than two samples or zero total distance
    InvalidSpacing,
    SampleLimitExceeded
};

inline std::string resample_status_to_string(ResampleStatus s) {
    switch (s) {
        case ResampleStatus::Ok: return "ok";
        case ResampleStatus::Passthrough: return "passthrough";
        case ResampleStatus::InvalidSpacing: return "invalid_spacing";
        case ResampleStatus::SampleLimitExceeded: return "sample_limit_exceeded";
    }
    return "ok";
}

// Outcome tag of one (configuration, track) evaluation
enum class EvalStatus {
    Ok,
    ResourceLimited,
    Failed
};

inline std::string eval_status_to_string(EvalStatus s) {
    switch (s) {
        case EvalStatus::Ok: return "ok";
        case EvalStatus::ResourceLimited: return "resource_limited";
        case EvalStatus::Failed: return "failed";
    }
    return "ok";
}

// filename -> reference gain in metres (0 = unknown)
using GroundTruthMap = std::map<std::string, uint32_t>;

struct NamedTrack {
    std::string name;
    Trace trace;
};

} // namespace elevation_tuner
