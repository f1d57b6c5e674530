#pragma once

#include "elevation_tuner/core/types.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace elevation_tuner::config {

namespace fs = std::filesystem;

struct PipelineParams;

// Declared bounds of one numeric knob. Exactly one member pointer is set.
struct ParamSpec {
  const char *name;
  double min_value;
  double max_value;
  double PipelineParams::*real = nullptr;
  int PipelineParams::*integer = nullptr;
};

// Every knob of the signal-conditioning pipeline. Numeric knobs are clamped
// into their declared bounds by clamp_all() and set().
struct PipelineParams {
  // Resampler
  bool resample = true;
  double spacing_m = 1.0;

  // Outlier corrector
  bool outlier_correction = true;
  double outlier_k = 3.0;

  // Smoother
  SmoothingMethod smoothing = SmoothingMethod::Gaussian;
  double window_alpha = 50.0;
  int window_min = 51;
  int window_max = 301;
  double cutoff_interval_m = 3.0; // zero-phase: preserved wavelength = 2x

  // Gradient post-processor (blend, then clamp)
  bool gradient_blending = false;
  double blend_factor = 0.0;
  bool gradient_capping = true;
  double gradient_min = -0.5;
  double gradient_max = 0.6;

  // Spike rejection, one threshold per terrain class
  bool spike_removal = false;
  double spike_threshold_flat_m = 0.0;
  double spike_threshold_rolling_m = 0.0;
  double spike_threshold_hilly_m = 0.0;
  double spike_threshold_mountainous_m = 0.0;

  // Terrain classification boundaries, raw gain per km
  double terrain_flat_max_per_km = 20.0;
  double terrain_rolling_max_per_km = 40.0;
  double terrain_hilly_max_per_km = 60.0;

  // Accumulator
  AccumulationMode accumulation = AccumulationMode::Naive;
  double gain_threshold_m = 0.0;
  double loss_threshold_m = 0.0;
  double gradient_cap_percent = 0.0; // 0 = off

  static const std::vector<ParamSpec> &specs();
  static const ParamSpec *find_spec(const std::string &name);
  static bool is_known(const std::string &name);

  // Named presets: conservative | moderate | aggressive | experimental
  static PipelineParams preset(const std::string &name);
  static std::vector<std::string> preset_names();

  // Sets a knob by name. Numeric values are clamped, flags take 0/1 and
  // selectors take their enum ordinal. Throws ConfigError on unknown names.
  void set(const std::string &name, double value);
  void set_option(const std::string &name, const std::string &value);
  double get(const std::string &name) const;

  void clamp_all();

  // Reads any knob present in node on top of *this.
  void merge_yaml(const YAML::Node &node);
  YAML::Node to_yaml() const;

  // Encodes a selector string (e.g. smoothing: zero_phase) as set() expects.
  static double encode_option(const std::string &name, const std::string &value);
  static std::string decode_option(const std::string &name, double value);
  static bool is_selector(const std::string &name);
};

// Immutable pipeline configuration with a position in its search sequence.
class Configuration {
public:
  Configuration() = default;
  Configuration(size_t index, PipelineParams params, std::string label = "");

  size_t index() const { return index_; }
  const PipelineParams &params() const { return params_; }
  const std::string &label() const { return label_; }

  // "name=value" pairs of the knobs that differ from the defaults
  std::string describe() const;

private:
  size_t index_ = 0;
  PipelineParams params_;
  std::string label_;
};

struct ScanConfig {
  std::string parameter = "cutoff_interval_m";
  double start = 0.1;
  double stop = 7.0;
  double step = 0.025;
};

struct AdaptiveConfig {
  std::string parameter = "cutoff_interval_m";
  double start = 0.5;
  double stop = 10.0;
  int coarse_points = 20;
  int refine_rounds = 3;
  int refine_points = 11;
  double shrink = 0.25;
};

struct SearchSection {
  std::string mode = "grid"; // grid | scan | adaptive
  std::string preset = "aggressive";
  PipelineParams base;
  std::vector<std::pair<std::string, std::vector<double>>> grid;
  ScanConfig scan;
  AdaptiveConfig adaptive;
  std::string scoring = "combined"; // combined (higher is better) | error (lower is better)
  int top_n = 10;
};

struct RuntimeConfig {
  int workers = 4;
  std::string stop_file;
};

struct OutputConfig {
  std::string report_json = "search_report.json";
  std::string results_csv = "search_results.csv";
  std::string events_jsonl = "events.jsonl";
};

struct SearchConfig {
  SearchSection search;
  RuntimeConfig runtime;
  OutputConfig output;

  static SearchConfig load(const fs::path &path);
  static SearchConfig from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace elevation_tuner::config
