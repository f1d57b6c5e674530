#include "elevation_tuner/config/configuration.hpp"
#include "elevation_tuner/core/errors.hpp"
#include "elevation_tuner/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace elevation_tuner::config {

namespace {

ParamSpec real_spec(const char *name, double lo, double hi,
                    double PipelineParams::*member) {
  ParamSpec s{name, lo, hi};
  s.real = member;
  return s;
}

ParamSpec int_spec(const char *name, double lo, double hi,
                   int PipelineParams::*member) {
  ParamSpec s{name, lo, hi};
  s.integer = member;
  return s;
}

const char *const kFlags[] = {"resample", "outlier_correction",
                              "gradient_blending", "gradient_capping",
                              "spike_removal"};

bool PipelineParams::*flag_member(const std::string &name) {
  if (name == "resample") return &PipelineParams::resample;
  if (name == "outlier_correction") return &PipelineParams::outlier_correction;
  if (name == "gradient_blending") return &PipelineParams::gradient_blending;
  if (name == "gradient_capping") return &PipelineParams::gradient_capping;
  if (name == "spike_removal") return &PipelineParams::spike_removal;
  return nullptr;
}

double clamp_value(const ParamSpec &spec, double value) {
  return std::min(std::max(value, spec.min_value), spec.max_value);
}

std::string format_number(double v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

} // namespace

const std::vector<ParamSpec> &PipelineParams::specs() {
  static const std::vector<ParamSpec> table = {
      real_spec("spacing_m", 0.1, 100.0, &PipelineParams::spacing_m),
      real_spec("outlier_k", 0.5, 20.0, &PipelineParams::outlier_k),
      real_spec("window_alpha", 1.0, 500.0, &PipelineParams::window_alpha),
      int_spec("window_min", 3, 1001, &PipelineParams::window_min),
      int_spec("window_max", 3, 2001, &PipelineParams::window_max),
      real_spec("cutoff_interval_m", 0.05, 100.0, &PipelineParams::cutoff_interval_m),
      real_spec("blend_factor", 0.0, 1.0, &PipelineParams::blend_factor),
      real_spec("gradient_min", -5.0, 0.0, &PipelineParams::gradient_min),
      real_spec("gradient_max", 0.0, 5.0, &PipelineParams::gradient_max),
      real_spec("spike_threshold_flat_m", 0.0, 50.0,
                &PipelineParams::spike_threshold_flat_m),
      real_spec("spike_threshold_rolling_m", 0.0, 50.0,
                &PipelineParams::spike_threshold_rolling_m),
      real_spec("spike_threshold_hilly_m", 0.0, 50.0,
                &PipelineParams::spike_threshold_hilly_m),
      real_spec("spike_threshold_mountainous_m", 0.0, 50.0,
                &PipelineParams::spike_threshold_mountainous_m),
      real_spec("terrain_flat_max_per_km", 0.0, 1000.0,
                &PipelineParams::terrain_flat_max_per_km),
      real_spec("terrain_rolling_max_per_km", 0.0, 1000.0,
                &PipelineParams::terrain_rolling_max_per_km),
      real_spec("terrain_hilly_max_per_km", 0.0, 1000.0,
                &PipelineParams::terrain_hilly_max_per_km),
      real_spec("gain_threshold_m", 0.0, 20.0, &PipelineParams::gain_threshold_m),
      real_spec("loss_threshold_m", 0.0, 20.0, &PipelineParams::loss_threshold_m),
      real_spec("gradient_cap_percent", 0.0, 100.0,
                &PipelineParams::gradient_cap_percent),
  };
  return table;
}

const ParamSpec *PipelineParams::find_spec(const std::string &name) {
  for (const auto &s : specs()) {
    if (name == s.name) return &s;
  }
  return nullptr;
}

bool PipelineParams::is_selector(const std::string &name) {
  return name == "smoothing" || name == "accumulation";
}

bool PipelineParams::is_known(const std::string &name) {
  return find_spec(name) != nullptr || flag_member(name) != nullptr ||
         is_selector(name);
}

PipelineParams PipelineParams::preset(const std::string &name) {
  const std::string key = core::to_lower(core::trim(name));
  PipelineParams p;
  if (key == "aggressive" || key == "default") {
    return p;
  }
  if (key == "conservative") {
    p.window_alpha = 20.0;
    p.window_min = 21;
    p.window_max = 101;
    p.outlier_k = 5.0;
    p.gradient_min = -1.0;
    p.gradient_max = 1.0;
    p.blend_factor = 0.2;
    p.gradient_capping = true;
    p.gradient_blending = true;
    return p;
  }
  if (key == "moderate") {
    p.window_alpha = 35.0;
    p.window_min = 31;
    p.window_max = 151;
    p.outlier_k = 4.0;
    p.gradient_min = -0.7;
    p.gradient_max = 0.8;
    p.blend_factor = 0.15;
    p.gradient_capping = true;
    p.gradient_blending = true;
    return p;
  }
  if (key == "experimental") {
    p.window_alpha = 15.0;
    p.window_min = 15;
    p.window_max = 81;
    p.outlier_k = 7.0;
    p.gradient_min = -2.0;
    p.gradient_max = 2.0;
    p.blend_factor = 0.3;
    p.gradient_capping = false;
    p.gradient_blending = true;
    return p;
  }
  throw ConfigError("unknown preset '" + name + "'");
}

std::vector<std::string> PipelineParams::preset_names() {
  return {"conservative", "moderate", "aggressive", "experimental"};
}

void PipelineParams::set(const std::string &name, double value) {
  if (const ParamSpec *spec = find_spec(name)) {
    if (!std::isfinite(value)) {
      const PipelineParams defaults;
      value = spec->real ? defaults.*(spec->real)
                         : static_cast<double>(defaults.*(spec->integer));
    }
    value = clamp_value(*spec, value);
    if (spec->real) {
      this->*(spec->real) = value;
    } else {
      this->*(spec->integer) = static_cast<int>(std::lround(value));
    }
    if (window_max < window_min) window_max = window_min;
    return;
  }
  if (auto member = flag_member(name)) {
    this->*member = std::isfinite(value) && value != 0.0;
    return;
  }
  if (name == "smoothing") {
    const int v = std::isfinite(value) ? static_cast<int>(std::lround(value)) : 1;
    smoothing = static_cast<SmoothingMethod>(std::min(std::max(v, 0), 2));
    return;
  }
  if (name == "accumulation") {
    const int v = std::isfinite(value) ? static_cast<int>(std::lround(value)) : 0;
    accumulation = static_cast<AccumulationMode>(std::min(std::max(v, 0), 2));
    return;
  }
  throw ConfigError("unknown parameter '" + name + "'");
}

double PipelineParams::encode_option(const std::string &name,
                                     const std::string &value) {
  if (name == "smoothing") {
    auto m = string_to_smoothing_method(value);
    if (!m) throw ConfigError("smoothing must be none, gaussian or zero_phase");
    return static_cast<double>(static_cast<int>(*m));
  }
  if (name == "accumulation") {
    auto m = string_to_accumulation_mode(value);
    if (!m) {
      throw ConfigError(
          "accumulation must be naive, dead_zone or symmetric_dead_zone");
    }
    return static_cast<double>(static_cast<int>(*m));
  }
  if (flag_member(name)) {
    const std::string v = core::to_lower(value);
    if (v == "true" || v == "on" || v == "1") return 1.0;
    if (v == "false" || v == "off" || v == "0") return 0.0;
    throw ConfigError(name + " must be a boolean");
  }
  const std::string trimmed = core::trim(value);
  char *end = nullptr;
  const double d = std::strtod(trimmed.c_str(), &end);
  if (!trimmed.empty() && end == trimmed.c_str() + trimmed.size()) {
    return d;
  }
  throw ConfigError(name + " must be numeric, got '" + value + "'");
}

std::string PipelineParams::decode_option(const std::string &name, double value) {
  if (name == "smoothing") {
    return smoothing_method_to_string(
        static_cast<SmoothingMethod>(static_cast<int>(std::lround(value))));
  }
  if (name == "accumulation") {
    return accumulation_mode_to_string(
        static_cast<AccumulationMode>(static_cast<int>(std::lround(value))));
  }
  if (flag_member(name)) return value != 0.0 ? "true" : "false";
  return format_number(value);
}

void PipelineParams::set_option(const std::string &name, const std::string &value) {
  set(name, encode_option(name, value));
}

double PipelineParams::get(const std::string &name) const {
  if (const ParamSpec *spec = find_spec(name)) {
    return spec->real ? this->*(spec->real)
                      : static_cast<double>(this->*(spec->integer));
  }
  if (auto member = flag_member(name)) {
    return this->*member ? 1.0 : 0.0;
  }
  if (name == "smoothing") return static_cast<double>(static_cast<int>(smoothing));
  if (name == "accumulation") {
    return static_cast<double>(static_cast<int>(accumulation));
  }
  throw ConfigError("unknown parameter '" + name + "'");
}

void PipelineParams::clamp_all() {
  for (const auto &spec : specs()) {
    set(spec.name, get(spec.name));
  }
}

void PipelineParams::merge_yaml(const YAML::Node &node) {
  if (!node || !node.IsMap()) return;
  for (const auto &kv : node) {
    const std::string key = kv.first.as<std::string>();
    if (!is_known(key)) {
      throw ConfigError("unknown parameter '" + key + "'");
    }
    set_option(key, kv.second.as<std::string>());
  }
}

YAML::Node PipelineParams::to_yaml() const {
  YAML::Node node;
  node["smoothing"] = smoothing_method_to_string(smoothing);
  node["accumulation"] = accumulation_mode_to_string(accumulation);
  for (const char *flag : kFlags) {
    node[flag] = get(flag) != 0.0;
  }
  for (const auto &spec : specs()) {
    if (spec.real) {
      node[spec.name] = this->*(spec.real);
    } else {
      node[spec.name] = this->*(spec.integer);
    }
  }
  return node;
}

Configuration::Configuration(size_t index, PipelineParams params, std::string label)
    : index_(index), params_(std::move(params)), label_(std::move(label)) {
  params_.clamp_all();
}

std::string Configuration::describe() const {
  const PipelineParams defaults;
  std::ostringstream oss;
  bool first = true;
  auto append = [&](const std::string &name) {
    const double v = params_.get(name);
    if (v == defaults.get(name)) return;
    if (!first) oss << ' ';
    oss << name << '=' << PipelineParams::decode_option(name, v);
    first = false;
  };
  append("smoothing");
  append("accumulation");
  for (const char *flag : kFlags) append(flag);
  for (const auto &spec : PipelineParams::specs()) append(spec.name);
  if (first) oss << "defaults";
  return oss.str();
}

} // namespace elevation_tuner::config
