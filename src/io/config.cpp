#include "elevation_tuner/config/configuration.hpp"
#include "elevation_tuner/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace elevation_tuner::config {

static std::vector<double> read_dimension_values(const std::string& name,
                                                 const YAML::Node& n) {
    std::vector<double> values;
    if (!n || !n.IsSequence()) {
        throw ConfigError("search.grid." + name + " must be a list");
    }
    for (const auto& item : n) {
        values.push_back(PipelineParams::encode_option(name, item.as<std::string>()));
    }
    return values;
}

SearchConfig SearchConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

SearchConfig SearchConfig::from_yaml(const YAML::Node& node) {
    SearchConfig cfg;

    if (node["search"]) {
        auto s = node["search"];
        if (s["mode"]) cfg.search.mode = s["mode"].as<std::string>();
        if (s["preset"]) cfg.search.preset = s["preset"].as<std::string>();
        cfg.search.base = PipelineParams::preset(cfg.search.preset);
        if (s["base"]) cfg.search.base.merge_yaml(s["base"]);
        cfg.search.base.clamp_all();

        if (s["grid"]) {
            if (!s["grid"].IsMap()) {
                throw ConfigError("search.grid must be a map of parameter -> values");
            }
            for (const auto& kv : s["grid"]) {
                const std::string name = kv.first.as<std::string>();
                if (!PipelineParams::is_known(name)) {
                    throw ConfigError("search.grid: unknown parameter '" + name + "'");
                }
                cfg.search.grid.emplace_back(name, read_dimension_values(name, kv.second));
            }
        }

        if (s["scan"]) {
            auto sc = s["scan"];
            if (sc["parameter"]) cfg.search.scan.parameter = sc["parameter"].as<std::string>();
            if (sc["start"]) cfg.search.scan.start = sc["start"].as<double>();
            if (sc["stop"]) cfg.search.scan.stop = sc["stop"].as<double>();
            if (sc["step"]) cfg.search.scan.step = sc["step"].as<double>();
        }

        if (s["adaptive"]) {
            auto a = s["adaptive"];
            if (a["parameter"]) cfg.search.adaptive.parameter = a["parameter"].as<std::string>();
            if (a["start"]) cfg.search.adaptive.start = a["start"].as<double>();
            if (a["stop"]) cfg.search.adaptive.stop = a["stop"].as<double>();
            if (a["coarse_points"]) cfg.search.adaptive.coarse_points = a["coarse_points"].as<int>();
            if (a["refine_rounds"]) cfg.search.adaptive.refine_rounds = a["refine_rounds"].as<int>();
            if (a["refine_points"]) cfg.search.adaptive.refine_points = a["refine_points"].as<int>();
            if (a["shrink"]) cfg.search.adaptive.shrink = a["shrink"].as<double>();
        }

        if (s["scoring"]) cfg.search.scoring = s["scoring"].as<std::string>();
        if (s["top_n"]) cfg.search.top_n = s["top_n"].as<int>();
    } else {
        cfg.search.base = PipelineParams::preset(cfg.search.preset);
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["workers"]) cfg.runtime.workers = r["workers"].as<int>();
        if (r["stop_file"]) cfg.runtime.stop_file = r["stop_file"].as<std::string>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["report_json"]) cfg.output.report_json = o["report_json"].as<std::string>();
        if (o["results_csv"]) cfg.output.results_csv = o["results_csv"].as<std::string>();
        if (o["events_jsonl"]) cfg.output.events_jsonl = o["events_jsonl"].as<std::string>();
    }

    return cfg;
}

void SearchConfig::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node SearchConfig::to_yaml() const {
    YAML::Node node;

    node["search"]["mode"] = search.mode;
    node["search"]["preset"] = search.preset;
    node["search"]["base"] = search.base.to_yaml();
    for (const auto& [name, values] : search.grid) {
        YAML::Node seq(YAML::NodeType::Sequence);
        for (double v : values) {
            if (PipelineParams::is_selector(name)) {
                seq.push_back(PipelineParams::decode_option(name, v));
            } else {
                seq.push_back(v);
            }
        }
        node["search"]["grid"][name] = seq;
    }

    node["search"]["scan"]["parameter"] = search.scan.parameter;
    node["search"]["scan"]["start"] = search.scan.start;
    node["search"]["scan"]["stop"] = search.scan.stop;
    node["search"]["scan"]["step"] = search.scan.step;

    node["search"]["adaptive"]["parameter"] = search.adaptive.parameter;
    node["search"]["adaptive"]["start"] = search.adaptive.start;
    node["search"]["adaptive"]["stop"] = search.adaptive.stop;
    node["search"]["adaptive"]["coarse_points"] = search.adaptive.coarse_points;
    node["search"]["adaptive"]["refine_rounds"] = search.adaptive.refine_rounds;
    node["search"]["adaptive"]["refine_points"] = search.adaptive.refine_points;
    node["search"]["adaptive"]["shrink"] = search.adaptive.shrink;

    node["search"]["scoring"] = search.scoring;
    node["search"]["top_n"] = search.top_n;

    node["runtime"]["workers"] = runtime.workers;
    node["runtime"]["stop_file"] = runtime.stop_file;

    node["output"]["report_json"] = output.report_json;
    node["output"]["results_csv"] = output.results_csv;
    node["output"]["events_jsonl"] = output.events_jsonl;

    return node;
}

static bool is_numeric_dimension(const std::string& name) {
    return PipelineParams::find_spec(name) != nullptr;
}

void SearchConfig::validate() const {
    if (search.mode != "grid" && search.mode != "scan" && search.mode != "adaptive") {
        throw ValidationError("search.mode must be 'grid', 'scan' or 'adaptive'");
    }
    if (search.scoring != "combined" && search.scoring != "error") {
        throw ValidationError("search.scoring must be 'combined' or 'error'");
    }
    if (search.top_n < 1) {
        throw ValidationError("search.top_n must be >= 1");
    }
    if (search.mode == "grid") {
        if (search.grid.empty()) {
            throw ValidationError("search.grid must name at least one parameter in grid mode");
        }
        for (const auto& [name, values] : search.grid) {
            if (values.empty()) {
                throw ValidationError("search.grid." + name + " must not be empty");
            }
            for (double v : values) {
                if (!std::isfinite(v)) {
                    throw ValidationError("search.grid." + name + " values must be finite");
                }
            }
        }
    }
    if (search.mode == "scan") {
        if (!is_numeric_dimension(search.scan.parameter)) {
            throw ValidationError("search.scan.parameter must be a numeric parameter");
        }
        if (!(search.scan.step > 0.0)) {
            throw ValidationError("search.scan.step must be > 0");
        }
        if (!(search.scan.stop >= search.scan.start)) {
            throw ValidationError("search.scan.stop must be >= search.scan.start");
        }
    }
    if (search.mode == "adaptive") {
        const auto& a = search.adaptive;
        if (!is_numeric_dimension(a.parameter)) {
            throw ValidationError("search.adaptive.parameter must be a numeric parameter");
        }
        if (!(a.stop > a.start)) {
            throw ValidationError("search.adaptive.stop must be > search.adaptive.start");
        }
        if (a.coarse_points < 2 || a.refine_points < 2) {
            throw ValidationError("search.adaptive.coarse_points/refine_points must be >= 2");
        }
        if (a.refine_rounds < 0 || a.refine_rounds > 10) {
            throw ValidationError("search.adaptive.refine_rounds must be in [0,10]");
        }
        if (!(a.shrink > 0.0 && a.shrink < 1.0)) {
            throw ValidationError("search.adaptive.shrink must be in (0,1)");
        }
    }
    if (runtime.workers < 1) {
        throw ValidationError("runtime.workers must be >= 1");
    }
    if (output.report_json.empty()) {
        throw ValidationError("output.report_json must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "title": "Elevation Tuner Search Configuration",
  "type": "object",
  "properties": {
    "search": {
      "type": "object",
      "properties": {
        "mode": {"type": "string", "enum": ["grid", "scan", "adaptive"]},
        "preset": {"type": "string", "enum": ["conservative", "moderate", "aggressive", "experimental"]},
        "base": {
          "type": "object",
          "properties": {
            "smoothing": {"type": "string", "enum": ["none", "gaussian", "zero_phase"]},
            "accumulation": {"type": "string", "enum": ["naive", "dead_zone", "symmetric_dead_zone"]},
            "resample": {"type": "boolean"},
            "outlier_correction": {"type": "boolean"},
            "gradient_blending": {"type": "boolean"},
            "gradient_capping": {"type": "boolean"},
            "spike_removal": {"type": "boolean"},
            "spacing_m": {"type": "number", "minimum": 0.1, "maximum": 100},
            "outlier_k": {"type": "number", "minimum": 0.5, "maximum": 20},
            "window_alpha": {"type": "number", "minimum": 1, "maximum": 500},
            "window_min": {"type": "integer", "minimum": 3, "maximum": 1001},
            "window_max": {"type": "integer", "minimum": 3, "maximum": 2001},
            "cutoff_interval_m": {"type": "number", "minimum": 0.05, "maximum": 100},
            "blend_factor": {"type": "number", "minimum": 0, "maximum": 1},
            "gradient_min": {"type": "number", "minimum": -5, "maximum": 0},
            "gradient_max": {"type": "number", "minimum": 0, "maximum": 5},
            "spike_threshold_flat_m": {"type": "number", "minimum": 0, "maximum": 50},
            "spike_threshold_rolling_m": {"type": "number", "minimum": 0, "maximum": 50},
            "spike_threshold_hilly_m": {"type": "number", "minimum": 0, "maximum": 50},
            "spike_threshold_mountainous_m": {"type": "number", "minimum": 0, "maximum": 50},
            "terrain_flat_max_per_km": {"type": "number", "minimum": 0, "maximum": 1000},
            "terrain_rolling_max_per_km": {"type": "number", "minimum": 0, "maximum": 1000},
            "terrain_hilly_max_per_km": {"type": "number", "minimum": 0, "maximum": 1000},
            "gain_threshold_m": {"type": "number", "minimum": 0, "maximum": 20},
            "loss_threshold_m": {"type": "number", "minimum": 0, "maximum": 20},
            "gradient_cap_percent": {"type": "number", "minimum": 0, "maximum": 100}
          }
        },
        "grid": {
          "type": "object",
          "additionalProperties": {"type": "array", "minItems": 1}
        },
        "scan": {
          "type": "object",
          "properties": {
            "parameter": {"type": "string"},
            "start": {"type": "number"},
            "stop": {"type": "number"},
            "step": {"type": "number", "exclusiveMinimum": 0}
          }
        },
        "adaptive": {
          "type": "object",
          "properties": {
            "parameter": {"type": "string"},
            "start": {"type": "number"},
            "stop": {"type": "number"},
            "coarse_points": {"type": "integer", "minimum": 2},
            "refine_rounds": {"type": "integer", "minimum": 0, "maximum": 10},
            "refine_points": {"type": "integer", "minimum": 2},
            "shrink": {"type": "number", "exclusiveMinimum": 0, "exclusiveMaximum": 1}
          }
        },
        "scoring": {"type": "string", "enum": ["combined", "error"]},
        "top_n": {"type": "integer", "minimum": 1}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "workers": {"type": "integer", "minimum": 1},
        "stop_file": {"type": "string"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "report_json": {"type": "string"},
        "results_csv": {"type": "string"},
        "events_jsonl": {"type": "string"}
      }
    }
  }
})";
}

} // namespace elevation_tuner::config
