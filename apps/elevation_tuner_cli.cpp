#include "elevation_tuner/config/configuration.hpp"
#include "elevation_tuner/core/errors.hpp"
#include "elevation_tuner/core/events.hpp"
#include "elevation_tuner/core/progress.hpp"
#include "elevation_tuner/core/utils.hpp"
#include "elevation_tuner/eval/evaluator.hpp"
#include "elevation_tuner/eval/scoring.hpp"
#include "elevation_tuner/io/corpus.hpp"
#include "elevation_tuner/io/report.hpp"
#include "elevation_tuner/search/parameter_space.hpp"
#include "elevation_tuner/search/search_harness.hpp"
#include "elevation_tuner/signal/incline.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace elevation_tuner;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailure = 2;
constexpr int kExitStopped = 3;

// Writes every character to both buffers.
class TeeBuf : public std::streambuf {
public:
    TeeBuf(std::streambuf* a, std::streambuf* b) : a_(a), b_(b) {}

protected:
    int overflow(int c) override {
        if (c == EOF) return EOF;
        const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
        const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
        return (ra == EOF || rb == EOF) ? EOF : c;
    }

    int sync() override {
        int ra = a_ ? a_->pubsync() : 0;
        int rb = b_ ? b_->pubsync() : 0;
        return (ra == 0 && rb == 0) ? 0 : -1;
    }

private:
    std::streambuf* a_;
    std::streambuf* b_;
};

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

bool parse_number(const std::string& s, double& out) {
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return !s.empty() && end == s.c_str() + s.size();
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << config::get_schema_json() << std::endl;
    return kExitOk;
}

// ============================================================================
// presets
// ============================================================================
int cmd_presets() {
    json out = json::object();
    for (const auto& name : config::PipelineParams::preset_names()) {
        out[name] = io::params_to_json(config::PipelineParams::preset(name));
    }
    print_json(out);
    return kExitOk;
}

// ============================================================================
// validate-config --path <yaml> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["path"] = path;

    try {
        config::SearchConfig cfg = config::SearchConfig::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? kExitOk : kExitUsage;
    }
    return kExitOk;
}

// ============================================================================
// process --track <csv> [--preset P] [--config C] [--set name=value ...]
// ============================================================================
int cmd_process(const std::string& track_path, const std::string& preset,
                const std::string& config_path, const std::vector<std::string>& overrides) {
    try {
        config::PipelineParams params = config::PipelineParams::preset(preset.empty() ? "aggressive" : preset);
        if (!config_path.empty()) {
            params = config::SearchConfig::load(config_path).search.base;
        }
        for (const auto& kv : overrides) {
            const auto eq = kv.find('=');
            if (eq == std::string::npos) {
                std::cerr << "--set expects name=value, got '" << kv << "'\n";
                return kExitUsage;
            }
            params.set_option(kv.substr(0, eq), kv.substr(eq + 1));
        }

        const Trace trace = io::load_track_csv(track_path);
        const auto out = eval::run_pipeline(params, trace);
        const auto inclines = signal::analyze_inclines(out.processed);

        json j;
        j["track"] = fs::path(track_path).stem().string();
        j["params"] = io::params_to_json(params);
        j["resample_status"] = resample_status_to_string(out.resample_status);
        j["terrain"] = terrain_class_to_string(out.terrain);
        j["samples"] = out.samples;
        j["raw_gain"] = out.raw.gain;
        j["raw_loss"] = out.raw.loss;
        j["gain"] = out.result.gain;
        j["loss"] = out.result.loss;
        j["ratio"] = out.result.ratio();
        j["outliers_corrected"] = out.outliers_corrected;
        j["spikes_removed"] = out.spikes_removed;
        j["window"] = out.window;
        j["cutoff"] = out.cutoff;
        j["epsilon"] = out.epsilon;
        j["inclines"] = io::incline_to_json(inclines);
        print_json(j);
        return kExitOk;
    } catch (const ElevationTunerError& e) {
        std::cerr << "[PROCESS] " << e.what() << std::endl;
        return kExitFailure;
    } catch (const YAML::Exception& e) {
        std::cerr << "[PROCESS] " << e.what() << std::endl;
        return kExitFailure;
    }
}

// ============================================================================
// search --config <yaml> --corpus <dir> [--ground-truth <csv>] [--out <dir>]
//        [--workers N]
// ============================================================================
int cmd_search(const std::string& config_path, const std::string& corpus_dir,
               const std::string& truth_path, const std::string& out_arg,
               const std::string& workers_arg) {
    config::SearchConfig cfg;
    try {
        cfg = config::SearchConfig::load(config_path);
        if (!workers_arg.empty()) {
            double w = 0.0;
            if (!parse_number(workers_arg, w)) {
                std::cerr << "--workers expects a number\n";
                return kExitUsage;
            }
            cfg.runtime.workers = static_cast<int>(w);
        }
        cfg.validate();
    } catch (const ElevationTunerError& e) {
        std::cerr << "[CONFIG] " << e.what() << std::endl;
        return kExitUsage;
    } catch (const YAML::Exception& e) {
        std::cerr << "[CONFIG] " << e.what() << std::endl;
        return kExitUsage;
    }

    const std::string run_id = core::get_run_id();
    const fs::path out_dir = out_arg.empty() ? fs::path("runs") / run_id : fs::path(out_arg);
    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        std::cerr << "[SEARCH] Cannot create output directory " << out_dir.string() << ": "
                  << ec.message() << std::endl;
        return kExitFailure;
    }

    std::ofstream event_log_file(out_dir / cfg.output.events_jsonl);
    TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
    std::ostream log_file(&tee_buf);
    core::EventEmitter emitter;

    try {
        const auto corpus = io::load_corpus(corpus_dir);
        GroundTruthMap truth;
        if (!truth_path.empty()) {
            truth = io::load_ground_truth(truth_path);
        }

        emitter.run_start(run_id,
                          {{"config_path", config_path},
                           {"config_sha256", core::sha256_file(config_path)},
                           {"corpus_dir", corpus_dir},
                           {"tracks", corpus.size()},
                           {"ground_truth_entries", truth.size()},
                           {"mode", cfg.search.mode},
                           {"scoring", cfg.search.scoring},
                           {"out_dir", out_dir.string()}},
                          log_file);

        size_t with_truth = 0;
        for (const auto& t : corpus) {
            if (eval::lookup_truth(truth, t.name)) ++with_truth;
        }
        if (with_truth == 0) {
            emitter.warning(run_id, "no track has a known ground truth; accuracy is undefined",
                            log_file);
        }

        search::HarnessOptions hopt;
        hopt.workers = cfg.runtime.workers;
        hopt.scoring = *eval::string_to_scoring_method(cfg.search.scoring);
        hopt.run_id = run_id;
        hopt.event_log = &log_file;
        hopt.stop_file = cfg.runtime.stop_file;
        search::SearchHarness harness(hopt);
        core::SearchProgress progress;

        search::SearchReport report;
        if (cfg.search.mode == "grid") {
            search::ParameterSpace space;
            for (const auto& [name, values] : cfg.search.grid) {
                space.add(name, values);
            }
            search::GridSequence seq(cfg.search.base, space);
            report = harness.run(seq, corpus, truth, progress);
        } else if (cfg.search.mode == "scan") {
            const auto& sc = cfg.search.scan;
            search::ScanSequence seq(cfg.search.base, sc.parameter, sc.start, sc.stop, sc.step);
            report = harness.run(seq, corpus, truth, progress);
        } else {
            report = harness.run_adaptive(cfg.search.base, cfg.search.adaptive, corpus, truth,
                                          progress);
        }

        const size_t top_n = static_cast<size_t>(cfg.search.top_n);
        io::write_report_json(out_dir / cfg.output.report_json, report, top_n);
        if (!cfg.output.results_csv.empty()) {
            io::write_results_csv(out_dir / cfg.output.results_csv, report);
        }

        if (const auto* best = report.best()) {
            std::cerr << "[SEARCH] Best: #" << best->config_index << " " << best->label
                      << " score=" << best->score(report.scoring)
                      << " median_accuracy=" << best->median_accuracy << std::endl;
        }

        if (report.stopped) {
            emitter.run_end(run_id, false, "stopped", log_file);
            return kExitStopped;
        }
        emitter.run_end(run_id, true, "ok", log_file);
        return kExitOk;
    } catch (const ElevationTunerError& e) {
        emitter.error(run_id, e.what(), log_file);
        emitter.run_end(run_id, false, "error", log_file);
        return kExitFailure;
    } catch (const std::exception& e) {
        emitter.error(run_id, std::string("unexpected: ") + e.what(), log_file);
        emitter.run_end(run_id, false, "error", log_file);
        return kExitFailure;
    }
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: elevation_tuner_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  search --config C --corpus D [--ground-truth G] [--out O] [--workers N]\n"
              << "                                  Rank pipeline configurations on a corpus\n"
              << "  process --track T [--preset P | --config C] [--set name=value ...]\n"
              << "                                  Run the pipeline on one track\n"
              << "  validate-config --path P [--strict-exit-codes]  Validate search config\n"
              << "  get-schema                      Print JSON schema for search config\n"
              << "  presets                         Print the named parameter presets\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto get_all = [&](const char* name) -> std::vector<std::string> {
        std::vector<std::string> values;
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                values.emplace_back(argv[++i]);
            }
        }
        return values;
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "presets") {
        return cmd_presets();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        if (path.empty()) {
            std::cerr << "validate-config requires --path\n";
            return kExitUsage;
        }
        return cmd_validate_config(path, has_flag("--strict-exit-codes"));
    }

    if (command == "process") {
        std::string track = get_arg("--track");
        if (track.empty()) {
            std::cerr << "process requires --track\n";
            return kExitUsage;
        }
        return cmd_process(track, get_arg("--preset"), get_arg("--config"), get_all("--set"));
    }

    if (command == "search") {
        std::string config_path = get_arg("--config");
        std::string corpus = get_arg("--corpus");
        if (config_path.empty() || corpus.empty()) {
            std::cerr << "search requires --config and --corpus\n";
            return kExitUsage;
        }
        return cmd_search(config_path, corpus, get_arg("--ground-truth"), get_arg("--out"),
                          get_arg("--workers"));
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return kExitUsage;
}
