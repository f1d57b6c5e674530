#include "elevation_tuner/search/search_harness.hpp"
#include "elevation_tuner/core/errors.hpp"
#include "elevation_tuner/core/events.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>

namespace elevation_tuner::search {

int compute_worker_count(int requested, size_t task_count) {
    int workers = requested;
    if (workers < 1) {
        workers = 1;
    }
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(std::min<size_t>(task_count, 1u << 16)));
    }
    return std::max(1, workers);
}

SearchHarness::SearchHarness(HarnessOptions options) : options_(std::move(options)) {
    if (options_.progress_every == 0) {
        options_.progress_every = 1;
    }
}

bool SearchHarness::stop_file_present() const {
    if (options_.stop_file.empty()) return false;
    std::error_code ec;
    return fs::exists(options_.stop_file, ec);
}

SearchReport SearchHarness::run(const std::vector<config::Configuration>& configs,
                                const std::vector<NamedTrack>& corpus,
                                const GroundTruthMap& truth,
                                core::SearchProgress& progress) const {
    if (configs.empty()) {
        throw SearchError("no configurations to evaluate");
    }
    if (corpus.empty()) {
        throw SearchError("corpus is empty");
    }

    SearchReport report;
    report.scoring = options_.scoring;
    report.configs = configs;

    const size_t n_tracks = corpus.size();
    const size_t total = configs.size() * n_tracks;
    report.tasks_total = total;
    progress.reset(total);

    std::vector<std::optional<uint32_t>> track_truth;
    track_truth.reserve(n_tracks);
    for (const auto& t : corpus) {
        track_truth.push_back(eval::lookup_truth(truth, t.name));
    }

    core::EventEmitter emitter;
    const int workers = compute_worker_count(options_.workers, total);
    if (options_.event_log) {
        emitter.search_start(options_.run_id, "batch", configs.size(), n_tracks,
                             *options_.event_log);
    }
    std::cerr << "[SEARCH] Using " << workers << " parallel workers for "
              << configs.size() << " configurations x " << n_tracks << " tracks"
              << std::endl;

    std::vector<eval::EvaluationResult> results(total);
    std::vector<uint8_t> completed(total, 0);
    std::mutex log_mutex;
    std::mutex progress_mutex;
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        while (true) {
            if (progress.stop_requested()) {
                break;
            }
            const size_t ti = next.fetch_add(1);
            if (ti >= total) {
                break;
            }
            const size_t ci = ti / n_tracks;
            const size_t tk = ti % n_tracks;
            try {
                results[ti] = eval::evaluate(configs[ci], corpus[tk], track_truth[tk]);
            } catch (const std::exception& e) {
                // One bad task is recorded like any other failed track.
                eval::EvaluationResult r;
                r.config_index = configs[ci].index();
                r.track = corpus[tk].name;
                r.truth = track_truth[tk];
                r.status = EvalStatus::Failed;
                r.message = e.what();
                results[ti] = std::move(r);
                std::lock_guard<std::mutex> lock(log_mutex);
                std::cerr << "[SEARCH] config " << configs[ci].index() << " track "
                          << corpus[tk].name << " failed: " << e.what() << std::endl;
            }
            completed[ti] = 1;

            const size_t done = progress.complete_one();
            if (done % options_.progress_every == 0 || done == total) {
                if (stop_file_present()) {
                    progress.request_stop();
                }
                if (options_.event_log) {
                    std::lock_guard<std::mutex> lock(progress_mutex);
                    emitter.search_progress(options_.run_id, done, total,
                                            "evaluate " + std::to_string(done) + "/" +
                                                std::to_string(total) + " workers=" +
                                                std::to_string(workers),
                                            *options_.event_log);
                }
            }
        }
    };

    if (workers > 1) {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    // Barrier passed: aggregate configurations whose tracks all finished.
    report.stopped = progress.stop_requested();
    for (size_t ci = 0; ci < configs.size(); ++ci) {
        const size_t begin = ci * n_tracks;
        const size_t end = begin + n_tracks;
        bool complete = true;
        for (size_t ti = begin; ti < end; ++ti) {
            if (completed[ti]) {
                ++report.tasks_completed;
            } else {
                complete = false;
            }
        }
        if (!complete) continue;
        std::vector<eval::EvaluationResult> slice(results.begin() + static_cast<std::ptrdiff_t>(begin),
                                                  results.begin() + static_cast<std::ptrdiff_t>(end));
        report.scores.push_back(eval::aggregate(configs[ci], slice));
        for (auto& r : slice) {
            report.results.push_back(std::move(r));
        }
    }

    report.ranking = eval::rank(report.scores, report.scoring);
    report.pareto = eval::pareto_front(report.scores);

    if (report.stopped) {
        std::cerr << "[SEARCH] Stopped after " << report.tasks_completed << "/" << total
                  << " tasks" << std::endl;
        if (options_.event_log) {
            emitter.warning(options_.run_id,
                            "search stopped after " + std::to_string(report.tasks_completed) +
                                "/" + std::to_string(total) + " tasks",
                            *options_.event_log);
        }
    }

    if (options_.event_log) {
        core::json extra;
        extra["configs_ranked"] = report.scores.size();
        extra["tasks_completed"] = report.tasks_completed;
        extra["scoring"] = eval::scoring_method_to_string(report.scoring);
        if (const auto* best = report.best()) {
            extra["best_config"] = best->config_index;
            extra["best_score"] = best->score(report.scoring);
        }
        emitter.search_end(options_.run_id, report.stopped ? "stopped" : "ok", extra,
                           *options_.event_log);
    }

    return report;
}

SearchReport SearchHarness::run(ConfigSequence& sequence, const std::vector<NamedTrack>& corpus,
                                const GroundTruthMap& truth,
                                core::SearchProgress& progress) const {
    return run(collect(sequence), corpus, truth, progress);
}

SearchReport SearchHarness::run_adaptive(const config::PipelineParams& base,
                                         const config::AdaptiveConfig& adaptive,
                                         const std::vector<NamedTrack>& corpus,
                                         const GroundTruthMap& truth,
                                         core::SearchProgress& progress) const {
    const config::ParamSpec* spec = config::PipelineParams::find_spec(adaptive.parameter);
    if (!spec) {
        throw SearchError("adaptive parameter '" + adaptive.parameter + "' is not numeric");
    }
    if (!(adaptive.stop > adaptive.start) || adaptive.coarse_points < 2 ||
        adaptive.refine_points < 2 || !(adaptive.shrink > 0.0 && adaptive.shrink < 1.0)) {
        throw SearchError("invalid adaptive search settings");
    }

    SearchReport combined;
    combined.scoring = options_.scoring;

    const double range_lo = std::max(adaptive.start, spec->min_value);
    const double range_hi = std::min(adaptive.stop, spec->max_value);
    double lo = range_lo;
    double hi = range_hi;
    if (!(hi > lo)) {
        throw SearchError("adaptive range is empty after clamping to parameter bounds");
    }
    std::vector<double> values = linspace(lo, hi, static_cast<size_t>(adaptive.coarse_points));
    size_t next_index = 0;

    for (int round = 0; round <= adaptive.refine_rounds; ++round) {
        std::vector<config::Configuration> configs;
        configs.reserve(values.size());
        for (double v : values) {
            config::PipelineParams p = base;
            p.set(adaptive.parameter, v);
            std::ostringstream label;
            label << "round" << round << ' ' << adaptive.parameter << '='
                  << p.get(adaptive.parameter);
            configs.emplace_back(next_index++, std::move(p), label.str());
        }

        std::cerr << "[SEARCH] Adaptive round " << round << ": " << adaptive.parameter
                  << " in [" << lo << ", " << hi << "]" << std::endl;
        SearchReport rep = run(configs, corpus, truth, progress);

        combined.tasks_total += rep.tasks_total;
        combined.tasks_completed += rep.tasks_completed;
        combined.configs.insert(combined.configs.end(), rep.configs.begin(), rep.configs.end());
        combined.results.insert(combined.results.end(), rep.results.begin(), rep.results.end());
        combined.scores.insert(combined.scores.end(), rep.scores.begin(), rep.scores.end());
        if (rep.stopped) {
            combined.stopped = true;
            break;
        }
        if (round == adaptive.refine_rounds || combined.scores.empty()) {
            break;
        }

        const auto order = eval::rank(combined.scores, combined.scoring);
        const size_t best_index = combined.scores[order.front()].config_index;
        const double best_value = combined.configs[best_index].params().get(adaptive.parameter);

        const double half = 0.5 * (hi - lo) * adaptive.shrink;
        lo = std::max(best_value - half, range_lo);
        hi = std::min(best_value + half, range_hi);
        if (!(hi > lo)) {
            break;
        }
        values = linspace(lo, hi, static_cast<size_t>(adaptive.refine_points));
    }

    combined.ranking = eval::rank(combined.scores, combined.scoring);
    combined.pareto = eval::pareto_front(combined.scores);
    return combined;
}

} // namespace elevation_tuner::search
