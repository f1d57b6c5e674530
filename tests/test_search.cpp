#include "elevation_tuner/core/errors.hpp"
#include "elevation_tuner/core/utils.hpp"
#include "elevation_tuner/io/report.hpp"
#include "elevation_tuner/search/search_harness.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using elevation_tuner::GroundTruthMap;
using elevation_tuner::NamedTrack;
using elevation_tuner::SmoothingMethod;
using elevation_tuner::Trace;
namespace cfg = elevation_tuner::config;
namespace core = elevation_tuner::core;
namespace search = elevation_tuner::search;

namespace {

// Sine hills with alternating noise; gain of the clean profile is about
// 2 * amplitude per period.
NamedTrack hills(const std::string& name, double amplitude, size_t n) {
    std::vector<double> d, e;
    for (size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i) * 5.0;
        d.push_back(x);
        e.push_back(300.0 + amplitude * std::sin(x / 400.0) + ((i % 2 == 0) ? 0.5 : -0.5));
    }
    return {name, Trace::from_vectors(d, e)};
}

std::vector<NamedTrack> small_corpus() {
    return {hills("a", 20.0, 600), hills("b", 40.0, 500), hills("c", 10.0, 400)};
}

GroundTruthMap small_truth() {
    return {{"a", 80}, {"b", 120}, {"c", 0}};
}

std::vector<cfg::Configuration> cutoff_grid() {
    search::ParameterSpace space;
    space.add("cutoff_interval_m", {1.0, 5.0, 20.0, 60.0});
    cfg::PipelineParams base;
    base.smoothing = SmoothingMethod::ZeroPhase;
    base.spacing_m = 5.0;
    search::GridSequence seq(base, space);
    return search::collect(seq);
}

search::HarnessOptions options(int workers) {
    search::HarnessOptions opt;
    opt.workers = workers;
    opt.run_id = "test";
    return opt;
}

} // namespace

TEST_CASE("parallel_and_serial_searches_agree") {
    const auto corpus = small_corpus();
    const auto truth = small_truth();
    const auto configs = cutoff_grid();

    core::SearchProgress p1;
    core::SearchProgress p4;
    auto serial = search::SearchHarness(options(1)).run(configs, corpus, truth, p1);
    auto parallel = search::SearchHarness(options(4)).run(configs, corpus, truth, p4);

    REQUIRE_FALSE(serial.stopped);
    REQUIRE(serial.tasks_total == 12);
    REQUIRE(serial.tasks_completed == 12);
    REQUIRE(serial.results.size() == 12);
    REQUIRE(serial.scores.size() == 4);
    REQUIRE(p1.done() == 12);
    REQUIRE(p1.fraction() == Catch::Approx(1.0f));

    REQUIRE(serial.ranking == parallel.ranking);
    for (size_t i = 0; i < serial.scores.size(); ++i) {
        REQUIRE(serial.scores[i].combined_score == parallel.scores[i].combined_score);
        REQUIRE(serial.scores[i].with_truth == 2);
    }
    for (size_t i = 0; i < serial.results.size(); ++i) {
        REQUIRE(serial.results[i].config_index == parallel.results[i].config_index);
        REQUIRE(serial.results[i].track == parallel.results[i].track);
        REQUIRE(serial.results[i].gain == parallel.results[i].gain);
    }
    REQUIRE(serial.best() != nullptr);
}

TEST_CASE("stop_before_start_ranks_nothing") {
    core::SearchProgress progress;
    progress.request_stop();
    auto report = search::SearchHarness(options(2)).run(cutoff_grid(), small_corpus(),
                                                        small_truth(), progress);
    REQUIRE(report.stopped);
    REQUIRE(report.tasks_completed == 0);
    REQUIRE(report.scores.empty());
    REQUIRE(report.best() == nullptr);
}

TEST_CASE("stop_file_halts_after_completed_configs") {
    const auto stop = std::filesystem::temp_directory_path() /
                      ("elevation_tuner_" + core::get_run_id() + ".stop");
    {
        std::ofstream f(stop);
        f << "stop\n";
    }

    auto opt = options(1);
    opt.stop_file = stop;
    opt.progress_every = 1;
    std::vector<NamedTrack> one{hills("a", 20.0, 300)};

    core::SearchProgress progress;
    auto report = search::SearchHarness(opt).run(cutoff_grid(), one, small_truth(), progress);
    std::filesystem::remove(stop);

    REQUIRE(report.stopped);
    REQUIRE(report.tasks_completed == 1);
    REQUIRE(report.scores.size() == 1);
    REQUIRE(report.scores.front().config_index == 0);
}

TEST_CASE("empty_inputs_raise_search_error") {
    core::SearchProgress progress;
    search::SearchHarness harness(options(1));
    REQUIRE_THROWS_AS(harness.run(std::vector<cfg::Configuration>{}, small_corpus(),
                                  small_truth(), progress),
                      elevation_tuner::SearchError);
    REQUIRE_THROWS_AS(harness.run(cutoff_grid(), {}, small_truth(), progress),
                      elevation_tuner::SearchError);
}

TEST_CASE("failed_tracks_do_not_abort_the_search") {
    auto corpus = small_corpus();
    corpus.push_back({"broken", Trace::from_vectors({0.0, 10.0, 5.0}, {1.0, 2.0, 3.0})});
    core::SearchProgress progress;
    auto report = search::SearchHarness(options(2)).run(cutoff_grid(), corpus, small_truth(),
                                                        progress);
    REQUIRE_FALSE(report.stopped);
    REQUIRE(report.tasks_completed == report.tasks_total);
    REQUIRE(report.scores.size() == 4);
    for (const auto& s : report.scores) {
        REQUIRE(s.failed == 1);
        REQUIRE(s.usable == 3);
    }
    size_t broken = 0;
    for (const auto& r : report.results) {
        if (r.track != "broken") continue;
        ++broken;
        REQUIRE(r.status == elevation_tuner::EvalStatus::Failed);
        REQUIRE_FALSE(r.message.empty());
    }
    REQUIRE(broken == 4);
}

TEST_CASE("events_are_written_as_json_lines") {
    std::ostringstream log;
    auto opt = options(2);
    opt.event_log = &log;
    core::SearchProgress progress;
    search::SearchHarness(opt).run(cutoff_grid(), small_corpus(), small_truth(), progress);

    std::istringstream in(log.str());
    std::string line;
    std::set<std::string> types;
    while (std::getline(in, line)) {
        auto ev = core::json::parse(line);
        REQUIRE(ev["run_id"] == "test");
        types.insert(ev["type"].get<std::string>());
    }
    REQUIRE(types.count("search_start") == 1);
    REQUIRE(types.count("search_progress") == 1);
    REQUIRE(types.count("search_end") == 1);
}

TEST_CASE("adaptive_search_refines_with_unique_indices") {
    cfg::AdaptiveConfig adaptive;
    adaptive.parameter = "cutoff_interval_m";
    adaptive.start = 1.0;
    adaptive.stop = 50.0;
    adaptive.coarse_points = 5;
    adaptive.refine_rounds = 2;
    adaptive.refine_points = 3;
    adaptive.shrink = 0.25;

    cfg::PipelineParams base;
    base.smoothing = SmoothingMethod::ZeroPhase;
    base.spacing_m = 5.0;

    core::SearchProgress progress;
    auto report = search::SearchHarness(options(2)).run_adaptive(base, adaptive, small_corpus(),
                                                                 small_truth(), progress);
    REQUIRE(report.configs.size() == 11);
    REQUIRE(report.scores.size() == 11);
    std::set<size_t> indices;
    for (const auto& c : report.configs) {
        indices.insert(c.index());
        REQUIRE(c.params().cutoff_interval_m >= 1.0);
        REQUIRE(c.params().cutoff_interval_m <= 50.0);
        REQUIRE(report.configs[c.index()].index() == c.index());
    }
    REQUIRE(indices.size() == 11);
    REQUIRE(report.ranking.size() == 11);
}

TEST_CASE("compute_worker_count_bounds") {
    REQUIRE(search::compute_worker_count(0, 10) == 1);
    REQUIRE(search::compute_worker_count(8, 2) <= 2);
    REQUIRE(search::compute_worker_count(8, 2) >= 1);
}

TEST_CASE("report_json_writes_unbounded_error_as_null") {
    std::vector<NamedTrack> corpus{hills("c", 10.0, 400)};
    auto opt = options(1);
    opt.scoring = elevation_tuner::eval::ScoringMethod::Error;
    core::SearchProgress progress;
    auto report = search::SearchHarness(opt).run(cutoff_grid(), corpus, GroundTruthMap{}, progress);

    auto j = elevation_tuner::io::report_to_json(report, 2);
    REQUIRE(j["scoring"] == "error");
    REQUIRE(j["higher_is_better"] == false);
    REQUIRE(j["ranking"].size() == 2);
    REQUIRE(j["ranking"][0]["rank"] == 1);
    REQUIRE(j["ranking"][0]["error_score"].is_null());
    REQUIRE(j["ranking"][0]["config_index"] == 0);
    REQUIRE(j["ranking"][0]["params"]["smoothing"] == "zero_phase");

    const std::string csv = elevation_tuner::io::scores_to_csv(report);
    size_t lines = 0;
    for (char c : csv) lines += c == '\n' ? 1 : 0;
    REQUIRE(lines == 5);
}
