#include "elevation_tuner/signal/incline.hpp"
#include "elevation_tuner/signal/outlier.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace elevation_tuner::signal {

namespace {

// Runs of steps [first, last] whose grade satisfies pred.
template <typename Pred>
std::vector<std::pair<size_t, size_t>> find_runs(const std::vector<double>& grades, Pred pred) {
    std::vector<std::pair<size_t, size_t>> runs;
    bool open = false;
    size_t start = 0;
    for (size_t i = 0; i < grades.size(); ++i) {
        const bool in_run = pred(grades[i]);
        if (in_run && !open) {
            start = i;
            open = true;
        } else if (!in_run && open) {
            runs.emplace_back(start, i - 1);
            open = false;
        }
    }
    if (open) {
        runs.emplace_back(start, grades.size() - 1);
    }
    return runs;
}

Segment make_segment(const Trace& trace, const std::vector<double>& grades,
                     size_t first_step, size_t last_step, bool climbing) {
    Segment s;
    s.start_index = first_step;
    s.end_index = last_step + 1;
    const auto a = static_cast<Eigen::Index>(s.start_index);
    const auto b = static_cast<Eigen::Index>(s.end_index);
    s.start_distance_m = trace.distance[a];
    s.end_distance_m = trace.distance[b];
    s.start_elevation_m = trace.elevation[a];
    s.end_elevation_m = trace.elevation[b];
    const double length = s.length_m();
    s.average_grade_percent = length > 0.0 ? s.elevation_change_m() / length * 100.0 : 0.0;

    auto first = grades.begin() + static_cast<std::ptrdiff_t>(first_step);
    auto last = grades.begin() + static_cast<std::ptrdiff_t>(last_step) + 1;
    s.max_grade_percent = climbing ? *std::max_element(first, last) : *std::min_element(first, last);
    return s;
}

bool keep_segment(const Segment& s, const InclineOptions& options) {
    return std::fabs(s.elevation_change_m()) >= options.min_elevation_change_m &&
           s.length_m() >= options.min_length_m &&
           std::fabs(s.average_grade_percent) >= options.min_average_grade_percent;
}

template <typename Key>
std::optional<Segment> best_by(const std::vector<Segment>& segments, Key key) {
    if (segments.empty()) return std::nullopt;
    auto it = std::max_element(segments.begin(), segments.end(),
                               [&](const Segment& a, const Segment& b) { return key(a) < key(b); });
    return *it;
}

} // namespace

std::vector<double> step_grades_percent(const Trace& trace) {
    std::vector<double> grades = segment_gradients(trace);
    for (double& g : grades) g *= 100.0;
    return grades;
}

InclineReport analyze_inclines(const Trace& trace, const InclineOptions& options) {
    InclineReport report;
    if (trace.size() < 2) {
        return report;
    }

    const std::vector<double> grades = step_grades_percent(trace);
    const double deadband = options.deadband_grade * 100.0;

    for (const auto& [first, last] :
         find_runs(grades, [deadband](double g) { return g >= deadband; })) {
        Segment s = make_segment(trace, grades, first, last, true);
        if (s.elevation_change_m() > 0.0 && keep_segment(s, options)) {
            report.climbs.push_back(s);
        }
    }
    for (const auto& [first, last] :
         find_runs(grades, [deadband](double g) { return g <= -deadband; })) {
        Segment s = make_segment(trace, grades, first, last, false);
        if (s.elevation_change_m() < 0.0 && keep_segment(s, options)) {
            report.descents.push_back(s);
        }
    }

    report.longest_climb = best_by(report.climbs, [](const Segment& s) { return s.length_m(); });
    report.steepest_climb =
        best_by(report.climbs, [](const Segment& s) { return s.average_grade_percent; });
    report.largest_climb =
        best_by(report.climbs, [](const Segment& s) { return s.elevation_change_m(); });
    report.longest_descent =
        best_by(report.descents, [](const Segment& s) { return s.length_m(); });
    report.steepest_descent =
        best_by(report.descents, [](const Segment& s) { return -s.average_grade_percent; });
    report.largest_descent =
        best_by(report.descents, [](const Segment& s) { return -s.elevation_change_m(); });

    for (const auto& s : report.climbs) {
        report.climbing_distance_m += s.length_m();
        report.climbing_gain_m += s.elevation_change_m();
    }
    for (const auto& s : report.descents) {
        report.descending_distance_m += s.length_m();
        report.descending_loss_m -= s.elevation_change_m();
    }

    const double total = trace.total_distance() - trace.distance[0];
    if (total > 0.0) {
        report.climbing_percent = report.climbing_distance_m / total * 100.0;
        report.descending_percent = report.descending_distance_m / total * 100.0;
    }
    return report;
}

} // namespace elevation_tuner::signal
