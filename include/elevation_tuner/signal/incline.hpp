#pragma once

#include "elevation_tuner/core/types.hpp"

#include <optional>
#include <vector>

namespace elevation_tuner::signal {

struct InclineOptions {
    double deadband_grade = 0.03;         // fraction, 0.03 = 3 %
    double min_elevation_change_m = 25.0;
    double min_length_m = 200.0;
    double min_average_grade_percent = 4.0;
};

// A climb (positive change) or descent (negative change) between two samples.
struct Segment {
    size_t start_index = 0;
    size_t end_index = 0;
    double start_distance_m = 0.0;
    double end_distance_m = 0.0;
    double start_elevation_m = 0.0;
    double end_elevation_m = 0.0;
    double average_grade_percent = 0.0;  // signed
    double max_grade_percent = 0.0;      // steepest step in the climb direction

    double length_m() const { return end_distance_m - start_distance_m; }
    double elevation_change_m() const { return end_elevation_m - start_elevation_m; }
};

struct InclineReport {
    std::vector<Segment> climbs;
    std::vector<Segment> descents;
    std::optional<Segment> longest_climb;
    std::optional<Segment> steepest_climb;
    std::optional<Segment> largest_climb;
    std::optional<Segment> longest_descent;
    std::optional<Segment> steepest_descent;
    std::optional<Segment> largest_descent;
    double climbing_distance_m = 0.0;
    double descending_distance_m = 0.0;
    double climbing_gain_m = 0.0;
    double descending_loss_m = 0.0;
    double climbing_percent = 0.0;
    double descending_percent = 0.0;
};

// Grade in percent of each step; size n-1.
std::vector<double> step_grades_percent(const Trace& trace);

InclineReport analyze_inclines(const Trace& trace, const InclineOptions& options = {});

} // namespace elevation_tuner::signal
