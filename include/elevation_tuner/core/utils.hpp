#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace elevation_tuner::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Statistical utilities. median_of / mad_of reorder their argument.
double median_of(std::vector<double>& v);
double mad_of(std::vector<double> v);
double mean_of(const std::vector<double>& v);
double stddev_of(const std::vector<double>& v);
double sample_stddev_of(const std::vector<double>& v);

// Consecutive differences of a vector (size n-1, empty for n < 2)
std::vector<double> diffs_of(const VectorXd& v);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

} // namespace elevation_tuner::core
