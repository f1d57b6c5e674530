#pragma once

#include "elevation_tuner/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace elevation_tuner::io {

namespace fs = std::filesystem;

// One "distance_m,elevation_m" pair per line. A non-numeric first line is a
// header; blank lines and lines starting with '#' are skipped.
Trace parse_track_csv(const std::string& text, const std::string& source = "<memory>");
Trace load_track_csv(const fs::path& path);

// Every *.csv in dir, sorted by file name. The track name is the file name
// without extension.
std::vector<NamedTrack> load_corpus(const fs::path& dir);

// "filename,gain_m" per line. Keys are stored without extension; blank or
// zero gain means unknown and is kept as 0.
GroundTruthMap parse_ground_truth_csv(const std::string& text,
                                      const std::string& source = "<memory>");
GroundTruthMap load_ground_truth(const fs::path& path);

} // namespace elevation_tuner::io
