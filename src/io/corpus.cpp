#include "elevation_tuner/io/corpus.hpp"
#include "elevation_tuner/core/errors.hpp"
#include "elevation_tuner/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>

namespace elevation_tuner::io {

namespace {

bool parse_double(const std::string& s, double& out) {
    const std::string t = core::trim(s);
    if (t.empty()) return false;
    char* end = nullptr;
    out = std::strtod(t.c_str(), &end);
    return end == t.c_str() + t.size() && std::isfinite(out);
}

std::string strip_extension(const std::string& name) {
    return fs::path(name).stem().string();
}

} // namespace

Trace parse_track_csv(const std::string& text, const std::string& source) {
    std::vector<double> dist;
    std::vector<double> elev;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;
    bool seen_data = false;

    while (std::getline(in, line)) {
        ++line_no;
        const std::string t = core::trim(line);
        if (t.empty() || t[0] == '#') continue;

        const auto parts = core::split(t, ',');
        double d = 0.0;
        double e = 0.0;
        if (parts.size() < 2 || !parse_double(parts[0], d) || !parse_double(parts[1], e)) {
            if (!seen_data && line_no == 1) {
                continue; // header
            }
            throw IOError(source + ":" + std::to_string(line_no) +
                          ": expected 'distance_m,elevation_m'");
        }
        seen_data = true;
        dist.push_back(d);
        elev.push_back(e);
    }

    if (dist.empty()) {
        throw IOError(source + ": no samples");
    }
    return Trace::from_vectors(dist, elev);
}

Trace load_track_csv(const fs::path& path) {
    return parse_track_csv(core::read_text(path), path.string());
}

std::vector<NamedTrack> load_corpus(const fs::path& dir) {
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        throw IOError("Corpus directory not found: " + dir.string());
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() &&
            core::to_lower(entry.path().extension().string()) == ".csv") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<NamedTrack> corpus;
    corpus.reserve(files.size());
    for (const auto& f : files) {
        try {
            corpus.push_back({f.stem().string(), load_track_csv(f)});
        } catch (const IOError& e) {
            std::cerr << "[CORPUS] Skipping " << f.filename().string() << ": " << e.what()
                      << std::endl;
        }
    }
    return corpus;
}

GroundTruthMap parse_ground_truth_csv(const std::string& text, const std::string& source) {
    GroundTruthMap truth;
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const std::string t = core::trim(line);
        if (t.empty() || t[0] == '#') continue;

        const auto parts = core::split(t, ',');
        const std::string name = parts.empty() ? std::string() : core::trim(parts[0]);
        if (name.empty()) {
            throw IOError(source + ":" + std::to_string(line_no) + ": missing filename");
        }

        double gain = 0.0;
        const std::string value = parts.size() > 1 ? core::trim(parts[1]) : std::string();
        if (!value.empty() && !parse_double(value, gain)) {
            if (line_no == 1) continue; // header
            throw IOError(source + ":" + std::to_string(line_no) + ": bad gain '" + value + "'");
        }
        if (gain < 0.0) {
            throw IOError(source + ":" + std::to_string(line_no) + ": negative gain");
        }
        gain = std::round(gain);
        if (gain > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
            throw IOError(source + ":" + std::to_string(line_no) + ": gain out of range");
        }
        truth[strip_extension(name)] = static_cast<uint32_t>(gain);
    }
    return truth;
}

GroundTruthMap load_ground_truth(const fs::path& path) {
    return parse_ground_truth_csv(core::read_text(path), path.string());
}

} // namespace elevation_tuner::io
