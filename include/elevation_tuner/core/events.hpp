#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <string>

namespace elevation_tuner::core {

using json = nlohmann::json;

class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void search_start(const std::string& run_id, const std::string& mode,
                      size_t num_configs, size_t num_tracks, std::ostream& out);
    void search_progress(const std::string& run_id, size_t done, size_t total,
                         const std::string& message, std::ostream& out);
    void search_end(const std::string& run_id, const std::string& status,
                    const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

} // namespace elevation_tuner::core
