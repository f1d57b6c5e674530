#include "elevation_tuner/core/events.hpp"
#include "elevation_tuner/core/utils.hpp"

namespace elevation_tuner::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::search_start(const std::string& run_id, const std::string& mode,
                                size_t num_configs, size_t num_tracks, std::ostream& out) {
    json event = base_event("search_start", run_id);
    event["mode"] = mode;
    event["configs"] = num_configs;
    event["tracks"] = num_tracks;
    event["total"] = num_configs * num_tracks;
    emit(event, out);
}

void EventEmitter::search_progress(const std::string& run_id, size_t done, size_t total,
                                   const std::string& message, std::ostream& out) {
    json event = base_event("search_progress", run_id);
    event["current"] = done;
    event["total"] = total;
    event["progress"] = total == 0 ? 1.0 : static_cast<double>(done) / static_cast<double>(total);
    event["substep"] = message;
    emit(event, out);
}

void EventEmitter::search_end(const std::string& run_id, const std::string& status,
                              const json& extra, std::ostream& out) {
    json event = base_event("search_end", run_id);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

} // namespace elevation_tuner::core
