#include "plot_digitizer/core/events.hpp"
#include "plot_digitizer/core/utils.hpp"

namespace plot_digitizer::core {

EventEmitter::EventEmitter(std::ostream& out, std::ostream* log_file)
    : out_(out), log_file_(log_file) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();
    out_ << line << "\n";
    out_.flush();

    if (log_file_) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace plot_digitizer::core
