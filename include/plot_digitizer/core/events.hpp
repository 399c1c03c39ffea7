#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace plot_digitizer::core {

using json = nlohmann::json;

/**
 * Newline-delimited JSON run events. Every event carries type, run_id and ts.
 * Written to the primary stream and mirrored to an optional log stream.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out, std::ostream* log_file = nullptr);

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra = json::object());

    void phase_start(const std::string& run_id, Phase phase);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra = json::object());

    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream& out_;
    std::ostream* log_file_;
};

} // namespace plot_digitizer::core
