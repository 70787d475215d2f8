#include "ingest_relay/core/events.hpp"
#include "ingest_relay/core/utils.hpp"

namespace ingest_relay::core {

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        default: return "info";
    }
}

std::optional<LogLevel> string_to_log_level(const std::string& s) {
    const std::string norm = to_lower(s);
    if (norm == "debug") return LogLevel::DEBUG;
    if (norm == "info") return LogLevel::INFO;
    if (norm == "warning" || norm == "warn") return LogLevel::WARNING;
    if (norm == "error") return LogLevel::ERROR;
    return std::nullopt;
}

EventEmitter::EventEmitter(std::ostream& out, std::ofstream* log_file)
    : out_(&out), log_file_(log_file) {}

bool EventEmitter::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

json EventEmitter::base_event(LogLevel level, const std::string& type) const {
    return {
        {"type", type},
        {"level", log_level_to_string(level)},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(LogLevel level, const std::string& type, const json& fields) {
    if (!enabled(level)) {
        return;
    }

    json event = base_event(level, type);
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            event[key] = value;
        }
    }

    // Paths may carry bytes that are not valid UTF-8.
    const std::string line = event.dump(-1, ' ', false, json::error_handler_t::replace);

    (*out_) << line << "\n";
    out_->flush();

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
}

void EventEmitter::debug(const std::string& type, const json& fields) {
    emit(LogLevel::DEBUG, type, fields);
}

void EventEmitter::info(const std::string& type, const json& fields) {
    emit(LogLevel::INFO, type, fields);
}

void EventEmitter::warning(const std::string& type, const json& fields) {
    emit(LogLevel::WARNING, type, fields);
}

void EventEmitter::error(const std::string& type, const json& fields) {
    emit(LogLevel::ERROR, type, fields);
}

void EventEmitter::phase_start(Phase phase, const json& extra) {
    json fields = extra.is_object() ? extra : json::object();
    fields["phase"] = phase_to_int(phase);
    fields["phase_name"] = phase_to_string(phase);
    emit(LogLevel::INFO, "phase_start", fields);
}

void EventEmitter::phase_end(Phase phase, const std::string& status, const json& extra) {
    json fields = extra.is_object() ? extra : json::object();
    fields["phase"] = phase_to_int(phase);
    fields["phase_name"] = phase_to_string(phase);
    fields["status"] = status;
    emit(LogLevel::INFO, "phase_end", fields);
}

} // namespace ingest_relay::core
