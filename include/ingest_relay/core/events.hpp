#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace ingest_relay::core {

using json = nlohmann::json;

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

std::string log_level_to_string(LogLevel level);
std::optional<LogLevel> string_to_log_level(const std::string& s);

/**
 * Structured event log.
 * Every event is one JSON line carrying type, level, run_id and ts. Lines go
 * to `out` and, when set, are appended to `log_file` as well.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out = std::cerr, std::ofstream* log_file = nullptr);

    void set_run_id(const std::string& run_id) { run_id_ = run_id; }
    const std::string& run_id() const { return run_id_; }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }
    bool enabled(LogLevel level) const;

    void emit(LogLevel level, const std::string& type, const json& fields = json::object());

    void debug(const std::string& type, const json& fields = json::object());
    void info(const std::string& type, const json& fields = json::object());
    void warning(const std::string& type, const json& fields = json::object());
    void error(const std::string& type, const json& fields = json::object());

    void phase_start(Phase phase, const json& extra = json::object());
    void phase_end(Phase phase, const std::string& status, const json& extra = json::object());

private:
    json base_event(LogLevel level, const std::string& type) const;

    std::ostream* out_;
    std::ofstream* log_file_;
    std::string run_id_ = "-";
    LogLevel min_level_ = LogLevel::INFO;
};

} // namespace ingest_relay::core
