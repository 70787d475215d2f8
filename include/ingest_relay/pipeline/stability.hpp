#pragma once

#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/clock.hpp"
#include "ingest_relay/core/events.hpp"

#include <filesystem>
#include <string>

namespace ingest_relay::pipeline {

namespace fs = std::filesystem;

enum class StabilityOutcome {
    STABLE,
    VANISHED,
    TIMED_OUT
};

std::string stability_outcome_to_string(StabilityOutcome outcome);

/**
 * Decides when a file is no longer being written.
 *
 * The size is polled every `poll_interval` seconds. The file is stable once
 * the size has stayed the same for `stable_seconds`; a threshold of 0 is
 * satisfied by the first successful read. An unreadable path ends the wait
 * immediately with VANISHED. Without `max_wait_seconds` the wait is unbounded.
 */
class StabilityDetector {
public:
    StabilityDetector(const config::StabilityConfig& cfg, core::Clock& clock,
                      core::EventEmitter& events);

    StabilityOutcome wait(const fs::path& path);
    bool is_stable(const fs::path& path);

private:
    const config::StabilityConfig& cfg_;
    core::Clock& clock_;
    core::EventEmitter& events_;
};

} // namespace ingest_relay::pipeline
