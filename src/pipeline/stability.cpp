#include "ingest_relay/pipeline/stability.hpp"

#include <cstdint>
#include <system_error>

namespace ingest_relay::pipeline {

std::string stability_outcome_to_string(StabilityOutcome outcome) {
    switch (outcome) {
        case StabilityOutcome::STABLE: return "stable";
        case StabilityOutcome::VANISHED: return "vanished";
        case StabilityOutcome::TIMED_OUT: return "timed_out";
        default: return "unknown";
    }
}

StabilityDetector::StabilityDetector(const config::StabilityConfig& cfg, core::Clock& clock,
                                     core::EventEmitter& events)
    : cfg_(cfg), clock_(clock), events_(events) {}

StabilityOutcome StabilityDetector::wait(const fs::path& path) {
    bool have_size = false;
    uintmax_t last_size = 0;
    int unchanged_for = 0;
    int waited = 0;
    int polls = 0;

    while (true) {
        std::error_code ec;
        const uintmax_t size = fs::file_size(path, ec);
        ++polls;
        if (ec) {
            events_.debug("stability_wait", {{"path", path.string()},
                                             {"outcome", "vanished"},
                                             {"polls", polls},
                                             {"error", ec.message()}});
            return StabilityOutcome::VANISHED;
        }

        if (have_size && size == last_size) {
            unchanged_for += cfg_.poll_interval;
        } else {
            have_size = true;
            last_size = size;
            unchanged_for = 0;
        }

        if (unchanged_for >= cfg_.stable_seconds) {
            events_.debug("stability_wait", {{"path", path.string()},
                                             {"outcome", "stable"},
                                             {"size", static_cast<uint64_t>(size)},
                                             {"polls", polls},
                                             {"waited_seconds", waited}});
            return StabilityOutcome::STABLE;
        }

        if (cfg_.max_wait_seconds > 0 && waited + cfg_.poll_interval > cfg_.max_wait_seconds) {
            events_.warning("stability_timeout", {{"path", path.string()},
                                                  {"size", static_cast<uint64_t>(size)},
                                                  {"waited_seconds", waited},
                                                  {"max_wait_seconds", cfg_.max_wait_seconds}});
            return StabilityOutcome::TIMED_OUT;
        }

        clock_.sleep_for(std::chrono::seconds(cfg_.poll_interval));
        waited += cfg_.poll_interval;
    }
}

bool StabilityDetector::is_stable(const fs::path& path) {
    return wait(path) == StabilityOutcome::STABLE;
}

} // namespace ingest_relay::pipeline
