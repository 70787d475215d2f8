#pragma once

#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/clock.hpp"
#include "ingest_relay/core/events.hpp"
#include "ingest_relay/core/types.hpp"
#include "ingest_relay/pipeline/manifest.hpp"
#include "ingest_relay/pipeline/stability.hpp"
#include "ingest_relay/transfer/copy_engine.hpp"
#include "ingest_relay/transfer/destination.hpp"

#include <optional>

namespace ingest_relay::pipeline {

/**
 * Drives passes over the source directory.
 *
 * A pass builds the manifest, persists it when at least one candidate was
 * seen, then copies over a fresh listing. In trigger mode the orchestrator
 * polls for the marker file, runs a pass once the marker is stable and
 * removes it afterwards.
 */
class RunOrchestrator {
public:
    RunOrchestrator(const config::Config& cfg, transfer::DestinationWriter& writer,
                    core::Clock& clock, core::EventEmitter& events);

    PassSummary process_once(bool check_stable = true);

    // One WAITING step of the trigger loop. Returns the pass summary when the
    // marker was present and a pass ran.
    std::optional<PassSummary> poll_trigger_once();

    // Never returns under normal operation.
    void run_trigger_loop();

    int run(RunMode mode);

private:
    const config::Config& cfg_;
    core::Clock& clock_;
    core::EventEmitter& events_;
    StabilityDetector detector_;
    ManifestBuilder manifest_;
    transfer::HashedCopyEngine copier_;
};

} // namespace ingest_relay::pipeline
