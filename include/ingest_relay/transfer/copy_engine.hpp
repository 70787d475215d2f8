#pragma once

#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/clock.hpp"
#include "ingest_relay/core/events.hpp"
#include "ingest_relay/core/types.hpp"
#include "ingest_relay/pipeline/stability.hpp"
#include "ingest_relay/transfer/destination.hpp"

#include <filesystem>

namespace ingest_relay::transfer {

namespace fs = std::filesystem;

/**
 * Moves candidate files to the destination.
 *
 * Per file and attempt: wait for stability, hash, write, optionally verify the
 * written copy, then delete the source. Errors are retried `retry.count`
 * times with `retry.delay_seconds` between attempts. The source is removed
 * only after the write returned; a file that runs out of attempts stays in
 * the source directory for the next pass.
 */
class HashedCopyEngine {
public:
    HashedCopyEngine(const config::Config& cfg, pipeline::StabilityDetector& detector,
                     DestinationWriter& writer, core::Clock& clock, core::EventEmitter& events);

    CopyCounts copy_all(bool check_stable = true);
    bool copy_one(const fs::path& src, bool check_stable = true);

private:
    void verify_copy(const fs::path& src, const std::string& name, const std::string& src_hash);

    const config::Config& cfg_;
    pipeline::StabilityDetector& detector_;
    DestinationWriter& writer_;
    core::Clock& clock_;
    core::EventEmitter& events_;
};

} // namespace ingest_relay::transfer
