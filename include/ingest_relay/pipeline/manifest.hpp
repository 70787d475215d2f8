#pragma once

#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/clock.hpp"
#include "ingest_relay/core/events.hpp"
#include "ingest_relay/core/types.hpp"
#include "ingest_relay/pipeline/stability.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <vector>

namespace ingest_relay::pipeline {

namespace fs = std::filesystem;

nlohmann::json manifest_to_json(const Manifest& manifest);

/**
 * Read-only pass over the source directory.
 *
 * Each candidate is waited on for stability, then stat'ed and hashed. Read
 * errors are retried `retry.count` times with `retry.delay_seconds` between
 * attempts; a file that vanishes is counted failed without retrying. A single
 * file never aborts the pass.
 */
class ManifestBuilder {
public:
    ManifestBuilder(const config::Config& cfg, StabilityDetector& detector,
                    core::Clock& clock, core::EventEmitter& events);

    ManifestResult build(bool check_stable = true);

    // Entry for one file, or nullopt once it vanished or retries ran out.
    std::optional<ManifestEntry> make_entry(const fs::path& path, bool check_stable = true);

    // Persists the manifest as <source_dir>/<prefix>-<unix_ts>.json.
    fs::path write(const std::vector<ManifestEntry>& entries);

private:
    ManifestEntry read_entry(const fs::path& path) const;

    const config::Config& cfg_;
    StabilityDetector& detector_;
    core::Clock& clock_;
    core::EventEmitter& events_;
};

} // namespace ingest_relay::pipeline
