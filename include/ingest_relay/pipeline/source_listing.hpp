#pragma once

#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/events.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ingest_relay::pipeline {

namespace fs = std::filesystem;

/**
 * True for manifest names this system writes: `<prefix>-<unix_ts>.json`, or
 * `<prefix>-<unix_ts>-<n>.json` after a same-second collision.
 */
bool is_manifest_name(const std::string& name, const std::string& prefix);

/**
 * Discover candidate files in the source directory.
 * Only regular files at the top level are returned, sorted by path, skipping
 * the trigger marker and manifest artifacts. A missing or unreadable source
 * directory is logged and yields an empty list.
 */
std::vector<fs::path> list_candidate_files(const config::Config& cfg, core::EventEmitter& events);

} // namespace ingest_relay::pipeline
