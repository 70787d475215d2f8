#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ingest_relay {

namespace fs = std::filesystem;

// Run mode enumeration
enum class RunMode {
    CRON,    // one pass, then exit
    TRIGGER  // persistent loop waiting for the trigger marker
};

inline std::string run_mode_to_string(RunMode mode) {
    switch (mode) {
        case RunMode::CRON: return "cron";
        case RunMode::TRIGGER: return "trigger";
        default: return "unknown";
    }
}

inline std::optional<RunMode> string_to_run_mode(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "cron") return RunMode::CRON;
    if (norm == "trigger") return RunMode::TRIGGER;
    return std::nullopt;
}

// One file as recorded in a manifest
struct ManifestEntry {
    std::string name;     // basename inside the source directory
    uint64_t size = 0;    // bytes
    int64_t mtime = 0;    // unix seconds
    std::string sha256;   // lowercase hex
};

struct Manifest {
    int64_t generated_at = 0;  // unix seconds
    std::string source_dir;
    std::vector<ManifestEntry> files;
};

// Result of the read-only manifest pass
struct ManifestResult {
    int ok = 0;
    int failed = 0;
    std::vector<ManifestEntry> entries;
};

// Result of the copy pass
struct CopyCounts {
    int found = 0;
    int succeeded = 0;
    int failed = 0;
};

struct PassSummary {
    int manifest_ok = 0;
    int manifest_failed = 0;
    CopyCounts copy;
    std::optional<fs::path> manifest_path;  // unset when nothing was found
};

// Pass phase enumeration
enum class Phase {
    MANIFEST = 0,
    COPY = 1
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::MANIFEST: return "MANIFEST";
        case Phase::COPY: return "COPY";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace ingest_relay
