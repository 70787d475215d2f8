#include "ingest_relay/pipeline/manifest.hpp"
#include "ingest_relay/core/errors.hpp"
#include "ingest_relay/core/utils.hpp"
#include "ingest_relay/io/digest.hpp"
#include "ingest_relay/pipeline/source_listing.hpp"

#include <system_error>

namespace ingest_relay::pipeline {

nlohmann::json manifest_to_json(const Manifest& manifest) {
    nlohmann::json files = nlohmann::json::array();
    for (const auto& e : manifest.files) {
        files.push_back({
            {"name", e.name},
            {"size", e.size},
            {"mtime", e.mtime},
            {"sha256", e.sha256}
        });
    }

    nlohmann::json out;
    out["generated_at"] = manifest.generated_at;
    out["source_dir"] = manifest.source_dir;
    out["files"] = files;
    return out;
}

ManifestBuilder::ManifestBuilder(const config::Config& cfg, StabilityDetector& detector,
                                 core::Clock& clock, core::EventEmitter& events)
    : cfg_(cfg), detector_(detector), clock_(clock), events_(events) {}

ManifestEntry ManifestBuilder::read_entry(const fs::path& path) const {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw IOError("Cannot stat file: " + path.string() + ": " + ec.message());
    }

    ManifestEntry entry;
    entry.name = path.filename().string();
    entry.size = static_cast<uint64_t>(size);
    entry.mtime = core::file_mtime_seconds(path);
    entry.sha256 = io::sha256_file(path, cfg_.transfer.block_size);
    return entry;
}

std::optional<ManifestEntry> ManifestBuilder::make_entry(const fs::path& path, bool check_stable) {
    for (int attempt = 1; attempt <= cfg_.retry.count; ++attempt) {
        if (check_stable) {
            const auto outcome = detector_.wait(path);
            if (outcome != StabilityOutcome::STABLE) {
                const bool vanished = outcome == StabilityOutcome::VANISHED;
                events_.warning(vanished ? "file_vanished" : "file_unstable",
                                {{"path", path.string()},
                                 {"stage", "manifest"},
                                 {"outcome", stability_outcome_to_string(outcome)}});
                return std::nullopt;
            }
        }
        try {
            return read_entry(path);
        } catch (const std::exception& e) {
            events_.error("manifest_read_error", {{"path", path.string()},
                                                  {"attempt", attempt},
                                                  {"error", e.what()}});
            if (attempt < cfg_.retry.count) {
                clock_.sleep_for(std::chrono::seconds(cfg_.retry.delay_seconds));
            }
        }
    }
    return std::nullopt;
}

ManifestResult ManifestBuilder::build(bool check_stable) {
    ManifestResult result;
    for (const auto& path : list_candidate_files(cfg_, events_)) {
        auto entry = make_entry(path, check_stable);
        if (entry) {
            ++result.ok;
            result.entries.push_back(std::move(*entry));
        } else {
            ++result.failed;
        }
    }
    return result;
}

fs::path ManifestBuilder::write(const std::vector<ManifestEntry>& entries) {
    Manifest manifest;
    manifest.generated_at = clock_.unix_seconds();
    manifest.source_dir = cfg_.paths.source_dir;
    manifest.files = entries;

    const std::string stem = cfg_.manifest.prefix + "-" + std::to_string(manifest.generated_at);
    const fs::path path = core::pick_output_file(cfg_.source_path(), stem, ".json");

    const std::string text =
        manifest_to_json(manifest).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    core::write_text_atomic(path, text + "\n");

    events_.info("manifest_written", {{"path", path.string()}, {"files", entries.size()}});
    return path;
}

} // namespace ingest_relay::pipeline
