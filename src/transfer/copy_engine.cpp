#include "ingest_relay/transfer/copy_engine.hpp"
#include "ingest_relay/core/errors.hpp"
#include "ingest_relay/io/digest.hpp"
#include "ingest_relay/pipeline/source_listing.hpp"

#include <system_error>

namespace ingest_relay::transfer {

HashedCopyEngine::HashedCopyEngine(const config::Config& cfg,
                                   pipeline::StabilityDetector& detector,
                                   DestinationWriter& writer, core::Clock& clock,
                                   core::EventEmitter& events)
    : cfg_(cfg), detector_(detector), writer_(writer), clock_(clock), events_(events) {}

void HashedCopyEngine::verify_copy(const fs::path& src, const std::string& name,
                                   const std::string& src_hash) {
    auto dst_hash = writer_.fingerprint(name);
    if (!dst_hash) {
        events_.debug("verify_skipped", {{"path", src.string()},
                                         {"destination", writer_.describe(name)}});
        return;
    }
    if (*dst_hash != src_hash) {
        events_.error("verify_mismatch", {{"path", src.string()},
                                          {"destination", writer_.describe(name)},
                                          {"source_sha256", src_hash},
                                          {"destination_sha256", *dst_hash}});
        try {
            writer_.remove(name);
        } catch (const std::exception& e) {
            events_.error("verify_cleanup_failed", {{"destination", writer_.describe(name)},
                                                    {"error", e.what()}});
        }
        throw TransferError("checksum mismatch after writing " + writer_.describe(name));
    }
}

bool HashedCopyEngine::copy_one(const fs::path& src, bool check_stable) {
    const std::string name = src.filename().string();
    const std::string dst = writer_.describe(name);

    for (int attempt = 1; attempt <= cfg_.retry.count; ++attempt) {
        try {
            if (check_stable) {
                const auto outcome = detector_.wait(src);
                if (outcome != pipeline::StabilityOutcome::STABLE) {
                    const bool vanished = outcome == pipeline::StabilityOutcome::VANISHED;
                    events_.warning(vanished ? "file_vanished" : "file_unstable",
                                    {{"path", src.string()},
                                     {"stage", "copy"},
                                     {"outcome", pipeline::stability_outcome_to_string(outcome)}});
                    return false;
                }
            }

            const std::string src_hash = io::sha256_file(src, cfg_.transfer.block_size);

            writer_.write(src, name);

            if (cfg_.transfer.verify_after_write) {
                verify_copy(src, name, src_hash);
            }

            std::error_code ec;
            fs::remove(src, ec);
            if (ec) {
                throw IOError("Cannot remove source " + src.string() + ": " + ec.message());
            }

            events_.info("copy_ok", {{"path", src.string()},
                                     {"destination", dst},
                                     {"attempt", attempt},
                                     {"sha256", src_hash}});
            return true;
        } catch (const std::exception& e) {
            events_.error("copy_error", {{"path", src.string()},
                                         {"destination", dst},
                                         {"attempt", attempt},
                                         {"error", e.what()}});
            if (attempt < cfg_.retry.count) {
                clock_.sleep_for(std::chrono::seconds(cfg_.retry.delay_seconds));
            }
        }
    }

    events_.error("copy_failed", {{"path", src.string()},
                                  {"destination", dst},
                                  {"attempts", cfg_.retry.count}});
    return false;
}

CopyCounts HashedCopyEngine::copy_all(bool check_stable) {
    CopyCounts counts;
    for (const auto& src : pipeline::list_candidate_files(cfg_, events_)) {
        ++counts.found;
        if (copy_one(src, check_stable)) {
            ++counts.succeeded;
        } else {
            ++counts.failed;
        }
    }
    return counts;
}

} // namespace ingest_relay::transfer
