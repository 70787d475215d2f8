#include "ingest_relay/pipeline/orchestrator.hpp"
#include "ingest_relay/core/errors.hpp"

#include <system_error>

namespace ingest_relay::pipeline {

RunOrchestrator::RunOrchestrator(const config::Config& cfg, transfer::DestinationWriter& writer,
                                 core::Clock& clock, core::EventEmitter& events)
    : cfg_(cfg), clock_(clock), events_(events),
      detector_(cfg.stability, clock, events),
      manifest_(cfg, detector_, clock, events),
      copier_(cfg, detector_, writer, clock, events) {}

PassSummary RunOrchestrator::process_once(bool check_stable) {
    PassSummary summary;

    events_.phase_start(Phase::MANIFEST, {{"source_dir", cfg_.paths.source_dir}});
    ManifestResult manifest = manifest_.build(check_stable);
    summary.manifest_ok = manifest.ok;
    summary.manifest_failed = manifest.failed;

    if (manifest.ok == 0 && manifest.failed == 0) {
        events_.phase_end(Phase::MANIFEST, "skipped", {{"reason", "no_files"}});
        events_.info("nothing_to_do", {{"source_dir", cfg_.paths.source_dir}});
        return summary;
    }

    try {
        summary.manifest_path = manifest_.write(manifest.entries);
    } catch (const std::exception& e) {
        events_.phase_end(Phase::MANIFEST, "error", {{"error", e.what()}});
        throw IOError(std::string("cannot write manifest: ") + e.what());
    }
    events_.phase_end(Phase::MANIFEST, "ok", {{"ok", manifest.ok}, {"failed", manifest.failed}});

    events_.phase_start(Phase::COPY, {{"target_dir", cfg_.paths.target_dir}});
    summary.copy = copier_.copy_all(check_stable);
    events_.phase_end(Phase::COPY, summary.copy.failed == 0 ? "ok" : "partial",
                      {{"found", summary.copy.found},
                       {"succeeded", summary.copy.succeeded},
                       {"failed", summary.copy.failed}});

    events_.info("pass_summary", {{"found", summary.copy.found},
                                  {"succeeded", summary.copy.succeeded},
                                  {"failed", summary.copy.failed},
                                  {"manifest", summary.manifest_path->string()},
                                  {"manifest_ok", summary.manifest_ok},
                                  {"manifest_failed", summary.manifest_failed}});
    return summary;
}

std::optional<PassSummary> RunOrchestrator::poll_trigger_once() {
    const fs::path trigger = cfg_.trigger_path();

    std::error_code ec;
    if (!fs::is_regular_file(trigger, ec) || !detector_.is_stable(trigger)) {
        return std::nullopt;
    }

    events_.info("trigger_detected", {{"trigger", trigger.string()}});

    PassSummary summary;
    try {
        summary = process_once(true);
    } catch (const std::exception& e) {
        // The marker stays so the next poll retries the pass.
        events_.error("pass_error", {{"error", e.what()}, {"trigger", trigger.string()}});
        return std::nullopt;
    }

    fs::remove(trigger, ec);
    if (ec) {
        events_.error("trigger_remove_failed", {{"trigger", trigger.string()},
                                                {"error", ec.message()}});
    } else {
        events_.info("trigger_removed", {{"trigger", trigger.string()}});
    }
    return summary;
}

void RunOrchestrator::run_trigger_loop() {
    events_.info("trigger_loop_start", {{"trigger", cfg_.trigger_path().string()},
                                        {"poll_interval", cfg_.stability.poll_interval}});
    while (true) {
        poll_trigger_once();
        clock_.sleep_for(std::chrono::seconds(cfg_.stability.poll_interval));
    }
}

int RunOrchestrator::run(RunMode mode) {
    events_.info("mode", {{"run_mode", run_mode_to_string(mode)}});
    switch (mode) {
        case RunMode::CRON:
            try {
                process_once(true);
            } catch (const std::exception& e) {
                events_.error("pass_error", {{"error", e.what()}});
                return 1;
            }
            events_.info("relay_end", {{"run_mode", run_mode_to_string(mode)}});
            return 0;
        case RunMode::TRIGGER:
            run_trigger_loop();
            return 0;
    }
    throw ConfigError("unsupported run mode");
}

} // namespace ingest_relay::pipeline
