#include "ingest_relay/pipeline/orchestrator.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <sstream>

using ingest_relay::RunMode;
using ingest_relay::core::EventEmitter;
using ingest_relay::core::ManualClock;
using ingest_relay::pipeline::RunOrchestrator;
using ingest_relay::transfer::LocalDestinationWriter;
using ingest_relay::testing::TempDir;
using ingest_relay::testing::list_names;
using ingest_relay::testing::make_config;
using ingest_relay::testing::read_file;
using ingest_relay::testing::write_file;

namespace fs = std::filesystem;

namespace {

// Local writer that turns the trigger marker into a non-empty directory
// while the pass is running, so the marker cannot be deleted afterwards.
class MarkerBlockingWriter : public ingest_relay::transfer::DestinationWriter {
public:
  MarkerBlockingWriter(fs::path dir, fs::path marker)
      : local_(std::move(dir)), marker_(std::move(marker)) {}

  void write(const fs::path &src, const std::string &name) override {
    if (block) {
      fs::remove(marker_);
      write_file(marker_ / "held.txt", "held");
    }
    local_.write(src, name);
  }
  std::string describe(const std::string &name) const override {
    return local_.describe(name);
  }
  void remove(const std::string &name) override { local_.remove(name); }

  bool block = true;

private:
  LocalDestinationWriter local_;
  fs::path marker_;
};

} // namespace

TEST_CASE("pass_writes_manifest_then_moves_every_file") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "a.txt", "a");
  write_file(src / "b.txt", "bb");
  write_file(src / "c.txt", "ccc");

  auto cfg = make_config(src, out);
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  LocalDestinationWriter writer(out);
  RunOrchestrator orchestrator(cfg, writer, clock, events);

  const auto summary = orchestrator.process_once();
  REQUIRE(summary.manifest_ok == 3);
  REQUIRE(summary.manifest_failed == 0);
  REQUIRE(summary.copy.found == 3);
  REQUIRE(summary.copy.succeeded == 3);
  REQUIRE(summary.copy.failed == 0);
  REQUIRE(summary.manifest_path.has_value());

  REQUIRE(list_names(src) == std::vector<std::string>{"manifest-1700000000.json"});
  REQUIRE(list_names(out) == std::vector<std::string>{"a.txt", "b.txt", "c.txt"});

  const auto doc = nlohmann::json::parse(read_file(*summary.manifest_path));
  REQUIRE(doc["files"].size() == 3);
  REQUIRE(log.str().find("pass_summary") != std::string::npos);
}

TEST_CASE("second_pass_over_emptied_source_does_nothing") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "only.txt", "1");

  auto cfg = make_config(src, out);
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  LocalDestinationWriter writer(out);
  RunOrchestrator orchestrator(cfg, writer, clock, events);

  orchestrator.process_once();
  clock.advance(std::chrono::seconds(60));
  const auto second = orchestrator.process_once();

  REQUIRE(second.manifest_ok == 0);
  REQUIRE(second.manifest_failed == 0);
  REQUIRE(second.copy.found == 0);
  REQUIRE_FALSE(second.manifest_path.has_value());
  REQUIRE(list_names(src).size() == 1);
  REQUIRE(log.str().find("nothing_to_do") != std::string::npos);
}

TEST_CASE("file_vanishing_during_manifest_is_reported_and_not_copied") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  const auto file = src / "partial.upload";
  write_file(file, "half");

  auto cfg = make_config(src, out);
  cfg.stability.stable_seconds = 2;
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  clock.set_sleep_hook([&](int) {
    std::error_code ec;
    fs::remove(file, ec);
  });
  LocalDestinationWriter writer(out);
  RunOrchestrator orchestrator(cfg, writer, clock, events);

  const auto summary = orchestrator.process_once();
  REQUIRE(summary.manifest_ok == 0);
  REQUIRE(summary.manifest_failed == 1);
  REQUIRE(summary.manifest_path.has_value());
  REQUIRE(summary.copy.found == 0);

  const auto doc = nlohmann::json::parse(read_file(*summary.manifest_path));
  REQUIRE(doc["files"].empty());
  REQUIRE_FALSE(fs::exists(out / "partial.upload"));
}

TEST_CASE("trigger_poll_runs_pass_and_removes_marker") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "frame.raw", "pixels");

  auto cfg = make_config(src, out);
  cfg.run_mode = "trigger";
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  LocalDestinationWriter writer(out);
  RunOrchestrator orchestrator(cfg, writer, clock, events);

  // No marker yet: nothing moves.
  REQUIRE_FALSE(orchestrator.poll_trigger_once().has_value());
  REQUIRE(fs::exists(src / "frame.raw"));

  write_file(cfg.trigger_path(), "");
  const auto summary = orchestrator.poll_trigger_once();
  REQUIRE(summary.has_value());
  REQUIRE(summary->copy.succeeded == 1);
  REQUIRE_FALSE(fs::exists(cfg.trigger_path()));
  REQUIRE(read_file(out / "frame.raw") == "pixels");
  REQUIRE_FALSE(fs::exists(out / "trigger.txt"));
  REQUIRE(log.str().find("trigger_removed") != std::string::npos);
}

TEST_CASE("marker_recreated_after_pass_triggers_empty_pass") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "one.dat", "1");

  auto cfg = make_config(src, out);
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  LocalDestinationWriter writer(out);
  RunOrchestrator orchestrator(cfg, writer, clock, events);

  write_file(cfg.trigger_path(), "");
  REQUIRE(orchestrator.poll_trigger_once().has_value());

  write_file(cfg.trigger_path(), "");
  const auto again = orchestrator.poll_trigger_once();
  REQUIRE(again.has_value());
  REQUIRE(again->copy.found == 0);
  REQUIRE_FALSE(again->manifest_path.has_value());
  REQUIRE_FALSE(fs::exists(cfg.trigger_path()));
}

TEST_CASE("failed_marker_removal_is_logged_and_loop_keeps_working") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "payload.dat", "data");

  auto cfg = make_config(src, out);
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  MarkerBlockingWriter writer(out, cfg.trigger_path());
  RunOrchestrator orchestrator(cfg, writer, clock, events);

  write_file(cfg.trigger_path(), "");
  const auto summary = orchestrator.poll_trigger_once();
  REQUIRE(summary.has_value());
  REQUIRE(summary->copy.succeeded == 1);
  REQUIRE(fs::is_directory(cfg.trigger_path()));
  REQUIRE(log.str().find("trigger_remove_failed") != std::string::npos);
  REQUIRE(read_file(out / "payload.dat") == "data");

  // A directory is not a marker: polling it does nothing.
  REQUIRE_FALSE(orchestrator.poll_trigger_once().has_value());

  // Marker restored: the next pass is empty and harmless.
  writer.block = false;
  fs::remove_all(cfg.trigger_path());
  write_file(cfg.trigger_path(), "");
  const auto again = orchestrator.poll_trigger_once();
  REQUIRE(again.has_value());
  REQUIRE(again->copy.found == 0);
  REQUIRE_FALSE(again->manifest_path.has_value());
  REQUIRE_FALSE(fs::exists(cfg.trigger_path()));
  REQUIRE(list_names(out) == std::vector<std::string>{"payload.dat"});
}

TEST_CASE("marker_vanishing_before_stable_is_ignored") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "one.dat", "1");

  auto cfg = make_config(src, out);
  cfg.stability.stable_seconds = 2;
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  LocalDestinationWriter writer(out);
  RunOrchestrator orchestrator(cfg, writer, clock, events);

  write_file(cfg.trigger_path(), "x");
  clock.set_sleep_hook([&](int) { fs::remove(cfg.trigger_path()); });

  REQUIRE_FALSE(orchestrator.poll_trigger_once().has_value());
  REQUIRE(fs::exists(src / "one.dat"));
  REQUIRE_FALSE(fs::exists(out));
}

TEST_CASE("cron_run_performs_one_pass_and_returns_zero") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "x.log", "line\n");

  auto cfg = make_config(src, out);
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  LocalDestinationWriter writer(out);
  RunOrchestrator orchestrator(cfg, writer, clock, events);

  REQUIRE(orchestrator.run(RunMode::CRON) == 0);
  REQUIRE(fs::exists(out / "x.log"));
  REQUIRE(log.str().find("relay_end") != std::string::npos);
  REQUIRE(log.str().find("\"run_mode\":\"cron\"") != std::string::npos);
}
