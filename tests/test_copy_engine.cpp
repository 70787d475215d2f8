#include "ingest_relay/transfer/copy_engine.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

using ingest_relay::core::EventEmitter;
using ingest_relay::core::ManualClock;
using ingest_relay::pipeline::StabilityDetector;
using ingest_relay::transfer::HashedCopyEngine;
using ingest_relay::transfer::LocalDestinationWriter;
using ingest_relay::testing::FlakyWriter;
using ingest_relay::testing::TempDir;
using ingest_relay::testing::make_config;
using ingest_relay::testing::read_file;
using ingest_relay::testing::write_file;

namespace fs = std::filesystem;

TEST_CASE("copy_moves_file_and_removes_source") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "a.txt", "alpha");
  write_file(src / "b.txt", "beta");

  auto cfg = make_config(src, out);
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  StabilityDetector detector(cfg.stability, clock, events);
  LocalDestinationWriter writer(out);
  HashedCopyEngine engine(cfg, detector, writer, clock, events);

  const auto counts = engine.copy_all();
  REQUIRE(counts.found == 2);
  REQUIRE(counts.succeeded == 2);
  REQUIRE(counts.failed == 0);
  REQUIRE(read_file(out / "a.txt") == "alpha");
  REQUIRE(read_file(out / "b.txt") == "beta");
  REQUIRE_FALSE(fs::exists(src / "a.txt"));
  REQUIRE_FALSE(fs::exists(src / "b.txt"));
  REQUIRE(log.str().find("copy_ok") != std::string::npos);
}

TEST_CASE("persistent_write_failure_keeps_source_after_all_attempts") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "stuck.bin", "data");

  auto cfg = make_config(src, out);
  cfg.retry.count = 3;
  cfg.retry.delay_seconds = 2;
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  StabilityDetector detector(cfg.stability, clock, events);
  FlakyWriter writer(out, -1);
  HashedCopyEngine engine(cfg, detector, writer, clock, events);

  const auto counts = engine.copy_all();
  REQUIRE(counts.found == 1);
  REQUIRE(counts.succeeded == 0);
  REQUIRE(counts.failed == 1);
  REQUIRE(writer.calls == 3);
  REQUIRE(clock.sleep_count() == 2);
  REQUIRE(clock.total_slept() == std::chrono::seconds(4));
  REQUIRE(fs::exists(src / "stuck.bin"));
  REQUIRE_FALSE(fs::exists(out / "stuck.bin"));
  REQUIRE(log.str().find("copy_failed") != std::string::npos);
}

TEST_CASE("transient_write_failure_succeeds_on_retry") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "flaky.bin", "payload");

  auto cfg = make_config(src, out);
  cfg.retry.count = 3;
  cfg.retry.delay_seconds = 1;
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  StabilityDetector detector(cfg.stability, clock, events);
  FlakyWriter writer(out, 1);
  HashedCopyEngine engine(cfg, detector, writer, clock, events);

  REQUIRE(engine.copy_one(src / "flaky.bin"));
  REQUIRE(writer.calls == 2);
  REQUIRE(clock.sleep_count() == 1);
  REQUIRE(read_file(out / "flaky.bin") == "payload");
  REQUIRE_FALSE(fs::exists(src / "flaky.bin"));
  REQUIRE(log.str().find("\"attempt\":2") != std::string::npos);
}

TEST_CASE("file_vanishing_while_waiting_for_stability_is_not_retried") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  const auto file = src / "gone.tmp";
  write_file(file, "temp");

  auto cfg = make_config(src, out);
  cfg.stability.stable_seconds = 2;
  cfg.retry.count = 3;
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  clock.set_sleep_hook([&](int) { fs::remove(file); });
  StabilityDetector detector(cfg.stability, clock, events);
  FlakyWriter writer(out, 0);
  HashedCopyEngine engine(cfg, detector, writer, clock, events);

  const auto counts = engine.copy_all();
  REQUIRE(counts.found == 1);
  REQUIRE(counts.failed == 1);
  REQUIRE(writer.calls == 0);
  REQUIRE(clock.sleep_count() == 1);
  REQUIRE(log.str().find("file_vanished") != std::string::npos);
}

TEST_CASE("verification_mismatch_fails_and_keeps_source") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  write_file(src / "check.bin", "verify me");

  auto cfg = make_config(src, out);
  cfg.transfer.verify_after_write = true;
  cfg.retry.count = 2;
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  StabilityDetector detector(cfg.stability, clock, events);
  FlakyWriter writer(out, 0);
  writer.corrupt_fingerprint = true;
  HashedCopyEngine engine(cfg, detector, writer, clock, events);

  REQUIRE_FALSE(engine.copy_one(src / "check.bin"));
  REQUIRE(writer.calls == 2);
  REQUIRE(fs::exists(src / "check.bin"));
  REQUIRE_FALSE(fs::exists(out / "check.bin"));
  REQUIRE(log.str().find("verify_mismatch") != std::string::npos);

  writer.corrupt_fingerprint = false;
  REQUIRE(engine.copy_one(src / "check.bin"));
  REQUIRE_FALSE(fs::exists(src / "check.bin"));
}

TEST_CASE("file_still_growing_at_max_wait_is_reported_unstable") {
  TempDir dir;
  const auto src = dir.path() / "in";
  const auto out = dir.path() / "out";
  const auto file = src / "stream.log";
  write_file(file, "x");

  auto cfg = make_config(src, out);
  cfg.stability.stable_seconds = 3;
  cfg.stability.max_wait_seconds = 2;
  std::ostringstream log;
  EventEmitter events(log);
  ManualClock clock;
  clock.set_sleep_hook([&](int) { ingest_relay::testing::append_file(file, "more"); });
  StabilityDetector detector(cfg.stability, clock, events);
  FlakyWriter writer(out, 0);
  HashedCopyEngine engine(cfg, detector, writer, clock, events);

  REQUIRE_FALSE(engine.copy_one(file));
  REQUIRE(writer.calls == 0);
  REQUIRE(fs::exists(file));
  REQUIRE(log.str().find("file_unstable") != std::string::npos);
  REQUIRE(log.str().find("\"outcome\":\"timed_out\"") != std::string::npos);
  REQUIRE(log.str().find("file_vanished") == std::string::npos);
}
