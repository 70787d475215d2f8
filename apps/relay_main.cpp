#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/clock.hpp"
#include "ingest_relay/core/errors.hpp"
#include "ingest_relay/core/events.hpp"
#include "ingest_relay/core/utils.hpp"
#include "ingest_relay/pipeline/orchestrator.hpp"
#include "ingest_relay/transfer/destination.hpp"

#include <CLI/CLI.hpp>
#include <yaml-cpp/yaml.h>

#include <csignal>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

using ingest_relay::ConfigError;
using ingest_relay::ValidationError;

namespace config = ingest_relay::config;
namespace core = ingest_relay::core;
namespace pipeline = ingest_relay::pipeline;
namespace transfer = ingest_relay::transfer;

config::Config load_config(const std::string &config_path,
                           const std::string &mode_override,
                           const std::string &log_level_override) {
  config::Config cfg = config_path.empty() ? config::Config{}
                                           : config::Config::load(config_path);
  cfg.apply_env();
  if (!mode_override.empty())
    cfg.run_mode = core::to_lower(mode_override);
  if (!log_level_override.empty())
    cfg.logging.level = log_level_override;
  cfg.validate();
  return cfg;
}

int run_relay(const config::Config &cfg) {
  std::ofstream log_file;
  if (!cfg.logging.file.empty()) {
    const fs::path log_path(cfg.logging.file);
    if (log_path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(log_path.parent_path(), ec);
    }
    log_file.open(log_path, std::ios::app);
    if (!log_file) {
      std::cerr << "Error: cannot open log file: " << cfg.logging.file
                << std::endl;
      return 1;
    }
  }

  core::EventEmitter events(std::cerr, log_file.is_open() ? &log_file : nullptr);
  events.set_min_level(*core::string_to_log_level(cfg.logging.level));
  events.set_run_id(core::get_run_id());

  events.info("relay_start", {{"source_dir", cfg.paths.source_dir},
                              {"target_dir", cfg.paths.target_dir},
                              {"trigger_file", cfg.trigger.file},
                              {"run_mode", cfg.run_mode}});

  try {
    auto writer = transfer::make_destination_writer(cfg, events);
    core::SystemClock clock;
    pipeline::RunOrchestrator orchestrator(cfg, *writer, clock, events);
    return orchestrator.run(cfg.mode());
  } catch (const ConfigError &e) {
    events.error("config_error", {{"error", e.what()}});
    return 1;
  } catch (const std::exception &e) {
    events.error("fatal_error", {{"error", e.what()}});
    return 1;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  // Writes into a dead smbclient pipe must fail with EPIPE, not kill us.
  std::signal(SIGPIPE, SIG_IGN);

  CLI::App app{"ingest_relay - stable-file manifest and transfer service"};

  std::string config_path;
  std::string mode_override;
  std::string log_level_override;
  bool print_config = false;

  app.add_option("--config", config_path,
                 "YAML config file (environment variables take precedence)")
      ->check(CLI::ExistingFile);
  app.add_option("--mode", mode_override, "Run mode override: cron|trigger");
  app.add_option("--log-level", log_level_override,
                 "Log level override: debug|info|warning|error");
  app.add_flag("--print-config", print_config,
               "Print the effective configuration as YAML and exit");

  CLI11_PARSE(app, argc, argv);

  config::Config cfg;
  try {
    cfg = load_config(config_path, mode_override, log_level_override);
  } catch (const ConfigError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const ValidationError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (print_config) {
    YAML::Emitter out;
    out << cfg.to_yaml(true);
    std::cout << out.c_str() << std::endl;
    return 0;
  }

  return run_relay(cfg);
}
