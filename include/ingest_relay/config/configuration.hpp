#pragma once

#include "ingest_relay/core/types.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace ingest_relay::config {

namespace fs = std::filesystem;

struct PathsConfig {
  std::string source_dir;
  std::string target_dir; // local path or smb://host/share/path
};

struct StabilityConfig {
  int stable_seconds = 3;
  int poll_interval = 1;
  int max_wait_seconds = 0; // 0 = wait until stable or vanished
};

struct TriggerConfig {
  std::string file = "trigger.txt";
};

struct RetryConfig {
  int count = 3;
  int delay_seconds = 2;
};

struct ManifestConfig {
  std::string prefix = "manifest";
};

struct TransferConfig {
  bool verify_after_write = false;
  size_t block_size = 1024 * 1024;
};

struct SmbConfig {
  std::string username;
  std::string password;
  std::string client_bin = "smbclient";
};

struct LoggingConfig {
  std::string level = "info"; // debug | info | warning | error
  std::string file;
};

// Returns the value of an environment variable, or nullopt when unset/empty.
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

std::optional<std::string> process_env(const std::string &name);

struct Config {
  PathsConfig paths;
  StabilityConfig stability;
  TriggerConfig trigger;
  RetryConfig retry;
  ManifestConfig manifest;
  TransferConfig transfer;
  SmbConfig smb;
  LoggingConfig logging;
  std::string run_mode = "trigger"; // trigger | cron

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);
  static Config from_env(const EnvLookup &env = process_env);

  // Overlays every variable that is set on top of the current values.
  void apply_env(const EnvLookup &env = process_env);

  void save(const fs::path &path) const;
  YAML::Node to_yaml(bool mask_secrets = false) const;

  void validate() const;

  RunMode mode() const;
  fs::path source_path() const;
  fs::path trigger_path() const;
};

} // namespace ingest_relay::config
