#pragma once

#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/errors.hpp"
#include "ingest_relay/transfer/destination.hpp"
#include "ingest_relay/transfer/share_client.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace ingest_relay::testing {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &prefix = "ingest_relay_test") {
    std::random_device rd;
    const auto tick =
        std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            (prefix + "-" + std::to_string(tick) + "-" + std::to_string(rd()));
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline void append_file(const fs::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::app);
  out << content;
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

inline std::vector<std::string> list_names(const fs::path &dir) {
  std::vector<std::string> names;
  for (const auto &entry : fs::directory_iterator(dir)) {
    names.push_back(entry.path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

// Quick configuration: immediate stability, a single attempt, no delays.
inline config::Config make_config(const fs::path &source,
                                  const fs::path &target) {
  config::Config cfg;
  cfg.paths.source_dir = source.string();
  cfg.paths.target_dir = target.string();
  cfg.stability.stable_seconds = 0;
  cfg.stability.poll_interval = 1;
  cfg.retry.count = 1;
  cfg.retry.delay_seconds = 0;
  cfg.run_mode = "cron";
  return cfg;
}

// In-memory share: records directories and file contents.
struct FakeShareState {
  std::vector<std::string> mkdir_calls;
  std::set<std::string> existing_dirs;
  std::set<std::string> failing_dirs;
  std::map<std::string, std::string> files;
  std::vector<size_t> chunk_sizes;
  std::vector<std::string> aborted;
  std::vector<std::string> removed;
  bool fail_writes = false;
  int fail_after_chunks = -1; // negative: never
};

class FakeShareClient : public transfer::ShareClient {
public:
  explicit FakeShareClient(std::shared_ptr<FakeShareState> state)
      : state_(std::move(state)) {}

  void make_directory(const transfer::ShareAddress &,
                      const std::string &path) override {
    state_->mkdir_calls.push_back(path);
    if (state_->failing_dirs.count(path)) {
      throw ShareError("access denied: " + path);
    }
    if (!state_->existing_dirs.insert(path).second) {
      throw ShareError("exists: " + path, true);
    }
  }

  std::unique_ptr<transfer::ShareFileWriter>
  open_for_write(const transfer::ShareAddress &,
                 const std::string &path) override {
    return std::make_unique<Writer>(state_, path);
  }

  void remove_file(const transfer::ShareAddress &,
                   const std::string &path) override {
    state_->removed.push_back(path);
    state_->files.erase(path);
  }

private:
  class Writer : public transfer::ShareFileWriter {
  public:
    Writer(std::shared_ptr<FakeShareState> state, std::string path)
        : state_(std::move(state)), path_(std::move(path)) {}

    void write(const char *data, size_t size) override {
      if (state_->fail_writes ||
          (state_->fail_after_chunks >= 0 &&
           static_cast<int>(state_->chunk_sizes.size()) >=
               state_->fail_after_chunks)) {
        throw ShareError("broken pipe");
      }
      state_->chunk_sizes.push_back(size);
      buffer_.append(data, size);
    }
    void close() override { state_->files[path_] = buffer_; }
    void abort() override {
      state_->aborted.push_back(path_);
      state_->files.erase(path_);
    }

  private:
    std::shared_ptr<FakeShareState> state_;
    std::string path_;
    std::string buffer_;
  };

  std::shared_ptr<FakeShareState> state_;
};

// Destination that fails the first `failures` writes, then copies locally.
class FlakyWriter : public transfer::DestinationWriter {
public:
  FlakyWriter(fs::path dir, int failures)
      : local_(std::move(dir)), failures_(failures) {}

  void write(const fs::path &src, const std::string &name) override {
    ++calls;
    if (failures_ < 0 || calls <= failures_) {
      throw IOError("simulated write failure");
    }
    local_.write(src, name);
  }
  std::string describe(const std::string &name) const override {
    return local_.describe(name);
  }
  std::optional<std::string>
  fingerprint(const std::string &name) const override {
    if (corrupt_fingerprint) {
      return std::string(64, '0');
    }
    return local_.fingerprint(name);
  }
  void remove(const std::string &name) override { local_.remove(name); }

  int calls = 0;
  bool corrupt_fingerprint = false;

private:
  transfer::LocalDestinationWriter local_;
  int failures_; // negative: always fail
};

} // namespace ingest_relay::testing
