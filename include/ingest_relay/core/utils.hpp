#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ingest_relay::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
int64_t to_unix_seconds(std::chrono::system_clock::time_point tp);
int64_t file_mtime_seconds(const fs::path& path);

// File utilities
std::string read_text(const fs::path& path);
void write_text_atomic(const fs::path& path, const std::string& text);
fs::path pick_output_file(const fs::path& dir, const std::string& stem, const std::string& ext);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string shell_quote(const std::string& s);

} // namespace ingest_relay::core
