#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/errors.hpp"
#include "ingest_relay/core/events.hpp"
#include "ingest_relay/core/utils.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace ingest_relay::config {

static int parse_int(const std::string& name, const std::string& raw) {
    size_t pos = 0;
    long value = 0;
    try {
        value = std::stol(raw, &pos);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be an integer, got '" + raw + "'");
    }
    if (pos != raw.size() || value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        throw ConfigError(name + " must be an integer, got '" + raw + "'");
    }
    return static_cast<int>(value);
}

static bool parse_bool(const std::string& name, const std::string& raw) {
    const std::string v = core::to_lower(raw);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(name + " must be a boolean, got '" + raw + "'");
}

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["paths"]) {
        auto p = node["paths"];
        if (p["source_dir"]) cfg.paths.source_dir = p["source_dir"].as<std::string>();
        if (p["target_dir"]) cfg.paths.target_dir = p["target_dir"].as<std::string>();
    }

    if (node["stability"]) {
        auto s = node["stability"];
        if (s["stable_seconds"]) cfg.stability.stable_seconds = s["stable_seconds"].as<int>();
        if (s["poll_interval"]) cfg.stability.poll_interval = s["poll_interval"].as<int>();
        if (s["max_wait_seconds"]) cfg.stability.max_wait_seconds = s["max_wait_seconds"].as<int>();
    }

    if (node["trigger"]) {
        auto t = node["trigger"];
        if (t["file"]) cfg.trigger.file = t["file"].as<std::string>();
    }

    if (node["retry"]) {
        auto r = node["retry"];
        if (r["count"]) cfg.retry.count = r["count"].as<int>();
        if (r["delay_seconds"]) cfg.retry.delay_seconds = r["delay_seconds"].as<int>();
    }

    if (node["manifest"]) {
        auto m = node["manifest"];
        if (m["prefix"]) cfg.manifest.prefix = m["prefix"].as<std::string>();
    }

    if (node["transfer"]) {
        auto t = node["transfer"];
        if (t["verify_after_write"]) cfg.transfer.verify_after_write = t["verify_after_write"].as<bool>();
        if (t["block_size"]) cfg.transfer.block_size = t["block_size"].as<size_t>();
    }

    if (node["smb"]) {
        auto s = node["smb"];
        if (s["username"]) cfg.smb.username = s["username"].as<std::string>();
        if (s["password"]) cfg.smb.password = s["password"].as<std::string>();
        if (s["client_bin"]) cfg.smb.client_bin = s["client_bin"].as<std::string>();
    }

    if (node["logging"]) {
        auto l = node["logging"];
        if (l["level"]) cfg.logging.level = l["level"].as<std::string>();
        if (l["file"]) cfg.logging.file = l["file"].as<std::string>();
    }

    if (node["run_mode"]) cfg.run_mode = node["run_mode"].as<std::string>();

    return cfg;
}

Config Config::from_env(const EnvLookup& env) {
    Config cfg;
    cfg.apply_env(env);
    return cfg;
}

void Config::apply_env(const EnvLookup& env) {
    if (auto v = env("SOURCE_DIR")) paths.source_dir = *v;
    if (auto v = env("TARGET_DIR")) paths.target_dir = *v;

    if (auto v = env("STABLE_SECONDS")) stability.stable_seconds = parse_int("STABLE_SECONDS", *v);
    if (auto v = env("POLL_INTERVAL")) stability.poll_interval = parse_int("POLL_INTERVAL", *v);
    if (auto v = env("MAX_WAIT_SECONDS")) stability.max_wait_seconds = parse_int("MAX_WAIT_SECONDS", *v);

    if (auto v = env("TRIGGER_FILE")) trigger.file = *v;

    if (auto v = env("RETRY_COUNT")) retry.count = parse_int("RETRY_COUNT", *v);
    if (auto v = env("RETRY_DELAY")) retry.delay_seconds = parse_int("RETRY_DELAY", *v);

    if (auto v = env("MANIFEST_PREFIX")) manifest.prefix = *v;
    if (auto v = env("VERIFY_AFTER_WRITE")) transfer.verify_after_write = parse_bool("VERIFY_AFTER_WRITE", *v);

    if (auto v = env("RUN_MODE")) run_mode = core::to_lower(*v);

    if (auto v = env("SMB_USERNAME")) smb.username = *v;
    if (auto v = env("SMB_PASSWORD")) smb.password = *v;
    if (auto v = env("SMB_CLIENT_BIN")) smb.client_bin = *v;

    if (auto v = env("LOG_LEVEL")) logging.level = *v;
    if (auto v = env("LOG_FILE")) logging.file = *v;
}

YAML::Node Config::to_yaml(bool mask_secrets) const {
    YAML::Node node;

    node["paths"]["source_dir"] = paths.source_dir;
    node["paths"]["target_dir"] = paths.target_dir;

    node["stability"]["stable_seconds"] = stability.stable_seconds;
    node["stability"]["poll_interval"] = stability.poll_interval;
    node["stability"]["max_wait_seconds"] = stability.max_wait_seconds;

    node["trigger"]["file"] = trigger.file;

    node["retry"]["count"] = retry.count;
    node["retry"]["delay_seconds"] = retry.delay_seconds;

    node["manifest"]["prefix"] = manifest.prefix;

    node["transfer"]["verify_after_write"] = transfer.verify_after_write;
    node["transfer"]["block_size"] = transfer.block_size;

    node["smb"]["username"] = smb.username;
    node["smb"]["password"] = (mask_secrets && !smb.password.empty()) ? std::string("***") : smb.password;
    node["smb"]["client_bin"] = smb.client_bin;

    node["logging"]["level"] = logging.level;
    node["logging"]["file"] = logging.file;

    node["run_mode"] = run_mode;

    return node;
}

void Config::save(const fs::path& path) const {
    YAML::Emitter out;
    out << to_yaml();
    core::write_text_atomic(path, std::string(out.c_str()) + "\n");
}

void Config::validate() const {
    if (paths.source_dir.empty()) {
        throw ConfigError("required variable 'SOURCE_DIR' (paths.source_dir) is not set");
    }
    if (paths.target_dir.empty()) {
        throw ConfigError("required variable 'TARGET_DIR' (paths.target_dir) is not set");
    }

    if (stability.stable_seconds < 0) {
        throw ValidationError("stability.stable_seconds must be >= 0");
    }
    if (stability.poll_interval < 1) {
        throw ValidationError("stability.poll_interval must be >= 1");
    }
    if (stability.max_wait_seconds < 0) {
        throw ValidationError("stability.max_wait_seconds must be >= 0");
    }

    if (trigger.file.empty()) {
        throw ValidationError("trigger.file must not be empty");
    }
    if (fs::path(trigger.file).has_parent_path()) {
        throw ValidationError("trigger.file must be a plain file name");
    }

    if (retry.count < 1) {
        throw ValidationError("retry.count must be >= 1");
    }
    if (retry.delay_seconds < 0) {
        throw ValidationError("retry.delay_seconds must be >= 0");
    }

    if (manifest.prefix.empty()) {
        throw ValidationError("manifest.prefix must not be empty");
    }

    if (transfer.block_size == 0) {
        throw ValidationError("transfer.block_size must be > 0");
    }

    if (!string_to_run_mode(run_mode)) {
        throw ConfigError("invalid RUN_MODE '" + run_mode + "', expected 'cron' or 'trigger'");
    }

    if (!core::string_to_log_level(logging.level)) {
        throw ValidationError("logging.level must be one of debug|info|warning|error");
    }
}

RunMode Config::mode() const {
    auto m = string_to_run_mode(run_mode);
    if (!m) {
        throw ConfigError("invalid RUN_MODE '" + run_mode + "', expected 'cron' or 'trigger'");
    }
    return *m;
}

fs::path Config::source_path() const {
    return fs::path(paths.source_dir);
}

fs::path Config::trigger_path() const {
    return source_path() / trigger.file;
}

} // namespace ingest_relay::config
