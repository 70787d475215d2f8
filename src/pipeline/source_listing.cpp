#include "ingest_relay/pipeline/source_listing.hpp"
#include "ingest_relay/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace ingest_relay::pipeline {

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

} // namespace

bool is_manifest_name(const std::string& name, const std::string& prefix) {
    const std::string head = prefix + "-";
    const std::string tail = ".json";
    if (name.size() < head.size() + tail.size() || !core::starts_with(name, head) ||
        !core::ends_with(name, tail)) {
        return false;
    }

    // <unix_ts> or <unix_ts>-<n>
    const std::string stamp = name.substr(head.size(), name.size() - head.size() - tail.size());
    const auto dash = stamp.find('-');
    if (dash == std::string::npos) {
        return all_digits(stamp);
    }
    return all_digits(stamp.substr(0, dash)) && all_digits(stamp.substr(dash + 1));
}

std::vector<fs::path> list_candidate_files(const config::Config& cfg, core::EventEmitter& events) {
    std::vector<fs::path> paths;
    const fs::path source = cfg.source_path();

    std::error_code ec;
    fs::directory_iterator it(source, ec);
    if (ec) {
        events.error("source_unavailable", {{"source_dir", source.string()},
                                            {"error", ec.message()}});
        return paths;
    }

    const fs::directory_iterator end;
    while (!ec && it != end) {
        const std::string name = it->path().filename().string();
        std::error_code type_ec;
        if (name != cfg.trigger.file && !is_manifest_name(name, cfg.manifest.prefix) &&
            it->is_regular_file(type_ec)) {
            paths.push_back(it->path());
        }
        it.increment(ec);
    }
    if (ec) {
        events.error("source_unavailable", {{"source_dir", source.string()},
                                            {"error", ec.message()}});
    }

    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace ingest_relay::pipeline
