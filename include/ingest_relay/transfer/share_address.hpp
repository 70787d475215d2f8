#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ingest_relay::transfer {

// smb://host/share[/dir/...]
struct ShareAddress {
    std::string host;
    std::string share;
    std::vector<std::string> directory;  // in-share directory components

    std::string unc() const;                                // //host/share
    std::string directory_path() const;                     // dir/sub, empty at share root
    std::string file_path(const std::string& name) const;   // dir/sub/name
};

bool is_share_address(const std::string& target);

/**
 * Parse a share address. Returns nullopt when `target` is not an smb:// URI;
 * throws ConfigError when it is one but lacks a host or share name.
 */
std::optional<ShareAddress> parse_share_address(const std::string& target);

} // namespace ingest_relay::transfer
