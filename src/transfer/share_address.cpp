#include "ingest_relay/transfer/share_address.hpp"
#include "ingest_relay/core/errors.hpp"
#include "ingest_relay/core/utils.hpp"

namespace ingest_relay::transfer {

namespace {

constexpr const char* kScheme = "smb://";

} // namespace

std::string ShareAddress::unc() const {
    return "//" + host + "/" + share;
}

std::string ShareAddress::directory_path() const {
    return core::join(directory, "/");
}

std::string ShareAddress::file_path(const std::string& name) const {
    if (directory.empty()) {
        return name;
    }
    return directory_path() + "/" + name;
}

bool is_share_address(const std::string& target) {
    return core::starts_with(core::to_lower(target), kScheme);
}

std::optional<ShareAddress> parse_share_address(const std::string& target) {
    if (!is_share_address(target)) {
        return std::nullopt;
    }

    const std::string rest = target.substr(std::string(kScheme).size());
    std::vector<std::string> parts;
    for (auto& part : core::split(rest, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }

    if (parts.size() < 2) {
        throw ConfigError("invalid SMB address '" + target +
                          "', expected smb://host/share/path");
    }

    ShareAddress addr;
    addr.host = parts[0];
    addr.share = parts[1];
    addr.directory.assign(parts.begin() + 2, parts.end());
    return addr;
}

} // namespace ingest_relay::transfer
