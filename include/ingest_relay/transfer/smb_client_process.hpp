#pragma once

#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/transfer/share_client.hpp"

#include <filesystem>
#include <string>

namespace ingest_relay::transfer {

/**
 * ShareClient backed by the `smbclient` command-line tool.
 *
 * Directories are created with `mkdir`; files are streamed through a pipe into
 * `put /dev/stdin <path>` and removed with `del`. Credentials go into a
 * private 0600 authentication file that lives as long as the client. Callers must ignore SIGPIPE so a
 * client that exits early surfaces as a ShareError instead of a signal.
 */
class SmbClientProcess : public ShareClient {
public:
    explicit SmbClientProcess(const config::SmbConfig& cfg);
    ~SmbClientProcess() override;

    SmbClientProcess(const SmbClientProcess&) = delete;
    SmbClientProcess& operator=(const SmbClientProcess&) = delete;

    void make_directory(const ShareAddress& share, const std::string& path) override;
    std::unique_ptr<ShareFileWriter> open_for_write(const ShareAddress& share,
                                                    const std::string& path) override;
    void remove_file(const ShareAddress& share, const std::string& path) override;

    // Shell command running `commands` against the share, without redirections.
    std::string command_line(const ShareAddress& share, const std::string& commands) const;

private:
    std::string delete_command(const ShareAddress& share, const std::string& path) const;

    config::SmbConfig cfg_;
    std::filesystem::path auth_file_;
};

// Converts a '/'-separated share path to the form smbclient commands expect.
std::string to_smb_path(const std::string& path);

} // namespace ingest_relay::transfer
