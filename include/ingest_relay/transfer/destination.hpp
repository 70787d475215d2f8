#pragma once

#include "ingest_relay/config/configuration.hpp"
#include "ingest_relay/core/events.hpp"
#include "ingest_relay/transfer/share_address.hpp"
#include "ingest_relay/transfer/share_client.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace ingest_relay::transfer {

namespace fs = std::filesystem;

/**
 * Where transferred files land. write() either completes or throws; the
 * source file is never touched by a writer.
 */
class DestinationWriter {
public:
    virtual ~DestinationWriter() = default;

    virtual void write(const fs::path& src, const std::string& name) = 0;

    // Human-readable location of `name`, used in log records.
    virtual std::string describe(const std::string& name) const = 0;

    // SHA-256 of the written copy when the destination can be read back.
    virtual std::optional<std::string> fingerprint(const std::string& name) const;

    // Deletes a written copy. A missing copy is not an error.
    virtual void remove(const std::string& name) = 0;
};

// Copies into a local directory, keeping permissions and modification time.
class LocalDestinationWriter : public DestinationWriter {
public:
    explicit LocalDestinationWriter(fs::path dir, size_t block_size = 1024 * 1024);

    void write(const fs::path& src, const std::string& name) override;
    std::string describe(const std::string& name) const override;
    std::optional<std::string> fingerprint(const std::string& name) const override;
    void remove(const std::string& name) override;

private:
    fs::path dir_;
    size_t block_size_;
};

// Streams files onto an SMB share, creating the target directory first.
class ShareDestinationWriter : public DestinationWriter {
public:
    ShareDestinationWriter(ShareAddress address, std::unique_ptr<ShareClient> client,
                           core::EventEmitter& events, size_t block_size = 1024 * 1024);

    void write(const fs::path& src, const std::string& name) override;
    std::string describe(const std::string& name) const override;
    void remove(const std::string& name) override;

    const ShareAddress& address() const { return address_; }

private:
    void ensure_directories();

    ShareAddress address_;
    std::unique_ptr<ShareClient> client_;
    core::EventEmitter& events_;
    size_t block_size_;
};

/**
 * Classify `cfg.paths.target_dir` once and build the matching writer.
 * For share targets `share_client` is used when given, otherwise an
 * SmbClientProcess is created from `cfg.smb`.
 */
std::unique_ptr<DestinationWriter> make_destination_writer(
    const config::Config& cfg, core::EventEmitter& events,
    std::unique_ptr<ShareClient> share_client = nullptr);

} // namespace ingest_relay::transfer
