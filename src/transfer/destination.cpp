#include "ingest_relay/transfer/destination.hpp"
#include "ingest_relay/core/errors.hpp"
#include "ingest_relay/io/digest.hpp"
#include "ingest_relay/transfer/smb_client_process.hpp"

#include <fstream>
#include <system_error>
#include <vector>

namespace ingest_relay::transfer {

std::optional<std::string> DestinationWriter::fingerprint(const std::string&) const {
    return std::nullopt;
}

LocalDestinationWriter::LocalDestinationWriter(fs::path dir, size_t block_size)
    : dir_(std::move(dir)), block_size_(block_size) {}

void LocalDestinationWriter::write(const fs::path& src, const std::string& name) {
    fs::create_directories(dir_);

    const fs::path dst = dir_ / name;
    const fs::path partial = dir_ / ("." + name + ".partial");

    // Copy next to the target and rename, so a failed copy leaves no file
    // under the final name.
    try {
        fs::copy_file(src, partial, fs::copy_options::overwrite_existing);
        fs::permissions(partial, fs::status(src).permissions(), fs::perm_options::replace);
        fs::last_write_time(partial, fs::last_write_time(src));
        fs::rename(partial, dst);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(partial, ec);
        throw IOError("copy " + src.string() + " -> " + dst.string() + " failed: " + e.code().message());
    }
}

std::string LocalDestinationWriter::describe(const std::string& name) const {
    return (dir_ / name).string();
}

std::optional<std::string> LocalDestinationWriter::fingerprint(const std::string& name) const {
    return io::sha256_file(dir_ / name, block_size_);
}

void LocalDestinationWriter::remove(const std::string& name) {
    std::error_code ec;
    fs::remove(dir_ / name, ec);
    if (ec) {
        throw IOError("Cannot remove " + (dir_ / name).string() + ": " + ec.message());
    }
}

ShareDestinationWriter::ShareDestinationWriter(ShareAddress address,
                                               std::unique_ptr<ShareClient> client,
                                               core::EventEmitter& events, size_t block_size)
    : address_(std::move(address)), client_(std::move(client)), events_(events),
      block_size_(block_size) {
    if (!client_) {
        throw ConfigError("share destination requires a share client");
    }
}

void ShareDestinationWriter::ensure_directories() {
    std::string path;
    for (const auto& component : address_.directory) {
        path = path.empty() ? component : path + "/" + component;
        try {
            client_->make_directory(address_, path);
        } catch (const ShareError& e) {
            if (!e.already_exists()) {
                events_.warning("share_mkdir_warning", {{"directory", address_.unc() + "/" + path},
                                                        {"error", e.what()}});
            }
        }
    }
}

void ShareDestinationWriter::write(const fs::path& src, const std::string& name) {
    ensure_directories();

    std::ifstream in(src, std::ios::binary);
    if (!in) {
        throw IOError("Cannot open file: " + src.string());
    }

    auto out = client_->open_for_write(address_, address_.file_path(name));
    try {
        std::vector<char> buffer(block_size_ > 0 ? block_size_ : 1024 * 1024);
        while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
               in.gcount() > 0) {
            out->write(buffer.data(), static_cast<size_t>(in.gcount()));
        }
        if (in.bad()) {
            throw IOError("Cannot read file: " + src.string());
        }
        out->close();
    } catch (const std::exception&) {
        // A truncated upload must not stay behind under the final name.
        try {
            out->abort();
        } catch (const ShareError& e) {
            events_.warning("share_abort_failed", {{"destination", describe(name)},
                                                   {"error", e.what()}});
        }
        throw;
    }
}

void ShareDestinationWriter::remove(const std::string& name) {
    client_->remove_file(address_, address_.file_path(name));
}

std::string ShareDestinationWriter::describe(const std::string& name) const {
    return "smb:" + address_.unc() + "/" + address_.file_path(name);
}

std::unique_ptr<DestinationWriter> make_destination_writer(
    const config::Config& cfg, core::EventEmitter& events,
    std::unique_ptr<ShareClient> share_client) {
    auto share = parse_share_address(cfg.paths.target_dir);
    if (!share) {
        return std::make_unique<LocalDestinationWriter>(fs::path(cfg.paths.target_dir),
                                                        cfg.transfer.block_size);
    }
    if (!share_client) {
        share_client = std::make_unique<SmbClientProcess>(cfg.smb);
    }
    return std::make_unique<ShareDestinationWriter>(std::move(*share), std::move(share_client),
                                                    events, cfg.transfer.block_size);
}

} // namespace ingest_relay::transfer
