#pragma once

#include "ingest_relay/transfer/share_address.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace ingest_relay::transfer {

/**
 * Byte sink for one file opened on a share. close() commits the upload;
 * abort() discards it and removes whatever reached the share. A writer
 * destroyed without close() discards its upload.
 */
class ShareFileWriter {
public:
    virtual ~ShareFileWriter() = default;

    virtual void write(const char* data, size_t size) = 0;
    virtual void close() = 0;
    virtual void abort() = 0;
};

/**
 * Remote filesystem client reaching an SMB share.
 * Paths are relative to the share root and '/'-separated. Failures throw
 * ShareError; make_directory() flags an existing directory with
 * ShareError::already_exists(). remove_file() on a missing file succeeds.
 */
class ShareClient {
public:
    virtual ~ShareClient() = default;

    virtual void make_directory(const ShareAddress& share, const std::string& path) = 0;
    virtual std::unique_ptr<ShareFileWriter> open_for_write(const ShareAddress& share,
                                                            const std::string& path) = 0;
    virtual void remove_file(const ShareAddress& share, const std::string& path) = 0;
};

} // namespace ingest_relay::transfer
