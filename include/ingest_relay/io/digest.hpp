#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace ingest_relay::io {

namespace fs = std::filesystem;

constexpr size_t kDefaultBlockSize = 1024 * 1024;

/**
 * Incremental SHA-256 over OpenSSL EVP.
 * Feeding the same bytes in any split yields the same digest.
 */
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t size);

    // Lowercase hex digest. The hasher cannot be updated afterwards.
    std::string finish();

private:
    EVP_MD_CTX* ctx_;
    bool finished_ = false;
};

/**
 * Stream a file through SHA-256 in blocks of `block_size` bytes.
 * Throws IOError if the file cannot be opened or read.
 */
std::string sha256_file(const fs::path& path, size_t block_size = kDefaultBlockSize);

std::string sha256_bytes(const std::vector<uint8_t>& data);

} // namespace ingest_relay::io
