#include "ingest_relay/io/digest.hpp"
#include "ingest_relay/core/errors.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace ingest_relay::io {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw IngestRelayError("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw IngestRelayError("EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const void* data, size_t size) {
    if (finished_) {
        throw IngestRelayError("SHA-256 update after finish");
    }
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw IngestRelayError("EVP_DigestUpdate failed");
    }
}

std::string Sha256::finish() {
    if (finished_) {
        throw IngestRelayError("SHA-256 finished twice");
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &hash_len) != 1) {
        throw IngestRelayError("EVP_DigestFinal_ex failed");
    }
    finished_ = true;

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_file(const fs::path& path, size_t block_size) {
    if (block_size == 0) {
        block_size = kDefaultBlockSize;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file for hashing: " + path.string());
    }

    Sha256 hasher;
    std::vector<char> buffer(block_size);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        hasher.update(buffer.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw IOError("Cannot read file for hashing: " + path.string());
    }

    return hasher.finish();
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    Sha256 hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish();
}

} // namespace ingest_relay::io
