#pragma once

#include <stdexcept>
#include <string>

namespace ingest_relay {

class IngestRelayError : public std::runtime_error {
public:
    explicit IngestRelayError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public IngestRelayError {
public:
    explicit ConfigError(const std::string& message)
        : IngestRelayError("Config error: " + message) {}
};

class ValidationError : public IngestRelayError {
public:
    explicit ValidationError(const std::string& message)
        : IngestRelayError("Validation error: " + message) {}
};

class IOError : public IngestRelayError {
public:
    explicit IOError(const std::string& message)
        : IngestRelayError("I/O error: " + message) {}
};

class TransferError : public IngestRelayError {
public:
    explicit TransferError(const std::string& message)
        : IngestRelayError("Transfer error: " + message) {}
};

class ShareError : public IOError {
public:
    explicit ShareError(const std::string& message, bool already_exists = false)
        : IOError("SMB error: " + message), already_exists_(already_exists) {}

    bool already_exists() const { return already_exists_; }

private:
    bool already_exists_;
};

} // namespace ingest_relay
