#include "ingest_relay/transfer/smb_client_process.hpp"
#include "ingest_relay/core/errors.hpp"
#include "ingest_relay/core/utils.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <utility>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

namespace ingest_relay::transfer {

namespace fs = std::filesystem;

namespace {

constexpr const char* kCollision = "NT_STATUS_OBJECT_NAME_COLLISION";
constexpr const char* kNotFound = "NT_STATUS_OBJECT_NAME_NOT_FOUND";
constexpr const char* kStatusPrefix = "NT_STATUS_";

int exit_status(int raw) {
    if (raw == -1) return -1;
    if (WIFEXITED(raw)) return WEXITSTATUS(raw);
    return -1;
}

// First line of smbclient output that reports an NT status failure.
std::string find_status_error(const std::string& output) {
    for (const auto& line : core::split(output, '\n')) {
        if (line.find(kStatusPrefix) != std::string::npos) {
            return line;
        }
    }
    return "";
}

// Runs `cmd` and collects its output. Returns -1 when the shell cannot start.
int run_captured(const std::string& cmd, std::string& output) {
    FILE* pipe = ::popen(cmd.c_str(), "r");
    if (!pipe) {
        return -1;
    }
    std::array<char, 4096> buffer;
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }
    return exit_status(::pclose(pipe));
}

// Runs a `del` command; a file that is already gone counts as removed.
void run_delete(const std::string& cmd, const std::string& target) {
    std::string output;
    const int status = run_captured(cmd, output);
    if (status == -1 && output.empty()) {
        throw ShareError("cannot run delete for " + target + ": " + std::strerror(errno));
    }
    if (output.find(kNotFound) != std::string::npos) {
        return;
    }
    const std::string status_error = find_status_error(output);
    if (status != 0 || !status_error.empty()) {
        throw ShareError("del " + target + " failed (exit " + std::to_string(status) +
                         "): " + (status_error.empty() ? output : status_error));
    }
}

fs::path make_private_file(const std::string& contents) {
    std::string pattern = (fs::temp_directory_path() / "ingest_relay_auth_XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        throw ShareError(std::string("cannot create authentication file: ") + std::strerror(errno));
    }
    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n <= 0) {
            ::close(fd);
            ::unlink(buf.data());
            throw ShareError("cannot write authentication file");
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);
    return fs::path(buf.data());
}

class SmbPipeWriter : public ShareFileWriter {
public:
    SmbPipeWriter(FILE* pipe, fs::path output_log, std::string target, std::string delete_cmd)
        : pipe_(pipe), output_log_(std::move(output_log)), target_(std::move(target)),
          delete_cmd_(std::move(delete_cmd)) {}

    ~SmbPipeWriter() override {
        if (!committed_ && !discarded_) {
            // Never committed: whatever smbclient stored on EOF is removed.
            if (pipe_) {
                ::pclose(pipe_);
                pipe_ = nullptr;
            }
            std::string output;
            run_captured(delete_cmd_, output);
        }
        std::error_code ec;
        fs::remove(output_log_, ec);
    }

    void write(const char* data, size_t size) override {
        if (!pipe_) {
            throw ShareError("write after close: " + target_);
        }
        if (size > 0 && std::fwrite(data, 1, size, pipe_) != size) {
            throw ShareError("short write to smbclient for " + target_);
        }
    }

    void close() override {
        if (!pipe_) {
            throw ShareError("upload of " + target_ + " already finished");
        }
        const int status = exit_status(::pclose(pipe_));
        pipe_ = nullptr;

        std::string output;
        try {
            output = core::read_text(output_log_);
        } catch (const IOError&) {
            output.clear();
        }
        const std::string status_error = find_status_error(output);
        if (status != 0 || !status_error.empty()) {
            throw ShareError("upload of " + target_ + " failed (exit " + std::to_string(status) +
                             "): " + (status_error.empty() ? output : status_error));
        }
        committed_ = true;
    }

    void abort() override {
        if (discarded_) {
            return;
        }
        if (pipe_) {
            ::pclose(pipe_);
            pipe_ = nullptr;
        }
        discarded_ = true;
        run_delete(delete_cmd_, target_);
    }

private:
    FILE* pipe_;
    fs::path output_log_;
    std::string target_;
    std::string delete_cmd_;
    bool committed_ = false;
    bool discarded_ = false;
};

} // namespace

std::string to_smb_path(const std::string& path) {
    std::string out = path;
    for (char& c : out) {
        if (c == '/') c = '\\';
    }
    return out;
}

SmbClientProcess::SmbClientProcess(const config::SmbConfig& cfg) : cfg_(cfg) {
    if (!cfg_.username.empty() || !cfg_.password.empty()) {
        std::string contents;
        if (!cfg_.username.empty()) {
            contents += "username = " + cfg_.username + "\n";
        }
        if (!cfg_.password.empty()) {
            contents += "password = " + cfg_.password + "\n";
        }
        auth_file_ = make_private_file(contents);
    }
}

SmbClientProcess::~SmbClientProcess() {
    if (!auth_file_.empty()) {
        std::error_code ec;
        fs::remove(auth_file_, ec);
    }
}

std::string SmbClientProcess::command_line(const ShareAddress& share,
                                           const std::string& commands) const {
    std::string cmd = core::shell_quote(cfg_.client_bin) + " " + core::shell_quote(share.unc());
    if (!auth_file_.empty()) {
        cmd += " -A " + core::shell_quote(auth_file_.string());
    }
    if (cfg_.password.empty()) {
        cmd += " -N";
    }
    cmd += " -c " + core::shell_quote(commands);
    return cmd;
}

void SmbClientProcess::make_directory(const ShareAddress& share, const std::string& path) {
    const std::string cmd =
        command_line(share, "mkdir \"" + to_smb_path(path) + "\"") + " 2>&1";

    std::string output;
    const int status = run_captured(cmd, output);
    if (status == -1 && output.empty()) {
        throw ShareError("cannot run " + cfg_.client_bin + ": " + std::strerror(errno));
    }

    if (output.find(kCollision) != std::string::npos) {
        throw ShareError("directory exists: " + share.unc() + "/" + path, true);
    }
    const std::string status_error = find_status_error(output);
    if (status != 0 || !status_error.empty()) {
        throw ShareError("mkdir " + share.unc() + "/" + path + " failed (exit " +
                         std::to_string(status) + "): " +
                         (status_error.empty() ? output : status_error));
    }
}

std::unique_ptr<ShareFileWriter> SmbClientProcess::open_for_write(const ShareAddress& share,
                                                                  const std::string& path) {
    fs::path output_log = make_private_file("");
    const std::string cmd =
        command_line(share, "put /dev/stdin \"" + to_smb_path(path) + "\"") +
        " > " + core::shell_quote(output_log.string()) + " 2>&1";

    FILE* pipe = ::popen(cmd.c_str(), "w");
    if (!pipe) {
        std::error_code ec;
        fs::remove(output_log, ec);
        throw ShareError("cannot run " + cfg_.client_bin + ": " + std::strerror(errno));
    }
    return std::make_unique<SmbPipeWriter>(pipe, std::move(output_log), share.unc() + "/" + path,
                                           delete_command(share, path));
}

void SmbClientProcess::remove_file(const ShareAddress& share, const std::string& path) {
    run_delete(delete_command(share, path), share.unc() + "/" + path);
}

std::string SmbClientProcess::delete_command(const ShareAddress& share,
                                             const std::string& path) const {
    return command_line(share, "del \"" + to_smb_path(path) + "\"") + " 2>&1";
}

} // namespace ingest_relay::transfer
