#include "ingest_relay/core/utils.hpp"
#include "ingest_relay/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <sys/stat.h>

namespace ingest_relay::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

int64_t to_unix_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(
        tp.time_since_epoch()).count();
}

int64_t file_mtime_seconds(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        throw IOError("Cannot stat file: " + path.string() + ": " + std::strerror(errno));
    }
    return static_cast<int64_t>(st.st_mtime);
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text_atomic(const fs::path& path, const std::string& text) {
    static std::atomic<uint64_t> counter{0};

    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    fs::path tmp = path;
    tmp += ".tmp." + std::to_string(counter.fetch_add(1));
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw IOError("Cannot create file: " + tmp.string());
        }
        file << text;
        if (!file) {
            throw IOError("Cannot write file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(tmp, cleanup_ec);
        throw IOError("Cannot publish file: " + path.string() + ": " + ec.message());
    }
}

fs::path pick_output_file(const fs::path& dir, const std::string& stem, const std::string& ext) {
    fs::create_directories(dir);

    int counter = 0;
    fs::path candidate;
    do {
        std::ostringstream oss;
        oss << stem;
        if (counter > 0) {
            oss << "-" << counter;
        }
        oss << ext;
        candidate = dir / oss.str();
        ++counter;
    } while (fs::exists(candidate) && counter < 10000);

    return candidate;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace ingest_relay::core
