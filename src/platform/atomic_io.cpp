#include "devshell/platform.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace devshell {

namespace fs = std::filesystem;

namespace {

// Unique per writer: resolver workers can fill the same cache directory concurrently
std::string temp_path_for(const std::string& path) {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::ostringstream name;
    name << path << ".tmp." << std::hex << gen();
    return name.str();
}

// Removes the temp file unless it was renamed into place
class TempFileGuard {
public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!committed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::string& path() const { return path_; }
    void commit() { committed_ = true; }

private:
    std::string path_;
    bool committed_ = false;
};

std::string errno_message(const std::string& what) {
    return what + ": " + std::string(strerror(errno));
}

#ifndef _WIN32

bool sync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

bool write_all(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

void sync_directory(const std::string& dir) {
    int fd = open(dir.empty() ? "." : dir.c_str(), O_RDONLY);
    if (fd < 0) return;
    sync_fd(fd);
    close(fd);
}

#endif

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    std::string dir = get_parent_directory(path);
    if (!dir.empty() && !create_directories(dir)) {
        result.error = "cannot create directory " + dir;
        return result;
    }

    TempFileGuard temp(temp_path_for(path));

#ifdef _WIN32
    {
        std::ofstream out(temp.path(), std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            result.error = "failed to write " + temp.path();
            return result;
        }
    }

    if (!MoveFileExA(temp.path().c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        result.error = "failed to replace " + path;
        return result;
    }
    temp.commit();
#else
    int fd = open(temp.path().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = errno_message("failed to create " + temp.path());
        return result;
    }

    bool written = write_all(fd, content) && sync_fd(fd);
    if (!written) {
        result.error = errno_message("failed to write " + temp.path());
    }
    close(fd);
    if (!written) {
        return result;
    }

    if (rename(temp.path().c_str(), path.c_str()) != 0) {
        result.error = errno_message("failed to replace " + path);
        return result;
    }
    temp.commit();

    // The rename is durable once the directory entry is synced
    sync_directory(dir);
#endif

    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    return (fs::path(base) / rel).generic_string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

    auto add = [&env](const std::string& entry) {
        auto eq = entry.find('=');
        if (eq != std::string::npos && eq > 0) {
            env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
        }
    };

#ifdef _WIN32
    char* block = GetEnvironmentStrings();
    if (block) {
        for (const char* p = block; *p; p += std::strlen(p) + 1) {
            add(p);
        }
        FreeEnvironmentStrings(block);
    }
#else
    for (char** ep = environ; *ep; ++ep) {
        add(*ep);
    }
#endif

    return env;
}

} // namespace devshell
