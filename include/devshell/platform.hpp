#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devshell {

// ============================================================================
// Platform Identifiers
// ============================================================================

// An architecture/OS pair such as x86_64-linux or aarch64-darwin
struct Platform {
    std::string arch;
    std::string os;

    std::string to_string() const { return arch + "-" + os; }
};

inline bool operator==(const Platform& a, const Platform& b) {
    return a.arch == b.arch && a.os == b.os;
}

inline bool operator!=(const Platform& a, const Platform& b) {
    return !(a == b);
}

inline bool operator<(const Platform& a, const Platform& b) {
    return a.to_string() < b.to_string();
}

// Parse "<arch>-<os>". Only known architectures and operating systems are accepted.
std::optional<Platform> parse_platform(const std::string& s);

// Platform this binary was compiled for
Platform get_current_platform();

// ============================================================================
// Platform Enumerator
// ============================================================================

class PlatformEnumerator {
public:
    virtual ~PlatformEnumerator() = default;

    // Sorted, duplicate-free set of platforms shells may be resolved for
    virtual std::vector<Platform> default_platforms() const = 0;

    bool supports(const Platform& platform) const;
};

// aarch64-darwin, aarch64-linux, x86_64-darwin, x86_64-linux
class DefaultPlatformEnumerator : public PlatformEnumerator {
public:
    std::vector<Platform> default_platforms() const override;
};

// Platform list supplied by host configuration
class ConfiguredPlatformEnumerator : public PlatformEnumerator {
public:
    explicit ConfiguredPlatformEnumerator(std::vector<Platform> platforms);

    std::vector<Platform> default_platforms() const override { return platforms_; }

private:
    std::vector<Platform> platforms_;
};

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Replace `path` with `content` via temp file + fsync + rename + fsync(dir),
// creating missing parent directories
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Path Utilities
// ============================================================================

// Read entire file contents
std::optional<std::string> read_file(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_regular_file(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Environment of this process
std::unordered_map<std::string, std::string> get_all_env();

} // namespace devshell
