#include "devshell/platform.hpp"

#include <algorithm>
#include <array>

namespace devshell {

namespace {

constexpr std::array<const char*, 5> KNOWN_ARCHES = {
    "x86_64", "aarch64", "i686", "armv7l", "riscv64"
};

constexpr std::array<const char*, 2> KNOWN_OSES = {
    "linux", "darwin"
};

template <size_t N>
bool is_known(const std::array<const char*, N>& names, const std::string& value) {
    return std::find(names.begin(), names.end(), value) != names.end();
}

} // namespace

std::optional<Platform> parse_platform(const std::string& s) {
    // Architectures never contain '-', so the first dash splits arch from os
    auto dash = s.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 >= s.size()) {
        return std::nullopt;
    }

    Platform platform;
    platform.arch = s.substr(0, dash);
    platform.os = s.substr(dash + 1);

    if (!is_known(KNOWN_ARCHES, platform.arch) || !is_known(KNOWN_OSES, platform.os)) {
        return std::nullopt;
    }

    return platform;
}

Platform get_current_platform() {
    Platform platform;

#if defined(__x86_64__) || defined(_M_X64)
    platform.arch = "x86_64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    platform.arch = "aarch64";
#elif defined(__i386__) || defined(_M_IX86)
    platform.arch = "i686";
#elif defined(__arm__)
    platform.arch = "armv7l";
#elif defined(__riscv)
    platform.arch = "riscv64";
#else
    platform.arch = "unknown";
#endif

#if defined(__APPLE__)
    platform.os = "darwin";
#else
    platform.os = "linux";
#endif

    return platform;
}

bool PlatformEnumerator::supports(const Platform& platform) const {
    auto platforms = default_platforms();
    return std::find(platforms.begin(), platforms.end(), platform) != platforms.end();
}

std::vector<Platform> DefaultPlatformEnumerator::default_platforms() const {
    return {
        {"aarch64", "darwin"},
        {"aarch64", "linux"},
        {"x86_64", "darwin"},
        {"x86_64", "linux"},
    };
}

ConfiguredPlatformEnumerator::ConfiguredPlatformEnumerator(std::vector<Platform> platforms)
    : platforms_(std::move(platforms)) {
    std::sort(platforms_.begin(), platforms_.end());
    platforms_.erase(std::unique(platforms_.begin(), platforms_.end()), platforms_.end());
}

} // namespace devshell
