#pragma once

#include "devshell/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace devshell {

// ============================================================================
// Host Configuration (<root>/config.json)
// ============================================================================

struct HostConfig {
    std::string schema;  // MUST be "devshell.config.v1"

    // Overrides the default platform enumeration when non-empty
    std::vector<std::string> platforms;

    // Snapshot cache; empty means <root>/snapshots
    std::string cache_dir;

    // Source host -> base location serving package-set indexes (file: or https://)
    std::unordered_map<std::string, std::string> mirrors;

    struct {
        int max_attempts = 3;
        int initial_backoff_ms = 200;
        int max_backoff_ms = 5000;
        int timeout_seconds = 60;
        bool offline = false;
    } fetch;

    struct {
        int max_concurrency = 0;  // 0 = min(hardware threads, platform count)
    } resolve;

    struct {
        std::string program;  // empty = $SHELL, then /bin/sh
    } shell;

    // [warnings] section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for diagnostics
    std::string source_path;
};

// Built-in configuration used when <root>/config.json does not exist
HostConfig get_builtin_default_config();

struct HostConfigParseResult {
    bool ok = false;
    std::string error;
    HostConfig config;
    std::vector<std::string> warnings;
};

// Parse a host configuration from JSON string. Malformed optional values
// produce "invalid_configuration:<field>" warnings and keep their defaults.
HostConfigParseResult parse_host_config(const std::string& json_str,
                                        const std::string& source_path = "");

// Load <root>/config.json, falling back to the built-in defaults when absent
HostConfigParseResult load_host_config(const std::string& devshell_root);

// Effective snapshot cache directory for a root
std::string effective_cache_dir(const HostConfig& config, const std::string& devshell_root);

// Get the effective action for a warning key given a configuration.
// Returns "warn" if the key is not present.
WarningAction get_warning_action(const HostConfig& config, Warning warning);
WarningAction get_warning_action(const HostConfig& config, const std::string& warning_key);

} // namespace devshell
