#include "devshell/host_config.hpp"
#include "devshell/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace devshell {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Reads a positive integer field; anything else leaves `out` untouched and warns
void read_positive_int(const nlohmann::json& j, const std::string& key,
                       const std::string& field_name, int& out,
                       std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    if (j[key].is_number_integer() && j[key].get<long long>() > 0) {
        out = static_cast<int>(j[key].get<long long>());
    } else {
        warnings.push_back("invalid_configuration:" + field_name);
    }
}

} // namespace

HostConfig get_builtin_default_config() {
    HostConfig config;
    config.schema = "devshell.config.v1";
    config.warnings["unlocked_input"] = WarningAction::Warn;
    config.warnings["lock_stale"] = WarningAction::Warn;
    return config;
}

HostConfigParseResult parse_host_config(const std::string& json_str,
                                        const std::string& source_path) {
    HostConfigParseResult result;
    result.config = get_builtin_default_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != "devshell.config.v1") {
            result.error = "$schema mismatch: expected devshell.config.v1";
            return result;
        }

        // "platforms" - invalid identifiers are dropped
        if (j.contains("platforms")) {
            if (j["platforms"].is_array()) {
                for (const auto& elem : j["platforms"]) {
                    if (elem.is_string() && parse_platform(elem.get<std::string>())) {
                        result.config.platforms.push_back(elem.get<std::string>());
                    } else {
                        result.warnings.push_back("invalid_configuration:platforms");
                    }
                }
            } else {
                result.warnings.push_back("invalid_configuration:platforms");
            }
        }

        if (auto cache_dir = get_string(j, "cache_dir")) {
            result.config.cache_dir = *cache_dir;
        }

        // "mirrors" section
        if (j.contains("mirrors") && j["mirrors"].is_object()) {
            for (auto& [key, val] : j["mirrors"].items()) {
                if (val.is_string()) {
                    std::string base = val.get<std::string>();
                    while (!base.empty() && base.back() == '/') base.pop_back();
                    result.config.mirrors[to_lower(key)] = base;
                } else {
                    result.warnings.push_back("invalid_configuration:mirrors." + key);
                }
            }
        }

        // "fetch" section
        if (j.contains("fetch") && j["fetch"].is_object()) {
            const auto& fetch = j["fetch"];
            read_positive_int(fetch, "max_attempts", "fetch.max_attempts",
                              result.config.fetch.max_attempts, result.warnings);
            read_positive_int(fetch, "initial_backoff_ms", "fetch.initial_backoff_ms",
                              result.config.fetch.initial_backoff_ms, result.warnings);
            read_positive_int(fetch, "max_backoff_ms", "fetch.max_backoff_ms",
                              result.config.fetch.max_backoff_ms, result.warnings);
            read_positive_int(fetch, "timeout_seconds", "fetch.timeout_seconds",
                              result.config.fetch.timeout_seconds, result.warnings);
            if (fetch.contains("offline")) {
                if (fetch["offline"].is_boolean()) {
                    result.config.fetch.offline = fetch["offline"].get<bool>();
                } else {
                    result.warnings.push_back("invalid_configuration:fetch.offline");
                }
            }
        }

        // "resolve" section
        if (j.contains("resolve") && j["resolve"].is_object()) {
            read_positive_int(j["resolve"], "max_concurrency", "resolve.max_concurrency",
                              result.config.resolve.max_concurrency, result.warnings);
        }

        // "shell" section
        if (j.contains("shell") && j["shell"].is_object()) {
            if (auto program = get_string(j["shell"], "program")) {
                result.config.shell.program = *program;
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (val.is_string()) {
                    std::string key_str = to_lower(key);
                    auto action = parse_warning_action(val.get<std::string>());
                    if (action) {
                        result.config.warnings[key_str] = *action;
                    } else {
                        result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                    }
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

HostConfigParseResult load_host_config(const std::string& devshell_root) {
    std::string path = join_path(devshell_root, "config.json");

    if (!is_regular_file(path)) {
        HostConfigParseResult result;
        result.ok = true;
        result.config = get_builtin_default_config();
        return result;
    }

    auto content = read_file(path);
    if (!content) {
        HostConfigParseResult result;
        result.error = "failed to read " + path;
        return result;
    }

    return parse_host_config(*content, path);
}

std::string effective_cache_dir(const HostConfig& config, const std::string& devshell_root) {
    if (!config.cache_dir.empty()) {
        return config.cache_dir;
    }
    return join_path(devshell_root, "snapshots");
}

WarningAction get_warning_action(const HostConfig& config, Warning warning) {
    return get_warning_action(config, warning_to_string(warning));
}

WarningAction get_warning_action(const HostConfig& config, const std::string& warning_key) {
    std::string key = to_lower(warning_key);
    auto it = config.warnings.find(key);
    if (it != config.warnings.end()) {
        return it->second;
    }
    return WarningAction::Warn;
}

} // namespace devshell
