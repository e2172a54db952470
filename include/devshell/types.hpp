#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devshell {

// ============================================================================
// Resolution Errors
// ============================================================================

enum class ResolveError {
    UNRESOLVED_INPUT,
    UNREACHABLE_SOURCE,
    UNSUPPORTED_PLATFORM,
    TOOL_NOT_FOUND,
    CANCELLED,
};

inline const char* resolve_error_to_string(ResolveError e) {
    switch (e) {
        case ResolveError::UNRESOLVED_INPUT: return "UNRESOLVED_INPUT";
        case ResolveError::UNREACHABLE_SOURCE: return "UNREACHABLE_SOURCE";
        case ResolveError::UNSUPPORTED_PLATFORM: return "UNSUPPORTED_PLATFORM";
        case ResolveError::TOOL_NOT_FOUND: return "TOOL_NOT_FOUND";
        case ResolveError::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

std::optional<ResolveError> parse_resolve_error(const std::string& s);

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    invalid_configuration,
    unknown_descriptor_key,
    unlocked_input,
    unused_input,
    duplicate_build_input,
    lock_stale,
    lock_missing,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::invalid_configuration: return "invalid_configuration";
        case Warning::unknown_descriptor_key: return "unknown_descriptor_key";
        case Warning::unlocked_input: return "unlocked_input";
        case Warning::unused_input: return "unused_input";
        case Warning::duplicate_build_input: return "duplicate_build_input";
        case Warning::lock_stale: return "lock_stale";
        case Warning::lock_missing: return "lock_missing";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Tool Reference
// ============================================================================

// A build tool resolved against one package snapshot for one platform.
struct ToolReference {
    std::string tool_id;    // identifier as written in buildInputs
    std::string input;      // input whose snapshot provided the tool
    std::string attr_path;  // attribute path inside the package set
    std::string name;       // e.g. "gcc-wrapper-12.3.0"
    std::string version;
    std::string path;       // installed location of the package
    std::string bin_dir;    // relative to path, empty if the tool has no binaries
};

inline bool operator==(const ToolReference& a, const ToolReference& b) {
    return a.tool_id == b.tool_id && a.input == b.input && a.attr_path == b.attr_path &&
           a.name == b.name && a.version == b.version && a.path == b.path &&
           a.bin_dir == b.bin_dir;
}

inline bool operator!=(const ToolReference& a, const ToolReference& b) {
    return !(a == b);
}

// ============================================================================
// Shell Specification
// ============================================================================

struct ShellSpecification {
    std::string platform;
    std::vector<ToolReference> tools;                     // declared order
    std::unordered_map<std::string, std::string> inputs;  // input name -> resolved rev
    std::unordered_map<std::string, std::string> env;
    std::string shell_hook;
};

inline bool operator==(const ShellSpecification& a, const ShellSpecification& b) {
    return a.platform == b.platform && a.tools == b.tools && a.inputs == b.inputs &&
           a.env == b.env && a.shell_hook == b.shell_hook;
}

inline bool operator!=(const ShellSpecification& a, const ShellSpecification& b) {
    return !(a == b);
}

} // namespace devshell
