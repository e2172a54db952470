#include "devshell/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace devshell {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

std::optional<ResolveError> parse_resolve_error(const std::string& s) {
    std::string upper = to_upper(s);
    if (upper == "UNRESOLVED_INPUT") return ResolveError::UNRESOLVED_INPUT;
    if (upper == "UNREACHABLE_SOURCE") return ResolveError::UNREACHABLE_SOURCE;
    if (upper == "UNSUPPORTED_PLATFORM") return ResolveError::UNSUPPORTED_PLATFORM;
    if (upper == "TOOL_NOT_FOUND") return ResolveError::TOOL_NOT_FOUND;
    if (upper == "CANCELLED") return ResolveError::CANCELLED;
    return std::nullopt;
}

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "invalid_configuration") return Warning::invalid_configuration;
    if (lower == "unknown_descriptor_key") return Warning::unknown_descriptor_key;
    if (lower == "unlocked_input") return Warning::unlocked_input;
    if (lower == "unused_input") return Warning::unused_input;
    if (lower == "duplicate_build_input") return Warning::duplicate_build_input;
    if (lower == "lock_stale") return Warning::lock_stale;
    if (lower == "lock_missing") return Warning::lock_missing;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace devshell
