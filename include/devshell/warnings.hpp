#pragma once

#include "devshell/types.hpp"
#include "devshell/host_config.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace devshell {

// ============================================================================
// Warning Collector
// ============================================================================

class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    explicit WarningCollector(const HostConfig* config);

    void set_config(const HostConfig* config);

    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);
    void emit(Warning warning);

    // Emit a warning by key string (for dynamic warning keys)
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Re-emit warnings already materialized elsewhere, re-applying this policy
    void merge(const std::vector<WarningObject>& warnings);

    // Get all emitted warnings after policy application.
    // Warnings with action "ignore" are excluded.
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    bool has_effective_warnings() const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;

    WarningAction get_effective_action(const std::string& key) const;
};

// ============================================================================
// Field helpers for specific warnings
// ============================================================================

namespace warnings {

inline std::unordered_map<std::string, std::string> unlocked_input(
    const std::string& input,
    const std::string& reference) {
    return {{"input", input}, {"reference", reference}};
}

inline std::unordered_map<std::string, std::string> unused_input(
    const std::string& input) {
    return {{"input", input}};
}

inline std::unordered_map<std::string, std::string> duplicate_build_input(
    const std::string& tool) {
    return {{"tool", tool}};
}

inline std::unordered_map<std::string, std::string> lock_stale(
    const std::string& input,
    const std::string& locked_original,
    const std::string& declared) {
    return {{"input", input}, {"locked_original", locked_original}, {"declared", declared}};
}

inline std::unordered_map<std::string, std::string> invalid_configuration(
    const std::string& reason,
    const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace devshell
