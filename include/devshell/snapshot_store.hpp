#pragma once

#include "devshell/host_config.hpp"
#include "devshell/package_set.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>

namespace devshell {

// ============================================================================
// Directory Snapshot Evaluator
// ============================================================================
//
// Package-set indexes are cached under
//
//     <cache_dir>/<host>/<owner>/<repo>/<rev|ref|HEAD>/<platform>.json
//
// and fetched on a miss from the mirror configured for the reference host:
//
//     <mirror>/<owner>/<repo>/<rev|ref|HEAD>/<platform>.json
//
// Pinned references are served from the cache first. Moving references are
// fetched first and fall back to the cache when the mirror is unreachable.

struct SnapshotStoreOptions {
    std::string cache_dir;
    std::unordered_map<std::string, std::string> mirrors;  // host -> base location
    int timeout_seconds = 60;
    bool offline = false;
};

SnapshotStoreOptions snapshot_store_options(const HostConfig& config,
                                            const std::string& devshell_root);

class DirectorySnapshotEvaluator : public PackageSnapshotEvaluator {
public:
    explicit DirectorySnapshotEvaluator(SnapshotStoreOptions options);

    ImportResult import_snapshot(const SourceReference& ref,
                                 const Platform& platform) const override;

    // Cache location for a reference and platform
    std::string cache_path(const SourceReference& ref, const Platform& platform) const;

    // Mirror location for a reference and platform; empty if the host has no mirror
    std::string mirror_location(const SourceReference& ref, const Platform& platform) const;

private:
    SnapshotStoreOptions options_;

    ImportResult load_cached(const SourceReference& ref, const Platform& platform) const;
    ImportResult fetch_remote(const SourceReference& ref, const Platform& platform) const;
    void store(const SourceReference& ref, const Platform& platform,
               const std::string& content, const std::string& rev) const;
};

// Checks an index against the reference and platform it was requested for
ImportResult validate_snapshot(const std::string& content,
                               const SourceReference& ref,
                               const Platform& platform);

// ============================================================================
// Retrying Snapshot Evaluator
// ============================================================================

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    std::chrono::milliseconds max_backoff{5000};
    int multiplier = 2;
};

RetryPolicy retry_policy(const HostConfig& config);

// Delay before retry number `retry` (1-based): initial * multiplier^(retry-1), capped
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int retry);

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Retries transient import failures with exponential backoff. Permanent
// failures (no mirror, not found, malformed index) are returned at once.
class RetryingSnapshotEvaluator : public PackageSnapshotEvaluator {
public:
    RetryingSnapshotEvaluator(const PackageSnapshotEvaluator& inner,
                              RetryPolicy policy,
                              Sleeper sleeper = {});

    ImportResult import_snapshot(const SourceReference& ref,
                                 const Platform& platform) const override;

private:
    const PackageSnapshotEvaluator& inner_;
    RetryPolicy policy_;
    Sleeper sleeper_;
};

} // namespace devshell
