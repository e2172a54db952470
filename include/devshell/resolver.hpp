#pragma once

#include "devshell/descriptor.hpp"
#include "devshell/package_set.hpp"
#include "devshell/platform.hpp"
#include "devshell/types.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devshell {

// ============================================================================
// Cancellation
// ============================================================================

class CancellationToken {
public:
    CancellationToken() = default;  // never cancelled

    bool is_cancelled() const { return flag_ && flag_->load(); }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

// Hands out one token per key (a platform string); cancelling one key leaves
// the others running.
class CancellationSource {
public:
    CancellationToken token(const std::string& key);

    void cancel(const std::string& key);
    void cancel_all();

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> flags_;
    bool all_cancelled_ = false;
};

// ============================================================================
// Resolution Result
// ============================================================================

// Which snapshot a tool was taken from
struct TraceEntry {
    std::string input;
    std::string source;
    std::string rev;
    std::string nar_hash;
};

struct ResolutionResult {
    bool ok = false;
    std::optional<ResolveError> error;
    std::string error_context;
    std::string platform;
    ShellSpecification spec;
    std::vector<WarningObject> warnings;
    std::optional<std::unordered_map<std::string, TraceEntry>> trace;  // tool id -> origin
};

struct ResolveOptions {
    bool enable_trace = false;
    std::unordered_map<std::string, WarningAction> warning_policy;
    CancellationToken cancellation;
};

// ============================================================================
// Resolution
// ============================================================================

// Resolve the descriptor's devShell for one platform.
//
// Fails with UNSUPPORTED_PLATFORM when the enumerator does not produce
// `platform`, UNRESOLVED_INPUT when the outputs reference an undeclared input,
// UNREACHABLE_SOURCE when a tool input's snapshot cannot be imported and
// TOOL_NOT_FOUND when a build input is missing from its package set. On success
// the shell specification holds exactly the declared build inputs, in order.
ResolutionResult resolve(const Descriptor& descriptor,
                         const Platform& platform,
                         const PlatformEnumerator& enumerator,
                         const PackageSnapshotEvaluator& evaluator,
                         const ResolveOptions& options = {});

// ============================================================================
// Resolution over all platforms
// ============================================================================

struct ResolutionSet {
    std::map<std::string, ResolutionResult> results;  // platform -> result

    bool all_ok() const;
    std::vector<std::string> failures() const;  // failed platforms, sorted
};

struct ResolveAllOptions {
    int max_concurrency = 0;  // 0 = min(hardware threads, platform count)
    bool enable_trace = false;
    std::unordered_map<std::string, WarningAction> warning_policy;
    CancellationSource* cancellation = nullptr;
};

// Platforms resolve_all covers: outputs.systems when declared, else the
// enumerator's default set
std::vector<Platform> target_platforms(const Descriptor& descriptor,
                                       const PlatformEnumerator& enumerator);

// Resolve every target platform independently on a bounded worker pool.
// A failure for one platform never affects another.
ResolutionSet resolve_all(const Descriptor& descriptor,
                          const PlatformEnumerator& enumerator,
                          const PackageSnapshotEvaluator& evaluator,
                          const ResolveAllOptions& options = {});

} // namespace devshell
