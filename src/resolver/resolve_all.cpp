#include "devshell/resolver.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace devshell {

// ============================================================================
// Cancellation
// ============================================================================

CancellationToken CancellationSource::token(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& flag = flags_[key];
    if (!flag) {
        flag = std::make_shared<std::atomic<bool>>(all_cancelled_);
    }
    return CancellationToken(flag);
}

void CancellationSource::cancel(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& flag = flags_[key];
    if (!flag) {
        flag = std::make_shared<std::atomic<bool>>(true);
    }
    flag->store(true);
}

void CancellationSource::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    all_cancelled_ = true;
    for (auto& [_, flag] : flags_) {
        flag->store(true);
    }
}

// ============================================================================
// Resolution Set
// ============================================================================

bool ResolutionSet::all_ok() const {
    return std::all_of(results.begin(), results.end(),
                       [](const auto& entry) { return entry.second.ok; });
}

std::vector<std::string> ResolutionSet::failures() const {
    std::vector<std::string> failed;
    for (const auto& [platform, result] : results) {
        if (!result.ok) failed.push_back(platform);
    }
    return failed;
}

// ============================================================================
// Resolve All
// ============================================================================

std::vector<Platform> target_platforms(const Descriptor& descriptor,
                                       const PlatformEnumerator& enumerator) {
    if (descriptor.outputs.systems.empty()) {
        return enumerator.default_platforms();
    }

    std::vector<Platform> platforms;
    for (const auto& system : descriptor.outputs.systems) {
        auto parsed = parse_platform(system);
        if (parsed && std::find(platforms.begin(), platforms.end(), *parsed) == platforms.end()) {
            platforms.push_back(*parsed);
        }
    }
    std::sort(platforms.begin(), platforms.end());
    return platforms;
}

namespace {

// Joins every started thread, including when the calling worker throws
struct WorkerPool {
    WorkerPool() = default;
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    ~WorkerPool() {
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

    std::vector<std::thread> threads;
};

} // namespace

ResolutionSet resolve_all(const Descriptor& descriptor,
                          const PlatformEnumerator& enumerator,
                          const PackageSnapshotEvaluator& evaluator,
                          const ResolveAllOptions& options) {
    auto platforms = target_platforms(descriptor, enumerator);
    std::vector<ResolutionResult> results(platforms.size());

    std::vector<ResolveOptions> per_platform(platforms.size());
    for (size_t i = 0; i < platforms.size(); ++i) {
        per_platform[i].enable_trace = options.enable_trace;
        per_platform[i].warning_policy = options.warning_policy;
        if (options.cancellation) {
            per_platform[i].cancellation = options.cancellation->token(platforms[i].to_string());
        }
    }

    size_t workers = options.max_concurrency > 0
        ? static_cast<size_t>(options.max_concurrency)
        : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, platforms.size());

    std::atomic<size_t> next{0};
    auto work = [&]() {
        for (size_t i = next++; i < platforms.size(); i = next++) {
            results[i] = resolve(descriptor, platforms[i], enumerator, evaluator, per_platform[i]);
        }
    };

    // The calling thread is one of the workers; platforms a helper could not
    // be started for are picked up by the workers that are running
    {
        WorkerPool pool;
        for (size_t w = 1; w < workers; ++w) {
            try {
                pool.threads.emplace_back(work);
            } catch (const std::system_error& e) {
                spdlog::warn("resolving with {} of {} workers: {}",
                             pool.threads.size() + 1, workers, e.what());
                break;
            }
        }
        work();
    }

    ResolutionSet set;
    for (size_t i = 0; i < platforms.size(); ++i) {
        set.results[platforms[i].to_string()] = std::move(results[i]);
    }
    return set;
}

} // namespace devshell
