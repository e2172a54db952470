#include "devshell/snapshot_store.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

namespace devshell {

RetryPolicy retry_policy(const HostConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = config.fetch.max_attempts;
    policy.initial_backoff = std::chrono::milliseconds(config.fetch.initial_backoff_ms);
    policy.max_backoff = std::chrono::milliseconds(config.fetch.max_backoff_ms);
    return policy;
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int retry) {
    auto delay = policy.initial_backoff;
    for (int i = 1; i < retry && delay < policy.max_backoff; ++i) {
        delay *= policy.multiplier;
    }
    return std::min(delay, policy.max_backoff);
}

RetryingSnapshotEvaluator::RetryingSnapshotEvaluator(const PackageSnapshotEvaluator& inner,
                                                     RetryPolicy policy,
                                                     Sleeper sleeper)
    : inner_(inner), policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

ImportResult RetryingSnapshotEvaluator::import_snapshot(const SourceReference& ref,
                                                        const Platform& platform) const {
    int attempts = std::max(1, policy_.max_attempts);

    ImportResult result;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        result = inner_.import_snapshot(ref, platform);
        if (result.ok || !result.transient || attempt == attempts) {
            break;
        }

        auto delay = backoff_delay(policy_, attempt);
        spdlog::debug("{} ({}): {}; retry {} of {} in {}ms", ref.to_string(),
                      platform.to_string(), result.error, attempt, attempts - 1,
                      delay.count());
        sleeper_(delay);
    }

    if (!result.ok && result.transient && attempts > 1) {
        result.error += " (after " + std::to_string(attempts) + " attempts)";
    }
    return result;
}

} // namespace devshell
