#include "devshell/snapshot_store.hpp"
#include "devshell/fetch.hpp"
#include "devshell/platform.hpp"

#include <spdlog/spdlog.h>

namespace devshell {

SnapshotStoreOptions snapshot_store_options(const HostConfig& config,
                                            const std::string& devshell_root) {
    SnapshotStoreOptions options;
    options.cache_dir = effective_cache_dir(config, devshell_root);
    options.mirrors = config.mirrors;
    options.timeout_seconds = config.fetch.timeout_seconds;
    options.offline = config.fetch.offline;
    return options;
}

ImportResult validate_snapshot(const std::string& content,
                               const SourceReference& ref,
                               const Platform& platform) {
    ImportResult result;

    auto parsed = parse_package_set(content);
    if (!parsed.ok) {
        result.error = "invalid package set for " + ref.to_string() + ": " + parsed.error;
        return result;
    }

    if (parsed.package_set.platform != platform.to_string()) {
        result.error = "package set for " + ref.to_string() + " was evaluated for " +
                       parsed.package_set.platform + ", not " + platform.to_string();
        return result;
    }

    if (ref.is_pinned() && parsed.package_set.rev != ref.rev) {
        result.error = "package set for " + ref.to_string() + " has rev " +
                       parsed.package_set.rev + ", expected " + ref.rev;
        return result;
    }

    result.package_set = std::move(parsed.package_set);
    result.ok = true;
    return result;
}

DirectorySnapshotEvaluator::DirectorySnapshotEvaluator(SnapshotStoreOptions options)
    : options_(std::move(options)) {}

std::string DirectorySnapshotEvaluator::cache_path(const SourceReference& ref,
                                                   const Platform& platform) const {
    return join_path(join_path(options_.cache_dir, ref.cache_key()),
                     platform.to_string() + ".json");
}

std::string DirectorySnapshotEvaluator::mirror_location(const SourceReference& ref,
                                                        const Platform& platform) const {
    auto it = options_.mirrors.find(ref.host);
    if (it == options_.mirrors.end()) {
        return "";
    }
    return it->second + "/" + ref.owner + "/" + ref.repo + "/" + ref.selector() + "/" +
           platform.to_string() + ".json";
}

ImportResult DirectorySnapshotEvaluator::import_snapshot(const SourceReference& ref,
                                                         const Platform& platform) const {
    if (ref.is_pinned() && !is_valid_revision(ref.rev)) {
        ImportResult invalid;
        invalid.error = "invalid rev '" + ref.rev + "' for " + ref.to_string();
        return invalid;
    }

    if (ref.is_pinned() || options_.offline) {
        auto cached = load_cached(ref, platform);
        if (cached.ok || options_.offline) {
            return cached;
        }
        return fetch_remote(ref, platform);
    }

    auto fetched = fetch_remote(ref, platform);
    if (fetched.ok) {
        return fetched;
    }

    auto cached = load_cached(ref, platform);
    if (cached.ok) {
        spdlog::warn("{}: {}; using cached snapshot {}", ref.to_string(), fetched.error,
                     cached.package_set.rev);
        return cached;
    }
    return fetched;
}

ImportResult DirectorySnapshotEvaluator::load_cached(const SourceReference& ref,
                                                     const Platform& platform) const {
    ImportResult result;
    auto path = cache_path(ref, platform);

    auto content = read_file(path);
    if (!content) {
        result.error = "snapshot " + ref.to_string() + " for " + platform.to_string() +
                       " is not cached";
        return result;
    }

    result = validate_snapshot(*content, ref, platform);
    if (!result.ok) {
        spdlog::debug("Ignoring cache entry {}: {}", path, result.error);
        return result;
    }

    spdlog::debug("Cache hit: {}", path);
    return result;
}

ImportResult DirectorySnapshotEvaluator::fetch_remote(const SourceReference& ref,
                                                      const Platform& platform) const {
    ImportResult result;

    if (options_.offline) {
        result.error = "offline mode: cannot fetch " + ref.to_string();
        return result;
    }

    auto location = mirror_location(ref, platform);
    if (location.empty()) {
        result.error = "no mirror configured for host '" + ref.host + "'";
        return result;
    }

    spdlog::debug("Fetching {}", location);
    auto fetched = fetch_location(location, options_.timeout_seconds);
    if (!fetched.ok) {
        result.error = "cannot fetch " + ref.to_string() + ": " + fetched.error;
        result.transient = fetched.transient;
        return result;
    }

    result = validate_snapshot(fetched.body, ref, platform);
    if (!result.ok) {
        return result;
    }

    store(ref, platform, fetched.body, result.package_set.rev);
    return result;
}

void DirectorySnapshotEvaluator::store(const SourceReference& ref, const Platform& platform,
                                       const std::string& content,
                                       const std::string& rev) const {
    SourceReference pinned = ref;
    pinned.rev = rev;

    // Moving references are stored under their ref and under the rev they resolved to
    std::vector<std::string> paths = {cache_path(ref, platform)};
    if (!ref.is_pinned()) {
        paths.push_back(cache_path(pinned, platform));
    }

    for (const auto& path : paths) {
        auto written = atomic_write_file(path, content);
        if (!written.ok) {
            spdlog::warn("Cannot write cache entry {}: {}", path, written.error);
        }
    }
}

} // namespace devshell
