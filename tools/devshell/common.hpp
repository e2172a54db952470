/**
 * devshell CLI - Common utilities and types
 */

#pragma once

#include "devshell/descriptor.hpp"
#include "devshell/host_config.hpp"
#include "devshell/lock_file.hpp"
#include "devshell/platform.hpp"
#include "devshell/resolver.hpp"
#include "devshell/snapshot_store.hpp"
#include "devshell/warnings.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace devshell::cli {

inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string file;              // -f, --file
    bool json = false;             // --json
    bool trace = false;            // --trace
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the devshell root directory.
 * Priority: --root flag > DEVSHELL_ROOT env > ~/.devshell
 */
inline std::string resolve_devshell_root(const std::optional<std::string>& override_root) {
    if (override_root && !override_root->empty()) {
        return *override_root;
    }

    std::string env_root = safe_getenv("DEVSHELL_ROOT");
    if (!env_root.empty()) {
        return env_root;
    }

    std::string home = safe_getenv("HOME");
    if (!home.empty()) {
        return home + "/.devshell";
    }

    std::string userprofile = safe_getenv("USERPROFILE");
    if (!userprofile.empty()) {
        return userprofile + "/.devshell";
    }

    return ".devshell";
}

// Descriptor path: -f/--file, else ./devshell.json
inline std::string resolve_descriptor_path(const GlobalOptions& opts) {
    return opts.file.empty() ? std::string("devshell.json") : opts.file;
}

/**
 * Route log output to stderr so --json output on stdout stays parseable.
 */
inline void configure_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("devshell");
    if (!logger) {
        logger = spdlog::stderr_color_mt("devshell");
        logger->set_pattern("%^%l%$: %v");
        spdlog::set_default_logger(logger);
    }

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Collects warnings for the current command.
 * In JSON mode they are emitted with the output; in text mode they are
 * printed to stderr as they arrive.
 */
struct MessageCollector {
    std::vector<WarningObject> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const WarningObject& w) {
        warnings.push_back(w);
        if (json_mode || (quiet && w.action != "error")) {
            return;
        }
        std::cerr << (w.action == "error" ? "Error: " : "Warning: ") << w.key;
        bool first = true;
        for (const auto& [k, v] : w.fields) {
            std::cerr << (first ? " (" : ", ") << k << "=" << v;
            first = false;
        }
        std::cerr << (first ? "" : ")") << std::endl;
    }

    void add_all(const std::vector<WarningObject>& ws) {
        for (const auto& w : ws) add(w);
    }

    bool has_errors() const {
        for (const auto& w : warnings) {
            if (w.action == "error") return true;
        }
        return false;
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& w : warnings) {
            arr.push_back({{"key", w.key}, {"action", w.action}, {"fields", w.fields}});
        }
        return arr;
    }
};

inline MessageCollector& get_message_collector() {
    static thread_local MessageCollector collector;
    return collector;
}

inline void init_message_collector(bool json_mode, bool quiet) {
    auto& collector = get_message_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_message_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_message_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Everything a command needs: host configuration, the descriptor (with the
 * lock file applied when requested) and the collaborators built from them.
 */
struct CommandContext {
    std::string root;
    HostConfig config;
    std::string descriptor_path;
    std::string lock_path;
    Descriptor descriptor;
    bool locked = false;

    std::unique_ptr<PlatformEnumerator> enumerator;
    std::unique_ptr<DirectorySnapshotEvaluator> store;
    std::unique_ptr<RetryingSnapshotEvaluator> evaluator;
};

inline std::unique_ptr<PlatformEnumerator> make_platform_enumerator(const HostConfig& config) {
    if (config.platforms.empty()) {
        return std::make_unique<DefaultPlatformEnumerator>();
    }
    std::vector<Platform> platforms;
    for (const auto& p : config.platforms) {
        if (auto parsed = parse_platform(p)) {
            platforms.push_back(*parsed);
        }
    }
    return std::make_unique<ConfiguredPlatformEnumerator>(std::move(platforms));
}

// Loads configuration and descriptor, reporting failures itself.
// Returns nullopt when the command should exit with status 1.
inline std::optional<CommandContext> load_command_context(const GlobalOptions& opts,
                                                          bool apply_lock_file = true) {
    auto& messages = get_message_collector();

    CommandContext ctx;
    ctx.root = resolve_devshell_root(
        opts.root.empty() ? std::nullopt : std::make_optional(opts.root));

    auto config = load_host_config(ctx.root);
    if (!config.ok) {
        print_error(config.error, opts.json);
        return std::nullopt;
    }
    ctx.config = config.config;

    WarningCollector collector(&ctx.config);
    for (const auto& w : config.warnings) {
        auto colon = w.find(':');
        collector.emit(Warning::invalid_configuration,
                      warnings::invalid_configuration(
                          colon == std::string::npos ? w : w.substr(colon + 1),
                          ctx.config.source_path));
    }

    ctx.descriptor_path = resolve_descriptor_path(opts);
    auto loaded = load_descriptor_file(ctx.descriptor_path);
    if (!loaded.ok) {
        messages.add_all(collector.get_warnings());
        print_error(loaded.error, opts.json);
        return std::nullopt;
    }
    collector.merge(loaded.warnings);
    ctx.descriptor = loaded.value;

    ctx.lock_path = lock_path_for(ctx.descriptor_path);
    if (apply_lock_file && is_regular_file(ctx.lock_path)) {
        auto lock = load_lock_file(ctx.lock_path);
        if (!lock.ok) {
            messages.add_all(collector.get_warnings());
            print_error(lock.error, opts.json);
            return std::nullopt;
        }
        ctx.descriptor = apply_lock(ctx.descriptor, lock.value, collector);
        ctx.locked = true;
        spdlog::debug("Applied lock file {}", ctx.lock_path);
    }

    messages.add_all(collector.get_warnings());

    ctx.enumerator = make_platform_enumerator(ctx.config);
    ctx.store = std::make_unique<DirectorySnapshotEvaluator>(
        snapshot_store_options(ctx.config, ctx.root));
    ctx.evaluator = std::make_unique<RetryingSnapshotEvaluator>(
        *ctx.store, retry_policy(ctx.config));

    return std::optional<CommandContext>(std::move(ctx));
}

// Target platform: --platform, else the platform this binary runs on
inline std::optional<Platform> resolve_target_platform(const std::string& requested,
                                                       bool json_mode) {
    if (requested.empty()) {
        return get_current_platform();
    }
    auto parsed = parse_platform(requested);
    if (!parsed) {
        print_error("Unknown platform: " + requested, json_mode);
    }
    return parsed;
}

inline ResolveOptions make_resolve_options(const GlobalOptions& opts, const HostConfig& config) {
    ResolveOptions options;
    options.enable_trace = opts.trace;
    options.warning_policy = config.warnings;
    return options;
}

inline ResolveAllOptions make_resolve_all_options(const GlobalOptions& opts,
                                                  const HostConfig& config) {
    ResolveAllOptions options;
    options.max_concurrency = config.resolve.max_concurrency;
    options.enable_trace = opts.trace;
    options.warning_policy = config.warnings;
    return options;
}

/**
 * Human-readable form of one platform's result.
 */
inline void print_resolution_text(const ResolutionResult& result, bool trace) {
    if (!result.ok) {
        std::cout << result.platform << ": "
                  << (result.error ? resolve_error_to_string(*result.error) : "UNKNOWN")
                  << ": " << result.error_context << std::endl;
        return;
    }

    std::cout << result.platform << ": " << result.spec.tools.size() << " tool(s)" << std::endl;
    for (const auto& tool : result.spec.tools) {
        std::cout << "  " << tool.tool_id << " -> " << tool.name;
        if (!tool.version.empty()) std::cout << " " << tool.version;
        std::cout << " (" << tool.path << ")" << std::endl;

        if (trace && result.trace) {
            auto it = result.trace->find(tool.tool_id);
            if (it != result.trace->end()) {
                std::cout << "      from " << it->second.input << " @ " << it->second.rev
                          << " " << it->second.nar_hash << std::endl;
            }
        }
    }
}

} // namespace devshell::cli
