/**
 * devshell CLI - lock command
 *
 * Pin every tool input to the revision its reference currently designates.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace devshell::cli::commands {

namespace {

struct LockCommandOptions {
    std::string platform;
};

int cmd_lock(const GlobalOptions& opts, const LockCommandOptions& lock_opts) {
    configure_logging(opts);
    init_message_collector(opts.json, opts.quiet);

    // Re-resolve moving references instead of reusing the existing pins
    auto ctx = load_command_context(opts, false);
    if (!ctx) {
        return 1;
    }

    auto platform = resolve_target_platform(lock_opts.platform, opts.json);
    if (!platform) {
        return 1;
    }

    auto locked = create_lock(ctx->descriptor, *ctx->evaluator, *platform);
    if (!locked.ok) {
        print_error(locked.error, opts.json);
        return 1;
    }

    auto written = write_lock_file(ctx->lock_path, locked.lock);
    if (!written.ok) {
        print_error("Failed to write " + ctx->lock_path + ": " + written.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["lock_file"] = ctx->lock_path;
        j["platform"] = platform->to_string();
        nlohmann::json nodes = nlohmann::json::object();
        for (const auto& [name, node] : locked.lock.nodes) {
            nodes[name] = {{"original", node.original}, {"rev", node.rev},
                           {"nar_hash", node.nar_hash}};
        }
        j["nodes"] = nodes;
        output_json(j);
    } else {
        for (const auto& [name, node] : locked.lock.nodes) {
            std::cout << name << ": " << node.original << " -> " << node.rev << std::endl;
        }
        print_success("Wrote " + ctx->lock_path, opts.json);
    }

    return 0;
}

} // namespace

void setup_lock(CLI::App* app, GlobalOptions& opts) {
    static LockCommandOptions lock_opts;

    app->add_option("--platform", lock_opts.platform,
                    "Platform whose snapshots are imported (default: current)");

    app->callback([&opts]() {
        std::exit(cmd_lock(opts, lock_opts));
    });
}

} // namespace devshell::cli::commands
