/**
 * devshell CLI - resolve command
 *
 * Resolve the descriptor's shell for one platform or for every platform.
 */

#include "../common.hpp"
#include "devshell/serialize.hpp"
#include <CLI/CLI.hpp>

namespace devshell::cli::commands {

namespace {

struct ResolveCommandOptions {
    std::string platform;
    bool all = false;
};

int cmd_resolve(const GlobalOptions& opts, const ResolveCommandOptions& resolve_opts) {
    configure_logging(opts);
    init_message_collector(opts.json, opts.quiet);
    auto& messages = get_message_collector();

    auto ctx = load_command_context(opts);
    if (!ctx) {
        return 1;
    }

    if (resolve_opts.all) {
        auto set = resolve_all(ctx->descriptor, *ctx->enumerator, *ctx->evaluator,
                               make_resolve_all_options(opts, ctx->config));

        if (opts.json) {
            std::cout << serialize_resolution_set_json(set, opts.trace) << std::endl;
        } else {
            for (const auto& [_, result] : set.results) {
                print_resolution_text(result, opts.trace);
            }
        }

        bool warning_errors = messages.has_errors();
        for (const auto& [_, result] : set.results) {
            if (!opts.json) messages.add_all(result.warnings);
            for (const auto& w : result.warnings) {
                if (w.action == "error") warning_errors = true;
            }
        }
        return set.all_ok() && !warning_errors ? 0 : 1;
    }

    auto platform = resolve_target_platform(resolve_opts.platform, opts.json);
    if (!platform) {
        return 1;
    }

    auto result = resolve(ctx->descriptor, *platform, *ctx->enumerator, *ctx->evaluator,
                          make_resolve_options(opts, ctx->config));

    if (opts.json) {
        std::cout << serialize_resolution_json(result, opts.trace) << std::endl;
    } else {
        print_resolution_text(result, opts.trace);
    }
    messages.add_all(result.warnings);

    return result.ok && !messages.has_errors() ? 0 : 1;
}

} // namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveCommandOptions resolve_opts;

    auto* platform_opt = app->add_option("--platform", resolve_opts.platform,
                                         "Platform to resolve (default: current)");
    app->add_flag("--all", resolve_opts.all, "Resolve every target platform")
        ->excludes(platform_opt);

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

} // namespace devshell::cli::commands
