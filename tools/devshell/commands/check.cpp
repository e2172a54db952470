/**
 * devshell CLI - check command
 *
 * Validate the descriptor and resolve it on every target platform.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace devshell::cli::commands {

namespace {

int cmd_check(const GlobalOptions& opts) {
    configure_logging(opts);
    init_message_collector(opts.json, opts.quiet);
    auto& messages = get_message_collector();

    auto ctx = load_command_context(opts);
    if (!ctx) {
        return 1;
    }

    nlohmann::json issues = nlohmann::json::array();

    auto refs = validate_references(ctx->descriptor);
    for (const auto& symbol : refs.unresolved) {
        issues.push_back({{"platform", nullptr},
                          {"error", resolve_error_to_string(ResolveError::UNRESOLVED_INPUT)},
                          {"context", "input '" + symbol.name + "' referenced by " + symbol.context}});
    }

    if (refs.ok) {
        auto set = resolve_all(ctx->descriptor, *ctx->enumerator, *ctx->evaluator,
                               make_resolve_all_options(opts, ctx->config));
        for (const auto& [platform, result] : set.results) {
            if (!result.ok) {
                issues.push_back({{"platform", platform},
                                  {"error", resolve_error_to_string(*result.error)},
                                  {"context", result.error_context}});
            }
            messages.add_all(result.warnings);
        }
    }

    bool ok = issues.empty() && !messages.has_errors();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = ok;
        j["issues"] = issues;
        output_json(j);
    } else {
        for (const auto& issue : issues) {
            std::string platform = issue["platform"].is_null()
                ? std::string("descriptor") : issue["platform"].get<std::string>();
            std::cout << platform << ": " << issue["error"].get<std::string>() << ": "
                      << issue["context"].get<std::string>() << std::endl;
        }
        if (ok) {
            print_success("OK: " + ctx->descriptor_path, opts.json);
        }
    }

    return ok ? 0 : 1;
}

} // namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_check(opts));
    });
}

} // namespace devshell::cli::commands
