/**
 * devshell CLI - platforms command
 *
 * List the platforms shells can be resolved for.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace devshell::cli::commands {

namespace {

int cmd_platforms(const GlobalOptions& opts) {
    configure_logging(opts);
    init_message_collector(opts.json, opts.quiet);

    std::string root = resolve_devshell_root(
        opts.root.empty() ? std::nullopt : std::make_optional(opts.root));

    auto config = load_host_config(root);
    if (!config.ok) {
        print_error(config.error, opts.json);
        return 1;
    }

    auto enumerator = make_platform_enumerator(config.config);
    auto platforms = enumerator->default_platforms();
    auto current = get_current_platform();

    if (opts.json) {
        nlohmann::json j;
        j["current"] = current.to_string();
        j["configured"] = !config.config.platforms.empty();
        j["platforms"] = nlohmann::json::array();
        for (const auto& p : platforms) {
            j["platforms"].push_back(p.to_string());
        }
        output_json(j);
        return 0;
    }

    for (const auto& p : platforms) {
        std::cout << (p == current ? "* " : "  ") << p.to_string() << std::endl;
    }
    if (!enumerator->supports(current) && !opts.quiet) {
        std::cout << "(current platform " << current.to_string() << " is not listed)" << std::endl;
    }
    return 0;
}

} // namespace

void setup_platforms(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_platforms(opts));
    });
}

} // namespace devshell::cli::commands
