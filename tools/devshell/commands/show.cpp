/**
 * devshell CLI - show command
 *
 * Describe the descriptor: inputs, pins, platforms and requested tools.
 */

#include "../common.hpp"
#include "devshell/serialize.hpp"
#include <CLI/CLI.hpp>

namespace devshell::cli::commands {

namespace {

int cmd_show(const GlobalOptions& opts) {
    configure_logging(opts);
    init_message_collector(opts.json, opts.quiet);

    auto ctx = load_command_context(opts);
    if (!ctx) {
        return 1;
    }

    const auto& d = ctx->descriptor;

    if (opts.json) {
        auto j = nlohmann::json::parse(serialize_descriptor_json(d));
        j["path"] = ctx->descriptor_path;
        j["locked"] = ctx->locked;
        output_json(j);
        return 0;
    }

    std::cout << "Descriptor: " << ctx->descriptor_path << std::endl;
    if (!d.description.empty()) {
        std::cout << "Description: " << d.description << std::endl;
    }

    std::cout << std::endl << "Inputs:" << std::endl;
    for (const auto& [name, input] : d.inputs) {
        std::cout << "  " << name << ": " << input.url;
        if (input.reference.is_pinned()) {
            std::cout << " @ " << input.reference.rev;
        }
        std::cout << std::endl;
    }

    const auto& outputs = d.outputs;
    std::cout << std::endl << "Outputs:" << std::endl;
    if (!outputs.args.empty()) {
        std::cout << "  args:";
        for (const auto& arg : outputs.args) std::cout << " " << arg;
        std::cout << std::endl;
    }

    std::cout << "  systems:";
    for (const auto& platform : target_platforms(d, *ctx->enumerator)) {
        std::cout << " " << platform.to_string();
    }
    if (outputs.systems.empty()) std::cout << " (default)";
    std::cout << std::endl;

    std::cout << "  devShell (packages from " << outputs.dev_shell.packages << "):" << std::endl;
    for (const auto& tool : outputs.dev_shell.build_inputs) {
        std::cout << "    " << tool << std::endl;
    }
    if (!outputs.dev_shell.shell_hook.empty()) {
        std::cout << "  shellHook: " << outputs.dev_shell.shell_hook << std::endl;
    }

    auto unused = unused_inputs(d);
    if (!unused.empty() && opts.verbose) {
        std::cout << std::endl << "Unused inputs:";
        for (const auto& name : unused) std::cout << " " << name;
        std::cout << std::endl;
    }

    return 0;
}

} // namespace

void setup_show(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_show(opts));
    });
}

} // namespace devshell::cli::commands
