/**
 * devshell CLI - Entry Point
 *
 * Resolves development-shell descriptors into per-platform shells.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace devshell::cli::commands {
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_shell(CLI::App* app, GlobalOptions& opts);
    void setup_lock(CLI::App* app, GlobalOptions& opts);
    void setup_show(CLI::App* app, GlobalOptions& opts);
    void setup_platforms(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace devshell::cli;

    CLI::App app{"devshell - reproducible development shells"};
    app.set_version_flag("-V,--version", DEVSHELL_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    app.add_option("--root", opts.root, "devshell root directory");
    app.add_option("-f,--file", opts.file, "Descriptor file (default ./devshell.json)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("--trace", opts.trace, "Include the origin of every tool");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    auto* resolve_cmd = app.add_subcommand("resolve", "Resolve the shell for one or all platforms");
    commands::setup_resolve(resolve_cmd, opts);

    auto* shell_cmd = app.add_subcommand("shell", "Enter the development shell");
    commands::setup_shell(shell_cmd, opts);

    auto* lock_cmd = app.add_subcommand("lock", "Pin every input to its current revision");
    commands::setup_lock(lock_cmd, opts);

    auto* show_cmd = app.add_subcommand("show", "Describe the descriptor");
    commands::setup_show(show_cmd, opts);

    auto* platforms_cmd = app.add_subcommand("platforms", "List supported platforms");
    commands::setup_platforms(platforms_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Validate the descriptor on every platform");
    commands::setup_check(check_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
