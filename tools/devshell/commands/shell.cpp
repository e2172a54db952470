/**
 * devshell CLI - shell command
 *
 * Resolve the shell for one platform and start it.
 */

#include "../common.hpp"
#include "devshell/shell_launcher.hpp"
#include <CLI/CLI.hpp>

namespace devshell::cli::commands {

namespace {

struct ShellCommandOptions {
    std::string platform;
    std::string command;
};

int cmd_shell(const GlobalOptions& opts, const ShellCommandOptions& shell_opts) {
    configure_logging(opts);
    init_message_collector(false, opts.quiet);

    auto ctx = load_command_context(opts);
    if (!ctx) {
        return 1;
    }

    auto platform = resolve_target_platform(shell_opts.platform, false);
    if (!platform) {
        return 1;
    }

    auto result = resolve(ctx->descriptor, *platform, *ctx->enumerator, *ctx->evaluator,
                          make_resolve_options(opts, ctx->config));
    get_message_collector().add_all(result.warnings);

    if (!result.ok) {
        print_error(std::string(resolve_error_to_string(*result.error)) + ": " +
                    result.error_context, false);
        return 1;
    }
    if (get_message_collector().has_errors()) {
        print_error("warnings configured as errors", false);
        return 1;
    }

    ProcessLaunchOptions launch;
    launch.program = ctx->config.shell.program;
    launch.base_env = get_all_env();
    if (!shell_opts.command.empty()) {
        launch.command = shell_opts.command;
    }

    ProcessShellLauncher launcher(launch);
    auto launched = launcher.mk_shell(result.spec);
    if (!launched.ok) {
        print_error(launched.error, false);
        return 1;
    }

    auto ended = launched.session->wait();
    if (!ended.ok) {
        print_error(ended.error, false);
        return 1;
    }
    return ended.exit_code;
}

} // namespace

void setup_shell(CLI::App* app, GlobalOptions& opts) {
    static ShellCommandOptions shell_opts;

    app->add_option("--platform", shell_opts.platform, "Platform to resolve (default: current)");
    app->add_option("-c,--command", shell_opts.command, "Run a command instead of an interactive shell");

    app->callback([&opts]() {
        std::exit(cmd_shell(opts, shell_opts));
    });
}

} // namespace devshell::cli::commands
