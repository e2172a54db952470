#pragma once

#include "devshell/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devshell {

// ============================================================================
// Interactive Session
// ============================================================================

struct SessionExit {
    bool ok = false;
    int exit_code = -1;
    std::string error;
};

class InteractiveSession {
public:
    virtual ~InteractiveSession() = default;

    virtual long id() const = 0;

    // Block until the session ends. A session dropped without wait() reaps
    // its process only if it has already exited.
    virtual SessionExit wait() = 0;
};

struct LaunchResult {
    bool ok = false;
    std::string error;
    std::unique_ptr<InteractiveSession> session;
};

// ============================================================================
// Shell Launcher
// ============================================================================

class ShellLauncher {
public:
    virtual ~ShellLauncher() = default;

    virtual LaunchResult mk_shell(const ShellSpecification& spec) = 0;
};

// Environment of a session: base_env with every tool's bin directory prepended
// to PATH in tool order, the shell's env applied on top, and
// IN_DEVSHELL / DEVSHELL_PLATFORM set.
std::unordered_map<std::string, std::string> build_shell_environment(
    const ShellSpecification& spec,
    const std::unordered_map<std::string, std::string>& base_env);

// argv for the session: runs the shell hook, then `command` if given,
// otherwise an interactive shell
std::vector<std::string> build_shell_argv(const std::string& program,
                                          const ShellSpecification& spec,
                                          const std::optional<std::string>& command);

struct ProcessLaunchOptions {
    std::string program;                   // empty = $SHELL, then /bin/sh
    std::optional<std::string> command;    // one-shot command instead of an interactive shell
    std::string cwd;                       // empty = inherit
    std::unordered_map<std::string, std::string> base_env;
};

// Spawns the shell as a child process (fork/execve)
class ProcessShellLauncher : public ShellLauncher {
public:
    explicit ProcessShellLauncher(ProcessLaunchOptions options);

    LaunchResult mk_shell(const ShellSpecification& spec) override;

    // Program that will be executed, resolved against PATH when not a path
    std::string resolve_program(const std::unordered_map<std::string, std::string>& env) const;

private:
    ProcessLaunchOptions options_;
};

} // namespace devshell
