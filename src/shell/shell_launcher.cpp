#include "devshell/shell_launcher.hpp"
#include "devshell/platform.hpp"

#include <cerrno>
#include <cstring>
#include <set>

#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace devshell {

namespace {

std::string single_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::vector<std::string> split_path_list(const std::string& value) {
    std::vector<std::string> dirs;
    size_t start = 0;
    while (start <= value.size()) {
        size_t next = value.find(':', start);
        if (next == std::string::npos) next = value.size();
        if (next > start) dirs.push_back(value.substr(start, next - start));
        start = next + 1;
    }
    return dirs;
}

#ifndef _WIN32

class ProcessSession : public InteractiveSession {
public:
    explicit ProcessSession(pid_t pid) : pid_(pid) {}

    ~ProcessSession() override {
        if (!waited_ && waitpid(pid_, nullptr, WNOHANG) == 0) {
            spdlog::debug("session {} dropped while still running", pid_);
        }
    }

    ProcessSession(const ProcessSession&) = delete;
    ProcessSession& operator=(const ProcessSession&) = delete;

    long id() const override { return static_cast<long>(pid_); }

    SessionExit wait() override {
        SessionExit result;
        if (waited_) {
            result.error = "session already waited for";
            return result;
        }

        int status = 0;
        if (waitpid(pid_, &status, 0) == -1) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
        waited_ = true;

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            result.ok = true;
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
            result.ok = true;
        } else {
            result.error = "process terminated abnormally";
        }
        return result;
    }

private:
    pid_t pid_;
    bool waited_ = false;
};

#endif

} // namespace

std::unordered_map<std::string, std::string> build_shell_environment(
    const ShellSpecification& spec,
    const std::unordered_map<std::string, std::string>& base_env) {
    auto env = base_env;

    std::string tool_path;
    std::set<std::string> seen;
    for (const auto& tool : spec.tools) {
        if (tool.bin_dir.empty()) continue;
        auto dir = join_path(tool.path, tool.bin_dir);
        if (!seen.insert(dir).second) continue;
        if (!tool_path.empty()) tool_path += ":";
        tool_path += dir;
    }

    if (!tool_path.empty()) {
        auto it = env.find("PATH");
        if (it != env.end() && !it->second.empty()) {
            env["PATH"] = tool_path + ":" + it->second;
        } else {
            env["PATH"] = tool_path;
        }
    }

    for (const auto& [key, value] : spec.env) {
        env[key] = value;
    }

    env["IN_DEVSHELL"] = "1";
    env["DEVSHELL_PLATFORM"] = spec.platform;
    return env;
}

std::vector<std::string> build_shell_argv(const std::string& program,
                                          const ShellSpecification& spec,
                                          const std::optional<std::string>& command) {
    if (command) {
        std::string script = spec.shell_hook.empty() ? *command : spec.shell_hook + "\n" + *command;
        return {program, "-c", script};
    }
    if (spec.shell_hook.empty()) {
        return {program, "-i"};
    }
    return {program, "-c", spec.shell_hook + "\nexec " + single_quote(program) + " -i"};
}

ProcessShellLauncher::ProcessShellLauncher(ProcessLaunchOptions options)
    : options_(std::move(options)) {}

std::string ProcessShellLauncher::resolve_program(
    const std::unordered_map<std::string, std::string>& env) const {
    std::string program = options_.program;
    if (program.empty()) {
        auto shell = options_.base_env.find("SHELL");
        program = (shell != options_.base_env.end() && !shell->second.empty())
            ? shell->second : "/bin/sh";
    }

    if (program.find('/') != std::string::npos) {
        return program;
    }

    auto path = env.find("PATH");
    if (path != env.end()) {
        for (const auto& dir : split_path_list(path->second)) {
            auto candidate = join_path(dir, program);
            if (is_regular_file(candidate)) {
                return candidate;
            }
        }
    }
    return program;
}

LaunchResult ProcessShellLauncher::mk_shell(const ShellSpecification& spec) {
    LaunchResult result;

#ifdef _WIN32
    (void)spec;
    result.error = "interactive shells are not supported on Windows";
    return result;
#else
    auto env_map = build_shell_environment(spec, options_.base_env);
    auto program = resolve_program(env_map);
    auto argv_strings = build_shell_argv(program, spec, options_.command);

    std::vector<std::string> env_strings;
    env_strings.reserve(env_map.size());
    for (const auto& [key, value] : env_map) {
        env_strings.push_back(key + "=" + value);
    }

    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    spdlog::debug("Launching {} for {} with {} tools", program, spec.platform, spec.tools.size());

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        if (!options_.cwd.empty() && chdir(options_.cwd.c_str()) != 0) {
            _exit(127);
        }
        execve(program.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    result.session = std::make_unique<ProcessSession>(pid);
    result.ok = true;
    return result;
#endif
}

} // namespace devshell
