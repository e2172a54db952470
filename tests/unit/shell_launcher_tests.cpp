#include <doctest/doctest.h>
#include <devshell/shell_launcher.hpp>

#include "../test_support.hpp"

#include <cerrno>
#include <chrono>
#include <thread>

#ifndef _WIN32
#include <sys/wait.h>
#endif

using namespace devshell;

namespace {

ShellSpecification spec_with_tools() {
    ShellSpecification spec;
    spec.platform = "x86_64-linux";
    spec.tools.push_back({"stdenv.cc", "nixpkgs", "stdenv.cc", "gcc-wrapper", "12.3.0",
                          "/nix/store/aaa-gcc-wrapper", "bin"});
    spec.tools.push_back({"cmake", "nixpkgs", "cmake", "cmake", "3.27.7",
                          "/nix/store/bbb-cmake", "bin"});
    return spec;
}

} // namespace

TEST_CASE("shell environment prepends tool bin directories in order") {
    auto env = build_shell_environment(spec_with_tools(), {{"PATH", "/usr/bin:/bin"}, {"HOME", "/home/u"}});

    CHECK(env.at("PATH") == "/nix/store/aaa-gcc-wrapper/bin:/nix/store/bbb-cmake/bin:/usr/bin:/bin");
    CHECK(env.at("HOME") == "/home/u");
    CHECK(env.at("IN_DEVSHELL") == "1");
    CHECK(env.at("DEVSHELL_PLATFORM") == "x86_64-linux");
}

TEST_CASE("shell environment skips tools without a bin directory and duplicates") {
    auto spec = spec_with_tools();
    spec.tools[1].bin_dir.clear();
    spec.tools.push_back(spec.tools[0]);

    auto env = build_shell_environment(spec, {});
    CHECK(env.at("PATH") == "/nix/store/aaa-gcc-wrapper/bin");
}

TEST_CASE("shell env overrides the base environment") {
    auto spec = spec_with_tools();
    spec.env["CC"] = "gcc";
    spec.env["HOME"] = "/tmp/devshell-home";

    auto env = build_shell_environment(spec, {{"HOME", "/home/u"}, {"CC", "clang"}});
    CHECK(env.at("CC") == "gcc");
    CHECK(env.at("HOME") == "/tmp/devshell-home");
}

TEST_CASE("shell argv") {
    ShellSpecification spec;

    SUBCASE("interactive without hook") {
        auto argv = build_shell_argv("/bin/bash", spec, std::nullopt);
        REQUIRE(argv.size() == 2);
        CHECK(argv[0] == "/bin/bash");
        CHECK(argv[1] == "-i");
    }

    SUBCASE("interactive with hook") {
        spec.shell_hook = "echo ready";
        auto argv = build_shell_argv("/bin/bash", spec, std::nullopt);
        REQUIRE(argv.size() == 3);
        CHECK(argv[1] == "-c");
        CHECK(argv[2] == "echo ready\nexec '/bin/bash' -i");
    }

    SUBCASE("command with hook") {
        spec.shell_hook = "export A=1";
        auto argv = build_shell_argv("/bin/sh", spec, std::string("make"));
        REQUIRE(argv.size() == 3);
        CHECK(argv[2] == "export A=1\nmake");
    }

    SUBCASE("command without hook") {
        auto argv = build_shell_argv("/bin/sh", spec, std::string("make"));
        REQUIRE(argv.size() == 3);
        CHECK(argv[2] == "make");
    }
}

TEST_CASE("resolve_program falls back from configuration to SHELL to /bin/sh") {
    ProcessLaunchOptions configured;
    configured.program = "/bin/zsh";
    configured.base_env = {{"SHELL", "/bin/bash"}};
    CHECK(ProcessShellLauncher(configured).resolve_program({}) == "/bin/zsh");

    ProcessLaunchOptions from_env;
    from_env.base_env = {{"SHELL", "/bin/bash"}};
    CHECK(ProcessShellLauncher(from_env).resolve_program({}) == "/bin/bash");

    CHECK(ProcessShellLauncher(ProcessLaunchOptions{}).resolve_program({}) == "/bin/sh");
}

TEST_CASE("resolve_program searches PATH for bare names") {
    testing::TempDir dir;
    testing::write_text(dir.path() + "/bin/myshell", "#!/bin/sh\n");

    ProcessLaunchOptions options;
    options.program = "myshell";
    ProcessShellLauncher launcher(options);

    CHECK(launcher.resolve_program({{"PATH", "/nonexistent:" + dir.path() + "/bin"}}) ==
          dir.path() + "/bin/myshell");
    CHECK(launcher.resolve_program({}) == "myshell");
}

#ifndef _WIN32

TEST_CASE("process launcher runs a command and reports its exit code") {
    ProcessLaunchOptions options;
    options.program = "/bin/sh";
    options.command = "test \"$IN_DEVSHELL\" = 1 && test \"$DEVSHELL_PLATFORM\" = x86_64-linux && exit 3";
    options.base_env = {{"PATH", "/usr/bin:/bin"}};

    ProcessShellLauncher launcher(options);
    ShellSpecification spec;
    spec.platform = "x86_64-linux";

    auto launched = launcher.mk_shell(spec);
    REQUIRE(launched.ok);
    REQUIRE(launched.session);
    CHECK(launched.session->id() > 0);

    auto ended = launched.session->wait();
    REQUIRE(ended.ok);
    CHECK(ended.exit_code == 3);

    auto again = launched.session->wait();
    CHECK_FALSE(again.ok);
}

TEST_CASE("dropping an exited session reaps its process") {
    ProcessLaunchOptions options;
    options.program = "/bin/sh";
    options.command = "exit 0";
    options.base_env = {{"PATH", "/usr/bin:/bin"}};

    ShellSpecification spec;
    spec.platform = "x86_64-linux";

    auto launched = ProcessShellLauncher(options).mk_shell(spec);
    REQUIRE(launched.ok);
    auto pid = static_cast<pid_t>(launched.session->id());

    // Wait for the exit without collecting the status
    bool exited = false;
    for (int i = 0; i < 500 && !exited; ++i) {
        siginfo_t info{};
        REQUIRE(waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0);
        exited = info.si_pid == pid;
        if (!exited) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(exited);

    launched.session.reset();

    errno = 0;
    CHECK(waitpid(pid, nullptr, WNOHANG) == -1);
    CHECK(errno == ECHILD);
}

TEST_CASE("process launcher runs the shell hook before the command") {
    ProcessLaunchOptions options;
    options.program = "/bin/sh";
    options.command = "exit $HOOK_CODE";
    options.base_env = {{"PATH", "/usr/bin:/bin"}};

    ShellSpecification spec;
    spec.platform = "aarch64-linux";
    spec.shell_hook = "HOOK_CODE=7";

    auto launched = ProcessShellLauncher(options).mk_shell(spec);
    REQUIRE(launched.ok);
    auto ended = launched.session->wait();
    REQUIRE(ended.ok);
    CHECK(ended.exit_code == 7);
}

#endif
