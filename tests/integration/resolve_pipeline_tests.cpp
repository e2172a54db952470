#include <doctest/doctest.h>
#include <devshell/host_config.hpp>
#include <devshell/lock_file.hpp>
#include <devshell/resolver.hpp>
#include <devshell/serialize.hpp>
#include <devshell/snapshot_store.hpp>

#include "../test_support.hpp"

#include <nlohmann/json.hpp>

using namespace devshell;
using testing::TempDir;
using testing::package_set_json;
using testing::write_text;

namespace {

const char* DESCRIPTOR = R"({
    "description": "A very basic flake",
    "inputs": {
        "nixpkgs": { "url": "github:NixOS/nixpkgs/release-23.11" },
        "flake-utils": "github:numtide/flake-utils"
    },
    "outputs": {
        "args": ["self", "nixpkgs", "flake-utils"],
        "devShell": { "buildInputs": ["stdenv.cc"] }
    }
})";

// A devshell root whose config points github at a file: mirror holding one
// release-23.11 index per default platform
struct Environment {
    TempDir dir;
    std::string root;
    std::string mirror;
    std::string project;
    HostConfig config;

    Environment() {
        root = dir.path() + "/root";
        mirror = dir.path() + "/mirror";
        project = dir.path() + "/project";

        for (const auto& p : DefaultPlatformEnumerator().default_platforms()) {
            write_text(mirror + "/NixOS/nixpkgs/release-23.11/" + p.to_string() + ".json",
                       package_set_json(p.to_string(), "057f9aecfb71"));
        }
        write_text(project + "/devshell.json", DESCRIPTOR);
        write_config(false);
    }

    void write_config(bool offline) {
        write_text(root + "/config.json", R"({
            "$schema": "devshell.config.v1",
            "mirrors": { "github": "file:)" + mirror + R"(" },
            "fetch": { "max_attempts": 2, "initial_backoff_ms": 1, "offline": )" +
                       std::string(offline ? "true" : "false") + R"( }
        })");
        auto loaded = load_host_config(root);
        REQUIRE(loaded.ok);
        CHECK(loaded.warnings.empty());
        config = loaded.config;
    }

    Descriptor descriptor() const {
        auto r = load_descriptor_file(project + "/devshell.json");
        REQUIRE(r.ok);
        return r.value;
    }
};

void no_sleep(std::chrono::milliseconds) {}

} // namespace

TEST_CASE("resolve_all through a file mirror") {
    Environment env;
    DirectorySnapshotEvaluator store(snapshot_store_options(env.config, env.root));
    RetryingSnapshotEvaluator evaluator(store, retry_policy(env.config), no_sleep);
    DefaultPlatformEnumerator enumerator;

    auto set = resolve_all(env.descriptor(), enumerator, evaluator);
    REQUIRE(set.results.size() == 4);
    CHECK(set.all_ok());

    for (const auto& [name, result] : set.results) {
        REQUIRE(result.spec.tools.size() == 1);
        CHECK(result.spec.tools[0].tool_id == "stdenv.cc");
        CHECK(result.spec.tools[0].path == "/nix/store/057f9aecfb71-" + name + "-gcc-wrapper-12.3.0");
        CHECK(result.spec.inputs.at("nixpkgs") == "057f9aecfb71");
    }

    // Fetched indexes land in the cache under the ref and the resolved rev
    auto cache = env.root + "/snapshots/github/NixOS/nixpkgs";
    CHECK(path_exists(cache + "/release-23.11/x86_64-linux.json"));
    CHECK(path_exists(cache + "/057f9aecfb71/x86_64-linux.json"));

    auto j = nlohmann::json::parse(serialize_resolution_set_json(set, false));
    CHECK(j["ok"] == true);
    CHECK(j["platforms"].size() == 4);
}

TEST_CASE("a lock written online resolves offline from the cache") {
    Environment env;
    auto platform = *parse_platform("x86_64-linux");
    DefaultPlatformEnumerator enumerator;

    {
        DirectorySnapshotEvaluator store(snapshot_store_options(env.config, env.root));
        auto created = create_lock(env.descriptor(), store, platform);
        REQUIRE(created.ok);
        REQUIRE(write_lock_file(lock_path_for(env.project + "/devshell.json"), created.lock).ok);
    }

    env.write_config(true);
    DirectorySnapshotEvaluator offline(snapshot_store_options(env.config, env.root));

    auto lock = load_lock_file(env.project + "/devshell.lock");
    REQUIRE(lock.ok);
    WarningCollector collector;
    auto locked = apply_lock(env.descriptor(), lock.value, collector);
    CHECK(collector.get_warnings().empty());

    auto r = resolve(locked, platform, enumerator, offline);
    REQUIRE(r.ok);
    CHECK(r.spec.inputs.at("nixpkgs") == "057f9aecfb71");

    // Nothing was cached for other platforms
    auto other = resolve(locked, *parse_platform("aarch64-darwin"), enumerator, offline);
    CHECK_FALSE(other.ok);
    CHECK(*other.error == ResolveError::UNREACHABLE_SOURCE);
}

TEST_CASE("a moving reference falls back to the cache when the mirror disappears") {
    Environment env;
    auto platform = *parse_platform("aarch64-linux");
    DefaultPlatformEnumerator enumerator;
    DirectorySnapshotEvaluator store(snapshot_store_options(env.config, env.root));

    REQUIRE(resolve(env.descriptor(), platform, enumerator, store).ok);

    std::error_code ec;
    std::filesystem::remove_all(env.mirror, ec);
    REQUIRE_FALSE(ec);

    auto r = resolve(env.descriptor(), platform, enumerator, store);
    REQUIRE(r.ok);
    CHECK(r.spec.inputs.at("nixpkgs") == "057f9aecfb71");
}

TEST_CASE("a source host without a mirror is unreachable on every platform") {
    Environment env;
    write_text(env.project + "/devshell.json", R"({
        "description": "Test shell",
        "inputs": { "nixpkgs": "gitlab:NixOS/nixpkgs/release-23.11" },
        "outputs": { "devShell": { "buildInputs": ["stdenv.cc"] } }
    })");

    DirectorySnapshotEvaluator store(snapshot_store_options(env.config, env.root));
    DefaultPlatformEnumerator enumerator;

    auto set = resolve_all(env.descriptor(), enumerator, store);
    REQUIRE(set.results.size() == 4);
    CHECK(set.failures().size() == 4);
    for (const auto& [_, result] : set.results) {
        CHECK(*result.error == ResolveError::UNREACHABLE_SOURCE);
        CHECK(result.error_context.find("no mirror configured for host 'gitlab'") != std::string::npos);
    }
}

TEST_CASE("a missing tool fails only where the index lacks it") {
    Environment env;
    write_text(env.mirror + "/NixOS/nixpkgs/release-23.11/x86_64-darwin.json",
               package_set_json("x86_64-darwin", "057f9aecfb71", "clang", "clang-16"));

    DirectorySnapshotEvaluator store(snapshot_store_options(env.config, env.root));
    DefaultPlatformEnumerator enumerator;

    auto set = resolve_all(env.descriptor(), enumerator, store);
    auto failed = set.failures();
    REQUIRE(failed.size() == 1);
    CHECK(failed[0] == "x86_64-darwin");
    CHECK(*set.results.at("x86_64-darwin").error == ResolveError::TOOL_NOT_FOUND);
}
