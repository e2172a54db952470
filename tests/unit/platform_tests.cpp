#include <doctest/doctest.h>
#include <devshell/platform.hpp>

#include "../test_support.hpp"

using namespace devshell;

TEST_CASE("parse_platform accepts known arch-os pairs") {
    auto p = parse_platform("x86_64-linux");
    REQUIRE(p.has_value());
    CHECK(p->arch == "x86_64");
    CHECK(p->os == "linux");
    CHECK(p->to_string() == "x86_64-linux");

    CHECK(parse_platform("aarch64-darwin").has_value());
    CHECK(parse_platform("riscv64-linux").has_value());
}

TEST_CASE("parse_platform rejects unknown identifiers") {
    CHECK_FALSE(parse_platform("").has_value());
    CHECK_FALSE(parse_platform("x86_64").has_value());
    CHECK_FALSE(parse_platform("x86_64-").has_value());
    CHECK_FALSE(parse_platform("-linux").has_value());
    CHECK_FALSE(parse_platform("sparc-linux").has_value());
    CHECK_FALSE(parse_platform("x86_64-windows").has_value());
}

TEST_CASE("default enumerator yields the four standard platforms in order") {
    DefaultPlatformEnumerator enumerator;
    auto platforms = enumerator.default_platforms();
    REQUIRE(platforms.size() == 4);
    CHECK(platforms[0].to_string() == "aarch64-darwin");
    CHECK(platforms[1].to_string() == "aarch64-linux");
    CHECK(platforms[2].to_string() == "x86_64-darwin");
    CHECK(platforms[3].to_string() == "x86_64-linux");
}

TEST_CASE("supports checks membership in the enumerated set") {
    DefaultPlatformEnumerator enumerator;
    CHECK(enumerator.supports(*parse_platform("x86_64-linux")));
    CHECK_FALSE(enumerator.supports(*parse_platform("riscv64-linux")));
}

TEST_CASE("configured enumerator sorts and removes duplicates") {
    ConfiguredPlatformEnumerator enumerator({
        *parse_platform("x86_64-linux"),
        *parse_platform("aarch64-linux"),
        *parse_platform("x86_64-linux"),
    });
    auto platforms = enumerator.default_platforms();
    REQUIRE(platforms.size() == 2);
    CHECK(platforms[0].to_string() == "aarch64-linux");
    CHECK(platforms[1].to_string() == "x86_64-linux");
}

TEST_CASE("current platform is a recognised identifier") {
    auto current = get_current_platform();
    CHECK_FALSE(current.arch.empty());
    CHECK((current.os == "linux" || current.os == "darwin"));
}

TEST_CASE("atomic_write_file replaces file content") {
    testing::TempDir temp;
    std::string path = join_path(temp.path(), "out.json");

    auto first = atomic_write_file(path, "one");
    REQUIRE(first.ok);
    CHECK(read_file(path).value_or("") == "one");

    auto second = atomic_write_file(path, "two");
    REQUIRE(second.ok);
    CHECK(read_file(path).value_or("") == "two");
}

TEST_CASE("atomic_write_file fails when the directory is missing") {
    testing::TempDir temp;
    auto result = atomic_write_file(join_path(temp.path(), "missing/out.json"), "x");
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("path helpers") {
    CHECK(join_path("/a", "b") == "/a/b");
    CHECK(get_parent_directory("/a/b/devshell.json") == "/a/b");
}
