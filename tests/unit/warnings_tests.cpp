#include <doctest/doctest.h>
#include <devshell/warnings.hpp>
#include <devshell/types.hpp>

using namespace devshell;

TEST_CASE("warning_to_string returns correct warning key") {
    CHECK(std::string(warning_to_string(Warning::unlocked_input)) == "unlocked_input");
    CHECK(std::string(warning_to_string(Warning::unused_input)) == "unused_input");
    CHECK(std::string(warning_to_string(Warning::duplicate_build_input)) == "duplicate_build_input");
    CHECK(std::string(warning_to_string(Warning::lock_stale)) == "lock_stale");
}

TEST_CASE("parse_warning_key parses known warning keys") {
    CHECK(parse_warning_key("unlocked_input") == Warning::unlocked_input);
    CHECK(parse_warning_key("UNKNOWN_DESCRIPTOR_KEY") == Warning::unknown_descriptor_key);
    CHECK(parse_warning_key("lock_missing") == Warning::lock_missing);
    CHECK_FALSE(parse_warning_key("not_a_warning").has_value());
    CHECK_FALSE(parse_warning_key("").has_value());
}

TEST_CASE("resolve errors round-trip through their names") {
    CHECK(std::string(resolve_error_to_string(ResolveError::TOOL_NOT_FOUND)) == "TOOL_NOT_FOUND");
    CHECK(parse_resolve_error("unreachable_source") == ResolveError::UNREACHABLE_SOURCE);
    CHECK(parse_resolve_error("UNSUPPORTED_PLATFORM") == ResolveError::UNSUPPORTED_PLATFORM);
    CHECK_FALSE(parse_resolve_error("SEGFAULT").has_value());
}

TEST_CASE("WarningCollector default policy is warn") {
    WarningCollector collector;
    collector.emit(Warning::unused_input, warnings::unused_input("flake-utils"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[0].key == "unused_input");
    CHECK(warnings[0].fields.at("input") == "flake-utils");
    CHECK(collector.has_effective_warnings());
    CHECK_FALSE(collector.has_errors());
}

TEST_CASE("WarningCollector applies error policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["unlocked_input"] = WarningAction::Error;

    WarningCollector collector(policy);
    collector.emit(Warning::unlocked_input, warnings::unlocked_input("nixpkgs", "github:NixOS/nixpkgs"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
    CHECK(collector.has_errors());
}

TEST_CASE("WarningCollector applies ignore policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["duplicate_build_input"] = WarningAction::Ignore;

    WarningCollector collector(policy);
    collector.emit(Warning::duplicate_build_input, warnings::duplicate_build_input("stdenv.cc"));

    CHECK(collector.get_warnings().empty());
    CHECK_FALSE(collector.has_effective_warnings());
}

TEST_CASE("WarningCollector takes its policy from host config") {
    HostConfig config = get_builtin_default_config();
    config.warnings["unused_input"] = WarningAction::Error;

    WarningCollector collector(&config);
    collector.emit(Warning::unused_input);
    CHECK(collector.has_errors());

    collector.set_config(nullptr);
    collector.clear();
    collector.emit(Warning::unused_input);
    CHECK_FALSE(collector.has_errors());
}

TEST_CASE("WarningCollector merge re-applies the policy") {
    std::vector<WarningObject> loaded = {
        {"unknown_descriptor_key", "warn", {{"key", "nixConfig"}}}
    };

    std::unordered_map<std::string, WarningAction> policy;
    policy["unknown_descriptor_key"] = WarningAction::Error;
    WarningCollector collector(policy);
    collector.merge(loaded);

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
    CHECK(warnings[0].fields.at("key") == "nixConfig");
}

TEST_CASE("WarningCollector lowercases dynamic keys") {
    WarningCollector collector;
    collector.emit("Lock_Stale", {{"input", "nixpkgs"}});
    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].key == "lock_stale");
}
