#include <doctest/doctest.h>
#include <devshell/serialize.hpp>

#include <nlohmann/json.hpp>

using namespace devshell;
using json = nlohmann::json;

namespace {

ResolutionResult successful_result() {
    ResolutionResult r;
    r.ok = true;
    r.platform = "x86_64-linux";
    r.spec.platform = "x86_64-linux";
    r.spec.tools.push_back({"stdenv.cc", "nixpkgs", "stdenv.cc", "gcc-wrapper", "12.3.0",
                            "/nix/store/aaa-gcc-wrapper", "bin"});
    r.spec.inputs["nixpkgs"] = "057f9ae";
    r.spec.env["B"] = "2";
    r.spec.env["A"] = "1";
    return r;
}

} // namespace

TEST_CASE("resolution JSON carries the shell") {
    auto j = json::parse(serialize_resolution_json(successful_result(), false));

    CHECK(j["schema"] == "devshell.resolution.v1");
    CHECK(j["ok"] == true);
    CHECK(j["platform"] == "x86_64-linux");
    REQUIRE(j["spec"]["tools"].size() == 1);
    CHECK(j["spec"]["tools"][0]["tool_id"] == "stdenv.cc");
    CHECK(j["spec"]["inputs"]["nixpkgs"] == "057f9ae");
    CHECK_FALSE(j.contains("error"));
    CHECK_FALSE(j.contains("trace"));
}

TEST_CASE("failed resolution JSON carries the error kind") {
    ResolutionResult r;
    r.platform = "aarch64-darwin";
    r.error = ResolveError::TOOL_NOT_FOUND;
    r.error_context = "tool 'x' not found";

    auto j = json::parse(serialize_resolution_json(r, false));
    CHECK(j["ok"] == false);
    CHECK(j["error"] == "TOOL_NOT_FOUND");
    CHECK(j["error_context"] == "tool 'x' not found");
    CHECK_FALSE(j.contains("spec"));
}

TEST_CASE("serialization is byte-stable") {
    auto a = successful_result();
    auto b = successful_result();
    b.spec.env.clear();
    b.spec.env["A"] = "1";
    b.spec.env["B"] = "2";

    CHECK(serialize_resolution_json(a, false) == serialize_resolution_json(b, false));
    auto text = serialize_shell_specification_json(a.spec);
    CHECK(text.find("\"A\"") < text.find("\"B\""));
}

TEST_CASE("trace is emitted only on request") {
    auto r = successful_result();
    r.trace = std::unordered_map<std::string, TraceEntry>{
        {"stdenv.cc", {"nixpkgs", "github:NixOS/nixpkgs/release-23.11", "057f9ae", "sha256-x"}}};

    CHECK_FALSE(json::parse(serialize_resolution_json(r, false)).contains("trace"));
    auto j = json::parse(serialize_resolution_json(r, true));
    CHECK(j["trace"]["stdenv.cc"]["rev"] == "057f9ae");
    CHECK(j["trace"]["stdenv.cc"]["source"] == "github:NixOS/nixpkgs/release-23.11");
}

TEST_CASE("resolution set JSON groups results by platform") {
    ResolutionSet set;
    set.results["x86_64-linux"] = successful_result();
    ResolutionResult failed;
    failed.platform = "aarch64-darwin";
    failed.error = ResolveError::UNREACHABLE_SOURCE;
    set.results["aarch64-darwin"] = failed;

    auto j = json::parse(serialize_resolution_set_json(set, false));
    CHECK(j["ok"] == false);
    CHECK(j["platforms"]["x86_64-linux"]["ok"] == true);
    CHECK(j["platforms"]["aarch64-darwin"]["error"] == "UNREACHABLE_SOURCE");
}

TEST_CASE("descriptor JSON shows the normalized descriptor") {
    auto parsed = parse_descriptor(R"({
        "description": "Test shell",
        "inputs": { "nixpkgs": { "url": "github:NixOS/nixpkgs/release-23.11" } },
        "outputs": { "devShell": { "buildInputs": ["stdenv.cc"] } }
    })");
    REQUIRE(parsed.ok);

    auto j = json::parse(serialize_descriptor_json(parsed.value));
    CHECK(j["inputs"]["nixpkgs"]["owner"] == "NixOS");
    CHECK(j["inputs"]["nixpkgs"]["ref"] == "release-23.11");
    CHECK_FALSE(j["inputs"]["nixpkgs"].contains("rev"));
    CHECK(j["outputs"]["devShell"]["packages"] == "nixpkgs");
}
