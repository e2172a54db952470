#pragma once

#include "devshell/source_ref.hpp"
#include "devshell/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devshell {

// ============================================================================
// PARSE RESULTS
// ============================================================================

template<typename T>
struct ParseResult {
    bool ok = false;
    std::string error;
    T value;
    std::vector<WarningObject> warnings;
};

// ============================================================================
// DESCRIPTOR
// ============================================================================
//
// The declarative environment description (devshell.json):
//
//     {
//       "description": "A very basic flake",
//       "inputs": {
//         "nixpkgs": { "url": "github:NixOS/nixpkgs/release-23.11" },
//         "flake-utils": "github:numtide/flake-utils"
//       },
//       "outputs": {
//         "args": ["self", "nixpkgs", "flake-utils"],
//         "devShell": { "packages": "nixpkgs", "buildInputs": ["stdenv.cc"] }
//       }
//     }
//
// `outputs` stands for the function from the declared inputs to the shell:
// `args` are the inputs it takes, `devShell` is what it produces.

struct InputDecl {
    std::string name;
    std::string url;
    SourceReference reference;
};

struct ShellDecl {
    std::string packages = "nixpkgs";       // input supplying unqualified tools
    std::vector<std::string> build_inputs;  // "attr.path" or "<input>#attr.path"
    std::string shell_hook;
    std::unordered_map<std::string, std::string> env;
};

struct OutputsDecl {
    std::vector<std::string> args;     // empty = every input
    std::vector<std::string> systems;  // empty = each default platform
    ShellDecl dev_shell;
};

struct Descriptor {
    std::string description;
    std::map<std::string, InputDecl> inputs;
    OutputsDecl outputs;

    std::string source_path;  // for diagnostics
};

// Name under which the descriptor refers to itself; never declared as an input
constexpr const char* SELF_INPUT = "self";

// ============================================================================
// TOOL IDENTIFIERS
// ============================================================================

struct ToolId {
    std::string input;
    std::string attr_path;
};

// "stdenv.cc" -> {default_input, "stdenv.cc"}; "other#hello" -> {"other", "hello"}
// Returns nullopt for an empty attribute path or empty input qualifier.
std::optional<ToolId> parse_tool_id(const std::string& tool, const std::string& default_input);

// ============================================================================
// LOADING
// ============================================================================

// Parse and schema-check a descriptor. Fails with a message naming the
// offending field; unknown top-level keys produce warnings.
ParseResult<Descriptor> parse_descriptor(const std::string& json_str,
                                         const std::string& source_path = "");

ParseResult<Descriptor> load_descriptor_file(const std::string& path);

// ============================================================================
// REFERENCE VALIDATION
// ============================================================================

struct UnresolvedSymbol {
    std::string name;     // symbolic input name that could not be resolved
    std::string context;  // where it was referenced
};

struct ReferenceCheckResult {
    bool ok = true;
    std::vector<UnresolvedSymbol> unresolved;
};

// Check that every input name referenced by the outputs function exists in
// `inputs` and, when `args` is declared, is one of its arguments.
ReferenceCheckResult validate_references(const Descriptor& descriptor);

// Inputs that are neither outputs arguments nor tool sources
std::vector<std::string> unused_inputs(const Descriptor& descriptor);

// Distinct inputs providing tools, in first-use order
std::vector<std::string> tool_inputs(const Descriptor& descriptor);

} // namespace devshell
