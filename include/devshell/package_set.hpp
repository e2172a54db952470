#pragma once

#include "devshell/platform.hpp"
#include "devshell/source_ref.hpp"
#include "devshell/types.hpp"

#include <map>
#include <string>

namespace devshell {

// ============================================================================
// Package Set
// ============================================================================
//
// The evaluated contents of one snapshot for one platform, as served by a
// package-set index:
//
//     {
//       "$schema": "devshell.package_set.v1",
//       "source": "github:NixOS/nixpkgs/release-23.11",
//       "rev": "057f9aecfb71c4437d2b27d3323df7f93c010b7e",
//       "platform": "x86_64-linux",
//       "packages": {
//         "stdenv.cc": {
//           "name": "gcc-wrapper-12.3.0",
//           "version": "12.3.0",
//           "path": "/nix/store/...-gcc-wrapper-12.3.0",
//           "bin_dir": "bin"
//         }
//       }
//     }

struct PackageInfo {
    std::string name;
    std::string version;
    std::string path;
    std::string bin_dir;
};

struct LookupResult {
    bool found = false;
    ToolReference reference;  // tool_id and input are left to the caller
};

struct PackageSet {
    std::string source;
    std::string rev;
    std::string platform;
    std::string nar_hash;  // sha256-<hex> of the index bytes
    std::map<std::string, PackageInfo> packages;

    LookupResult lookup(const std::string& attr_path) const;
};

struct PackageSetParseResult {
    bool ok = false;
    std::string error;
    PackageSet package_set;
};

PackageSetParseResult parse_package_set(const std::string& json_str);

// ============================================================================
// Package Snapshot Evaluator
// ============================================================================

struct ImportResult {
    bool ok = false;
    std::string error;
    bool transient = false;  // worth retrying
    PackageSet package_set;
};

// Imports the snapshot a source reference designates, evaluated for one
// platform. Implementations must be safe to call from several threads.
class PackageSnapshotEvaluator {
public:
    virtual ~PackageSnapshotEvaluator() = default;

    virtual ImportResult import_snapshot(const SourceReference& ref,
                                         const Platform& platform) const = 0;
};

} // namespace devshell
