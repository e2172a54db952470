#pragma once

#include "devshell/descriptor.hpp"
#include "devshell/package_set.hpp"
#include "devshell/platform.hpp"
#include "devshell/warnings.hpp"

#include <map>
#include <string>

namespace devshell {

// ============================================================================
// Lock File (devshell.lock, next to the descriptor)
// ============================================================================
//
//     {
//       "version": 1,
//       "nodes": {
//         "nixpkgs": {
//           "original": "github:NixOS/nixpkgs/release-23.11",
//           "locked": { "rev": "057f9ae...", "nar_hash": "sha256-..." }
//         }
//       }
//     }

constexpr int LOCK_FILE_VERSION = 1;
constexpr const char* LOCK_FILE_NAME = "devshell.lock";

struct LockedInput {
    std::string original;  // source reference as written in the descriptor
    std::string rev;
    std::string nar_hash;  // index hash for the platform the lock was created on
};

struct LockFile {
    int version = LOCK_FILE_VERSION;
    std::map<std::string, LockedInput> nodes;
};

ParseResult<LockFile> parse_lock_file(const std::string& json_str,
                                      const std::string& source_path = "");

ParseResult<LockFile> load_lock_file(const std::string& path);

// Deterministic, pretty-printed form written to disk
std::string serialize_lock_file(const LockFile& lock);

AtomicWriteResult write_lock_file(const std::string& path, const LockFile& lock);

// <directory of descriptor>/devshell.lock
std::string lock_path_for(const std::string& descriptor_path);

struct LockResult {
    bool ok = false;
    std::string error;
    LockFile lock;
};

// Import the current snapshot of every tool input for `platform` and record
// its rev and hash.
LockResult create_lock(const Descriptor& descriptor,
                       const PackageSnapshotEvaluator& evaluator,
                       const Platform& platform);

// Copy of `descriptor` whose input references carry the locked revs. A node
// whose `original` no longer matches the declared URL is not applied
// (lock_stale); a tool input without a node is reported as lock_missing.
Descriptor apply_lock(const Descriptor& descriptor, const LockFile& lock,
                      WarningCollector& collector);

} // namespace devshell
