#pragma once

#include <string>

namespace devshell {

// ============================================================================
// Source Reference
// ============================================================================
//
// Identifies a package-repository snapshot:
//
//     <host>:<owner>/<repo>[/<ref>]
//
// e.g. github:NixOS/nixpkgs/release-23.11. An empty ref means the
// repository's default branch. `rev` is never part of the string form; it is
// filled in from the lock file and pins the reference to one snapshot.

struct SourceReference {
    std::string host;
    std::string owner;
    std::string repo;
    std::string ref;
    std::string rev;

    bool is_pinned() const { return !rev.empty(); }

    // The original "<host>:<owner>/<repo>[/<ref>]" form
    std::string to_string() const;

    // Ref or rev used to address the snapshot: rev if pinned, else ref, else HEAD
    std::string selector() const;

    // <host>/<owner>/<repo>/<selector>, used as a cache directory
    std::string cache_key() const;
};

inline bool operator==(const SourceReference& a, const SourceReference& b) {
    return a.host == b.host && a.owner == b.owner && a.repo == b.repo &&
           a.ref == b.ref && a.rev == b.rev;
}

inline bool operator!=(const SourceReference& a, const SourceReference& b) {
    return !(a == b);
}

struct SourceReferenceParseResult {
    bool ok = false;
    std::string error;
    SourceReference reference;
};

SourceReferenceParseResult parse_source_reference(const std::string& s);

// A rev names one directory in the snapshot cache and on mirrors: non-empty,
// not "." or "..", no '/', '\\', ':', whitespace or control characters
bool is_valid_revision(const std::string& rev);

} // namespace devshell
