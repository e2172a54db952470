#pragma once

#include <string>

namespace devshell {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;  // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::string& data);

// "sha256-<hex>" content hash recorded for package sets and in lock files
std::string content_hash(const std::string& data);

// ============================================================================
// Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    std::string body;
    long http_status = 0;
    bool transient = false;  // network failure, timeout, 408, 429 or 5xx
};

// Fetch a location:
//   - file:<path>    read from the local filesystem
//   - https://...    fetched with TLS verification
// Plain http:// is rejected.
FetchResult fetch_location(const std::string& location, int timeout_seconds);

FetchResult fetch_https(const std::string& url, int timeout_seconds);

} // namespace devshell
