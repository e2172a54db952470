#include "devshell/source_ref.hpp"

#include <cctype>
#include <vector>

namespace devshell {

namespace {

bool is_valid_host(const std::string& host) {
    if (host.empty()) return false;
    for (char c : host) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!(std::islower(u) || std::isdigit(u) || c == '+' || c == '.' || c == '-')) {
            return false;
        }
    }
    return true;
}

bool is_valid_segment(const std::string& segment) {
    if (segment.empty() || segment == "." || segment == "..") return false;
    for (char c : segment) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::iscntrl(u) || std::isspace(u) || c == ':' || c == '\\' || c == '/') {
            return false;
        }
    }
    return true;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t next = s.find(delim, start);
        if (next == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, next - start));
        start = next + 1;
    }
    return parts;
}

} // namespace

std::string SourceReference::to_string() const {
    std::string result = host + ":" + owner + "/" + repo;
    if (!ref.empty()) {
        result += "/" + ref;
    }
    return result;
}

std::string SourceReference::selector() const {
    if (!rev.empty()) return rev;
    if (!ref.empty()) return ref;
    return "HEAD";
}

std::string SourceReference::cache_key() const {
    return host + "/" + owner + "/" + repo + "/" + selector();
}

bool is_valid_revision(const std::string& rev) {
    return is_valid_segment(rev);
}

SourceReferenceParseResult parse_source_reference(const std::string& s) {
    SourceReferenceParseResult result;

    auto colon = s.find(':');
    if (colon == std::string::npos) {
        result.error = "missing '<host>:' prefix in source reference: " + s;
        return result;
    }

    auto& ref = result.reference;
    ref.host = s.substr(0, colon);
    if (!is_valid_host(ref.host)) {
        result.error = "invalid host in source reference: " + s;
        return result;
    }

    auto segments = split(s.substr(colon + 1), '/');
    if (segments.size() < 2) {
        result.error = "expected <owner>/<repo> in source reference: " + s;
        return result;
    }

    for (const auto& segment : segments) {
        if (!is_valid_segment(segment)) {
            result.error = "invalid path segment '" + segment + "' in source reference: " + s;
            return result;
        }
    }

    ref.owner = segments[0];
    ref.repo = segments[1];

    // Branch names may themselves contain '/' (release/23.11)
    for (size_t i = 2; i < segments.size(); ++i) {
        if (i > 2) ref.ref += "/";
        ref.ref += segments[i];
    }

    result.ok = true;
    return result;
}

} // namespace devshell
