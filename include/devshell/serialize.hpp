#pragma once

#include "devshell/descriptor.hpp"
#include "devshell/resolver.hpp"

#include <string>

namespace devshell {

// ============================================================================
// JSON Output
// ============================================================================
//
// Key order is fixed and maps are emitted with sorted keys, so identical
// results serialize to identical bytes.

std::string serialize_shell_specification_json(const ShellSpecification& spec);

std::string serialize_resolution_json(const ResolutionResult& result, bool include_trace);

// {"schema": "devshell.resolution.v1", "ok": ..., "platforms": {<platform>: <result>}}
std::string serialize_resolution_set_json(const ResolutionSet& set, bool include_trace);

std::string serialize_descriptor_json(const Descriptor& descriptor);

} // namespace devshell
