#include "devshell/serialize.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace devshell {

namespace {

using ordered_json = nlohmann::ordered_json;

template<typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys;
    for (const auto& [k, _] : map) {
        keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

template<typename Map>
ordered_json sorted_string_map(const Map& map) {
    ordered_json obj = ordered_json::object();
    for (const auto& k : sorted_keys(map)) {
        obj[k] = map.at(k);
    }
    return obj;
}

ordered_json spec_to_json(const ShellSpecification& spec) {
    ordered_json j;
    j["platform"] = spec.platform;

    ordered_json tools = ordered_json::array();
    for (const auto& tool : spec.tools) {
        ordered_json t;
        t["tool_id"] = tool.tool_id;
        t["input"] = tool.input;
        t["attr_path"] = tool.attr_path;
        t["name"] = tool.name;
        t["version"] = tool.version;
        t["path"] = tool.path;
        t["bin_dir"] = tool.bin_dir;
        tools.push_back(t);
    }
    j["tools"] = tools;
    j["inputs"] = sorted_string_map(spec.inputs);
    j["env"] = sorted_string_map(spec.env);
    j["shell_hook"] = spec.shell_hook;
    return j;
}

ordered_json warnings_to_json(const std::vector<WarningObject>& warnings) {
    ordered_json arr = ordered_json::array();
    for (const auto& w : warnings) {
        ordered_json obj;
        obj["key"] = w.key;
        obj["action"] = w.action;
        obj["fields"] = sorted_string_map(w.fields);
        arr.push_back(obj);
    }
    return arr;
}

ordered_json result_to_json(const ResolutionResult& result, bool include_trace) {
    ordered_json j;
    j["ok"] = result.ok;
    j["platform"] = result.platform;

    if (result.ok) {
        j["spec"] = spec_to_json(result.spec);
    } else {
        j["error"] = result.error ? resolve_error_to_string(*result.error) : "UNKNOWN";
        j["error_context"] = result.error_context;
    }

    j["warnings"] = warnings_to_json(result.warnings);

    if (include_trace && result.trace.has_value()) {
        ordered_json trace = ordered_json::object();
        for (const auto& tool : sorted_keys(*result.trace)) {
            const auto& entry = result.trace->at(tool);
            trace[tool]["input"] = entry.input;
            trace[tool]["source"] = entry.source;
            trace[tool]["rev"] = entry.rev;
            trace[tool]["nar_hash"] = entry.nar_hash;
        }
        j["trace"] = trace;
    }

    return j;
}

} // namespace

std::string serialize_shell_specification_json(const ShellSpecification& spec) {
    return spec_to_json(spec).dump(2);
}

std::string serialize_resolution_json(const ResolutionResult& result, bool include_trace) {
    ordered_json j;
    j["schema"] = "devshell.resolution.v1";
    for (auto& [key, value] : result_to_json(result, include_trace).items()) {
        j[key] = value;
    }
    return j.dump(2);
}

std::string serialize_resolution_set_json(const ResolutionSet& set, bool include_trace) {
    ordered_json j;
    j["schema"] = "devshell.resolution.v1";
    j["ok"] = set.all_ok();

    ordered_json platforms = ordered_json::object();
    for (const auto& [platform, result] : set.results) {
        platforms[platform] = result_to_json(result, include_trace);
    }
    j["platforms"] = platforms;
    return j.dump(2);
}

std::string serialize_descriptor_json(const Descriptor& descriptor) {
    ordered_json j;
    j["description"] = descriptor.description;

    ordered_json inputs = ordered_json::object();
    for (const auto& [name, input] : descriptor.inputs) {
        ordered_json in;
        in["url"] = input.url;
        in["host"] = input.reference.host;
        in["owner"] = input.reference.owner;
        in["repo"] = input.reference.repo;
        in["ref"] = input.reference.ref;
        if (input.reference.is_pinned()) {
            in["rev"] = input.reference.rev;
        }
        inputs[name] = in;
    }
    j["inputs"] = inputs;

    const auto& outputs = descriptor.outputs;
    j["outputs"]["args"] = outputs.args;
    j["outputs"]["systems"] = outputs.systems;
    j["outputs"]["devShell"]["packages"] = outputs.dev_shell.packages;
    j["outputs"]["devShell"]["buildInputs"] = outputs.dev_shell.build_inputs;
    j["outputs"]["devShell"]["shellHook"] = outputs.dev_shell.shell_hook;
    j["outputs"]["devShell"]["env"] = sorted_string_map(outputs.dev_shell.env);
    return j.dump(2);
}

} // namespace devshell
