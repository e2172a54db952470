#include "devshell/descriptor.hpp"
#include "devshell/platform.hpp"

#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>

namespace devshell {

using json = nlohmann::json;

namespace {

const std::set<std::string> KNOWN_TOP_LEVEL_KEYS = {
    "$schema", "description", "inputs", "outputs"
};

// Parses a JSON array of strings; a non-array or non-string element is a schema error
bool read_string_array(const json& j, const std::string& field,
                       std::vector<std::string>& out, std::string& error) {
    if (!j.is_array()) {
        error = field + " must be an array of strings";
        return false;
    }
    for (const auto& elem : j) {
        if (!elem.is_string()) {
            error = field + " must be an array of strings";
            return false;
        }
        out.push_back(elem.get<std::string>());
    }
    return true;
}

bool parse_input(const std::string& name, const json& j, InputDecl& out, std::string& error) {
    out.name = name;

    if (j.is_string()) {
        out.url = j.get<std::string>();
    } else if (j.is_object() && j.contains("url") && j["url"].is_string()) {
        out.url = j["url"].get<std::string>();
    } else {
        error = "inputs." + name + " must be a source reference string or an object with a url";
        return false;
    }

    auto parsed = parse_source_reference(out.url);
    if (!parsed.ok) {
        error = "inputs." + name + ": " + parsed.error;
        return false;
    }
    out.reference = parsed.reference;
    return true;
}

bool parse_dev_shell(const json& j, ShellDecl& out, std::string& error) {
    if (!j.is_object()) {
        error = "outputs.devShell must be an object";
        return false;
    }

    if (j.contains("packages")) {
        if (!j["packages"].is_string() || j["packages"].get<std::string>().empty()) {
            error = "outputs.devShell.packages must be a non-empty string";
            return false;
        }
        out.packages = j["packages"].get<std::string>();
    }

    if (!j.contains("buildInputs")) {
        error = "outputs.devShell.buildInputs missing";
        return false;
    }
    if (!read_string_array(j["buildInputs"], "outputs.devShell.buildInputs",
                           out.build_inputs, error)) {
        return false;
    }
    for (const auto& tool : out.build_inputs) {
        if (!parse_tool_id(tool, out.packages)) {
            error = "outputs.devShell.buildInputs: invalid tool identifier '" + tool + "'";
            return false;
        }
    }

    if (j.contains("shellHook")) {
        if (!j["shellHook"].is_string()) {
            error = "outputs.devShell.shellHook must be a string";
            return false;
        }
        out.shell_hook = j["shellHook"].get<std::string>();
    }

    if (j.contains("env")) {
        if (!j["env"].is_object()) {
            error = "outputs.devShell.env must be an object";
            return false;
        }
        for (auto& [key, val] : j["env"].items()) {
            if (!val.is_string()) {
                error = "outputs.devShell.env." + key + " must be a string";
                return false;
            }
            out.env[key] = val.get<std::string>();
        }
    }

    return true;
}

bool parse_outputs(const json& j, OutputsDecl& out, std::string& error) {
    if (!j.is_object()) {
        error = "outputs must be an object";
        return false;
    }

    if (j.contains("args") && !read_string_array(j["args"], "outputs.args", out.args, error)) {
        return false;
    }

    if (j.contains("systems")) {
        if (!read_string_array(j["systems"], "outputs.systems", out.systems, error)) {
            return false;
        }
        for (const auto& system : out.systems) {
            if (!parse_platform(system)) {
                error = "outputs.systems: unknown platform '" + system + "'";
                return false;
            }
        }
    }

    if (!j.contains("devShell")) {
        error = "outputs.devShell missing";
        return false;
    }
    return parse_dev_shell(j["devShell"], out.dev_shell, error);
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

std::optional<ToolId> parse_tool_id(const std::string& tool, const std::string& default_input) {
    ToolId id;
    auto hash = tool.find('#');
    if (hash == std::string::npos) {
        id.input = default_input;
        id.attr_path = tool;
    } else {
        id.input = tool.substr(0, hash);
        id.attr_path = tool.substr(hash + 1);
    }

    if (id.input.empty() || id.attr_path.empty()) {
        return std::nullopt;
    }
    if (id.attr_path.front() == '.' || id.attr_path.back() == '.' ||
        id.attr_path.find("..") != std::string::npos) {
        return std::nullopt;
    }
    return id;
}

ParseResult<Descriptor> parse_descriptor(const std::string& json_str,
                                         const std::string& source_path) {
    ParseResult<Descriptor> result;
    auto& descriptor = result.value;
    descriptor.source_path = source_path;

    try {
        json j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "descriptor must be a JSON object";
            return result;
        }

        for (auto& [key, _] : j.items()) {
            if (KNOWN_TOP_LEVEL_KEYS.count(key) == 0) {
                result.warnings.push_back({
                    warning_to_string(Warning::unknown_descriptor_key), "warn",
                    {{"key", key}, {"source_path", source_path}}
                });
            }
        }

        if (!j.contains("description")) {
            result.error = "description missing";
            return result;
        }
        if (!j["description"].is_string()) {
            result.error = "description must be a string";
            return result;
        }
        descriptor.description = j["description"].get<std::string>();

        if (!j.contains("inputs") || !j["inputs"].is_object()) {
            result.error = "inputs missing or not an object";
            return result;
        }
        for (auto& [name, val] : j["inputs"].items()) {
            if (name == SELF_INPUT) {
                result.error = "inputs.self is reserved";
                return result;
            }
            InputDecl input;
            if (!parse_input(name, val, input, result.error)) {
                return result;
            }
            descriptor.inputs[name] = input;
        }

        if (!j.contains("outputs")) {
            result.error = "outputs missing";
            return result;
        }
        if (!parse_outputs(j["outputs"], descriptor.outputs, result.error)) {
            return result;
        }

        result.ok = true;

    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

ParseResult<Descriptor> load_descriptor_file(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        ParseResult<Descriptor> result;
        result.error = "failed to read descriptor: " + path;
        return result;
    }
    return parse_descriptor(*content, path);
}

ReferenceCheckResult validate_references(const Descriptor& descriptor) {
    ReferenceCheckResult result;
    const auto& outputs = descriptor.outputs;

    auto unresolved = [&result](const std::string& name, const std::string& context) {
        result.ok = false;
        result.unresolved.push_back({name, context});
    };

    for (const auto& arg : outputs.args) {
        if (arg != SELF_INPUT && descriptor.inputs.count(arg) == 0) {
            unresolved(arg, "outputs.args");
        }
    }

    for (const auto& tool : outputs.dev_shell.build_inputs) {
        auto id = parse_tool_id(tool, outputs.dev_shell.packages);
        if (!id) continue;  // rejected at load time

        if (descriptor.inputs.count(id->input) == 0) {
            unresolved(id->input, "outputs.devShell.buildInputs: " + tool);
        } else if (!outputs.args.empty() && !contains(outputs.args, id->input)) {
            unresolved(id->input, "outputs.devShell.buildInputs: " + tool +
                                  " (not an argument of outputs)");
        }
    }

    return result;
}

std::vector<std::string> tool_inputs(const Descriptor& descriptor) {
    std::vector<std::string> result;
    const auto& shell = descriptor.outputs.dev_shell;
    for (const auto& tool : shell.build_inputs) {
        auto id = parse_tool_id(tool, shell.packages);
        if (id && !contains(result, id->input)) {
            result.push_back(id->input);
        }
    }
    return result;
}

std::vector<std::string> unused_inputs(const Descriptor& descriptor) {
    std::vector<std::string> result;
    auto used = tool_inputs(descriptor);
    for (const auto& [name, _] : descriptor.inputs) {
        if (contains(used, name)) continue;
        if (!descriptor.outputs.args.empty() && contains(descriptor.outputs.args, name)) continue;
        result.push_back(name);
    }
    return result;
}

} // namespace devshell
