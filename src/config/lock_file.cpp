#include "devshell/lock_file.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace devshell {

using json = nlohmann::json;

ParseResult<LockFile> parse_lock_file(const std::string& json_str,
                                      const std::string& source_path) {
    ParseResult<LockFile> result;
    auto& lock = result.value;

    try {
        json j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "lock file must be a JSON object";
            return result;
        }

        if (!j.contains("version") || !j["version"].is_number_integer()) {
            result.error = "lock file version missing";
            return result;
        }
        lock.version = j["version"].get<int>();
        if (lock.version != LOCK_FILE_VERSION) {
            result.error = "unsupported lock file version " + std::to_string(lock.version);
            return result;
        }

        if (!j.contains("nodes") || !j["nodes"].is_object()) {
            result.error = "nodes missing or not an object";
            return result;
        }

        for (auto& [name, node] : j["nodes"].items()) {
            if (!node.is_object() || !node.contains("original") || !node["original"].is_string() ||
                !node.contains("locked") || !node["locked"].is_object()) {
                result.error = "nodes." + name + " must have original and locked";
                return result;
            }
            const auto& locked = node["locked"];
            if (!locked.contains("rev") || !locked["rev"].is_string() ||
                locked["rev"].get<std::string>().empty()) {
                result.error = "nodes." + name + ".locked.rev missing";
                return result;
            }

            LockedInput input;
            input.original = node["original"].get<std::string>();
            input.rev = locked["rev"].get<std::string>();
            if (!is_valid_revision(input.rev)) {
                result.error = "nodes." + name + ".locked.rev is not a valid revision: " + input.rev;
                return result;
            }
            if (locked.contains("nar_hash") && locked["nar_hash"].is_string()) {
                input.nar_hash = locked["nar_hash"].get<std::string>();
            }
            lock.nodes[name] = input;
        }

        result.ok = true;

    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error in ") +
                       (source_path.empty() ? "lock file" : source_path) + ": " + e.what();
    }

    return result;
}

ParseResult<LockFile> load_lock_file(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        ParseResult<LockFile> result;
        result.error = "failed to read lock file: " + path;
        return result;
    }
    return parse_lock_file(*content, path);
}

std::string serialize_lock_file(const LockFile& lock) {
    json nodes = json::object();
    for (const auto& [name, input] : lock.nodes) {
        nodes[name] = {
            {"original", input.original},
            {"locked", {{"rev", input.rev}, {"nar_hash", input.nar_hash}}}
        };
    }

    json j = {{"version", lock.version}, {"nodes", nodes}};
    return j.dump(2) + "\n";
}

AtomicWriteResult write_lock_file(const std::string& path, const LockFile& lock) {
    return atomic_write_file(path, serialize_lock_file(lock));
}

std::string lock_path_for(const std::string& descriptor_path) {
    return join_path(get_parent_directory(descriptor_path), LOCK_FILE_NAME);
}

LockResult create_lock(const Descriptor& descriptor,
                       const PackageSnapshotEvaluator& evaluator,
                       const Platform& platform) {
    LockResult result;

    for (const auto& name : tool_inputs(descriptor)) {
        auto it = descriptor.inputs.find(name);
        if (it == descriptor.inputs.end()) {
            result.error = "input '" + name + "' is not declared in inputs";
            return result;
        }

        auto imported = evaluator.import_snapshot(it->second.reference, platform);
        if (!imported.ok) {
            result.error = "input '" + name + "' (" + it->second.url + "): " + imported.error;
            return result;
        }

        LockedInput locked;
        locked.original = it->second.url;
        locked.rev = imported.package_set.rev;
        locked.nar_hash = imported.package_set.nar_hash;
        result.lock.nodes[name] = locked;
    }

    result.ok = true;
    return result;
}

Descriptor apply_lock(const Descriptor& descriptor, const LockFile& lock,
                      WarningCollector& collector) {
    Descriptor locked = descriptor;
    auto used = tool_inputs(descriptor);

    for (auto& [name, input] : locked.inputs) {
        auto node = lock.nodes.find(name);
        if (node == lock.nodes.end()) {
            if (std::find(used.begin(), used.end(), name) != used.end()) {
                collector.emit(Warning::lock_missing, {{"input", name}});
            }
            continue;
        }

        if (node->second.original != input.url) {
            collector.emit(Warning::lock_stale,
                          warnings::lock_stale(name, node->second.original, input.url));
            continue;
        }

        input.reference.rev = node->second.rev;
    }

    return locked;
}

} // namespace devshell
