#include "devshell/package_set.hpp"
#include "devshell/fetch.hpp"

#include <nlohmann/json.hpp>

namespace devshell {

using json = nlohmann::json;

namespace {

std::string get_string(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

} // namespace

LookupResult PackageSet::lookup(const std::string& attr_path) const {
    LookupResult result;
    auto it = packages.find(attr_path);
    if (it == packages.end()) {
        return result;
    }

    result.found = true;
    result.reference.attr_path = attr_path;
    result.reference.name = it->second.name;
    result.reference.version = it->second.version;
    result.reference.path = it->second.path;
    result.reference.bin_dir = it->second.bin_dir;
    return result;
}

PackageSetParseResult parse_package_set(const std::string& json_str) {
    PackageSetParseResult result;
    auto& set = result.package_set;

    try {
        json j = json::parse(json_str);

        if (!j.is_object()) {
            result.error = "package set must be a JSON object";
            return result;
        }

        if (get_string(j, "$schema") != "devshell.package_set.v1") {
            result.error = "missing or invalid $schema (expected devshell.package_set.v1)";
            return result;
        }

        set.source = get_string(j, "source");
        set.rev = get_string(j, "rev");
        set.platform = get_string(j, "platform");
        if (set.rev.empty()) {
            result.error = "package set missing rev";
            return result;
        }
        if (!is_valid_revision(set.rev)) {
            result.error = "package set has invalid rev '" + set.rev + "'";
            return result;
        }
        if (set.platform.empty()) {
            result.error = "package set missing platform";
            return result;
        }

        if (!j.contains("packages") || !j["packages"].is_object()) {
            result.error = "packages missing or not an object";
            return result;
        }

        for (auto& [attr, pkg] : j["packages"].items()) {
            if (!pkg.is_object()) {
                result.error = "packages." + attr + " must be an object";
                return result;
            }
            PackageInfo info;
            info.name = get_string(pkg, "name");
            info.version = get_string(pkg, "version");
            info.path = get_string(pkg, "path");
            info.bin_dir = get_string(pkg, "bin_dir");
            if (info.path.empty()) {
                result.error = "packages." + attr + ".path missing";
                return result;
            }
            if (info.name.empty()) {
                info.name = attr;
            }
            set.packages[attr] = info;
        }

        set.nar_hash = content_hash(json_str);
        result.ok = true;

    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

} // namespace devshell
