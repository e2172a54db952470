#include "devshell/warnings.hpp"

#include <algorithm>
#include <cctype>

namespace devshell {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

WarningCollector::WarningCollector(const HostConfig* config) {
    if (config) {
        policy_ = config->warnings;
    }
}

void WarningCollector::set_config(const HostConfig* config) {
    if (config) {
        policy_ = config->warnings;
    } else {
        policy_.clear();
    }
}

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(Warning warning) {
    emit(warning_to_string(warning), {});
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    WarningAction action = get_effective_action(warning_key);

    // Ignored warnings are still collected so has_errors() stays accurate
    warnings_.push_back({to_lower(warning_key), std::move(fields), action});
}

void WarningCollector::merge(const std::vector<WarningObject>& warnings) {
    for (const auto& w : warnings) {
        emit(w.key, w.fields);
    }
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action == WarningAction::Error;
    });
}

bool WarningCollector::has_effective_warnings() const {
    return std::any_of(warnings_.begin(), warnings_.end(), [](const CollectedWarning& w) {
        return w.effective_action != WarningAction::Ignore;
    });
}

void WarningCollector::clear() {
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    auto it = policy_.find(to_lower(key));
    if (it != policy_.end()) {
        return it->second;
    }
    return WarningAction::Warn;
}

} // namespace devshell
