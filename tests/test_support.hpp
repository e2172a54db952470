#pragma once

#include <devshell/package_set.hpp>
#include <devshell/platform.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace devshell::testing {

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("devshell_test_" + std::to_string(rd()) + "_" + std::to_string(counter_++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
    static inline std::atomic<int> counter_{0};
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline PackageSet make_package_set(const std::string& platform, const std::string& rev,
                                   const std::map<std::string, std::string>& packages) {
    PackageSet set;
    set.source = "github:NixOS/nixpkgs/release-23.11";
    set.rev = rev;
    set.platform = platform;
    set.nar_hash = "sha256-" + rev;
    for (const auto& [attr, name] : packages) {
        set.packages[attr] = PackageInfo{name, "1.0", "/nix/store/" + rev + "-" + platform + "-" + name, "bin"};
    }
    return set;
}

// Index document in the format served by mirrors
inline std::string package_set_json(const std::string& platform, const std::string& rev,
                                    const std::string& attr = "stdenv.cc",
                                    const std::string& name = "gcc-wrapper-12.3.0") {
    return R"({
        "$schema": "devshell.package_set.v1",
        "source": "github:NixOS/nixpkgs/release-23.11",
        "rev": ")" + rev + R"(",
        "platform": ")" + platform + R"(",
        "packages": {
            ")" + attr + R"(": {
                "name": ")" + name + R"(",
                "version": "12.3.0",
                "path": "/nix/store/)" + rev + "-" + platform + "-" + name + R"(",
                "bin_dir": "bin"
            }
        }
    })";
}

// In-memory evaluator keyed by "<reference>|<platform>"
class FakeSnapshotEvaluator : public PackageSnapshotEvaluator {
public:
    void add(const std::string& reference, const PackageSet& set) {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_[reference + "|" + set.platform] = set;
    }

    void make_unreachable(const std::string& host) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreachable_hosts_.insert(host);
    }

    ImportResult import_snapshot(const SourceReference& ref,
                                 const Platform& platform) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        threads_.insert(std::this_thread::get_id());
        imported_.push_back(ref.to_string() + "|" + platform.to_string());

        ImportResult result;
        if (unreachable_hosts_.count(ref.host)) {
            result.error = "could not resolve host " + ref.host;
            result.transient = true;
            return result;
        }

        auto it = snapshots_.find(ref.to_string() + "|" + platform.to_string());
        if (it == snapshots_.end()) {
            result.error = "no snapshot for " + ref.to_string();
            return result;
        }
        if (ref.is_pinned() && it->second.rev != ref.rev) {
            result.error = "rev mismatch";
            return result;
        }

        result.package_set = it->second;
        result.ok = true;
        return result;
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::vector<std::string> imported() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return imported_;
    }

    // Threads import_snapshot was called on
    std::set<std::thread::id> threads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return threads_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, PackageSet> snapshots_;
    std::set<std::string> unreachable_hosts_;
    mutable int calls_ = 0;
    mutable std::vector<std::string> imported_;
    mutable std::set<std::thread::id> threads_;
};

} // namespace devshell::testing
