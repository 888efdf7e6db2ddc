#pragma once

#include <octpkg/collaborators.hpp>
#include <octpkg/config.hpp>
#include <octpkg/platform.hpp>
#include <octpkg/types.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace octpkg::testing {

namespace fs = std::filesystem;

// Temporary directory removed when the test finishes
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("octpkg_test_" + random_hex(16));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string sub(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline Dependency dep(const std::string& name, ConstraintOp op = ConstraintOp::Any,
                      const std::string& version = "") {
    Dependency d;
    d.name = name;
    d.op = op;
    d.version = version;
    return d;
}

inline PackageRecord make_record(const std::string& name, const std::string& version,
                                 std::vector<Dependency> deps = {}) {
    PackageRecord r;
    r.name = name;
    r.version = version;
    r.directory = "/pkgs/" + name + "-" + version;
    r.dependencies = std::move(deps);
    return r;
}

inline PackageMap make_map(const std::vector<PackageRecord>& records) {
    PackageMap m;
    for (const auto& r : records) m[r.name] = r;
    return m;
}

inline std::string description_text(const std::string& name, const std::string& version,
                                    const std::string& depends = "") {
    std::string text = "Name: " + name + "\n"
                       "Version: " + version + "\n"
                       "Date: 2024-01-15\n"
                       "Author: Jane Doe\n"
                       "Maintainer: Jane Doe <jane@example.org>\n"
                       "Title: The " + name + " package\n"
                       "Description: Functions for " + name + ".\n";
    if (!depends.empty()) text += "Depends: " + depends + "\n";
    return text;
}

/**
 * Write an unpacked source package under <parent>/<name>-<version>.
 * inst/<name>_fn.m is the only provided function.
 */
inline std::string write_source_package(const std::string& parent, const std::string& name,
                                        const std::string& version, const std::string& depends = "") {
    std::string root = (fs::path(parent) / (name + "-" + version)).string();
    write_text(root + "/DESCRIPTION", description_text(name, version, depends));
    write_text(root + "/COPYING", "GPL-3.0-or-later\n");
    write_text(root + "/inst/" + name + "_fn.m", "function r = " + name + "_fn()\n  r = 1;\nend\n");
    return root;
}

// Config rooted entirely inside a temporary directory
inline Config sandbox_config(const TempDir& tmp) {
    Config config = default_config(tmp.sub("home"));
    config.prefix = tmp.sub("local/packages");
    config.archprefix = config.prefix;
    config.local_list = tmp.sub("local/registry.json");
    config.global_prefix = tmp.sub("global/packages");
    config.global_archprefix = config.global_prefix;
    config.global_list = tmp.sub("global/registry.json");
    config.session_file = tmp.sub("home/session.json");
    config.arch = "x86_64-pc-linux-gnu";
    return config;
}

// PathActivator that records every call
class RecordingActivator : public PathActivator {
public:
    void activate(const std::string& directory, const std::string& arch_directory) override {
        calls.push_back("+" + directory);
        if (!arch_directory.empty()) calls.push_back("+" + arch_directory);
    }
    void deactivate(const std::string& directory, const std::string& arch_directory) override {
        calls.push_back("-" + directory);
        if (!arch_directory.empty()) calls.push_back("-" + arch_directory);
    }

    std::vector<std::string> calls;
};

} // namespace octpkg::testing
