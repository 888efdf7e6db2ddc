#pragma once

/**
 * @file collaborators.hpp
 * @brief Interfaces to the side-effecting steps the engine drives
 *
 * The orchestrators never download, compile or touch the interpreter's
 * search path themselves; they call these interfaces. Default
 * implementations live in fetcher.hpp, builder.hpp and session.hpp.
 */

#include "octpkg/description.hpp"
#include "octpkg/types.hpp"

#include <string>
#include <vector>

namespace octpkg {

// ============================================================================
// Archive fetcher
// ============================================================================

class ArchiveFetcher {
public:
    virtual ~ArchiveFetcher() = default;

    /// Make the package sources named by `locator` available below
    /// `staging_dir`; returns the path holding the unpacked tree
    /// (FetchError on failure).
    virtual Result<std::string> fetch(const std::string& locator, const std::string& staging_dir) = 0;
};

// ============================================================================
// Native build toolchain
// ============================================================================

struct BuildManifest {
    Description description;
    std::string package_root;                // unpacked source tree
    std::string inst_dir;                    // <root>/inst, may not exist
    std::vector<std::string> provided_files; // relative to package_root
    std::vector<std::string> arch_files;     // compiled outputs, relative to package_root
};

class BuildToolchain {
public:
    virtual ~BuildToolchain() = default;

    /// Build the staged sources; BuildError on failure
    virtual Result<BuildManifest> build(const std::string& staging_path) = 0;
};

// ============================================================================
// Path activator
// ============================================================================

class PathActivator {
public:
    virtual ~PathActivator() = default;

    /// Add directories to the search path; repeated activation is a no-op
    virtual void activate(const std::string& directory, const std::string& arch_directory) = 0;

    virtual void deactivate(const std::string& directory, const std::string& arch_directory) = 0;
};

// ============================================================================
// Remote index
// ============================================================================

class RemoteIndex {
public:
    virtual ~RemoteIndex() = default;

    /// Latest published version; NotFoundError when unknown
    virtual Result<std::string> latest_version(const std::string& name) = 0;

    /// Locator from which `name` at `version` can be fetched
    virtual Result<std::string> download_url(const std::string& name, const std::string& version) = 0;

    /// Names of every published package
    virtual Result<std::vector<std::string>> list_packages() = 0;
};

// ============================================================================
// Test runner
// ============================================================================

struct TestOutcome {
    bool passed = false;
    int exit_code = -1;
    std::string detail;
};

class TestRunner {
public:
    virtual ~TestRunner() = default;

    /// Run the self tests found in `directories`; `search_path` is the
    /// path the package was loaded with (front entry first)
    virtual Result<TestOutcome> run(const std::string& package,
                                    const std::vector<std::string>& directories,
                                    const std::vector<std::string>& search_path) = 0;
};

} // namespace octpkg
