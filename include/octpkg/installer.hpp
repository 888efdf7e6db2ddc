#pragma once

/**
 * @file installer.hpp
 * @brief Install and uninstall orchestration
 *
 * The orchestrator drives fetch -> build -> validate -> copy -> register for
 * each requested source. A batch is best effort: a package that fails is
 * reported and skipped, packages installed earlier in the same call stay
 * installed. Each package's registry change is persisted on its own, so a
 * failure never leaves a half-registered package behind.
 */

#include "octpkg/collaborators.hpp"
#include "octpkg/config.hpp"
#include "octpkg/registry.hpp"
#include "octpkg/session.hpp"

#include <string>
#include <vector>

namespace octpkg {

struct InstallOptions {
    bool no_deps = false;        // skip dependency validation
    bool prefer_local = false;   // install into the local registry
    bool prefer_global = false;  // install into the global registry
    bool force = false;          // reinstall identical name and version
};

struct UninstallOptions {
    bool no_deps = false;        // ignore installed dependents
    bool prefer_local = false;
    bool prefer_global = false;
};

struct PackageFailure {
    std::string package;   // package name, or the source locator when no name is known yet
    Error error;
};

struct InstallReport {
    std::vector<PackageRecord> installed;   // in install order
    std::vector<std::string> skipped;       // already installed at the same version
    std::vector<PackageFailure> failures;

    bool ok() const { return failures.empty(); }
};

struct UninstallReport {
    std::vector<std::string> removed;
    std::vector<PackageFailure> failures;

    bool ok() const { return failures.empty(); }
};

/// Registry a command targets: prefer_global, else prefer_local, else privilege
bool targets_global(bool prefer_local, bool prefer_global, bool privileged);

class InstallOrchestrator {
public:
    InstallOrchestrator(const Config& config,
                        Registry& local,
                        Registry& global,
                        Session& session,
                        PathActivator& activator,
                        ArchiveFetcher& fetcher,
                        BuildToolchain& toolchain);

    /**
     * @brief Install every source in `sources`
     *
     * Request level problems (a cycle among the requested packages, one name
     * requested at two versions) fail the whole call before anything is
     * installed. Everything else is a per-package failure in the report.
     */
    Result<InstallReport> install(const std::vector<std::string>& sources, const InstallOptions& options);

    /**
     * @brief Remove installed packages
     *
     * A package stays installed while any other installed package that is
     * not being removed in the same call depends on it (unless no_deps). A
     * copy of the same name in the other registry that still satisfies the
     * dependents lets the removal go ahead. The registry is persisted before
     * anything else changes; loaded packages are then deactivated and their
     * files removed.
     */
    Result<UninstallReport> uninstall(const std::vector<std::string>& names, const UninstallOptions& options);

    /// Treat the caller as privileged (system) when no registry is preferred
    void set_privileged(bool privileged) { privileged_ = privileged; }

private:
    struct Staged;

    Registry& target_registry(bool global) { return global ? global_ : local_; }
    const std::string& registry_path(bool global) const;

    Result<PackageRecord> register_package(Staged& staged, bool global);

    const Config& config_;
    Registry& local_;
    Registry& global_;
    Session& session_;
    PathActivator& activator_;
    ArchiveFetcher& fetcher_;
    BuildToolchain& toolchain_;
    bool privileged_;
};

} // namespace octpkg
