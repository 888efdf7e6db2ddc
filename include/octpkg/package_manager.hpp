#pragma once

/**
 * @file package_manager.hpp
 * @brief Entry point tying registries, session and collaborators together
 *
 * @example
 * ```cpp
 * auto config = octpkg::load_config();
 * auto pm = octpkg::PackageManager::open(config.value());
 * if (pm.isOk()) {
 *     auto report = pm.value()->load({"control"}, false);
 * }
 * ```
 */

#include "octpkg/collaborators.hpp"
#include "octpkg/config.hpp"
#include "octpkg/describe.hpp"
#include "octpkg/installer.hpp"
#include "octpkg/loader.hpp"
#include "octpkg/rebuild.hpp"
#include "octpkg/registry.hpp"
#include "octpkg/session.hpp"
#include "octpkg/updater.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace octpkg {

struct PackageTestResult {
    std::string name;
    bool passed = false;
    std::string detail;
};

struct RebuildReport {
    std::vector<std::string> names;     // packages in the rebuilt registry
    std::vector<std::string> warnings;
    bool global = false;
};

class PackageManager {
public:
    /**
     * @brief Load both registries and the session
     *
     * A corrupt registry is fatal: the command cannot safely proceed (see
     * rebuild()).
     */
    static Result<std::unique_ptr<PackageManager>> open(const Config& config);

    /// Regenerate a registry from the installed directories; works on a corrupt registry
    static Result<RebuildReport> rebuild(const Config& config,
                                         const std::vector<std::string>& names,
                                         bool global);

    const Config& config() const { return config_; }
    Registry& local() { return local_; }
    Registry& global() { return global_; }
    Session& session() { return session_; }
    const Session& session() const { return session_; }

    PackageMap effective() const { return effective_set(local_, global_); }
    std::set<std::string> loaded() const { return session_.loaded_set(); }

    // Collaborators; defaults are created on first use
    void set_fetcher(std::unique_ptr<ArchiveFetcher> fetcher) { fetcher_ = std::move(fetcher); }
    void set_toolchain(std::unique_ptr<BuildToolchain> toolchain) { toolchain_ = std::move(toolchain); }
    void set_remote_index(std::unique_ptr<RemoteIndex> index) { index_ = std::move(index); }
    void set_test_runner(std::unique_ptr<TestRunner> runner) { test_runner_ = std::move(runner); }
    void set_verbose(bool verbose) { verbose_ = verbose; }
    void set_privileged(bool privileged) { privileged_ = privileged; }

    /// Install sources; with `forge` each source is a package name looked up in the index
    Result<InstallReport> install(const std::vector<std::string>& sources,
                                  const InstallOptions& options,
                                  bool forge = false);

    Result<UninstallReport> uninstall(const std::vector<std::string>& names,
                                      const UninstallOptions& options);

    /// "all" loads every installed package, "auto" the autoload ones
    Result<LoadReport> load(const std::vector<std::string>& names, bool allow_missing);

    /// "all" unloads every loaded package
    Result<std::vector<std::string>> unload(const std::vector<std::string>& names, bool allow_missing);

    PackageListing list(const std::vector<std::string>& names = {}) const;

    /// Names of every package in the remote index
    Result<std::vector<std::string>> list_forge();

    Result<std::vector<PackageDescription>> describe(const std::vector<std::string>& names,
                                                     bool verbose,
                                                     bool allow_unknown) const;

    Result<UpdateReport> update(const std::vector<std::string>& names, const InstallOptions& options);

    /// Run package self tests; the session is left as it was
    Result<std::vector<PackageTestResult>> test(const std::vector<std::string>& names);

    Result<void> save_session() const;

private:
    explicit PackageManager(Config config);

    ArchiveFetcher& fetcher();
    BuildToolchain& toolchain();
    RemoteIndex& remote_index();
    TestRunner& test_runner();
    InstallOrchestrator make_orchestrator();

    Config config_;
    Registry local_{Installer::User};
    Registry global_{Installer::System};
    Session session_;
    bool verbose_ = false;
    bool privileged_ = false;

    std::unique_ptr<ArchiveFetcher> fetcher_;
    std::unique_ptr<BuildToolchain> toolchain_;
    std::unique_ptr<RemoteIndex> index_;
    std::unique_ptr<TestRunner> test_runner_;
};

} // namespace octpkg
