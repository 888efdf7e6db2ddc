#include "octpkg/package_manager.hpp"
#include "octpkg/builder.hpp"
#include "octpkg/fetcher.hpp"
#include "octpkg/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace octpkg {

namespace {

bool same_session(const Session& a, const Session& b) {
    return a.loaded == b.loaded && a.path.entries() == b.path.entries();
}

} // namespace

PackageManager::PackageManager(Config config)
    : config_(std::move(config)), privileged_(is_privileged_user()) {}

Result<std::unique_ptr<PackageManager>> PackageManager::open(const Config& config) {
    using R = Result<std::unique_ptr<PackageManager>>;

    std::unique_ptr<PackageManager> pm(new PackageManager(config));

    auto local = load_registry(config.local_list, Installer::User);
    if (local.isErr()) return R::err(local.error());
    pm->local_ = std::move(local.value());

    auto global = load_registry(config.global_list, Installer::System);
    if (global.isErr()) return R::err(global.error());
    pm->global_ = std::move(global.value());

    auto session = load_session(config.session_file);
    if (session.isErr()) return R::err(session.error());
    pm->session_ = std::move(session.value());

    spdlog::debug("opened registries: {} local, {} global, {} loaded",
                  pm->local_.size(), pm->global_.size(), pm->session_.loaded.size());
    return R::ok(std::move(pm));
}

// ============================================================================
// Collaborators
// ============================================================================

ArchiveFetcher& PackageManager::fetcher() {
    if (!fetcher_) fetcher_ = std::make_unique<DefaultArchiveFetcher>();
    return *fetcher_;
}

BuildToolchain& PackageManager::toolchain() {
    if (!toolchain_) {
        ToolchainOptions options;
        options.make_program = config_.make_program;
        options.mkoctfile = config_.mkoctfile;
        options.verbose = verbose_;
        toolchain_ = std::make_unique<MakeToolchain>(options);
    }
    return *toolchain_;
}

RemoteIndex& PackageManager::remote_index() {
    if (!index_) index_ = std::make_unique<ForgeIndex>(config_.forge_url);
    return *index_;
}

TestRunner& PackageManager::test_runner() {
    if (!test_runner_) test_runner_ = std::make_unique<InterpreterTestRunner>(config_.test_command, verbose_);
    return *test_runner_;
}

InstallOrchestrator PackageManager::make_orchestrator() {
    InstallOrchestrator orchestrator(config_, local_, global_, session_, session_.path,
                                     fetcher(), toolchain());
    orchestrator.set_privileged(privileged_);
    return orchestrator;
}

// ============================================================================
// Install / uninstall
// ============================================================================

Result<InstallReport> PackageManager::install(const std::vector<std::string>& sources,
                                              const InstallOptions& options,
                                              bool forge) {
    using R = Result<InstallReport>;

    InstallReport prepared;
    std::vector<std::string> locators;

    if (forge) {
        PackageMap installed = effective();
        for (const auto& name : sources) {
            auto latest = remote_index().latest_version(name);
            if (latest.isErr()) {
                prepared.failures.push_back({name, latest.error()});
                continue;
            }

            auto it = installed.find(name);
            if (!options.force && it != installed.end() && it->second.version == latest.value()) {
                spdlog::info("{} {} is already installed", name, latest.value());
                prepared.skipped.push_back(name);
                continue;
            }

            auto url = remote_index().download_url(name, latest.value());
            if (url.isErr()) {
                prepared.failures.push_back({name, url.error()});
                continue;
            }
            locators.push_back(url.value());
        }
    } else {
        locators = sources;
    }

    if (locators.empty()) return R::ok(std::move(prepared));

    Session before = session_;
    auto result = make_orchestrator().install(locators, options);
    if (result.isErr()) return result;

    InstallReport& report = result.value();
    report.skipped.insert(report.skipped.begin(), prepared.skipped.begin(), prepared.skipped.end());
    report.failures.insert(report.failures.begin(), prepared.failures.begin(), prepared.failures.end());

    if (!same_session(before, session_)) {
        auto saved = save_session();
        if (saved.isErr()) return R::err(saved.error());
    }
    return result;
}

Result<UninstallReport> PackageManager::uninstall(const std::vector<std::string>& names,
                                                  const UninstallOptions& options) {
    Session before = session_;
    auto result = make_orchestrator().uninstall(names, options);
    if (result.isErr()) return result;

    if (!same_session(before, session_)) {
        auto saved = save_session();
        if (saved.isErr()) return Result<UninstallReport>::err(saved.error());
    }
    return result;
}

// ============================================================================
// Load / unload
// ============================================================================

Result<LoadReport> PackageManager::load(const std::vector<std::string>& names, bool allow_missing) {
    using R = Result<LoadReport>;

    PackageMap packages = effective();
    LoadManager loader(session_.path, session_);

    Result<LoadReport> result = R::ok(LoadReport{});
    if (names.size() == 1 && names.front() == "auto") {
        result = loader.load_autoload(packages);
    } else if (names.size() == 1 && names.front() == "all") {
        std::vector<std::string> all;
        for (const auto& [name, record] : packages) all.push_back(name);
        result = loader.load_all(all, packages, allow_missing);
    } else {
        result = loader.load_all(names, packages, allow_missing);
    }
    if (result.isErr()) return result;

    if (!result.value().activated.empty()) {
        auto saved = save_session();
        if (saved.isErr()) return R::err(saved.error());
    }
    return result;
}

Result<std::vector<std::string>> PackageManager::unload(const std::vector<std::string>& names,
                                                        bool allow_missing) {
    using R = Result<std::vector<std::string>>;

    PackageMap packages = effective();
    LoadManager loader(session_.path, session_);

    std::vector<std::string> targets = names;
    if (names.size() == 1 && names.front() == "all") {
        // Packages no longer installed are dropped from the session as well
        targets.clear();
        const std::vector<std::string> loaded_now = session_.loaded;
        for (const auto& name : loaded_now) {
            if (packages.count(name)) {
                targets.push_back(name);
            } else {
                session_.mark_unloaded(name);
            }
        }
    }

    auto result = loader.unload_all(targets, packages, allow_missing);
    if (result.isErr()) return result;

    auto saved = save_session();
    if (saved.isErr()) return R::err(saved.error());
    return result;
}

// ============================================================================
// Queries
// ============================================================================

PackageListing PackageManager::list(const std::vector<std::string>& names) const {
    return list_installed(local_, global_, loaded(), names);
}

Result<std::vector<std::string>> PackageManager::list_forge() {
    return remote_index().list_packages();
}

Result<std::vector<PackageDescription>> PackageManager::describe(const std::vector<std::string>& names,
                                                                 bool verbose,
                                                                 bool allow_unknown) const {
    return describe_packages(names, effective(), loaded(), verbose, allow_unknown);
}

// ============================================================================
// Update / rebuild / test
// ============================================================================

Result<UpdateReport> PackageManager::update(const std::vector<std::string>& names,
                                            const InstallOptions& options) {
    Session before = session_;
    InstallOrchestrator orchestrator = make_orchestrator();
    UpdateChecker checker(remote_index(), orchestrator);

    auto result = checker.update(names, effective(), options);
    if (result.isErr()) return result;

    if (!same_session(before, session_)) {
        auto saved = save_session();
        if (saved.isErr()) return Result<UpdateReport>::err(saved.error());
    }
    return result;
}

Result<RebuildReport> PackageManager::rebuild(const Config& config,
                                              const std::vector<std::string>& names,
                                              bool global) {
    using R = Result<RebuildReport>;

    const Installer owner = global ? Installer::System : Installer::User;
    const std::string& list_path = global ? config.global_list : config.local_list;

    auto previous = load_registry(list_path, owner);
    if (previous.isErr()) {
        spdlog::warn("{}; rebuilding from the installed directories", previous.error().message());
    }

    RebuildOptions options;
    options.prefix = global ? config.global_prefix : config.prefix;
    options.archprefix = global ? config.global_archprefix : config.archprefix;
    options.arch = config.arch;
    options.owner = owner;
    options.names = names;

    auto rebuilt = rebuild_registry(options, previous.isOk() ? &previous.value() : nullptr);
    if (rebuilt.isErr()) return R::err(rebuilt.error());

    auto persisted = persist_registry(rebuilt.value().registry, list_path);
    if (persisted.isErr()) return R::err(persisted.error());

    RebuildReport report;
    report.names = rebuilt.value().registry.names();
    report.warnings = std::move(rebuilt.value().warnings);
    report.global = global;
    return R::ok(std::move(report));
}

Result<std::vector<PackageTestResult>> PackageManager::test(const std::vector<std::string>& names) {
    using R = Result<std::vector<PackageTestResult>>;

    PackageMap packages = effective();
    std::vector<PackageTestResult> results;

    for (const auto& name : names) {
        PackageTestResult entry;
        entry.name = name;

        // Load into a scratch copy so the real session is left untouched
        Session scratch = session_;
        LoadManager loader(scratch.path, scratch);
        auto loaded = loader.load(name, packages, false);
        if (loaded.isErr()) {
            entry.detail = loaded.error().message();
            results.push_back(std::move(entry));
            continue;
        }

        const PackageRecord& record = packages.at(name);
        std::vector<std::string> dirs{record.directory};
        if (!record.arch_directory.empty()) dirs.push_back(record.arch_directory);

        spdlog::debug("testing {} {}", name, record.version);
        auto outcome = test_runner().run(name, dirs, scratch.path.entries());
        if (outcome.isErr()) {
            entry.detail = outcome.error().message();
        } else {
            entry.passed = outcome.value().passed;
            entry.detail = outcome.value().detail;
        }
        results.push_back(std::move(entry));
    }

    return R::ok(std::move(results));
}

Result<void> PackageManager::save_session() const {
    return octpkg::save_session(session_, config_.session_file);
}

} // namespace octpkg
