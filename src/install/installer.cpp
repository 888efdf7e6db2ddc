#include "octpkg/installer.hpp"
#include "octpkg/describe.hpp"
#include "octpkg/platform.hpp"
#include "octpkg/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <memory>
#include <utility>

namespace octpkg {

namespace {

// Files copied into <dir>/packinfo when the package has them
const char* const kPackinfoFiles[] = {"DESCRIPTION", "COPYING", "INDEX", "NEWS", "CITATION",
                                      "ONEWS", "ChangeLog"};

// Destination of a provided file relative to the installed directory
std::string install_relative(const std::string& rel) {
    for (const char* prefix : {"inst/", "src/"}) {
        std::string p(prefix);
        if (rel.compare(0, p.size(), p) == 0) return rel.substr(p.size());
    }
    return rel;
}

// <archprefix>/<name>-<version> for a record with compiled files
std::string arch_root_of(const PackageRecord& record) {
    if (record.arch_directory.empty()) return "";
    return get_parent_directory(record.arch_directory);
}

void remove_package_files(const PackageRecord& record) {
    if (!record.directory.empty() && !remove_directory(record.directory)) {
        spdlog::warn("failed to remove {}", record.directory);
    }
    std::string arch_root = arch_root_of(record);
    if (!arch_root.empty() && !remove_directory(arch_root)) {
        spdlog::warn("failed to remove {}", arch_root);
    }
}

// Effective set once `removing` is gone from the target registry
PackageMap effective_after_removal(const Registry& local,
                                   const Registry& global,
                                   bool from_global,
                                   const std::vector<std::string>& removing) {
    Registry remaining_local = local;
    Registry remaining_global = global;
    Registry& target = from_global ? remaining_global : remaining_local;
    for (const auto& name : removing) target.remove(name);
    return effective_set(remaining_local, remaining_global);
}

} // namespace

bool targets_global(bool prefer_local, bool prefer_global, bool privileged) {
    if (prefer_global) return true;
    if (prefer_local) return false;
    return privileged;
}

struct InstallOrchestrator::Staged {
    std::string source;
    TempDirectory staging{"octpkg-install"};
    BuildManifest manifest;
    PackageRecord candidate;
};

InstallOrchestrator::InstallOrchestrator(const Config& config,
                                         Registry& local,
                                         Registry& global,
                                         Session& session,
                                         PathActivator& activator,
                                         ArchiveFetcher& fetcher,
                                         BuildToolchain& toolchain)
    : config_(config),
      local_(local),
      global_(global),
      session_(session),
      activator_(activator),
      fetcher_(fetcher),
      toolchain_(toolchain),
      privileged_(is_privileged_user()) {}

const std::string& InstallOrchestrator::registry_path(bool global) const {
    return global ? config_.global_list : config_.local_list;
}

// ============================================================================
// Install
// ============================================================================

Result<InstallReport> InstallOrchestrator::install(const std::vector<std::string>& sources,
                                                   const InstallOptions& options) {
    using R = Result<InstallReport>;

    InstallReport report;
    const bool global = targets_global(options.prefer_local, options.prefer_global, privileged_);

    // Fetch and build every source. Staging directories live until the
    // end of this call and are removed on every path out of it.
    std::vector<std::unique_ptr<Staged>> staged;
    std::map<std::string, Staged*> by_name;
    std::vector<PackageRecord> candidates;

    for (const auto& source : sources) {
        auto s = std::make_unique<Staged>();
        s->source = source;

        if (!s->staging.ok()) {
            report.failures.push_back({source, Error(ErrorCode::IoError,
                                                     "failed to create staging directory: " + s->staging.error())});
            continue;
        }

        spdlog::debug("fetching {}", source);
        auto fetched = fetcher_.fetch(source, s->staging.path());
        if (fetched.isErr()) {
            report.failures.push_back({source, fetched.error()});
            continue;
        }

        spdlog::debug("building {}", source);
        auto built = toolchain_.build(fetched.value());
        if (built.isErr()) {
            report.failures.push_back({source, built.error()});
            continue;
        }
        s->manifest = std::move(built.value());

        const Description& desc = s->manifest.description;
        if (!is_valid_package_name(desc.name)) {
            report.failures.push_back({source, Error(ErrorCode::InvalidDescription,
                                                     "invalid package name: " + desc.name)});
            continue;
        }

        s->candidate = record_from_description(desc);
        s->candidate.source = source;
        candidates.push_back(s->candidate);

        by_name.emplace(desc.name, s.get());
        staged.push_back(std::move(s));
    }

    PackageMap effective = effective_set(local_, global_);
    if (options.force) {
        for (const auto& candidate : candidates) effective.erase(candidate.name);
    }

    auto order = resolve_install_order(candidates, effective);
    if (order.isErr()) return R::err(order.error());

    for (const auto& [name, s] : by_name) {
        if (std::find(order.value().begin(), order.value().end(), name) == order.value().end()) {
            spdlog::info("{} {} is already installed", name, s->candidate.version);
            report.skipped.push_back(name);
        }
    }

    for (const auto& name : order.value()) {
        Staged& s = *by_name.at(name);

        if (!options.no_deps) {
            PackageMap available = effective_set(local_, global_);
            auto valid = validate_dependencies(s.candidate, available, config_.runtime_version);
            if (valid.isErr()) {
                report.failures.push_back({name, valid.error()});
                continue;
            }
        } else if (!s.candidate.dependencies.empty()) {
            spdlog::warn("not checking dependencies of {}", name);
        }

        auto registered = register_package(s, global);
        if (registered.isErr()) {
            report.failures.push_back({name, registered.error()});
            continue;
        }
        report.installed.push_back(std::move(registered.value()));
    }

    return R::ok(std::move(report));
}

Result<PackageRecord> InstallOrchestrator::register_package(Staged& staged, bool global) {
    using R = Result<PackageRecord>;

    const BuildManifest& manifest = staged.manifest;
    const Description& desc = manifest.description;
    const std::string& root = manifest.package_root;

    const std::string pkg_dirname = desc.name + "-" + desc.version;
    const std::string dir = join_path(global ? config_.global_prefix : config_.prefix, pkg_dirname);
    const std::string arch_root = join_path(global ? config_.global_archprefix : config_.archprefix, pkg_dirname);
    const std::string archdir = manifest.arch_files.empty() ? "" : join_path(arch_root, config_.arch);

    Registry& target = target_registry(global);
    std::optional<PackageRecord> previous;
    if (const PackageRecord* existing = target.find(desc.name)) {
        previous = *existing;
    }

    // The new tree is assembled beside its final location and swapped in.
    // Whatever is installed there now is set aside until the registry is
    // persisted, and put back on every failure. When archprefix equals
    // prefix both trees are one directory.
    const bool shared_root = arch_root == dir;
    const std::string suffix = random_hex(8);
    const std::string new_dir = dir + ".new-" + suffix;
    const std::string new_arch_root = shared_root ? new_dir : arch_root + ".new-" + suffix;
    const std::string new_archdir = archdir.empty() ? "" : join_path(new_arch_root, config_.arch);

    std::vector<std::pair<std::string, std::string>> set_aside;  // (live, backup)
    std::vector<std::string> swapped_in;

    auto fail = [&](Error error) {
        remove_directory(new_dir);
        remove_directory(new_arch_root);
        for (const auto& live : swapped_in) remove_directory(live);
        for (const auto& [live, backup] : set_aside) {
            if (!rename_path(backup, live)) {
                spdlog::error("failed to restore {} from {}", live, backup);
            }
        }
        return R::err(std::move(error));
    };

    spdlog::debug("copying {} into {}", desc.name, new_dir);
    if (!create_directories(new_dir)) {
        return fail(Error(ErrorCode::IoError, "failed to create " + new_dir, {desc.name}));
    }

    for (const auto& rel : manifest.provided_files) {
        std::string dest = join_path(new_dir, install_relative(rel));
        if (!copy_file(join_path(root, rel), dest)) {
            return fail(Error(ErrorCode::IoError, "failed to copy " + rel + " to " + dest, {desc.name}));
        }
    }

    for (const auto& rel : manifest.arch_files) {
        std::string dest = join_path(new_archdir, install_relative(rel));
        if (!copy_file(join_path(root, rel), dest)) {
            return fail(Error(ErrorCode::IoError, "failed to copy " + rel + " to " + dest, {desc.name}));
        }
    }

    const std::string packinfo = join_path(new_dir, "packinfo");
    for (const char* file : kPackinfoFiles) {
        std::string src = join_path(root, file);
        if (!is_regular_file(src)) continue;
        if (!copy_file(src, join_path(packinfo, file))) {
            return fail(Error(ErrorCode::IoError, std::string("failed to copy ") + file, {desc.name}));
        }
    }

    if (!is_regular_file(join_path(packinfo, "INDEX"))) {
        std::vector<std::string> files = list_files_recursive(new_dir);
        if (!new_archdir.empty()) {
            auto compiled = list_files_recursive(new_archdir);
            files.insert(files.end(), compiled.begin(), compiled.end());
        }
        auto written = atomic_write_file(join_path(packinfo, "INDEX"),
                                         generate_index(desc, function_names_from_files(files)));
        if (!written.ok) {
            return fail(Error(ErrorCode::IoError, "failed to write INDEX: " + written.error, {desc.name}));
        }
    }

    // A reinstall replaces files entirely; leftovers without a record go too
    std::vector<std::string> live_roots = {dir};
    if (!shared_root) live_roots.push_back(arch_root);

    for (const auto& live : live_roots) {
        if (!path_exists(live)) continue;
        if (!previous) spdlog::warn("replacing stale directory {}", live);
        std::string backup = live + ".old-" + suffix;
        if (!rename_path(live, backup)) {
            return fail(Error(ErrorCode::IoError, "failed to move aside " + live, {desc.name}));
        }
        set_aside.emplace_back(live, backup);
    }

    if (!rename_path(new_dir, dir)) {
        return fail(Error(ErrorCode::IoError, "failed to move " + new_dir + " to " + dir, {desc.name}));
    }
    swapped_in.push_back(dir);

    if (!new_archdir.empty() && !shared_root) {
        if (!rename_path(new_arch_root, arch_root)) {
            return fail(Error(ErrorCode::IoError, "failed to move " + new_arch_root + " to " + arch_root,
                              {desc.name}));
        }
        swapped_in.push_back(arch_root);
    }

    PackageRecord record = staged.candidate;
    record.directory = dir;
    record.arch_directory = archdir;
    record.installed_at = get_current_timestamp();

    target.upsert(record);
    auto persisted = persist_registry(target, registry_path(global));
    if (persisted.isErr()) {
        if (previous) {
            target.upsert(*previous);
        } else {
            target.remove(desc.name);
        }
        return fail(persisted.error());
    }
    record = *target.find(desc.name);

    for (const auto& entry : set_aside) {
        if (!remove_directory(entry.second)) spdlog::warn("failed to remove {}", entry.second);
    }

    if (previous && previous->directory != dir) {
        remove_package_files(*previous);
    }

    if (session_.is_loaded(desc.name)) {
        if (previous) activator_.deactivate(previous->directory, previous->arch_directory);
        activator_.activate(record.directory, record.arch_directory);
    }

    if (global && local_.contains(desc.name)) {
        spdlog::warn("{} is also installed locally; the local copy takes precedence", desc.name);
    }

    spdlog::info("installed {} {} in {}", record.name, record.version, record.directory);
    return R::ok(std::move(record));
}

// ============================================================================
// Uninstall
// ============================================================================

Result<UninstallReport> InstallOrchestrator::uninstall(const std::vector<std::string>& names,
                                                       const UninstallOptions& options) {
    using R = Result<UninstallReport>;

    UninstallReport report;
    const bool global = targets_global(options.prefer_local, options.prefer_global, privileged_);
    Registry& target = target_registry(global);
    const Registry& other = target_registry(!global);

    std::vector<std::string> removing;
    for (const auto& name : names) {
        if (std::find(removing.begin(), removing.end(), name) != removing.end()) continue;

        if (!target.contains(name)) {
            std::string message = "package " + name + " is not installed in the " +
                                  (global ? "global" : "local") + " registry";
            if (other.contains(name)) {
                message += global ? " (it is installed locally)" : " (it is installed globally; use --global)";
            }
            report.failures.push_back({name, Error(ErrorCode::NotFoundError, message, {name})});
            continue;
        }
        removing.push_back(name);
    }

    // Blocking is judged against what stays installed: dependents removed in
    // the same call do not block, and a copy of the name in the other
    // registry keeps satisfying its dependents. Drop blocked names until the
    // remaining set is consistent.
    bool changed = true;
    while (changed) {
        changed = false;
        PackageMap after = effective_after_removal(local_, global_, global, removing);

        for (auto it = removing.begin(); it != removing.end();) {
            auto verdict = resolve_uninstall_safety(*it, after, options.no_deps, {}, other.find(*it));
            if (verdict.ok()) {
                ++it;
                continue;
            }
            report.failures.push_back({*it, Error(ErrorCode::BlockedBy,
                                                  "cannot uninstall " + *it + ": needed by " +
                                                      join_names(verdict.blocked_by),
                                                  verdict.blocked_by)});
            it = removing.erase(it);
            changed = true;
        }
    }

    if (removing.empty()) return R::ok(std::move(report));

    // Registry first: files and session are only touched once the smaller
    // registry is on disk.
    std::vector<PackageRecord> records;
    for (const auto& name : removing) {
        records.push_back(*target.find(name));
        target.remove(name);
    }

    auto persisted = persist_registry(target, registry_path(global));
    if (persisted.isErr()) {
        for (const auto& record : records) target.upsert(record);
        return R::err(persisted.error());
    }

    for (const auto& record : records) {
        if (session_.is_loaded(record.name)) {
            spdlog::debug("unloading {} before removal", record.name);
            activator_.deactivate(record.directory, record.arch_directory);
            session_.mark_unloaded(record.name);
        }

        remove_package_files(record);
        report.removed.push_back(record.name);
        spdlog::info("removed {} {}", record.name, record.version);
    }

    return R::ok(std::move(report));
}

} // namespace octpkg
