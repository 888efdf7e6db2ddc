#include "octpkg/loader.hpp"
#include "octpkg/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace octpkg {

Result<LoadReport> LoadManager::load(const std::string& name, const PackageMap& effective,
                                     bool allow_missing) {
    return load_all({name}, effective, allow_missing);
}

Result<LoadReport> LoadManager::load_all(const std::vector<std::string>& names,
                                         const PackageMap& effective,
                                         bool allow_missing) {
    using R = Result<LoadReport>;

    // Resolve everything first; nothing is activated on failure
    std::vector<PackageRecord> plan;
    std::set<std::string> planned;
    for (const auto& name : names) {
        auto order = resolve_load_order(name, effective, allow_missing);
        if (order.isErr()) return R::err(order.error());

        for (auto& record : order.value()) {
            if (planned.insert(record.name).second) {
                plan.push_back(std::move(record));
            }
        }
    }

    LoadReport report;
    for (const auto& record : plan) {
        if (session_.is_loaded(record.name)) {
            report.already_loaded.push_back(record.name);
            continue;
        }
        spdlog::debug("activating {} {}", record.name, record.version);
        activator_.activate(record.directory, record.arch_directory);
        session_.mark_loaded(record.name);
        report.activated.push_back(record.name);
    }

    return R::ok(std::move(report));
}

Result<LoadReport> LoadManager::load_autoload(const PackageMap& effective) {
    std::vector<std::string> names;
    for (const auto& [name, record] : effective) {
        if (record.autoload) names.push_back(name);
    }
    if (names.empty()) {
        spdlog::debug("no packages are marked for autoloading");
        return Result<LoadReport>::ok(LoadReport{});
    }
    return load_all(names, effective, false);
}

Result<std::vector<std::string>> LoadManager::unload(const std::string& name,
                                                     const PackageMap& effective,
                                                     bool allow_missing) {
    return unload_all({name}, effective, allow_missing);
}

Result<std::vector<std::string>> LoadManager::unload_all(const std::vector<std::string>& names,
                                                         const PackageMap& effective,
                                                         bool allow_missing) {
    using R = Result<std::vector<std::string>>;

    for (const auto& name : names) {
        if (effective.find(name) == effective.end()) {
            return R::err(Error(ErrorCode::NotFoundError, "package " + name + " is not installed", {name}));
        }
    }

    std::set<std::string> unloading(names.begin(), names.end());
    std::set<std::string> loaded = session_.loaded_set();
    std::vector<std::string> blocked_by;

    for (const auto& name : names) {
        if (!loaded.count(name)) continue;

        auto verdict = resolve_unload_safety(name, effective, loaded, allow_missing, unloading);
        if (!verdict.ok()) {
            for (const auto& blocker : verdict.blocked_by) {
                if (std::find(blocked_by.begin(), blocked_by.end(), blocker) == blocked_by.end()) {
                    blocked_by.push_back(blocker);
                }
            }
        }
    }

    if (!blocked_by.empty()) {
        return R::err(Error(ErrorCode::BlockedBy,
                            "cannot unload " + join_names(names) + ": needed by loaded packages " +
                                join_names(blocked_by),
                            blocked_by));
    }

    std::vector<std::string> deactivated;
    for (const auto& name : names) {
        if (!session_.is_loaded(name)) {
            spdlog::debug("{} is not loaded", name);
            continue;
        }
        const PackageRecord& record = effective.at(name);
        spdlog::debug("deactivating {} {}", record.name, record.version);
        activator_.deactivate(record.directory, record.arch_directory);
        session_.mark_unloaded(name);
        deactivated.push_back(name);
    }

    return R::ok(std::move(deactivated));
}

} // namespace octpkg
