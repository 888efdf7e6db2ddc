#include "octpkg/updater.hpp"

#include <spdlog/spdlog.h>

namespace octpkg {

UpdateReport UpdateChecker::check(const std::vector<std::string>& names, const PackageMap& effective) {
    UpdateReport report;

    std::vector<std::string> targets = names;
    if (targets.empty()) {
        for (const auto& [name, record] : effective) targets.push_back(name);
    }

    for (const auto& name : targets) {
        auto it = effective.find(name);
        if (it == effective.end()) {
            report.warnings.push_back("package " + name + " is not installed; skipping update");
            continue;
        }
        const PackageRecord& record = it->second;

        auto latest = index_.latest_version(name);
        if (latest.isErr()) {
            report.warnings.push_back("checking for updates of " + name + " failed: " +
                                      latest.error().message());
            continue;
        }

        auto cmp = compare_versions(latest.value(), record.version);
        if (cmp.isErr()) {
            report.warnings.push_back("cannot compare versions of " + name + ": " + cmp.error().message());
            continue;
        }

        if (cmp.value() == Ordering::Greater) {
            spdlog::debug("{} {} can be updated to {}", name, record.version, latest.value());
            report.outdated.push_back({name, record.version, latest.value(), record.installer});
        } else {
            report.up_to_date.push_back(name);
        }
    }

    for (const auto& warning : report.warnings) {
        spdlog::warn("{}", warning);
    }
    return report;
}

Result<UpdateReport> UpdateChecker::update(const std::vector<std::string>& names,
                                           const PackageMap& effective,
                                           const InstallOptions& options) {
    using R = Result<UpdateReport>;

    UpdateReport report = check(names, effective);

    // One install batch per owning registry
    for (Installer owner : {Installer::User, Installer::System}) {
        std::vector<std::string> sources;
        for (const auto& candidate : report.outdated) {
            if (candidate.installer != owner) continue;

            auto url = index_.download_url(candidate.name, candidate.latest_version);
            if (url.isErr()) {
                report.install.failures.push_back({candidate.name, url.error()});
                continue;
            }
            sources.push_back(url.value());
        }
        if (sources.empty()) continue;

        InstallOptions batch = options;
        batch.prefer_local = owner == Installer::User;
        batch.prefer_global = owner == Installer::System;

        auto installed = installer_.install(sources, batch);
        if (installed.isErr()) return R::err(installed.error());

        auto& merged = report.install;
        auto& part = installed.value();
        merged.installed.insert(merged.installed.end(), part.installed.begin(), part.installed.end());
        merged.skipped.insert(merged.skipped.end(), part.skipped.begin(), part.skipped.end());
        merged.failures.insert(merged.failures.end(), part.failures.begin(), part.failures.end());
    }

    return R::ok(std::move(report));
}

} // namespace octpkg
