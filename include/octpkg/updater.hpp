#pragma once

/**
 * @file updater.hpp
 * @brief Checking installed packages against the package index
 */

#include "octpkg/collaborators.hpp"
#include "octpkg/installer.hpp"
#include "octpkg/version.hpp"

#include <string>
#include <vector>

namespace octpkg {

struct UpdateCandidate {
    std::string name;
    std::string installed_version;
    std::string latest_version;
    Installer installer = Installer::User;
};

struct UpdateReport {
    std::vector<UpdateCandidate> outdated;
    std::vector<std::string> up_to_date;
    std::vector<std::string> warnings;   // lookups that failed, names not installed
    InstallReport install;               // result of reinstalling `outdated`
};

/**
 * @brief Finds outdated packages and reinstalls them
 *
 * A failed lookup is recorded as a warning and never stops the remaining
 * checks. Packages are reinstalled into the registry that owns them.
 */
class UpdateChecker {
public:
    UpdateChecker(RemoteIndex& index, InstallOrchestrator& installer)
        : index_(index), installer_(installer) {}

    /// Compare installed versions with the index; `names` empty means all
    UpdateReport check(const std::vector<std::string>& names, const PackageMap& effective);

    /// check() followed by a reinstall of every outdated package
    Result<UpdateReport> update(const std::vector<std::string>& names,
                                const PackageMap& effective,
                                const InstallOptions& options);

private:
    RemoteIndex& index_;
    InstallOrchestrator& installer_;
};

} // namespace octpkg
