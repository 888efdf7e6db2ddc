#pragma once

/**
 * @file loader.hpp
 * @brief Activating and deactivating installed packages
 */

#include "octpkg/collaborators.hpp"
#include "octpkg/session.hpp"

#include <string>
#include <vector>

namespace octpkg {

struct LoadReport {
    std::vector<std::string> activated;       // in activation order
    std::vector<std::string> already_loaded;  // part of the order but left alone
};

/**
 * @brief Loads and unloads packages against a session
 *
 * Every requested name is resolved before the first directory is
 * activated, so a failed request leaves the session untouched. Unloading
 * never cascades to dependencies.
 */
class LoadManager {
public:
    LoadManager(PathActivator& activator, Session& session)
        : activator_(activator), session_(session) {}

    Result<LoadReport> load(const std::string& name, const PackageMap& effective, bool allow_missing);

    Result<LoadReport> load_all(const std::vector<std::string>& names,
                                const PackageMap& effective,
                                bool allow_missing);

    /// Load every installed package marked for autoloading
    Result<LoadReport> load_autoload(const PackageMap& effective);

    /// Returns the names actually deactivated; BlockedBy lists every loaded dependent
    Result<std::vector<std::string>> unload(const std::string& name,
                                            const PackageMap& effective,
                                            bool allow_missing);

    Result<std::vector<std::string>> unload_all(const std::vector<std::string>& names,
                                                const PackageMap& effective,
                                                bool allow_missing);

    const Session& session() const { return session_; }

private:
    PathActivator& activator_;
    Session& session_;
};

} // namespace octpkg
