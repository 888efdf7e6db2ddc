#pragma once

/**
 * @file rebuild.hpp
 * @brief Reconstructing a registry from installed package directories
 *
 * Every `<prefix>/<dir>/packinfo/DESCRIPTION` is an installed package. When
 * two directories hold the same name the higher version is kept.
 */

#include "octpkg/registry.hpp"

#include <string>
#include <vector>

namespace octpkg {

struct RebuildOptions {
    std::string prefix;
    std::string archprefix;
    std::string arch;
    Installer owner = Installer::User;
    std::vector<std::string> names;   // keep only these when non-empty
};

struct RebuildResult {
    Registry registry;
    std::vector<std::string> warnings;
};

/**
 * @brief Scan `options.prefix` and build a fresh registry
 *
 * `previous` supplies provenance (installed_at, source) for records whose
 * name, version and directory are unchanged; it may be empty or the result
 * of a failed load.
 */
Result<RebuildResult> rebuild_registry(const RebuildOptions& options, const Registry* previous = nullptr);

} // namespace octpkg
