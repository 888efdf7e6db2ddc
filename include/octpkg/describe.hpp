#pragma once

/**
 * @file describe.hpp
 * @brief Package listings, descriptions and the function INDEX
 */

#include "octpkg/description.hpp"
#include "octpkg/registry.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace octpkg {

// ============================================================================
// INDEX file
// ============================================================================

// INDEX layout:
//   <package> >> <title>
//   <category>
//    <function> <function> ...
struct IndexCategory {
    std::string name;
    std::vector<std::string> functions;
};

struct PackageIndex {
    std::string package;
    std::string title;
    std::vector<IndexCategory> categories;
};

struct IndexParseResult {
    bool ok = false;
    std::string error;
    PackageIndex index;
};

IndexParseResult parse_index(const std::string& content);

// Function names provided by installed files (top level .m/.oct/.mex), sorted
std::vector<std::string> function_names_from_files(const std::vector<std::string>& files);

// INDEX listing every function under one category named after the title
std::string generate_index(const Description& desc, const std::vector<std::string>& functions);

// ============================================================================
// Listing
// ============================================================================

struct ListRow {
    std::string name;
    std::string version;
    std::string directory;
    Installer installer = Installer::User;
    bool loaded = false;
    bool shadowed = false;   // global record hidden by a local one
};

struct PackageListing {
    std::vector<ListRow> local;
    std::vector<ListRow> global;
};

// Rows for both registries; `names` restricts the output when non-empty
PackageListing list_installed(const Registry& local, const Registry& global,
                              const std::set<std::string>& loaded,
                              const std::vector<std::string>& names = {});

// ============================================================================
// Describe
// ============================================================================

enum class PackageStatus {
    Loaded,
    NotLoaded,
    NotInstalled
};

const char* package_status_to_string(PackageStatus status);

struct PackageDescription {
    std::string name;
    PackageStatus status = PackageStatus::NotInstalled;
    std::optional<PackageRecord> record;
    std::vector<IndexCategory> categories;   // filled when verbose
};

/**
 * @brief Describe installed packages
 *
 * With no names every installed package is described. Unknown names fail
 * with NotFoundError unless `allow_unknown` is set, in which case they are
 * reported as NotInstalled.
 */
Result<std::vector<PackageDescription>> describe_packages(const std::vector<std::string>& names,
                                                          const PackageMap& effective,
                                                          const std::set<std::string>& loaded,
                                                          bool verbose,
                                                          bool allow_unknown);

} // namespace octpkg
