#pragma once

/**
 * @file resolver.hpp
 * @brief Dependency graph ordering and safety checks
 *
 * The graph is built on demand from an effective installed set (plus any
 * candidates pending install): nodes are package names, edges point from a
 * package to each of its declared dependencies. All traversals are explicit
 * walks with a visiting stack (unvisited / in-progress / done), so deep
 * graphs do not recurse and cycles are reported instead of looping.
 *
 * Where several orders are valid, dependencies are visited in declaration
 * order, making every result deterministic.
 */

#include "octpkg/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace octpkg {

/**
 * @brief Outcome of an unload / uninstall safety check
 *
 * `blocked_by` always lists every package whose dependency edge points at
 * the target, so all conflicts can be reported at once.
 */
struct SafetyVerdict {
    std::vector<std::string> blocked_by;
    bool overridden = false;  // conflicts present but ignored (allow_missing)

    bool ok() const { return blocked_by.empty() || overridden; }
};

/**
 * @brief Compute the load order for `target`: dependencies first
 *
 * Fails with NotFoundError if `target` itself is not in `effective`,
 * CyclicDependency (names = cycle path, first node repeated at the end) on
 * a cycle, and UnsatisfiedDependency (names = every missing or
 * version-mismatched dependency) unless `allow_missing` is set, in which case
 * such dependencies are skipped.
 */
Result<std::vector<PackageRecord>> resolve_load_order(const std::string& target,
                                                      const PackageMap& effective,
                                                      bool allow_missing);

/**
 * @brief Check that unloading `target` leaves every other loaded package intact
 *
 * Packages in `also_unloading` are ignored as blockers (batch unload).
 */
SafetyVerdict resolve_unload_safety(const std::string& target,
                                    const PackageMap& effective,
                                    const std::set<std::string>& loaded,
                                    bool allow_missing,
                                    const std::set<std::string>& also_unloading = {});

/**
 * @brief Check that removing `target` breaks no other installed package
 *
 * Considers every installed package, loaded or not. Packages in
 * `also_removing` are ignored as blockers (batch uninstall). `remaining` is
 * the record of the same name that stays installed in the other registry,
 * if any; dependents whose constraint it satisfies do not block.
 */
SafetyVerdict resolve_uninstall_safety(const std::string& target,
                                       const PackageMap& installed,
                                       bool allow_missing,
                                       const std::set<std::string>& also_removing = {},
                                       const PackageRecord* remaining = nullptr);

/**
 * @brief Order a multi-package install request
 *
 * A candidate is never placed before another candidate it depends on.
 * Candidates whose exact name and version are already in `effective` are
 * left out. Fails with CyclicDependency on a cycle among the candidates and
 * UnresolvableRequest when the request names one package at two versions.
 */
Result<std::vector<std::string>> resolve_install_order(const std::vector<PackageRecord>& requested,
                                                       const PackageMap& effective);

/**
 * @brief Check each declared dependency of `record` against `available`
 *
 * Also checks the runtime requirement against `runtime_version` when both
 * are set. Fails with UnsatisfiedDependency naming every unmet requirement.
 */
Result<void> validate_dependencies(const PackageRecord& record,
                                   const PackageMap& available,
                                   const std::string& runtime_version = "");

} // namespace octpkg
