#pragma once

/**
 * @file registry.hpp
 * @brief Local and global package registries
 *
 * A Registry maps package names to exactly one PackageRecord. Two instances
 * exist per invocation: the local (per-user) and global (system) registry.
 * The in-memory Registry is the source of truth for the duration of a
 * command; persist_registry() is the only operation that writes to disk.
 */

#include "octpkg/types.hpp"

#include <string>
#include <vector>

namespace octpkg {

inline constexpr const char* kRegistrySchema = "octpkg.registry.v1";

class Registry {
public:
    explicit Registry(Installer owner = Installer::User) : owner_(owner) {}

    Installer owner() const { return owner_; }

    /// Exact, case-sensitive lookup; nullptr when absent
    const PackageRecord* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /// Insert or replace the record with the same name; installer is forced to owner()
    void upsert(PackageRecord record);

    /// Remove a record; returns false when the name is not present
    bool remove(const std::string& name);

    const PackageMap& records() const { return records_; }
    std::vector<std::string> names() const;
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    void clear() { records_.clear(); }

private:
    Installer owner_;
    PackageMap records_;
};

// ============================================================================
// Registry Store operations
// ============================================================================

/**
 * @brief Load a registry file
 *
 * An absent or zero-byte file is an empty registry. Anything else that
 * cannot be parsed fails with CorruptRegistry.
 */
Result<Registry> load_registry(const std::string& path, Installer owner);

/// Parse registry JSON content (used by load_registry)
Result<Registry> parse_registry(const std::string& content, Installer owner,
                                const std::string& source_path = "");

/// Serialize a registry to its JSON form
std::string serialize_registry(const Registry& registry);

/// Write the full registry atomically (temp file + rename)
Result<void> persist_registry(const Registry& registry, const std::string& path);

/// Merge local and global: local records shadow global records of the same name
PackageMap effective_set(const Registry& local, const Registry& global);

/// Exact match only; nullptr when absent
const PackageRecord* find_by_name(const Registry& registry, const std::string& name);
const PackageRecord* find_by_name(const PackageMap& packages, const std::string& name);

} // namespace octpkg
