#pragma once

/**
 * @file session.hpp
 * @brief Loaded-package state of the running environment
 *
 * A Session records which packages are loaded and the resulting search
 * path. It is runtime state, not part of any registry, and is kept in its
 * own file so that consecutive commands see the same session.
 */

#include "octpkg/collaborators.hpp"

#include <set>
#include <string>
#include <vector>

namespace octpkg {

inline constexpr const char* kSessionSchema = "octpkg.session.v1";

/**
 * @brief Ordered search path; the front entry is searched first
 *
 * activate() prepends the package directory and then its arch directory,
 * leaving the arch directory in front. Entries already present are not
 * added again.
 */
class SearchPath : public PathActivator {
public:
    void activate(const std::string& directory, const std::string& arch_directory) override;
    void deactivate(const std::string& directory, const std::string& arch_directory) override;

    bool contains(const std::string& entry) const;
    const std::vector<std::string>& entries() const { return entries_; }
    void set_entries(std::vector<std::string> entries) { entries_ = std::move(entries); }

    /// Entries joined with `sep`, suitable for a PATH-like variable
    std::string join(char sep = ':') const;

private:
    void prepend(const std::string& entry);
    void erase(const std::string& entry);

    std::vector<std::string> entries_;
};

struct Session {
    std::vector<std::string> loaded;   // in load order
    SearchPath path;

    bool is_loaded(const std::string& name) const;
    void mark_loaded(const std::string& name);
    void mark_unloaded(const std::string& name);
    std::set<std::string> loaded_set() const;
};

/// Absent file: empty session
Result<Session> load_session(const std::string& path);

std::string serialize_session(const Session& session);

Result<void> save_session(const Session& session, const std::string& path);

} // namespace octpkg
