#include "octpkg/session.hpp"
#include "octpkg/platform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace octpkg {

// ============================================================================
// SearchPath
// ============================================================================

void SearchPath::prepend(const std::string& entry) {
    if (entry.empty() || contains(entry)) return;
    entries_.insert(entries_.begin(), entry);
}

void SearchPath::erase(const std::string& entry) {
    if (entry.empty()) return;
    entries_.erase(std::remove(entries_.begin(), entries_.end(), entry), entries_.end());
}

void SearchPath::activate(const std::string& directory, const std::string& arch_directory) {
    prepend(directory);
    prepend(arch_directory);
}

void SearchPath::deactivate(const std::string& directory, const std::string& arch_directory) {
    erase(directory);
    erase(arch_directory);
}

bool SearchPath::contains(const std::string& entry) const {
    return std::find(entries_.begin(), entries_.end(), entry) != entries_.end();
}

std::string SearchPath::join(char sep) const {
    std::string out;
    for (const auto& e : entries_) {
        if (!out.empty()) out += sep;
        out += e;
    }
    return out;
}

// ============================================================================
// Session
// ============================================================================

bool Session::is_loaded(const std::string& name) const {
    return std::find(loaded.begin(), loaded.end(), name) != loaded.end();
}

void Session::mark_loaded(const std::string& name) {
    if (!is_loaded(name)) loaded.push_back(name);
}

void Session::mark_unloaded(const std::string& name) {
    loaded.erase(std::remove(loaded.begin(), loaded.end(), name), loaded.end());
}

std::set<std::string> Session::loaded_set() const {
    return std::set<std::string>(loaded.begin(), loaded.end());
}

Result<Session> load_session(const std::string& path) {
    using R = Result<Session>;

    Session session;
    auto content = read_file(path);
    if (!content || content->find_first_not_of(" \t\r\n") == std::string::npos) {
        return R::ok(std::move(session));
    }

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object() || j.value("$schema", "") != kSessionSchema) {
            return R::err(Error(ErrorCode::IoError,
                                path + ": not a session file (expected " + kSessionSchema + ")"));
        }
        if (j.contains("loaded")) {
            for (const auto& name : j["loaded"]) {
                session.loaded.push_back(name.get<std::string>());
            }
        }
        if (j.contains("path")) {
            session.path.set_entries(j["path"].get<std::vector<std::string>>());
        }
    } catch (const nlohmann::json::exception& e) {
        return R::err(Error(ErrorCode::IoError, path + ": invalid session file: " + e.what()));
    }

    return R::ok(std::move(session));
}

std::string serialize_session(const Session& session) {
    nlohmann::json j;
    j["$schema"] = kSessionSchema;
    j["loaded"] = session.loaded;
    j["path"] = session.path.entries();
    return j.dump(2) + "\n";
}

Result<void> save_session(const Session& session, const std::string& path) {
    auto written = atomic_write_file(path, serialize_session(session));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IoError, "failed to write " + path + ": " + written.error));
    }
    return Result<void>::ok();
}

} // namespace octpkg
