#include "octpkg/registry.hpp"
#include "octpkg/platform.hpp"
#include "octpkg/version.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>

namespace octpkg {

namespace {

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string get_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

Error corrupt(const std::string& source_path, const std::string& reason) {
    std::string where = source_path.empty() ? "registry" : source_path;
    return Error(ErrorCode::CorruptRegistry, where + ": " + reason);
}

nlohmann::json dependency_to_json(const Dependency& dep) {
    nlohmann::json j;
    j["name"] = dep.name;
    j["operator"] = constraint_op_to_string(dep.op);
    j["version"] = dep.version;
    return j;
}

Result<Dependency> dependency_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Result<Dependency>::err(Error(ErrorCode::CorruptRegistry, "dependency must be an object"));
    }
    Dependency dep;
    dep.name = get_string(j, "name");
    dep.version = get_string(j, "version");
    auto op = parse_constraint_op(get_string(j, "operator"));
    if (dep.name.empty() || !op) {
        return Result<Dependency>::err(Error(ErrorCode::CorruptRegistry,
                                             "dependency has no name or an invalid operator"));
    }
    dep.op = *op;
    if (dep.op != ConstraintOp::Any && !is_valid_version(dep.version)) {
        return Result<Dependency>::err(Error(ErrorCode::CorruptRegistry,
                                             "dependency " + dep.name + " has an invalid version"));
    }
    return Result<Dependency>::ok(std::move(dep));
}

nlohmann::json record_to_json(const PackageRecord& r) {
    nlohmann::json j;
    j["name"] = r.name;
    j["version"] = r.version;
    j["date"] = r.date;
    j["title"] = r.title;
    j["description"] = r.description;
    j["author"] = r.author;
    j["maintainer"] = r.maintainer;
    j["license"] = r.license;
    j["url"] = r.url;
    j["dir"] = r.directory;
    j["archdir"] = r.arch_directory;
    j["autoload"] = r.autoload;

    j["depends"] = nlohmann::json::array();
    for (const auto& dep : r.dependencies) {
        j["depends"].push_back(dependency_to_json(dep));
    }
    if (r.runtime_requirement) {
        j["runtime_requirement"] = dependency_to_json(*r.runtime_requirement);
    }

    j["installed_at"] = r.installed_at;
    j["source"] = r.source;
    return j;
}

Result<PackageRecord> record_from_json(const nlohmann::json& j, Installer owner) {
    if (!j.is_object()) {
        return Result<PackageRecord>::err(Error(ErrorCode::CorruptRegistry, "record must be an object"));
    }

    PackageRecord r;
    r.installer = owner;
    r.name = get_string(j, "name");
    r.version = get_string(j, "version");
    r.directory = get_string(j, "dir");

    if (is_blank(r.name)) {
        return Result<PackageRecord>::err(Error(ErrorCode::CorruptRegistry, "record name missing"));
    }
    if (!is_valid_version(r.version)) {
        return Result<PackageRecord>::err(Error(ErrorCode::CorruptRegistry,
                                                "record " + r.name + " has invalid version '" + r.version + "'"));
    }
    if (is_blank(r.directory)) {
        return Result<PackageRecord>::err(Error(ErrorCode::CorruptRegistry,
                                                "record " + r.name + " has no directory"));
    }

    r.arch_directory = get_string(j, "archdir");
    r.date = get_string(j, "date");
    r.title = get_string(j, "title");
    r.description = get_string(j, "description");
    r.author = get_string(j, "author");
    r.maintainer = get_string(j, "maintainer");
    r.license = get_string(j, "license");
    r.url = get_string(j, "url");
    r.installed_at = get_string(j, "installed_at");
    r.source = get_string(j, "source");
    if (j.contains("autoload") && j["autoload"].is_boolean()) {
        r.autoload = j["autoload"].get<bool>();
    }

    if (j.contains("depends")) {
        if (!j["depends"].is_array()) {
            return Result<PackageRecord>::err(Error(ErrorCode::CorruptRegistry,
                                                    "record " + r.name + ": depends must be an array"));
        }
        for (const auto& dj : j["depends"]) {
            auto dep = dependency_from_json(dj);
            if (dep.isErr()) {
                return Result<PackageRecord>::err(dep.error().withContext("record " + r.name));
            }
            r.dependencies.push_back(std::move(dep.value()));
        }
    }

    if (j.contains("runtime_requirement")) {
        auto dep = dependency_from_json(j["runtime_requirement"]);
        if (dep.isErr()) {
            return Result<PackageRecord>::err(dep.error().withContext("record " + r.name));
        }
        r.runtime_requirement = std::move(dep.value());
    }

    return Result<PackageRecord>::ok(std::move(r));
}

} // namespace

// ============================================================================
// Registry
// ============================================================================

const PackageRecord* Registry::find(const std::string& name) const {
    auto it = records_.find(name);
    return it == records_.end() ? nullptr : &it->second;
}

void Registry::upsert(PackageRecord record) {
    record.installer = owner_;
    std::string name = record.name;
    records_[name] = std::move(record);
}

bool Registry::remove(const std::string& name) {
    return records_.erase(name) > 0;
}

std::vector<std::string> Registry::names() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& [name, record] : records_) {
        out.push_back(name);
    }
    return out;
}

// ============================================================================
// Store operations
// ============================================================================

Result<Registry> parse_registry(const std::string& content, Installer owner,
                                const std::string& source_path) {
    Registry registry(owner);

    if (is_blank(content)) {
        return Result<Registry>::ok(std::move(registry));
    }

    try {
        auto j = nlohmann::json::parse(content);

        if (!j.is_object()) {
            return Result<Registry>::err(corrupt(source_path, "JSON must be an object"));
        }
        if (get_string(j, "$schema") != kRegistrySchema) {
            return Result<Registry>::err(corrupt(source_path, std::string("$schema mismatch: expected ") +
                                                                  kRegistrySchema));
        }
        if (!j.contains("packages") || !j["packages"].is_array()) {
            return Result<Registry>::err(corrupt(source_path, "packages array missing"));
        }

        for (const auto& pj : j["packages"]) {
            auto record = record_from_json(pj, owner);
            if (record.isErr()) {
                return Result<Registry>::err(corrupt(source_path, record.error().message()));
            }
            if (registry.contains(record.value().name)) {
                return Result<Registry>::err(corrupt(source_path,
                                                     "duplicate package " + record.value().name));
            }
            registry.upsert(std::move(record.value()));
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<Registry>::err(corrupt(source_path, std::string("parse error: ") + e.what()));
    }

    return Result<Registry>::ok(std::move(registry));
}

Result<Registry> load_registry(const std::string& path, Installer owner) {
    if (!path_exists(path)) {
        spdlog::debug("registry {} does not exist, starting empty", path);
        return Result<Registry>::ok(Registry(owner));
    }

    auto content = read_file(path);
    if (!content) {
        return Result<Registry>::err(corrupt(path, "cannot be read"));
    }

    return parse_registry(*content, owner, path);
}

std::string serialize_registry(const Registry& registry) {
    nlohmann::json j;
    j["$schema"] = kRegistrySchema;
    j["packages"] = nlohmann::json::array();
    for (const auto& [name, record] : registry.records()) {
        j["packages"].push_back(record_to_json(record));
    }
    return j.dump(2) + "\n";
}

Result<void> persist_registry(const Registry& registry, const std::string& path) {
    auto result = atomic_write_file(path, serialize_registry(registry));
    if (!result.ok) {
        return Result<void>::err(Error(ErrorCode::IoError, "cannot write registry " + path + ": " + result.error));
    }
    spdlog::debug("persisted {} package(s) to {}", registry.size(), path);
    return Result<void>::ok();
}

PackageMap effective_set(const Registry& local, const Registry& global) {
    PackageMap merged = local.records();
    for (const auto& [name, record] : global.records()) {
        // insert() keeps an existing local entry
        merged.insert({name, record});
    }
    return merged;
}

const PackageRecord* find_by_name(const Registry& registry, const std::string& name) {
    return registry.find(name);
}

const PackageRecord* find_by_name(const PackageMap& packages, const std::string& name) {
    auto it = packages.find(name);
    return it == packages.end() ? nullptr : &it->second;
}

} // namespace octpkg
