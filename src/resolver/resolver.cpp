#include "octpkg/resolver.hpp"
#include "octpkg/description.hpp"
#include "octpkg/version.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <unordered_map>

namespace octpkg {

namespace {

enum class Mark {
    Unvisited,
    InProgress,
    Done
};

struct Frame {
    std::string name;
    size_t next_dep = 0;
};

// Cycle path from the frame holding `repeated` to the top of the stack,
// closed by repeating the first node.
std::vector<std::string> cycle_path(const std::vector<Frame>& stack, const std::string& repeated) {
    std::vector<std::string> path;
    bool in_cycle = false;
    for (const auto& frame : stack) {
        if (frame.name == repeated) in_cycle = true;
        if (in_cycle) path.push_back(frame.name);
    }
    path.push_back(repeated);
    return path;
}

Error cycle_error(const std::vector<std::string>& path) {
    return Error(ErrorCode::CyclicDependency,
                 "cyclic dependency: " + join_names(path, " -> "), path);
}

// A dependency is met when the name is present and its version satisfies
// the constraint. Unparsable installed versions count as unmet.
bool dependency_met(const Dependency& dep, const PackageRecord& provider) {
    auto ok = satisfies(provider.version, dep);
    return ok.isOk() && ok.value();
}

void add_unique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

SafetyVerdict dependents_of(const std::string& target,
                            const PackageMap& packages,
                            const std::set<std::string>* restrict_to,
                            bool allow_missing,
                            const std::set<std::string>& ignored,
                            const PackageRecord* remaining) {
    SafetyVerdict verdict;

    for (const auto& [name, record] : packages) {
        if (name == target || ignored.count(name)) continue;
        if (restrict_to && !restrict_to->count(name)) continue;

        for (const auto& dep : record.dependencies) {
            if (dep.name == target && !(remaining && dependency_met(dep, *remaining))) {
                verdict.blocked_by.push_back(name);
                break;
            }
        }
    }

    if (!verdict.blocked_by.empty() && allow_missing) {
        verdict.overridden = true;
        spdlog::warn("ignoring packages that depend on {}: {}", target, join_names(verdict.blocked_by));
    }
    return verdict;
}

} // namespace

Result<std::vector<PackageRecord>> resolve_load_order(const std::string& target,
                                                      const PackageMap& effective,
                                                      bool allow_missing) {
    using R = Result<std::vector<PackageRecord>>;

    if (effective.find(target) == effective.end()) {
        return R::err(Error(ErrorCode::NotFoundError, "package " + target + " is not installed", {target}));
    }

    std::unordered_map<std::string, Mark> marks;
    std::vector<Frame> stack;
    std::vector<PackageRecord> order;
    std::vector<std::string> missing;

    marks[target] = Mark::InProgress;
    stack.push_back({target, 0});

    while (!stack.empty()) {
        const PackageRecord& record = effective.at(stack.back().name);

        if (stack.back().next_dep >= record.dependencies.size()) {
            marks[record.name] = Mark::Done;
            order.push_back(record);
            stack.pop_back();
            continue;
        }

        const Dependency& dep = record.dependencies[stack.back().next_dep++];

        auto provider = effective.find(dep.name);
        if (provider == effective.end() || !dependency_met(dep, provider->second)) {
            if (allow_missing) {
                spdlog::warn("{} depends on {}, which is not available; continuing without it",
                             record.name, dep.to_string());
            } else {
                add_unique(missing, dep.name);
            }
            continue;
        }

        Mark mark = marks.count(dep.name) ? marks[dep.name] : Mark::Unvisited;
        if (mark == Mark::InProgress) {
            return R::err(cycle_error(cycle_path(stack, dep.name)));
        }
        if (mark == Mark::Done) continue;

        marks[dep.name] = Mark::InProgress;
        stack.push_back({dep.name, 0});
    }

    if (!missing.empty()) {
        return R::err(Error(ErrorCode::UnsatisfiedDependency,
                            "cannot load " + target + ": unsatisfied dependencies: " + join_names(missing),
                            missing));
    }

    return R::ok(std::move(order));
}

SafetyVerdict resolve_unload_safety(const std::string& target,
                                    const PackageMap& effective,
                                    const std::set<std::string>& loaded,
                                    bool allow_missing,
                                    const std::set<std::string>& also_unloading) {
    return dependents_of(target, effective, &loaded, allow_missing, also_unloading, nullptr);
}

SafetyVerdict resolve_uninstall_safety(const std::string& target,
                                       const PackageMap& installed,
                                       bool allow_missing,
                                       const std::set<std::string>& also_removing,
                                       const PackageRecord* remaining) {
    return dependents_of(target, installed, nullptr, allow_missing, also_removing, remaining);
}

Result<std::vector<std::string>> resolve_install_order(const std::vector<PackageRecord>& requested,
                                                       const PackageMap& effective) {
    using R = Result<std::vector<std::string>>;

    // Index the request, keeping input order and rejecting version conflicts
    std::map<std::string, const PackageRecord*> pending;
    std::vector<std::string> input_order;

    for (const auto& candidate : requested) {
        auto it = pending.find(candidate.name);
        if (it != pending.end()) {
            auto cmp = compare_versions(it->second->version, candidate.version);
            if (cmp.isErr() || cmp.value() != Ordering::Equal) {
                return R::err(Error(ErrorCode::UnresolvableRequest,
                                    "package " + candidate.name + " requested at versions " +
                                        it->second->version + " and " + candidate.version,
                                    {candidate.name}));
            }
            continue;
        }

        auto installed = effective.find(candidate.name);
        if (installed != effective.end()) {
            auto cmp = compare_versions(installed->second.version, candidate.version);
            if (cmp.isOk() && cmp.value() == Ordering::Equal) {
                spdlog::debug("{} {} is already installed", candidate.name, candidate.version);
                continue;
            }
        }

        pending[candidate.name] = &candidate;
        input_order.push_back(candidate.name);
    }

    std::unordered_map<std::string, Mark> marks;
    std::vector<std::string> order;

    for (const auto& root : input_order) {
        if (marks.count(root)) continue;

        std::vector<Frame> stack;
        marks[root] = Mark::InProgress;
        stack.push_back({root, 0});

        while (!stack.empty()) {
            const PackageRecord& record = *pending.at(stack.back().name);

            if (stack.back().next_dep >= record.dependencies.size()) {
                marks[record.name] = Mark::Done;
                order.push_back(record.name);
                stack.pop_back();
                continue;
            }

            const Dependency& dep = record.dependencies[stack.back().next_dep++];

            // Only edges inside the request constrain the order
            if (!pending.count(dep.name)) continue;

            Mark mark = marks.count(dep.name) ? marks[dep.name] : Mark::Unvisited;
            if (mark == Mark::InProgress) {
                return R::err(cycle_error(cycle_path(stack, dep.name)));
            }
            if (mark == Mark::Done) continue;

            marks[dep.name] = Mark::InProgress;
            stack.push_back({dep.name, 0});
        }
    }

    return R::ok(std::move(order));
}

Result<void> validate_dependencies(const PackageRecord& record,
                                   const PackageMap& available,
                                   const std::string& runtime_version) {
    std::vector<std::string> unmet_names;
    std::vector<std::string> unmet;

    if (record.runtime_requirement && !runtime_version.empty()) {
        auto ok = satisfies(runtime_version, *record.runtime_requirement);
        if (ok.isErr() || !ok.value()) {
            unmet_names.push_back(kRuntimeDependencyName);
            unmet.push_back(record.runtime_requirement->to_string() + " (running " + runtime_version + ")");
        }
    }

    for (const auto& dep : record.dependencies) {
        auto provider = available.find(dep.name);
        if (provider == available.end()) {
            add_unique(unmet_names, dep.name);
            unmet.push_back(dep.to_string() + " (not installed)");
        } else if (!dependency_met(dep, provider->second)) {
            add_unique(unmet_names, dep.name);
            unmet.push_back(dep.to_string() + " (installed " + provider->second.version + ")");
        }
    }

    if (!unmet.empty()) {
        return Result<void>::err(Error(ErrorCode::UnsatisfiedDependency,
                                       record.name + " needs " + join_names(unmet),
                                       unmet_names));
    }
    return Result<void>::ok();
}

} // namespace octpkg
