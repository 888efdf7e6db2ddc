#include "octpkg/rebuild.hpp"
#include "octpkg/description.hpp"
#include "octpkg/platform.hpp"
#include "octpkg/version.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace octpkg {

Result<RebuildResult> rebuild_registry(const RebuildOptions& options, const Registry* previous) {
    using R = Result<RebuildResult>;

    RebuildResult result{Registry(options.owner), {}};

    if (!is_directory(options.prefix)) {
        spdlog::debug("{} does not exist; rebuilt registry is empty", options.prefix);
        return R::ok(std::move(result));
    }

    for (const auto& entry : list_directory(options.prefix)) {
        std::string dir = join_path(options.prefix, entry);
        std::string desc_path = join_path(join_path(dir, "packinfo"), "DESCRIPTION");
        if (!is_regular_file(desc_path)) continue;

        auto content = read_file(desc_path);
        if (!content) {
            result.warnings.push_back("cannot read " + desc_path);
            continue;
        }

        auto parsed = parse_description(*content, desc_path);
        if (!parsed.ok) {
            result.warnings.push_back(desc_path + ": " + parsed.error);
            continue;
        }
        const Description& desc = parsed.description;

        if (!options.names.empty() &&
            std::find(options.names.begin(), options.names.end(), desc.name) == options.names.end()) {
            continue;
        }

        PackageRecord record = record_from_description(desc);
        record.directory = dir;

        std::string archdir = join_path(join_path(options.archprefix, entry), options.arch);
        if (is_directory(archdir)) record.arch_directory = archdir;

        if (previous) {
            const PackageRecord* old = previous->find(record.name);
            if (old && old->version == record.version && old->directory == record.directory) {
                record.installed_at = old->installed_at;
                record.source = old->source;
            }
        }

        if (const PackageRecord* seen = result.registry.find(record.name)) {
            auto cmp = compare_versions(record.version, seen->version);
            bool newer = cmp.isOk() && cmp.value() == Ordering::Greater;
            result.warnings.push_back("package " + record.name + " is installed twice (" + seen->directory +
                                      ", " + record.directory + "); keeping version " +
                                      (newer ? record.version : seen->version));
            if (!newer) continue;
        }

        result.registry.upsert(std::move(record));
    }

    for (const auto& warning : result.warnings) {
        spdlog::warn("{}", warning);
    }
    spdlog::info("found {} installed packages in {}", result.registry.size(), options.prefix);
    return R::ok(std::move(result));
}

} // namespace octpkg
