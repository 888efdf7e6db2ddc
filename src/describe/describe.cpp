#include "octpkg/describe.hpp"
#include "octpkg/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace octpkg {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool strip_suffix(std::string& s, const std::string& suffix) {
    if (s.size() > suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        s.erase(s.size() - suffix.size());
        return true;
    }
    return false;
}

bool wanted(const std::vector<std::string>& names, const std::string& name) {
    return names.empty() || std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

// ============================================================================
// INDEX
// ============================================================================

IndexParseResult parse_index(const std::string& content) {
    IndexParseResult result;
    std::istringstream in(content);
    std::string line;
    bool have_header = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty() || line[0] == '#') continue;

        if (!have_header) {
            auto sep = line.find(">>");
            if (sep == std::string::npos) {
                result.error = "first line must be '<package> >> <title>'";
                return result;
            }
            result.index.package = trim(line.substr(0, sep));
            result.index.title = trim(line.substr(sep + 2));
            have_header = true;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(line[0]))) {
            if (result.index.categories.empty()) {
                result.error = "function listed before any category: " + trim(line);
                return result;
            }
            std::istringstream words(line);
            std::string fn;
            while (words >> fn) {
                result.index.categories.back().functions.push_back(fn);
            }
        } else {
            result.index.categories.push_back({trim(line), {}});
        }
    }

    if (!have_header) {
        result.error = "empty INDEX";
        return result;
    }

    result.ok = true;
    return result;
}

std::vector<std::string> function_names_from_files(const std::vector<std::string>& files) {
    std::vector<std::string> functions;
    for (const auto& file : files) {
        if (file.find('/') != std::string::npos) continue;
        std::string fn = file;
        if (strip_suffix(fn, ".m") || strip_suffix(fn, ".oct") || strip_suffix(fn, ".mex")) {
            if (fn != "PKG_ADD" && fn != "PKG_DEL") functions.push_back(fn);
        }
    }
    std::sort(functions.begin(), functions.end());
    functions.erase(std::unique(functions.begin(), functions.end()), functions.end());
    return functions;
}

std::string generate_index(const Description& desc, const std::vector<std::string>& functions) {
    std::string out = desc.name + " >> " + desc.title + "\n";
    out += desc.title + "\n";
    for (const auto& fn : functions) {
        out += " " + fn + "\n";
    }
    return out;
}

// ============================================================================
// Listing
// ============================================================================

PackageListing list_installed(const Registry& local, const Registry& global,
                              const std::set<std::string>& loaded,
                              const std::vector<std::string>& names) {
    PackageListing listing;

    auto to_row = [&loaded](const PackageRecord& record) {
        ListRow row;
        row.name = record.name;
        row.version = record.version;
        row.directory = record.directory;
        row.installer = record.installer;
        row.loaded = loaded.count(record.name) > 0;
        return row;
    };

    for (const auto& [name, record] : local.records()) {
        if (wanted(names, name)) listing.local.push_back(to_row(record));
    }
    for (const auto& [name, record] : global.records()) {
        if (!wanted(names, name)) continue;
        ListRow row = to_row(record);
        if (local.contains(name)) {
            row.shadowed = true;
            row.loaded = false;
        }
        listing.global.push_back(std::move(row));
    }
    return listing;
}

// ============================================================================
// Describe
// ============================================================================

const char* package_status_to_string(PackageStatus status) {
    switch (status) {
        case PackageStatus::Loaded: return "Loaded";
        case PackageStatus::NotLoaded: return "Not loaded";
        case PackageStatus::NotInstalled: return "Not installed";
        default: return "Not installed";
    }
}

Result<std::vector<PackageDescription>> describe_packages(const std::vector<std::string>& names,
                                                          const PackageMap& effective,
                                                          const std::set<std::string>& loaded,
                                                          bool verbose,
                                                          bool allow_unknown) {
    using R = Result<std::vector<PackageDescription>>;

    std::vector<std::string> targets = names;
    if (targets.empty()) {
        for (const auto& [name, record] : effective) targets.push_back(name);
    }

    std::vector<std::string> unknown;
    std::vector<PackageDescription> out;

    for (const auto& name : targets) {
        PackageDescription desc;
        desc.name = name;

        auto it = effective.find(name);
        if (it == effective.end()) {
            unknown.push_back(name);
            out.push_back(std::move(desc));
            continue;
        }

        desc.record = it->second;
        desc.status = loaded.count(name) ? PackageStatus::Loaded : PackageStatus::NotLoaded;

        if (verbose) {
            std::string index_path = join_path(join_path(it->second.directory, "packinfo"), "INDEX");
            if (auto content = read_file(index_path)) {
                auto parsed = parse_index(*content);
                if (parsed.ok) {
                    desc.categories = std::move(parsed.index.categories);
                } else {
                    spdlog::warn("{}: {}", index_path, parsed.error);
                }
            } else {
                spdlog::warn("{} has no INDEX file", name);
            }
        }

        out.push_back(std::move(desc));
    }

    if (!unknown.empty() && !allow_unknown) {
        return R::err(Error(ErrorCode::NotFoundError,
                            "packages not installed: " + join_names(unknown), unknown));
    }
    return R::ok(std::move(out));
}

} // namespace octpkg
