/**
 * octpkg CLI - list and describe commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <algorithm>
#include <iomanip>

namespace octpkg::cli {

namespace {

nlohmann::json row_to_json(const ListRow& row) {
    return {{"name", row.name},
            {"version", row.version},
            {"dir", row.directory},
            {"installer", installer_to_string(row.installer)},
            {"loaded", row.loaded},
            {"shadowed", row.shadowed}};
}

void print_table(const std::vector<ListRow>& rows) {
    size_t name_w = std::string("Package Name").size();
    size_t ver_w = std::string("Package Version").size();
    for (const auto& row : rows) {
        name_w = std::max(name_w, row.name.size() + 2);
        ver_w = std::max(ver_w, row.version.size());
    }

    std::cout << " " << std::left << std::setw(static_cast<int>(name_w)) << "Package Name"
              << " | " << std::setw(static_cast<int>(ver_w)) << "Package Version"
              << " | Installation directory" << std::endl;
    std::cout << std::string(name_w + 2, '-') << "+" << std::string(ver_w + 2, '-') << "+"
              << std::string(24, '-') << std::endl;

    for (const auto& row : rows) {
        std::string name = row.name + (row.loaded ? " *" : "");
        std::cout << " " << std::right << std::setw(static_cast<int>(name_w)) << name
                  << " | " << std::left << std::setw(static_cast<int>(ver_w)) << row.version
                  << " | " << row.directory << (row.shadowed ? " (shadowed)" : "") << std::endl;
    }
}

} // namespace

int run_command(const GlobalOptions& opts, const ListCommand& cmd) {
    auto pm = open_manager(opts);
    if (!pm) return 1;

    if (cmd.forge) {
        auto names = pm->list_forge();
        if (names.isErr()) {
            print_error(names.error(), opts.json);
            return 1;
        }
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["packages"] = names.value();
            output_json(j);
        } else {
            for (const auto& name : names.value()) {
                std::cout << name << std::endl;
            }
        }
        return 0;
    }

    PackageListing listing = pm->list(cmd.names);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["local"] = nlohmann::json::array();
        j["global"] = nlohmann::json::array();
        for (const auto& row : listing.local) j["local"].push_back(row_to_json(row));
        for (const auto& row : listing.global) j["global"].push_back(row_to_json(row));
        output_json(j);
        return 0;
    }

    std::vector<ListRow> rows = listing.local;
    rows.insert(rows.end(), listing.global.begin(), listing.global.end());
    if (rows.empty()) {
        if (!opts.quiet) std::cout << "no packages installed." << std::endl;
        return 0;
    }
    std::sort(rows.begin(), rows.end(), [](const ListRow& a, const ListRow& b) {
        return a.name < b.name;
    });
    print_table(rows);
    return 0;
}

int run_command(const GlobalOptions& opts, const DescribeCommand& cmd) {
    auto pm = open_manager(opts);
    if (!pm) return 1;

    auto result = pm->describe(cmd.names, opts.verbose, cmd.status);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["packages"] = nlohmann::json::array();
        for (const auto& desc : result.value()) {
            nlohmann::json p;
            p["name"] = desc.name;
            p["status"] = package_status_to_string(desc.status);
            if (desc.record) {
                p["version"] = desc.record->version;
                p["title"] = desc.record->title;
                p["description"] = desc.record->description;
                p["dir"] = desc.record->directory;
            }
            if (!desc.categories.empty()) {
                p["categories"] = nlohmann::json::array();
                for (const auto& category : desc.categories) {
                    p["categories"].push_back({{"name", category.name}, {"functions", category.functions}});
                }
            }
            j["packages"].push_back(p);
        }
        output_json(j);
        return 0;
    }

    for (const auto& desc : result.value()) {
        std::cout << "---" << std::endl;
        std::cout << "Package name:" << std::endl << "\t" << desc.name << std::endl;
        if (desc.record) {
            std::cout << "Version:" << std::endl << "\t" << desc.record->version << std::endl;
            std::cout << "Short description:" << std::endl << "\t" << desc.record->description << std::endl;
        }
        std::cout << "Status:" << std::endl << "\t" << package_status_to_string(desc.status) << std::endl;
        for (const auto& category : desc.categories) {
            std::cout << "---" << std::endl << "Category " << category.name << ":" << std::endl;
            for (const auto& fn : category.functions) {
                std::cout << "\t" << fn << std::endl;
            }
        }
    }
    return 0;
}

namespace commands {

void setup_list(CLI::App* app, Command& selected) {
    static ListCommand list_cmd;

    app->add_option("names", list_cmd.names, "Only list these packages");
    app->add_flag("--forge", list_cmd.forge, "List the packages available in the package index");

    app->callback([&selected]() {
        selected = list_cmd;
    });
}

void setup_describe(CLI::App* app, Command& selected) {
    static DescribeCommand describe_cmd;

    app->add_option("names", describe_cmd.names, "Packages to describe (default: all installed)");
    app->add_flag("--status", describe_cmd.status, "Report unknown packages as not installed");

    app->callback([&selected]() {
        selected = describe_cmd;
    });
}

} // namespace commands

} // namespace octpkg::cli
