/**
 * octpkg CLI - update and rebuild commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace octpkg::cli {

int run_command(const GlobalOptions& opts, const UpdateCommand& cmd) {
    auto pm = open_manager(opts);
    if (!pm) return 1;

    InstallOptions options;
    options.no_deps = cmd.no_deps;

    auto result = pm->update(cmd.names, options);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }
    const UpdateReport& report = result.value();

    for (const auto& warning : report.warnings) {
        print_warning(warning);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.install.ok();
        j["outdated"] = nlohmann::json::array();
        for (const auto& c : report.outdated) {
            j["outdated"].push_back({{"name", c.name},
                                     {"installed", c.installed_version},
                                     {"latest", c.latest_version}});
        }
        j["up_to_date"] = report.up_to_date;
        j["failures"] = failures_to_json(report.install.failures);
        output_json(j);
    } else {
        if (!opts.quiet) {
            for (const auto& record : report.install.installed) {
                std::cout << "Updated " << record.name << " to " << record.version << std::endl;
            }
            if (report.outdated.empty()) {
                std::cout << "All packages are up to date." << std::endl;
            }
        }
        print_failures(report.install.failures);
    }

    return report.install.ok() ? 0 : 1;
}

int run_command(const GlobalOptions& opts, const RebuildCommand& cmd) {
    auto config = begin_command(opts);
    if (!config) return 1;

    auto result = PackageManager::rebuild(*config, cmd.names, cmd.global);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    for (const auto& warning : result.value().warnings) {
        print_warning(warning);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["registry"] = cmd.global ? "global" : "local";
        j["packages"] = result.value().names;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Rebuilt " << (cmd.global ? "global" : "local") << " registry with "
                  << result.value().names.size() << " packages" << std::endl;
    }
    return 0;
}

namespace commands {

void setup_update(CLI::App* app, Command& selected) {
    static UpdateCommand update_cmd;

    app->add_option("names", update_cmd.names, "Packages to update (default: all installed)");
    app->add_flag("--nodeps", update_cmd.no_deps, "Do not check dependencies when reinstalling");

    app->callback([&selected]() {
        selected = update_cmd;
    });
}

void setup_rebuild(CLI::App* app, Command& selected) {
    static RebuildCommand rebuild_cmd;

    app->add_option("names", rebuild_cmd.names, "Only keep these packages");
    app->add_flag("--global", rebuild_cmd.global, "Rebuild the global registry");

    app->callback([&selected]() {
        selected = rebuild_cmd;
    });
}

} // namespace commands

} // namespace octpkg::cli
