/**
 * octpkg CLI - install command
 *
 * Install packages from source directories, archives, URLs or the package index.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace octpkg::cli {

int run_command(const GlobalOptions& opts, const InstallCommand& cmd) {
    if (cmd.local && cmd.global) {
        init_warning_collector(opts.json, opts.quiet);
        print_error("--local and --global are mutually exclusive", opts.json);
        return 1;
    }

    auto pm = open_manager(opts);
    if (!pm) return 1;

    InstallOptions options;
    options.no_deps = cmd.no_deps;
    options.prefer_local = cmd.local;
    options.prefer_global = cmd.global;
    options.force = cmd.force;

    auto result = pm->install(cmd.sources, options, cmd.forge);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }
    const InstallReport& report = result.value();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.ok();
        j["installed"] = nlohmann::json::array();
        for (const auto& record : report.installed) {
            j["installed"].push_back({{"name", record.name},
                                      {"version", record.version},
                                      {"dir", record.directory},
                                      {"installer", installer_to_string(record.installer)}});
        }
        j["skipped"] = report.skipped;
        j["failures"] = failures_to_json(report.failures);
        output_json(j);
    } else {
        if (!opts.quiet) {
            for (const auto& record : report.installed) {
                std::cout << "Installed " << record.name << " " << record.version
                          << " in " << record.directory << std::endl;
            }
            for (const auto& name : report.skipped) {
                std::cout << name << " is already installed (use --force to reinstall)" << std::endl;
            }
        }
        print_failures(report.failures);
    }

    return report.ok() ? 0 : 1;
}

namespace commands {

void setup_install(CLI::App* app, Command& selected) {
    static InstallCommand install_cmd;

    app->add_option("sources", install_cmd.sources,
                    "Package directories, .tar.gz archives or URLs (names with --forge)")->required();
    app->add_flag("--nodeps", install_cmd.no_deps, "Do not check dependencies");
    app->add_flag("--local", install_cmd.local, "Install into the local registry");
    app->add_flag("--global", install_cmd.global, "Install into the global registry");
    app->add_flag("--forge", install_cmd.forge, "Download the latest version from the package index");
    app->add_flag("-f,--force", install_cmd.force, "Reinstall packages that are already installed");

    app->callback([&selected]() {
        selected = install_cmd;
    });
}

} // namespace commands

} // namespace octpkg::cli
