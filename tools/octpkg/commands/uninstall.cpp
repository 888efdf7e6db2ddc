/**
 * octpkg CLI - uninstall command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace octpkg::cli {

int run_command(const GlobalOptions& opts, const UninstallCommand& cmd) {
    if (cmd.local && cmd.global) {
        init_warning_collector(opts.json, opts.quiet);
        print_error("--local and --global are mutually exclusive", opts.json);
        return 1;
    }

    auto pm = open_manager(opts);
    if (!pm) return 1;

    UninstallOptions options;
    options.no_deps = cmd.no_deps;
    options.prefer_local = cmd.local;
    options.prefer_global = cmd.global;

    auto result = pm->uninstall(cmd.names, options);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }
    const UninstallReport& report = result.value();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.ok();
        j["removed"] = report.removed;
        j["failures"] = failures_to_json(report.failures);
        output_json(j);
    } else {
        if (!opts.quiet) {
            for (const auto& name : report.removed) {
                std::cout << "Uninstalled " << name << std::endl;
            }
        }
        print_failures(report.failures);
    }

    return report.ok() ? 0 : 1;
}

namespace commands {

void setup_uninstall(CLI::App* app, Command& selected) {
    static UninstallCommand uninstall_cmd;

    app->add_option("names", uninstall_cmd.names, "Packages to remove")->required();
    app->add_flag("--nodeps", uninstall_cmd.no_deps, "Remove even if other packages depend on them");
    app->add_flag("--local", uninstall_cmd.local, "Remove from the local registry");
    app->add_flag("--global", uninstall_cmd.global, "Remove from the global registry");

    app->callback([&selected]() {
        selected = uninstall_cmd;
    });
}

} // namespace commands

} // namespace octpkg::cli
