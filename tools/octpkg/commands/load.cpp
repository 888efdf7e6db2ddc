/**
 * octpkg CLI - load and unload commands
 *
 * Activate and deactivate packages in the persisted session.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace octpkg::cli {

int run_command(const GlobalOptions& opts, const LoadCommand& cmd) {
    auto pm = open_manager(opts);
    if (!pm) return 1;

    auto result = pm->load(cmd.names, cmd.no_deps);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["activated"] = result.value().activated;
        j["already_loaded"] = result.value().already_loaded;
        j["path"] = pm->session().path.entries();
        output_json(j);
    } else if (opts.verbose) {
        for (const auto& name : result.value().activated) {
            std::cout << "Loaded " << name << std::endl;
        }
    }
    return 0;
}

int run_command(const GlobalOptions& opts, const UnloadCommand& cmd) {
    auto pm = open_manager(opts);
    if (!pm) return 1;

    auto result = pm->unload(cmd.names, cmd.no_deps);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["unloaded"] = result.value();
        j["path"] = pm->session().path.entries();
        output_json(j);
    } else if (opts.verbose) {
        for (const auto& name : result.value()) {
            std::cout << "Unloaded " << name << std::endl;
        }
    }
    return 0;
}

namespace commands {

void setup_load(CLI::App* app, Command& selected) {
    static LoadCommand load_cmd;

    app->add_option("names", load_cmd.names, "Packages to load, 'all' or 'auto'")->required();
    app->add_flag("--nodeps", load_cmd.no_deps, "Load even if dependencies are missing");

    app->callback([&selected]() {
        selected = load_cmd;
    });
}

void setup_unload(CLI::App* app, Command& selected) {
    static UnloadCommand unload_cmd;

    app->add_option("names", unload_cmd.names, "Packages to unload or 'all'")->required();
    app->add_flag("--nodeps", unload_cmd.no_deps, "Unload even if loaded packages depend on them");

    app->callback([&selected]() {
        selected = unload_cmd;
    });
}

} // namespace commands

} // namespace octpkg::cli
