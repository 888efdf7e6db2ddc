/**
 * octpkg CLI - prefix, local-list, global-list and path commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <octpkg/platform.hpp>

namespace octpkg::cli {

int run_command(const GlobalOptions& opts, const PrefixCommand& cmd) {
    auto config = begin_command(opts);
    if (!config) return 1;

    if (!cmd.prefix.empty()) {
        config->prefix = absolute_path(cmd.prefix);
        config->archprefix = cmd.archprefix.empty() ? config->prefix : absolute_path(cmd.archprefix);

        auto saved = save_config(*config);
        if (saved.isErr()) {
            print_error(saved.error(), opts.json);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["prefix"] = config->prefix;
        j["archprefix"] = config->archprefix;
        output_json(j);
    } else {
        std::cout << "Installation prefix:             " << config->prefix << std::endl;
        std::cout << "Architecture dependent prefix:   " << config->archprefix << std::endl;
    }
    return 0;
}

int run_command(const GlobalOptions& opts, const ListFileCommand& cmd) {
    auto config = begin_command(opts);
    if (!config) return 1;

    std::string& field = cmd.global ? config->global_list : config->local_list;

    if (!cmd.file.empty()) {
        field = absolute_path(cmd.file);

        // An empty file is a valid, empty registry
        if (!path_exists(field)) {
            auto created = atomic_write_file(field, "");
            if (!created.ok) {
                print_error("failed to create " + field + ": " + created.error, opts.json);
                return 1;
            }
        }

        auto saved = save_config(*config);
        if (saved.isErr()) {
            print_error(saved.error(), opts.json);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j[cmd.global ? "global_list" : "local_list"] = field;
        output_json(j);
    } else {
        std::cout << field << std::endl;
    }
    return 0;
}

int run_command(const GlobalOptions& opts, const PathCommand&) {
    auto pm = open_manager(opts);
    if (!pm) return 1;

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["loaded"] = pm->session().loaded;
        j["path"] = pm->session().path.entries();
        output_json(j);
    } else {
        std::cout << pm->session().path.join(':') << std::endl;
    }
    return 0;
}

namespace commands {

void setup_prefix(CLI::App* app, Command& selected) {
    static PrefixCommand prefix_cmd;

    app->add_option("prefix", prefix_cmd.prefix, "New installation prefix");
    app->add_option("archprefix", prefix_cmd.archprefix, "New prefix for compiled files (default: prefix)");

    app->callback([&selected]() {
        selected = prefix_cmd;
    });
}

void setup_list_file(CLI::App* app, Command& selected, bool global) {
    static ListFileCommand local_cmd{false, ""};
    static ListFileCommand global_cmd{true, ""};
    ListFileCommand& cmd = global ? global_cmd : local_cmd;

    app->add_option("file", cmd.file, "New registry file");

    app->callback([&selected, &cmd]() {
        selected = cmd;
    });
}

void setup_path(CLI::App* app, Command& selected) {
    app->callback([&selected]() {
        selected = PathCommand{};
    });
}

} // namespace commands

} // namespace octpkg::cli
