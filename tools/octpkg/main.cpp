/**
 * octpkg CLI - Entry Point
 *
 * Installs, loads and inspects add-on packages for the numerical environment.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef OCTPKG_VERSION
#define OCTPKG_VERSION "0.0.0"
#endif

// Forward declarations for commands
namespace octpkg::cli::commands {
    void setup_install(CLI::App* app, Command& selected);
    void setup_uninstall(CLI::App* app, Command& selected);
    void setup_load(CLI::App* app, Command& selected);
    void setup_unload(CLI::App* app, Command& selected);
    void setup_list(CLI::App* app, Command& selected);
    void setup_describe(CLI::App* app, Command& selected);
    void setup_update(CLI::App* app, Command& selected);
    void setup_rebuild(CLI::App* app, Command& selected);
    void setup_test(CLI::App* app, Command& selected);
    void setup_prefix(CLI::App* app, Command& selected);
    void setup_list_file(CLI::App* app, Command& selected, bool global);
    void setup_path(CLI::App* app, Command& selected);
}

namespace {

struct Dispatch {
    const octpkg::cli::GlobalOptions& opts;

    int operator()(std::monostate) const { return 0; }

    template <typename Cmd>
    int operator()(const Cmd& cmd) const {
        return octpkg::cli::run_command(opts, cmd);
    }
};

} // namespace

int main(int argc, char** argv) {
    using namespace octpkg::cli;

    CLI::App app{"octpkg - package manager for numerical environment add-ons"};
    app.set_version_flag("-V,--version", OCTPKG_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;
    Command selected;

    // Global options
    app.add_option("--home", opts.home, "octpkg state directory (default: ~/.octpkg)");
    app.add_option("--local-list", opts.local_list, "Local registry file");
    app.add_option("--global-list", opts.global_list, "Global registry file");
    app.add_option("--forge-url", opts.forge_url, "Package index base URL");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    commands::setup_install(app.add_subcommand("install", "Install packages"), selected);
    commands::setup_uninstall(app.add_subcommand("uninstall", "Remove installed packages"), selected);
    commands::setup_load(app.add_subcommand("load", "Add packages to the search path"), selected);
    commands::setup_unload(app.add_subcommand("unload", "Remove packages from the search path"), selected);
    commands::setup_list(app.add_subcommand("list", "List installed packages"), selected);
    commands::setup_describe(app.add_subcommand("describe", "Describe installed packages"), selected);
    commands::setup_update(app.add_subcommand("update", "Update installed packages from the index"), selected);
    commands::setup_rebuild(app.add_subcommand("rebuild", "Rebuild a registry from installed directories"), selected);
    commands::setup_test(app.add_subcommand("test", "Run package self tests"), selected);
    commands::setup_prefix(app.add_subcommand("prefix", "Show or set the installation prefix"), selected);
    commands::setup_list_file(app.add_subcommand("local-list", "Show or set the local registry file"), selected, false);
    commands::setup_list_file(app.add_subcommand("global-list", "Show or set the global registry file"), selected, true);
    commands::setup_path(app.add_subcommand("path", "Print the search path of loaded packages"), selected);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (std::holds_alternative<std::monostate>(selected)) {
        std::cout << app.help() << std::endl;
        return 0;
    }

    return std::visit(Dispatch{opts}, selected);
}
