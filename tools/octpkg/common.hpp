/**
 * octpkg CLI - Common utilities and types
 */

#pragma once

#include <octpkg/config.hpp>
#include <octpkg/logging.hpp>
#include <octpkg/package_manager.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace octpkg::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string home;              // --home
    std::string local_list;        // --local-list
    std::string global_list;       // --global-list
    std::string forge_url;         // --forge-url
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

// ============================================================================
// Commands
// ============================================================================

struct InstallCommand {
    std::vector<std::string> sources;
    bool no_deps = false;
    bool local = false;
    bool global = false;
    bool forge = false;
    bool force = false;
};

struct UninstallCommand {
    std::vector<std::string> names;
    bool no_deps = false;
    bool local = false;
    bool global = false;
};

struct LoadCommand {
    std::vector<std::string> names;
    bool no_deps = false;
};

struct UnloadCommand {
    std::vector<std::string> names;
    bool no_deps = false;
};

struct ListCommand {
    std::vector<std::string> names;
    bool forge = false;
};

struct DescribeCommand {
    std::vector<std::string> names;
    bool status = false;
};

struct UpdateCommand {
    std::vector<std::string> names;
    bool no_deps = false;
};

struct RebuildCommand {
    std::vector<std::string> names;
    bool global = false;
};

struct TestCommand {
    std::vector<std::string> names;
};

struct PrefixCommand {
    std::string prefix;
    std::string archprefix;
};

struct ListFileCommand {
    bool global = false;   // global-list instead of local-list
    std::string file;
};

struct PathCommand {};

using Command = std::variant<std::monostate,
                             InstallCommand,
                             UninstallCommand,
                             LoadCommand,
                             UnloadCommand,
                             ListCommand,
                             DescribeCommand,
                             UpdateCommand,
                             RebuildCommand,
                             TestCommand,
                             PrefixCommand,
                             ListFileCommand,
                             PathCommand>;

// One handler per command; each returns the process exit code
int run_command(const GlobalOptions& opts, const InstallCommand& cmd);
int run_command(const GlobalOptions& opts, const UninstallCommand& cmd);
int run_command(const GlobalOptions& opts, const LoadCommand& cmd);
int run_command(const GlobalOptions& opts, const UnloadCommand& cmd);
int run_command(const GlobalOptions& opts, const ListCommand& cmd);
int run_command(const GlobalOptions& opts, const DescribeCommand& cmd);
int run_command(const GlobalOptions& opts, const UpdateCommand& cmd);
int run_command(const GlobalOptions& opts, const RebuildCommand& cmd);
int run_command(const GlobalOptions& opts, const TestCommand& cmd);
int run_command(const GlobalOptions& opts, const PrefixCommand& cmd);
int run_command(const GlobalOptions& opts, const ListFileCommand& cmd);
int run_command(const GlobalOptions& opts, const PathCommand& cmd);

// ============================================================================
// Output
// ============================================================================

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = error_code_to_string(error.code());
        if (!error.names().empty()) j["names"] = error.names();
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.message() << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline nlohmann::json failures_to_json(const std::vector<PackageFailure>& failures) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : failures) {
        arr.push_back({{"package", f.package},
                       {"code", error_code_to_string(f.error.code())},
                       {"error", f.error.message()}});
    }
    return arr;
}

inline void print_failures(const std::vector<PackageFailure>& failures) {
    for (const auto& f : failures) {
        std::cerr << "Error: " << f.package << ": " << f.error.message() << std::endl;
    }
}

// ============================================================================
// Setup shared by commands
// ============================================================================

/**
 * Start a command: logging, warnings and configuration.
 * Prints the error and returns nullopt when the configuration is invalid.
 */
inline std::optional<Config> begin_command(const GlobalOptions& opts) {
    init_logging(opts.verbose, opts.quiet || opts.json);
    init_warning_collector(opts.json, opts.quiet);

    ConfigOverrides overrides;
    if (!opts.home.empty()) overrides.home = opts.home;
    if (!opts.local_list.empty()) overrides.local_list = opts.local_list;
    if (!opts.global_list.empty()) overrides.global_list = opts.global_list;
    if (!opts.forge_url.empty()) overrides.forge_url = opts.forge_url;

    auto config = load_config(overrides);
    if (config.isErr()) {
        print_error(config.error(), opts.json);
        return std::nullopt;
    }
    return config.value();
}

/**
 * Open the registries and session for a command.
 * Prints the error and returns nullptr on failure.
 */
inline std::unique_ptr<PackageManager> open_manager(const GlobalOptions& opts) {
    auto config = begin_command(opts);
    if (!config) return nullptr;

    auto pm = PackageManager::open(*config);
    if (pm.isErr()) {
        if (pm.error().code() == ErrorCode::CorruptRegistry) {
            print_error(pm.error().message() + " (run 'octpkg rebuild' to regenerate it)", opts.json);
        } else {
            print_error(pm.error(), opts.json);
        }
        return nullptr;
    }
    pm.value()->set_verbose(opts.verbose);
    return std::move(pm.value());
}

} // namespace octpkg::cli
