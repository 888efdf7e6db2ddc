#pragma once

/**
 * @file config.hpp
 * @brief Install prefixes, registry locations and tool settings
 *
 * Resolution order, highest first:
 *   1. explicit overrides (command line flags)
 *   2. environment (OCTPKG_PREFIX, OCTPKG_ARCHPREFIX, OCTPKG_LOCAL_LIST,
 *      OCTPKG_GLOBAL_LIST, OCTPKG_FORGE_URL)
 *   3. <home>/config.json
 *   4. built-in defaults
 *
 * <home> is --home, else $OCTPKG_HOME, else ~/.octpkg.
 */

#include "octpkg/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace octpkg {

inline constexpr const char* kConfigSchema = "octpkg.config.v1";
inline constexpr const char* kDefaultGlobalRoot = "/usr/local/share/octpkg";

struct Config {
    std::string home;
    std::string config_file;

    // local (per-user) installation
    std::string prefix;
    std::string archprefix;
    std::string local_list;

    // global (system) installation
    std::string global_prefix;
    std::string global_archprefix;
    std::string global_list;

    std::string session_file;
    std::string forge_url;
    std::string runtime_version;   // empty: runtime requirement not checked
    std::string arch;

    std::string make_program;
    std::string mkoctfile;
    std::string test_command;
};

struct ConfigOverrides {
    std::optional<std::string> home;
    std::optional<std::string> prefix;
    std::optional<std::string> archprefix;
    std::optional<std::string> local_list;
    std::optional<std::string> global_list;
    std::optional<std::string> forge_url;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
};

// Architecture sub-directory name for compiled files, e.g. "x86_64-pc-linux-gnu"
std::string detect_arch();

// Home directory for octpkg state
std::string resolve_home(const std::optional<std::string>& override_home);

// Built-in defaults below `home`
Config default_config(const std::string& home);

// Apply config.json content on top of `config`; unknown keys produce warnings
ConfigParseResult apply_config_json(const std::string& content, Config& config);

// Resolve the full configuration
Result<Config> load_config(const ConfigOverrides& overrides = {});

// Config file content for the persisted settings
std::string serialize_config(const Config& config);

// Write the persisted settings to config.config_file atomically
Result<void> save_config(const Config& config);

} // namespace octpkg
