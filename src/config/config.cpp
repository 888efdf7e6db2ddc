#include "octpkg/config.hpp"
#include "octpkg/fetcher.hpp"
#include "octpkg/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sys/utsname.h>

namespace octpkg {

namespace {

struct Setting {
    const char* key;
    std::string Config::*field;
    bool is_path;
};

// Settings persisted in config.json
const Setting kSettings[] = {
    {"prefix", &Config::prefix, true},
    {"archprefix", &Config::archprefix, true},
    {"local_list", &Config::local_list, true},
    {"global_prefix", &Config::global_prefix, true},
    {"global_archprefix", &Config::global_archprefix, true},
    {"global_list", &Config::global_list, true},
    {"session_file", &Config::session_file, true},
    {"forge_url", &Config::forge_url, false},
    {"runtime_version", &Config::runtime_version, false},
    {"arch", &Config::arch, false},
    {"make_program", &Config::make_program, false},
    {"mkoctfile", &Config::mkoctfile, false},
    {"test_command", &Config::test_command, false},
};

void apply_env(const char* var, std::string& field, bool is_path) {
    if (auto value = get_env(var); value && !value->empty()) {
        field = is_path ? absolute_path(*value) : *value;
    }
}

void apply_override(const std::optional<std::string>& value, std::string& field, bool is_path) {
    if (value && !value->empty()) {
        field = is_path ? absolute_path(*value) : *value;
    }
}

} // namespace

std::string detect_arch() {
    struct utsname info;
    if (uname(&info) != 0) {
        return "unknown-linux-gnu";
    }
    return std::string(info.machine) + "-pc-linux-gnu";
}

std::string resolve_home(const std::optional<std::string>& override_home) {
    if (override_home && !override_home->empty()) {
        return absolute_path(*override_home);
    }
    if (auto env = get_env("OCTPKG_HOME"); env && !env->empty()) {
        return absolute_path(*env);
    }
    return join_path(get_home_directory(), ".octpkg");
}

Config default_config(const std::string& home) {
    Config config;
    config.home = home;
    config.config_file = join_path(home, "config.json");

    config.prefix = join_path(home, "packages");
    config.archprefix = config.prefix;
    config.local_list = join_path(home, "registry.json");

    config.global_prefix = join_path(kDefaultGlobalRoot, "packages");
    config.global_archprefix = config.global_prefix;
    config.global_list = join_path(kDefaultGlobalRoot, "registry.json");

    config.session_file = join_path(home, "session.json");
    config.forge_url = kDefaultForgeUrl;
    config.arch = detect_arch();
    config.make_program = "make";
    config.mkoctfile = "mkoctfile";
    config.test_command = "octave-cli";
    return config;
}

ConfigParseResult apply_config_json(const std::string& content, Config& config) {
    ConfigParseResult result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("invalid JSON: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }

    if (j.contains("$schema")) {
        if (!j["$schema"].is_string() || j["$schema"].get<std::string>() != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }
    }

    for (const auto& [key, value] : j.items()) {
        if (key == "$schema") continue;

        const Setting* setting = nullptr;
        for (const auto& s : kSettings) {
            if (key == s.key) {
                setting = &s;
                break;
            }
        }

        if (!setting) {
            result.warnings.push_back("unknown key: " + key);
            continue;
        }
        if (!value.is_string()) {
            result.warnings.push_back(key + " must be a string");
            continue;
        }

        std::string v = value.get<std::string>();
        config.*(setting->field) = setting->is_path && !v.empty() ? absolute_path(v) : v;
    }

    result.ok = true;
    return result;
}

Result<Config> load_config(const ConfigOverrides& overrides) {
    Config config = default_config(resolve_home(overrides.home));

    if (auto content = read_file(config.config_file)) {
        auto parsed = apply_config_json(*content, config);
        if (!parsed.ok) {
            return Result<Config>::err(Error(ErrorCode::InvalidArgument,
                                             config.config_file + ": " + parsed.error));
        }
        for (const auto& warning : parsed.warnings) {
            spdlog::warn("{}: {}", config.config_file, warning);
        }
    }

    // A prefix set without an archprefix keeps compiled files beside it
    std::string archprefix_before = config.archprefix;
    bool arch_follows_prefix = config.archprefix == config.prefix;

    apply_env("OCTPKG_PREFIX", config.prefix, true);
    apply_env("OCTPKG_ARCHPREFIX", config.archprefix, true);
    apply_env("OCTPKG_LOCAL_LIST", config.local_list, true);
    apply_env("OCTPKG_GLOBAL_LIST", config.global_list, true);
    apply_env("OCTPKG_FORGE_URL", config.forge_url, false);

    apply_override(overrides.prefix, config.prefix, true);
    apply_override(overrides.archprefix, config.archprefix, true);
    apply_override(overrides.local_list, config.local_list, true);
    apply_override(overrides.global_list, config.global_list, true);
    apply_override(overrides.forge_url, config.forge_url, false);

    if (arch_follows_prefix && config.archprefix == archprefix_before) {
        config.archprefix = config.prefix;
    }

    return Result<Config>::ok(std::move(config));
}

std::string serialize_config(const Config& config) {
    nlohmann::json j;
    j["$schema"] = kConfigSchema;
    for (const auto& s : kSettings) {
        j[s.key] = config.*(s.field);
    }
    return j.dump(2) + "\n";
}

Result<void> save_config(const Config& config) {
    auto written = atomic_write_file(config.config_file, serialize_config(config));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IoError,
                                       "failed to write " + config.config_file + ": " + written.error));
    }
    return Result<void>::ok();
}

} // namespace octpkg
