#include "octpkg/builder.hpp"
#include "octpkg/archive.hpp"
#include "octpkg/description.hpp"
#include "octpkg/platform.hpp"

#include <spdlog/spdlog.h>

#include <sys/stat.h>

namespace octpkg {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_executable(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && (st.st_mode & S_IXUSR);
}

// Quote a path for a single-quoted interpreter string literal
std::string quote_literal(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += "'";
    return out;
}

Error build_failure(const std::string& package, const std::string& step, const ExecResult& res,
                    const std::string& log_file) {
    std::string message = step + " failed for " + package;
    if (!res.ok) {
        message += ": " + res.error;
    } else {
        message += " (exit code " + std::to_string(res.exit_code) + ")";
    }
    if (!log_file.empty() && path_exists(log_file)) {
        message += "; see " + log_file;
    }
    return Error(ErrorCode::BuildError, message, {package});
}

} // namespace

bool is_arch_file(const std::string& path) {
    return ends_with(path, ".oct") || ends_with(path, ".mex");
}

MakeToolchain::MakeToolchain(ToolchainOptions options) : options_(std::move(options)) {}

ExecResult MakeToolchain::run_step(const std::vector<std::string>& argv, const std::string& cwd) {
    ProcessSpec spec;
    spec.argv = argv;
    spec.cwd = cwd;
    spec.env["MKOCTFILE"] = options_.mkoctfile;
    spec.show_output = options_.verbose;
    spec.log_file = join_path(cwd, "octpkg-build.log");
    return run_process(spec);
}

Result<BuildManifest> MakeToolchain::build(const std::string& staging_path) {
    using R = Result<BuildManifest>;

    auto root = find_package_root(staging_path);
    if (root.isErr()) return R::err(root.error());

    BuildManifest manifest;
    manifest.package_root = root.value();
    manifest.inst_dir = join_path(manifest.package_root, "inst");

    std::string desc_path = join_path(manifest.package_root, "DESCRIPTION");
    auto content = read_file(desc_path);
    if (!content) {
        return R::err(Error(ErrorCode::IoError, "failed to read " + desc_path));
    }

    auto parsed = parse_description(*content, desc_path);
    if (!parsed.ok) {
        return R::err(Error(ErrorCode::InvalidDescription, desc_path + ": " + parsed.error));
    }
    for (const auto& warning : parsed.warnings) {
        spdlog::warn("{}: {}", desc_path, warning);
    }
    manifest.description = std::move(parsed.description);
    const std::string& name = manifest.description.name;

    if (!is_regular_file(join_path(manifest.package_root, "COPYING"))) {
        return R::err(Error(ErrorCode::InvalidDescription,
                            "package " + name + " has no COPYING file", {name}));
    }

    std::string src_dir = join_path(manifest.package_root, "src");
    if (is_directory(src_dir)) {
        std::string configure = join_path(src_dir, "configure");
        if (is_regular_file(configure)) {
            spdlog::debug("configuring {}", name);
            std::vector<std::string> argv = is_executable(configure)
                ? std::vector<std::string>{"./configure"}
                : std::vector<std::string>{"/bin/sh", "configure"};
            auto res = run_step(argv, src_dir);
            if (!res.ok || res.exit_code != 0) {
                return R::err(build_failure(name, "configure", res, join_path(src_dir, "octpkg-build.log")));
            }
        }

        if (is_regular_file(join_path(src_dir, "Makefile"))) {
            spdlog::debug("building {} with {}", name, options_.make_program);
            auto res = run_step({options_.make_program}, src_dir);
            if (!res.ok || res.exit_code != 0) {
                return R::err(build_failure(name, options_.make_program, res,
                                            join_path(src_dir, "octpkg-build.log")));
            }
        }

        for (const auto& entry : list_directory(src_dir)) {
            if (!is_regular_file(join_path(src_dir, entry))) continue;
            if (is_arch_file(entry)) {
                manifest.arch_files.push_back("src/" + entry);
            } else if (ends_with(entry, ".m")) {
                manifest.provided_files.push_back("src/" + entry);
            }
        }
    }

    if (is_directory(manifest.inst_dir)) {
        for (const auto& rel : list_files_recursive(manifest.inst_dir)) {
            if (is_arch_file(rel)) {
                manifest.arch_files.push_back("inst/" + rel);
            } else {
                manifest.provided_files.push_back("inst/" + rel);
            }
        }
    }

    for (const char* hook : {"PKG_ADD", "PKG_DEL"}) {
        if (is_regular_file(join_path(manifest.package_root, hook))) {
            manifest.provided_files.push_back(hook);
        }
    }

    spdlog::debug("built {} {}: {} files, {} compiled", name, manifest.description.version,
                  manifest.provided_files.size(), manifest.arch_files.size());
    return R::ok(std::move(manifest));
}

// ============================================================================
// Self tests
// ============================================================================

std::string build_test_script(const std::vector<std::string>& directories,
                              const std::vector<std::string>& search_path) {
    std::string dirs;
    for (const auto& d : directories) {
        if (!dirs.empty()) dirs += ", ";
        dirs += quote_literal(d);
    }

    // addpath prepends, so add the back of the path first
    std::string script;
    for (auto it = search_path.rbegin(); it != search_path.rend(); ++it) {
        script += "addpath (" + quote_literal(*it) + "); ";
    }

    return script + "dirs = {" + dirs + "}; failed = 0; "
           "for i = 1:numel (dirs), "
           "files = [glob(fullfile (dirs{i}, '*.m')); glob(fullfile (dirs{i}, '*.oct'))]; "
           "for j = 1:numel (files), "
           "[~, fn] = fileparts (files{j}); "
           "[n, nmax] = test (fn, 'quiet', stdout); failed += nmax - n; "
           "end; end; "
           "exit (failed > 0);";
}

InterpreterTestRunner::InterpreterTestRunner(std::string program, bool verbose)
    : program_(std::move(program)), verbose_(verbose) {}

Result<TestOutcome> InterpreterTestRunner::run(const std::string& package,
                                               const std::vector<std::string>& directories,
                                               const std::vector<std::string>& search_path) {
    ProcessSpec spec;
    spec.argv = {program_, "--norc", "--quiet", "--eval", build_test_script(directories, search_path)};
    spec.show_output = verbose_;

    auto res = run_process(spec);
    if (!res.ok) {
        return Result<TestOutcome>::err(Error(ErrorCode::BuildError,
                                              "failed to run tests for " + package + ": " + res.error,
                                              {package}));
    }

    TestOutcome outcome;
    outcome.exit_code = res.exit_code;
    outcome.passed = res.exit_code == 0;
    if (res.exit_code == 127) {
        outcome.detail = program_ + " could not be started";
    } else if (!outcome.passed) {
        outcome.detail = "tests failed (exit code " + std::to_string(res.exit_code) + ")";
    }
    return Result<TestOutcome>::ok(std::move(outcome));
}

} // namespace octpkg
