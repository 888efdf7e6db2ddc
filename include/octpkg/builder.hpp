#pragma once

/**
 * @file builder.hpp
 * @brief Child process execution and the make-based build toolchain
 */

#include "octpkg/collaborators.hpp"

#include <map>
#include <string>
#include <vector>

namespace octpkg {

// ============================================================================
// Process execution
// ============================================================================

struct ProcessSpec {
    std::vector<std::string> argv;              // argv[0] is looked up in PATH
    std::string cwd;                            // empty: inherit
    std::map<std::string, std::string> env;     // added to the inherited environment
    bool show_output = false;                   // otherwise stdout/stderr go to log_file or /dev/null
    std::string log_file;
};

struct ExecResult {
    bool ok = false;        // the process ran and was waited for
    int exit_code = -1;     // 128 + signal when killed
    std::string error;
};

// Run a child process to completion using fork/exec
ExecResult run_process(const ProcessSpec& spec);

// ============================================================================
// Make toolchain
// ============================================================================

struct ToolchainOptions {
    std::string make_program = "make";
    std::string mkoctfile = "mkoctfile";
    bool verbose = false;
};

/**
 * @brief Builds package sources with configure / make
 *
 * Runs `./configure` and then make inside the package's src/ directory when
 * those files exist. Compiled .oct and .mex files become architecture
 * dependent outputs; .m files in src/ are installed with the inst/ tree.
 */
class MakeToolchain : public BuildToolchain {
public:
    explicit MakeToolchain(ToolchainOptions options = {});

    Result<BuildManifest> build(const std::string& staging_path) override;

private:
    ExecResult run_step(const std::vector<std::string>& argv, const std::string& cwd);

    ToolchainOptions options_;
};

/// Classify a file below src/ by extension
bool is_arch_file(const std::string& path);

// ============================================================================
// Self tests
// ============================================================================

/**
 * @brief Runs a package's embedded tests through the interpreter
 *
 * Invokes `<program> --norc --quiet --eval <script>`; the script runs the
 * tests of every function file in the package directories and exits
 * non-zero when any test fails.
 */
class InterpreterTestRunner : public TestRunner {
public:
    explicit InterpreterTestRunner(std::string program = "octave-cli", bool verbose = false);

    Result<TestOutcome> run(const std::string& package,
                            const std::vector<std::string>& directories,
                            const std::vector<std::string>& search_path) override;

private:
    std::string program_;
    bool verbose_;
};

/// Interpreter script that tests every function file in `directories`
std::string build_test_script(const std::vector<std::string>& directories,
                              const std::vector<std::string>& search_path);

} // namespace octpkg
