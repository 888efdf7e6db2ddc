#include <doctest/doctest.h>
#include <octpkg/builder.hpp>

#include "test_support.hpp"

#include <algorithm>

using namespace octpkg;
using namespace octpkg::testing;

namespace {

bool has(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

// ============================================================================
// run_process
// ============================================================================

TEST_CASE("run_process reports the exit code") {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "exit 3"};
    auto result = run_process(spec);
    CHECK(result.ok);
    CHECK(result.exit_code == 3);
}

TEST_CASE("run_process runs in cwd with extra environment and writes the log") {
    TempDir tmp;
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "echo \"$OCTPKG_TEST_VALUE\"; pwd"};
    spec.cwd = tmp.path();
    spec.env["OCTPKG_TEST_VALUE"] = "hello";
    spec.log_file = tmp.sub("out.log");

    auto result = run_process(spec);
    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);

    auto log = read_file(spec.log_file);
    REQUIRE(log.has_value());
    CHECK(log->find("hello") != std::string::npos);
    CHECK(log->find(fs::canonical(tmp.path()).string()) != std::string::npos);
}

TEST_CASE("run_process returns 127 for a missing program") {
    ProcessSpec spec;
    spec.argv = {"octpkg-no-such-program"};
    auto result = run_process(spec);
    CHECK(result.ok);
    CHECK(result.exit_code == 127);
}

TEST_CASE("run_process rejects an empty command line") {
    auto result = run_process(ProcessSpec{});
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

// ============================================================================
// MakeToolchain
// ============================================================================

TEST_CASE("is_arch_file") {
    CHECK(is_arch_file("src/filter.oct"));
    CHECK(is_arch_file("inst/private/kernel.mex"));
    CHECK_FALSE(is_arch_file("inst/filter.m"));
    CHECK_FALSE(is_arch_file("oct"));
}

TEST_CASE("MakeToolchain collects provided and compiled files") {
    TempDir tmp;
    std::string root = write_source_package(tmp.path(), "sig", "1.0.0");
    write_text(root + "/inst/private/helper.m", "");
    write_text(root + "/inst/fast.oct", "");
    write_text(root + "/src/extra.m", "");
    write_text(root + "/src/kernel.oct", "");
    write_text(root + "/src/kernel.cc", "");
    write_text(root + "/PKG_ADD", "");

    MakeToolchain toolchain;
    auto manifest = toolchain.build(tmp.path());
    REQUIRE(manifest.isOk());

    const BuildManifest& m = manifest.value();
    CHECK(m.package_root == root);
    CHECK(m.description.name == "sig");
    CHECK(has(m.provided_files, "inst/sig_fn.m"));
    CHECK(has(m.provided_files, "inst/private/helper.m"));
    CHECK(has(m.provided_files, "src/extra.m"));
    CHECK(has(m.provided_files, "PKG_ADD"));
    CHECK_FALSE(has(m.provided_files, "src/kernel.cc"));
    CHECK(has(m.arch_files, "inst/fast.oct"));
    CHECK(has(m.arch_files, "src/kernel.oct"));
}

TEST_CASE("MakeToolchain runs configure and reports a failing step") {
    TempDir tmp;
    std::string root = write_source_package(tmp.path(), "sig", "1.0.0");

    SUBCASE("successful configure") {
        write_text(root + "/src/configure", "echo configured > configured.txt\n");
        MakeToolchain toolchain;
        auto manifest = toolchain.build(root);
        REQUIRE(manifest.isOk());
        CHECK(fs::exists(root + "/src/configured.txt"));
    }

    SUBCASE("failing configure") {
        write_text(root + "/src/configure", "echo broken dependency\nexit 3\n");
        MakeToolchain toolchain;
        auto manifest = toolchain.build(root);
        REQUIRE(manifest.isErr());
        CHECK(manifest.error().code() == ErrorCode::BuildError);
        CHECK(manifest.error().message().find("exit code 3") != std::string::npos);
        CHECK(fs::exists(root + "/src/octpkg-build.log"));
    }
}

TEST_CASE("MakeToolchain rejects a bad DESCRIPTION") {
    TempDir tmp;
    std::string root = write_source_package(tmp.path(), "sig", "1.0.0");
    write_text(root + "/DESCRIPTION", "Name: sig\n");

    MakeToolchain toolchain;
    auto manifest = toolchain.build(root);
    REQUIRE(manifest.isErr());
    CHECK(manifest.error().code() == ErrorCode::InvalidDescription);
}

// ============================================================================
// InterpreterTestRunner
// ============================================================================

TEST_CASE("build_test_script adds the search path and quotes directories") {
    std::string script = build_test_script({"/p/it's"}, {"/p/first", "/p/second"});
    CHECK(script.find("dirs = {'/p/it''s'}") != std::string::npos);

    auto second = script.find("addpath ('/p/second')");
    auto first = script.find("addpath ('/p/first')");
    REQUIRE(second != std::string::npos);
    REQUIRE(first != std::string::npos);
    CHECK(second < first);
    CHECK(script.find("exit (failed > 0)") != std::string::npos);
}

TEST_CASE("InterpreterTestRunner maps the exit status") {
    SUBCASE("pass") {
        InterpreterTestRunner runner("true");
        auto outcome = runner.run("a", {"/p/a"}, {});
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().passed);
    }

    SUBCASE("fail") {
        InterpreterTestRunner runner("false");
        auto outcome = runner.run("a", {"/p/a"}, {});
        REQUIRE(outcome.isOk());
        CHECK_FALSE(outcome.value().passed);
        CHECK(outcome.value().detail.find("exit code 1") != std::string::npos);
    }

    SUBCASE("missing interpreter") {
        InterpreterTestRunner runner("octpkg-no-such-interpreter");
        auto outcome = runner.run("a", {"/p/a"}, {});
        REQUIRE(outcome.isOk());
        CHECK(outcome.value().exit_code == 127);
        CHECK(outcome.value().detail.find("could not be started") != std::string::npos);
    }
}
