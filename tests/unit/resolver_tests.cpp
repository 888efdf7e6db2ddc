#include <doctest/doctest.h>
#include <octpkg/resolver.hpp>

#include "test_support.hpp"

#include <algorithm>

using namespace octpkg;
using namespace octpkg::testing;

namespace {

std::vector<std::string> names_of(const std::vector<PackageRecord>& records) {
    std::vector<std::string> out;
    for (const auto& r : records) out.push_back(r.name);
    return out;
}

size_t position(const std::vector<std::string>& names, const std::string& name) {
    return static_cast<size_t>(std::find(names.begin(), names.end(), name) - names.begin());
}

} // namespace

// ============================================================================
// resolve_load_order
// ============================================================================

TEST_CASE("resolve_load_order puts dependencies first") {
    PackageMap effective = make_map({
        make_record("a", "1.0.0", {dep("b")}),
        make_record("b", "1.0.0"),
    });

    auto order = resolve_load_order("a", effective, false);
    REQUIRE(order.isOk());
    CHECK(names_of(order.value()) == std::vector<std::string>{"b", "a"});
}

TEST_CASE("resolve_load_order keeps declaration order between siblings") {
    PackageMap effective = make_map({
        make_record("app", "1.0.0", {dep("zeta"), dep("alpha"), dep("mid")}),
        make_record("zeta", "1.0.0"),
        make_record("alpha", "1.0.0"),
        make_record("mid", "1.0.0", {dep("alpha")}),
    });

    auto first = resolve_load_order("app", effective, false);
    auto second = resolve_load_order("app", effective, false);
    REQUIRE(first.isOk());
    REQUIRE(second.isOk());

    CHECK(names_of(first.value()) == std::vector<std::string>{"zeta", "alpha", "mid", "app"});
    CHECK(names_of(first.value()) == names_of(second.value()));
}

TEST_CASE("resolve_load_order visits shared dependencies once") {
    PackageMap effective = make_map({
        make_record("top", "1.0.0", {dep("left"), dep("right")}),
        make_record("left", "1.0.0", {dep("base")}),
        make_record("right", "1.0.0", {dep("base")}),
        make_record("base", "1.0.0"),
    });

    auto order = resolve_load_order("top", effective, false);
    REQUIRE(order.isOk());
    auto names = names_of(order.value());
    CHECK(names.size() == 4);
    CHECK(position(names, "base") < position(names, "left"));
    CHECK(position(names, "base") < position(names, "right"));
    CHECK(names.back() == "top");
}

TEST_CASE("resolve_load_order orders every dependency before its dependent on a deep chain") {
    std::vector<PackageRecord> records;
    const int depth = 2000;
    for (int i = 0; i < depth; ++i) {
        std::vector<Dependency> deps;
        if (i + 1 < depth) deps.push_back(dep("p" + std::to_string(i + 1)));
        records.push_back(make_record("p" + std::to_string(i), "1.0.0", deps));
    }

    auto order = resolve_load_order("p0", make_map(records), false);
    REQUIRE(order.isOk());
    REQUIRE(order.value().size() == static_cast<size_t>(depth));
    CHECK(order.value().front().name == "p" + std::to_string(depth - 1));
    CHECK(order.value().back().name == "p0");
}

TEST_CASE("resolve_load_order fails on a missing dependency naming all of them") {
    PackageMap effective = make_map({
        make_record("a", "1.0.0", {dep("b"), dep("c"), dep("d")}),
        make_record("c", "1.0.0"),
    });

    auto order = resolve_load_order("a", effective, false);
    REQUIRE(order.isErr());
    CHECK(order.error().code() == ErrorCode::UnsatisfiedDependency);
    CHECK(order.error().names() == std::vector<std::string>{"b", "d"});
}

TEST_CASE("resolve_load_order treats a violated version constraint as unsatisfied") {
    PackageMap effective = make_map({
        make_record("a", "1.0.0", {dep("b", ConstraintOp::Ge, "2.0.0")}),
        make_record("b", "1.5.0"),
    });

    auto order = resolve_load_order("a", effective, false);
    REQUIRE(order.isErr());
    CHECK(order.error().code() == ErrorCode::UnsatisfiedDependency);
    CHECK(order.error().names() == std::vector<std::string>{"b"});
}

TEST_CASE("resolve_load_order skips missing dependencies when allowed") {
    PackageMap effective = make_map({
        make_record("a", "1.0.0", {dep("missing"), dep("b")}),
        make_record("b", "1.0.0"),
    });

    auto order = resolve_load_order("a", effective, true);
    REQUIRE(order.isOk());
    CHECK(names_of(order.value()) == std::vector<std::string>{"b", "a"});
}

TEST_CASE("resolve_load_order reports an unknown target") {
    auto order = resolve_load_order("ghost", PackageMap{}, true);
    REQUIRE(order.isErr());
    CHECK(order.error().code() == ErrorCode::NotFoundError);
}

TEST_CASE("resolve_load_order rejects cycles") {
    SUBCASE("self reference") {
        PackageMap effective = make_map({make_record("a", "1.0.0", {dep("a")})});
        auto order = resolve_load_order("a", effective, false);
        REQUIRE(order.isErr());
        CHECK(order.error().code() == ErrorCode::CyclicDependency);
        CHECK(order.error().names() == std::vector<std::string>{"a", "a"});
    }

    SUBCASE("mutual") {
        PackageMap effective = make_map({
            make_record("a", "1.0.0", {dep("b")}),
            make_record("b", "1.0.0", {dep("a")}),
        });
        auto order = resolve_load_order("a", effective, false);
        REQUIRE(order.isErr());
        CHECK(order.error().code() == ErrorCode::CyclicDependency);
        CHECK(order.error().names() == std::vector<std::string>{"a", "b", "a"});
    }

    SUBCASE("cycle below the target") {
        PackageMap effective = make_map({
            make_record("top", "1.0.0", {dep("x")}),
            make_record("x", "1.0.0", {dep("y")}),
            make_record("y", "1.0.0", {dep("x")}),
        });
        auto order = resolve_load_order("top", effective, true);
        REQUIRE(order.isErr());
        CHECK(order.error().names() == std::vector<std::string>{"x", "y", "x"});
    }
}

// ============================================================================
// Safety checks
// ============================================================================

TEST_CASE("resolve_unload_safety only considers other loaded packages") {
    PackageMap effective = make_map({
        make_record("a", "1.0.0", {dep("base")}),
        make_record("b", "1.0.0", {dep("base")}),
        make_record("c", "1.0.0", {dep("base")}),
        make_record("base", "1.0.0"),
    });

    auto verdict = resolve_unload_safety("base", effective, {"base", "a", "c"}, false);
    CHECK_FALSE(verdict.ok());
    CHECK(verdict.blocked_by == std::vector<std::string>{"a", "c"});

    auto clear = resolve_unload_safety("base", effective, {"base", "b"}, false, {"b"});
    CHECK(clear.ok());
}

TEST_CASE("resolve_unload_safety is overridden by allow_missing") {
    PackageMap effective = make_map({
        make_record("a", "1.0.0", {dep("base")}),
        make_record("base", "1.0.0"),
    });

    auto verdict = resolve_unload_safety("base", effective, {"a", "base"}, true);
    CHECK(verdict.ok());
    CHECK(verdict.overridden);
    CHECK(verdict.blocked_by == std::vector<std::string>{"a"});
}

TEST_CASE("resolve_uninstall_safety considers unloaded dependents") {
    PackageMap installed = make_map({
        make_record("a", "1.0.0", {dep("b")}),
        make_record("b", "1.0.0"),
    });

    auto verdict = resolve_uninstall_safety("b", installed, false);
    CHECK_FALSE(verdict.ok());
    CHECK(verdict.blocked_by == std::vector<std::string>{"a"});

    CHECK(resolve_uninstall_safety("a", installed, false).ok());
    CHECK(resolve_uninstall_safety("b", installed, false, {"a"}).ok());
    CHECK(resolve_uninstall_safety("b", installed, true).ok());
}

TEST_CASE("resolve_uninstall_safety accepts a remaining copy that satisfies dependents") {
    PackageMap installed = make_map({
        make_record("a", "1.0.0", {dep("b", ConstraintOp::Ge, "1.0.0")}),
        make_record("b", "2.0.0"),
    });

    PackageRecord other_copy = make_record("b", "1.5.0");
    CHECK(resolve_uninstall_safety("b", installed, false, {}, &other_copy).ok());

    PackageRecord too_old = make_record("b", "0.9.0");
    auto verdict = resolve_uninstall_safety("b", installed, false, {}, &too_old);
    CHECK_FALSE(verdict.ok());
    CHECK(verdict.blocked_by == std::vector<std::string>{"a"});
}

// ============================================================================
// resolve_install_order
// ============================================================================

TEST_CASE("resolve_install_order installs requested dependencies first") {
    std::vector<PackageRecord> requested = {
        make_record("a", "1.0.0", {dep("b")}),
        make_record("c", "1.0.0"),
        make_record("b", "1.0.0", {dep("installed")}),
    };
    PackageMap effective = make_map({make_record("installed", "1.0.0")});

    auto order = resolve_install_order(requested, effective);
    REQUIRE(order.isOk());
    CHECK(order.value() == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("resolve_install_order excludes packages already installed at the same version") {
    std::vector<PackageRecord> requested = {
        make_record("a", "1.0.0"),
        make_record("b", "2.0.0"),
    };
    PackageMap effective = make_map({make_record("a", "1.0.0"), make_record("b", "1.0.0")});

    auto order = resolve_install_order(requested, effective);
    REQUIRE(order.isOk());
    CHECK(order.value() == std::vector<std::string>{"b"});
}

TEST_CASE("resolve_install_order collapses duplicate requests and rejects conflicts") {
    auto same = resolve_install_order({make_record("a", "1.0.0"), make_record("a", "1.0")}, {});
    REQUIRE(same.isErr());
    CHECK(same.error().code() == ErrorCode::UnresolvableRequest);

    auto dup = resolve_install_order({make_record("a", "1.0.0"), make_record("a", "1.0.0")}, {});
    REQUIRE(dup.isOk());
    CHECK(dup.value() == std::vector<std::string>{"a"});
}

TEST_CASE("resolve_install_order rejects a cycle inside the request") {
    std::vector<PackageRecord> requested = {
        make_record("a", "1.0.0", {dep("b")}),
        make_record("b", "1.0.0", {dep("a")}),
    };
    auto order = resolve_install_order(requested, {});
    REQUIRE(order.isErr());
    CHECK(order.error().code() == ErrorCode::CyclicDependency);
    CHECK(order.error().names() == std::vector<std::string>{"a", "b", "a"});
}

// ============================================================================
// validate_dependencies
// ============================================================================

TEST_CASE("validate_dependencies lists every unmet requirement") {
    PackageRecord record = make_record("a", "1.0.0",
                                       {dep("b", ConstraintOp::Ge, "2.0.0"), dep("c"), dep("d")});
    PackageMap available = make_map({make_record("b", "1.0.0"), make_record("d", "1.0.0")});

    auto result = validate_dependencies(record, available);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::UnsatisfiedDependency);
    CHECK(result.error().names() == std::vector<std::string>{"b", "c"});
}

TEST_CASE("validate_dependencies checks the runtime requirement when a version is known") {
    PackageRecord record = make_record("a", "1.0.0");
    record.runtime_requirement = dep("octave", ConstraintOp::Ge, "8.0.0");

    CHECK(validate_dependencies(record, {}).isOk());
    CHECK(validate_dependencies(record, {}, "8.4.0").isOk());

    auto old = validate_dependencies(record, {}, "7.1.0");
    REQUIRE(old.isErr());
    CHECK(old.error().names() == std::vector<std::string>{"octave"});
}
