#include <doctest/doctest.h>
#include <octpkg/version.hpp>

#include <vector>

using namespace octpkg;

namespace {

Ordering cmp(const std::string& a, const std::string& b) {
    auto r = compare_versions(a, b);
    REQUIRE(r.isOk());
    return r.value();
}

} // namespace

TEST_CASE("parse_version splits numeric segments") {
    auto r = parse_version("1.12.0");
    REQUIRE(r.isOk());
    CHECK(r.value() == VersionSegments{1, 12, 0});
}

TEST_CASE("parse_version accepts a single segment and surrounding whitespace") {
    auto r = parse_version("  7 ");
    REQUIRE(r.isOk());
    CHECK(r.value() == VersionSegments{7});
}

TEST_CASE("parse_version rejects malformed input") {
    for (const char* bad : {"", "1..2", ".1", "1.", "1.2a", "-1", "1.2.beta", "1,2"}) {
        auto r = parse_version(bad);
        CHECK_MESSAGE(r.isErr(), bad);
        if (r.isErr()) CHECK(r.error().code() == ErrorCode::InvalidVersion);
    }
}

TEST_CASE("parse_version rejects segments that overflow") {
    CHECK(parse_version("99999999999999999999999").isErr());
}

TEST_CASE("compare_versions orders segments numerically") {
    CHECK(cmp("1.2.3", "1.2.3") == Ordering::Equal);
    CHECK(cmp("1.2.3", "1.2.4") == Ordering::Less);
    CHECK(cmp("1.10.0", "1.9.0") == Ordering::Greater);
    CHECK(cmp("2.0.0", "10.0.0") == Ordering::Less);
}

TEST_CASE("compare_versions treats a strict prefix as smaller") {
    CHECK(cmp("1.2.0", "1.2") == Ordering::Greater);
    CHECK(cmp("1.2", "1.2.0") == Ordering::Less);
    CHECK(cmp("1", "1.0.0.0") == Ordering::Less);
}

TEST_CASE("compare_versions fails on invalid input") {
    auto r = compare_versions("1.2", "1.x");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::InvalidVersion);
}

TEST_CASE("compare_versions is a total order on equal-length versions") {
    std::vector<std::string> versions = {"0.0.1", "0.1.0", "1.0.0", "1.0.10", "1.2.3", "2.0.0", "10.0.0"};

    for (const auto& a : versions) {
        for (const auto& b : versions) {
            Ordering ab = cmp(a, b);
            Ordering ba = cmp(b, a);
            // antisymmetric
            if (ab == Ordering::Less) CHECK(ba == Ordering::Greater);
            if (ab == Ordering::Greater) CHECK(ba == Ordering::Less);
            if (ab == Ordering::Equal) CHECK(a == b);

            for (const auto& c : versions) {
                if (ab == Ordering::Less && cmp(b, c) == Ordering::Less) {
                    CHECK(cmp(a, c) == Ordering::Less);
                }
            }
        }
    }
}

TEST_CASE("satisfies evaluates every constraint operator") {
    CHECK(satisfies("1.2.0", ConstraintOp::Any, "").value());
    CHECK(satisfies("1.2.0", ConstraintOp::Eq, "1.2.0").value());
    CHECK_FALSE(satisfies("1.2.0", ConstraintOp::Eq, "1.2").value());
    CHECK(satisfies("1.2.0", ConstraintOp::Ne, "1.3.0").value());
    CHECK(satisfies("1.2.0", ConstraintOp::Lt, "1.3.0").value());
    CHECK(satisfies("1.2.0", ConstraintOp::Le, "1.2.0").value());
    CHECK(satisfies("1.3.0", ConstraintOp::Gt, "1.2.9").value());
    CHECK(satisfies("1.2.0", ConstraintOp::Ge, "1.2.0").value());
    CHECK_FALSE(satisfies("1.1.9", ConstraintOp::Ge, "1.2.0").value());
}

TEST_CASE("satisfies propagates invalid versions") {
    auto r = satisfies("abc", ConstraintOp::Ge, "1.0.0");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::InvalidVersion);
}

TEST_CASE("ordering_to_string") {
    CHECK(std::string(ordering_to_string(Ordering::Less)) == "LESS");
    CHECK(std::string(ordering_to_string(Ordering::Equal)) == "EQUAL");
    CHECK(std::string(ordering_to_string(Ordering::Greater)) == "GREATER");
}
