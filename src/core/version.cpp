#include "octpkg/version.hpp"

#include <cctype>
#include <limits>

namespace octpkg {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

Error invalid_version(const std::string& str, const std::string& reason) {
    return Error(ErrorCode::InvalidVersion, "invalid version '" + str + "': " + reason);
}

} // namespace

const char* ordering_to_string(Ordering o) {
    switch (o) {
        case Ordering::Less: return "LESS";
        case Ordering::Equal: return "EQUAL";
        case Ordering::Greater: return "GREATER";
        default: return "EQUAL";
    }
}

Result<VersionSegments> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) {
        return Result<VersionSegments>::err(invalid_version(str, "empty"));
    }

    VersionSegments segments;
    std::uint64_t current = 0;
    bool have_digit = false;

    for (char c : s) {
        if (c == '.') {
            if (!have_digit) {
                return Result<VersionSegments>::err(invalid_version(str, "empty segment"));
            }
            segments.push_back(current);
            current = 0;
            have_digit = false;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Result<VersionSegments>::err(
                invalid_version(str, std::string("unexpected character '") + c + "'"));
        }
        auto digit = static_cast<std::uint64_t>(c - '0');
        if (current > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return Result<VersionSegments>::err(invalid_version(str, "segment out of range"));
        }
        current = current * 10 + digit;
        have_digit = true;
    }

    if (!have_digit) {
        return Result<VersionSegments>::err(invalid_version(str, "empty segment"));
    }
    segments.push_back(current);

    return Result<VersionSegments>::ok(std::move(segments));
}

bool is_valid_version(const std::string& str) {
    return parse_version(str).isOk();
}

Ordering compare_segments(const VersionSegments& a, const VersionSegments& b) {
    size_t common = a.size() < b.size() ? a.size() : b.size();
    for (size_t i = 0; i < common; ++i) {
        if (a[i] < b[i]) return Ordering::Less;
        if (a[i] > b[i]) return Ordering::Greater;
    }
    if (a.size() < b.size()) return Ordering::Less;
    if (a.size() > b.size()) return Ordering::Greater;
    return Ordering::Equal;
}

Result<Ordering> compare_versions(const std::string& a, const std::string& b) {
    auto pa = parse_version(a);
    if (pa.isErr()) return Result<Ordering>::err(pa.error());
    auto pb = parse_version(b);
    if (pb.isErr()) return Result<Ordering>::err(pb.error());
    return Result<Ordering>::ok(compare_segments(pa.value(), pb.value()));
}

Result<bool> satisfies(const std::string& version, ConstraintOp op, const std::string& required) {
    if (op == ConstraintOp::Any) {
        return Result<bool>::ok(true);
    }

    auto cmp = compare_versions(version, required);
    if (cmp.isErr()) return Result<bool>::err(cmp.error());

    Ordering o = cmp.value();
    switch (op) {
        case ConstraintOp::Eq: return Result<bool>::ok(o == Ordering::Equal);
        case ConstraintOp::Ne: return Result<bool>::ok(o != Ordering::Equal);
        case ConstraintOp::Lt: return Result<bool>::ok(o == Ordering::Less);
        case ConstraintOp::Le: return Result<bool>::ok(o != Ordering::Greater);
        case ConstraintOp::Gt: return Result<bool>::ok(o == Ordering::Greater);
        case ConstraintOp::Ge: return Result<bool>::ok(o != Ordering::Less);
        case ConstraintOp::Any: break;
    }
    return Result<bool>::ok(true);
}

Result<bool> satisfies(const std::string& version, const Dependency& dep) {
    return satisfies(version, dep.op, dep.version);
}

} // namespace octpkg
