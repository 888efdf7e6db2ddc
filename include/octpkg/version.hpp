#pragma once

/**
 * @file version.hpp
 * @brief Dot-separated numeric version support
 *
 * Package versions are sequences of non-negative integers separated by '.'
 * (e.g. "1.2.3", "2.0", "10"). This header provides:
 * - Version parsing into numeric segments
 * - Total ordering (a strict prefix compares LESS: "1.2" < "1.2.0")
 * - Constraint satisfaction for dependency operators
 *
 * @example
 * ```cpp
 * #include <octpkg/version.hpp>
 *
 * auto cmp = octpkg::compare_versions("1.10.0", "1.9.2");
 * if (cmp.isOk() && cmp.value() == octpkg::Ordering::Greater) {
 *     // newer
 * }
 * ```
 */

#include "octpkg/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace octpkg {

enum class Ordering {
    Less,
    Equal,
    Greater
};

const char* ordering_to_string(Ordering o);

/// Parsed numeric segments of a version string
using VersionSegments = std::vector<std::uint64_t>;

/**
 * @brief Parse a version string into numeric segments
 * @param str Version string (e.g. "1.2.3"); surrounding whitespace is ignored
 * @return Segments, or InvalidVersion for empty strings, empty segments,
 *         non-digit characters or values that overflow
 */
Result<VersionSegments> parse_version(const std::string& str);

/// Check if a string is a well-formed version
bool is_valid_version(const std::string& str);

/// Compare two parsed versions segment by segment
Ordering compare_segments(const VersionSegments& a, const VersionSegments& b);

/**
 * @brief Compare two version strings
 *
 * The first differing segment decides; when one is a strict prefix of the
 * other the shorter one is LESS.
 */
Result<Ordering> compare_versions(const std::string& a, const std::string& b);

/// Check `version OP required`; Any is always satisfied
Result<bool> satisfies(const std::string& version, ConstraintOp op, const std::string& required);

/// Check a version against a dependency's constraint
Result<bool> satisfies(const std::string& version, const Dependency& dep);

} // namespace octpkg
