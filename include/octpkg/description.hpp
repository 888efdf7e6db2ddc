#pragma once

#include "octpkg/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace octpkg {

// ============================================================================
// Package Description (DESCRIPTION file)
// ============================================================================

/// Dependency name that refers to the numerical environment itself
inline constexpr const char* kRuntimeDependencyName = "octave";

struct Description {
    std::string name;
    std::string version;
    std::string date;
    std::string author;
    std::string maintainer;
    std::string title;
    std::string description;
    std::string license;
    std::string url;

    std::vector<Dependency> depends;               // package dependencies only
    std::optional<Dependency> runtime_requirement; // "octave (>= x)"
    std::vector<std::string> system_requirements;
    std::vector<std::string> build_requires;
    std::optional<bool> autoload;

    // Keys not listed above, lowercased key -> raw value
    std::map<std::string, std::string> extra;

    std::string source_path;
};

struct DescriptionParseResult {
    bool ok = false;
    std::string error;
    Description description;
    std::vector<std::string> warnings;
};

// Parse the contents of a DESCRIPTION file
DescriptionParseResult parse_description(const std::string& content,
                                         const std::string& source_path = "");

// Parse a "Depends" value: "octave (>= 4.0), control (>= 2.0), signal"
// The runtime dependency is returned separately through runtime_out.
Result<std::vector<Dependency>> parse_depends(const std::string& value,
                                              std::optional<Dependency>* runtime_out = nullptr);

// Check package name syntax: [A-Za-z0-9._-]+
bool is_valid_package_name(const std::string& name);

// Build a PackageRecord skeleton (no paths) from a parsed description
PackageRecord record_from_description(const Description& desc);

// Serialize a description back to DESCRIPTION syntax
std::string format_description(const Description& desc);

} // namespace octpkg
