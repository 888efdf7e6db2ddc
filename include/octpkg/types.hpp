#pragma once

/**
 * @file types.hpp
 * @brief Core data model shared by every octpkg module
 *
 * Provides:
 * - PackageRecord: metadata of one installed package
 * - Dependency: a (name, operator, version) requirement
 * - Error / Result<T>: error handling for fallible operations
 */

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace octpkg {

// ============================================================================
// Installer (registry ownership)
// ============================================================================

enum class Installer {
    User,    ///< local registry, owned by the current user
    System   ///< global registry, owned by the system
};

inline const char* installer_to_string(Installer i) {
    switch (i) {
        case Installer::User: return "user";
        case Installer::System: return "system";
        default: return "user";
    }
}

// ============================================================================
// Dependency constraints
// ============================================================================

enum class ConstraintOp {
    Any,  ///< no version requirement
    Eq,   ///< == or =
    Ne,   ///< !=
    Lt,   ///< <
    Le,   ///< <=
    Gt,   ///< >
    Ge    ///< >=
};

const char* constraint_op_to_string(ConstraintOp op);

std::optional<ConstraintOp> parse_constraint_op(const std::string& s);

struct Dependency {
    std::string name;
    ConstraintOp op = ConstraintOp::Any;
    std::string version;  // empty when op == Any

    /// Human readable form, e.g. "control (>= 2.0.0)"
    std::string to_string() const;
};

// ============================================================================
// Package Record
// ============================================================================

struct PackageRecord {
    // identity
    std::string name;
    std::string version;

    // installed locations
    std::string directory;       // absolute path to installed files
    std::string arch_directory;  // absolute path to compiled files, may be empty

    // declared requirements, in declaration order
    std::vector<Dependency> dependencies;
    std::optional<Dependency> runtime_requirement;  // the "octave" dependency

    Installer installer = Installer::User;
    bool autoload = false;

    // descriptive metadata (informational only)
    std::string date;
    std::string title;
    std::string description;
    std::string author;
    std::string maintainer;
    std::string license;
    std::string url;

    // provenance
    std::string installed_at;
    std::string source;
};

/// Name-keyed view of installed packages (the "effective installed set").
using PackageMap = std::map<std::string, PackageRecord>;

// ============================================================================
// Error Handling
// ============================================================================

enum class ErrorCode {
    InvalidVersion,
    CorruptRegistry,
    CyclicDependency,
    UnsatisfiedDependency,
    UnresolvableRequest,
    BlockedBy,
    FetchError,
    BuildError,
    NotFoundError,
    InvalidDescription,
    InvalidArgument,
    IoError,
};

const char* error_code_to_string(ErrorCode code);

/**
 * @brief Error with code, message and the full set of offending package names
 *
 * `names` holds every name involved: the cycle path for CyclicDependency,
 * each missing package for UnsatisfiedDependency, the blocking set for
 * BlockedBy.
 */
class Error {
public:
    Error(ErrorCode code, std::string message, std::vector<std::string> names = {})
        : code_(code), message_(std::move(message)), names_(std::move(names)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::vector<std::string>& names() const { return names_; }
    std::string toString() const { return message_; }

private:
    ErrorCode code_;
    std::string message_;
    std::vector<std::string> names_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

// Join names as "a, b, c" for messages
std::string join_names(const std::vector<std::string>& names, const std::string& sep = ", ");

} // namespace octpkg
