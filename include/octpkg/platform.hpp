#pragma once

#include <optional>
#include <string>
#include <vector>

namespace octpkg {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Scoped Staging Directory
// ============================================================================

/**
 * @brief Temporary directory removed on every exit path
 *
 * Created under `parent` (system temp directory when empty) with a random
 * suffix. The directory and everything inside it is removed by the
 * destructor.
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "octpkg", const std::string& parent = "");
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
};

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Make a path absolute and lexically normal; "~/" is expanded
std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// List directory entry names (not full paths), sorted
std::vector<std::string> list_directory(const std::string& path);

// Recursively list regular files below root as relative paths, sorted
std::vector<std::string> list_files_recursive(const std::string& root);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively; an absent path is not an error
bool remove_directory(const std::string& path);

// Copy a directory tree, overwriting files at the destination
bool copy_directory(const std::string& src, const std::string& dst, std::string* error = nullptr);

// Copy a file, creating the destination's parent directory
bool copy_file(const std::string& src, const std::string& dst);

// Rename a file or directory within one filesystem
bool rename_path(const std::string& from, const std::string& to);

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Home directory of the current user
std::string get_home_directory();

// True when running with system (root) privileges
bool is_privileged_user();

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a random lowercase hex string of the given length
std::string random_hex(size_t length);

} // namespace octpkg
