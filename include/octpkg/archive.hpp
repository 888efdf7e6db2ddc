#pragma once

#include "octpkg/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace octpkg {

// ============================================================================
// Safe Archive Extraction
// ============================================================================

// Result of an unpack operation
struct UnpackResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;   // paths of extracted entries
    std::vector<std::string> skipped;   // links and special files that were not extracted
};

struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;
};

// Reject absolute entries and entries escaping extraction_root
PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root);

// Decompress gzip data (any size, streaming inflate)
std::optional<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& compressed);

// Extract an uncompressed ustar/GNU tar stream into dest_dir.
// Pax headers are skipped, GNU long names honored, links skipped.
UnpackResult extract_tar(const std::vector<uint8_t>& tar_data, const std::string& dest_dir);

// Read, gunzip and extract a .tar.gz file
UnpackResult extract_tar_gz(const std::string& archive_path, const std::string& dest_dir);

// True for names ending in .tar.gz or .tgz
bool looks_like_tarball(const std::string& path);

// The directory holding DESCRIPTION: `dir` itself or its only sub-directory
Result<std::string> find_package_root(const std::string& dir);

} // namespace octpkg
