#pragma once

/**
 * @file fetcher.hpp
 * @brief Default archive fetcher and the package index client
 *
 * Network access goes through libcurl. Everything that does not need the
 * network (locator classification, index page parsing) is exposed so it can
 * be exercised offline.
 */

#include "octpkg/collaborators.hpp"

#include <optional>
#include <string>
#include <vector>

namespace octpkg {

// ============================================================================
// HTTP helpers
// ============================================================================

/// True for http://, https:// and ftp:// locators
bool is_url(const std::string& locator);

/// Download `url` into `output_path`, retrying up to `max_retries` times
Result<void> download_file(const std::string& url, const std::string& output_path,
                           int max_retries = 3);

/// Download `url` into memory
Result<std::string> download_string(const std::string& url);

// ============================================================================
// Archive fetcher
// ============================================================================

/**
 * @brief Resolves a locator into an unpacked source tree
 *
 * Accepts a source directory, a local .tar.gz / .tgz archive, or a URL to
 * such an archive. The returned path is the package root (the directory
 * holding DESCRIPTION) inside `staging_dir`.
 */
class DefaultArchiveFetcher : public ArchiveFetcher {
public:
    Result<std::string> fetch(const std::string& locator, const std::string& staging_dir) override;
};

// ============================================================================
// Package index
// ============================================================================

inline constexpr const char* kDefaultForgeUrl = "https://packages.octave.org";

/// Pull "Package Version: x.y.z" out of a package index page
std::optional<std::string> parse_forge_version(const std::string& html);

/// Split a list_packages response into names
std::vector<std::string> parse_package_list(const std::string& text);

class ForgeIndex : public RemoteIndex {
public:
    explicit ForgeIndex(std::string base_url = kDefaultForgeUrl);

    Result<std::string> latest_version(const std::string& name) override;
    Result<std::string> download_url(const std::string& name, const std::string& version) override;
    Result<std::vector<std::string>> list_packages() override;

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
};

} // namespace octpkg
