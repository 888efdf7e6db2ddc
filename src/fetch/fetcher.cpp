#include "octpkg/fetcher.hpp"
#include "octpkg/archive.hpp"
#include "octpkg/description.hpp"
#include "octpkg/platform.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>

namespace octpkg {

namespace {

size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* stream) {
    auto* out = static_cast<std::ostream*>(stream);
    size_t bytes = size * nmemb;
    out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    return out->good() ? bytes : 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

Result<void> perform_download(const std::string& url, std::ostream& out) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return Result<void>::err(Error(ErrorCode::FetchError, "failed to initialise download of " + url));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return Result<void>::err(Error(ErrorCode::FetchError,
                                       "failed to download " + url + ": " + curl_easy_strerror(res)));
    }
    return Result<void>::ok();
}

// Archive file name for a URL, without query string
std::string archive_name_from_url(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    std::string name = get_filename(path);
    if (!looks_like_tarball(name)) name = "package.tar.gz";
    return name;
}

Result<std::string> unpack_into(const std::string& archive, const std::string& staging_dir) {
    std::string dest = join_path(staging_dir, "src");
    auto unpacked = extract_tar_gz(archive, dest);
    if (!unpacked.ok) {
        return Result<std::string>::err(Error(ErrorCode::FetchError, unpacked.error));
    }
    for (const auto& skipped : unpacked.skipped) {
        spdlog::warn("{}: skipped link or special file {}", get_filename(archive), skipped);
    }
    return find_package_root(dest);
}

} // namespace

bool is_url(const std::string& locator) {
    for (const char* scheme : {"http://", "https://", "ftp://"}) {
        if (locator.rfind(scheme, 0) == 0) return true;
    }
    return false;
}

Result<void> download_file(const std::string& url, const std::string& output_path, int max_retries) {
    Result<void> last = Result<void>::ok();
    for (int attempt = 0; attempt < max_retries; ++attempt) {
        {
            std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Result<void>::err(Error(ErrorCode::IoError, "failed to create " + output_path));
            }
            last = perform_download(url, out);
        }
        if (last.isOk()) return last;

        std::remove(output_path.c_str());
        if (attempt + 1 < max_retries) {
            spdlog::warn("{}; retrying", last.error().message());
        }
    }
    return last;
}

Result<std::string> download_string(const std::string& url) {
    std::ostringstream out;
    auto res = perform_download(url, out);
    if (res.isErr()) return Result<std::string>::err(res.error());
    return Result<std::string>::ok(out.str());
}

Result<std::string> DefaultArchiveFetcher::fetch(const std::string& locator,
                                                 const std::string& staging_dir) {
    using R = Result<std::string>;

    if (is_url(locator)) {
        spdlog::debug("downloading {}", locator);
        std::string archive = join_path(staging_dir, archive_name_from_url(locator));
        auto downloaded = download_file(locator, archive);
        if (downloaded.isErr()) return R::err(downloaded.error());
        return unpack_into(archive, staging_dir);
    }

    std::string path = absolute_path(locator);

    if (is_directory(path)) {
        spdlog::debug("copying source tree {}", path);
        std::string dest = join_path(join_path(staging_dir, "src"), get_filename(path));
        std::string err;
        if (!copy_directory(path, dest, &err)) {
            return R::err(Error(ErrorCode::FetchError, "failed to copy " + path + ": " + err));
        }
        return find_package_root(join_path(staging_dir, "src"));
    }

    if (is_regular_file(path)) {
        if (!looks_like_tarball(path)) {
            return R::err(Error(ErrorCode::FetchError, locator + " is not a .tar.gz package archive"));
        }
        spdlog::debug("unpacking {}", path);
        return unpack_into(path, staging_dir);
    }

    if (is_valid_package_name(locator)) {
        return R::err(Error(ErrorCode::FetchError,
                            "file " + locator + " does not exist; to install " + locator +
                                " from the package index use 'install --forge " + locator + "'",
                            {locator}));
    }
    return R::err(Error(ErrorCode::FetchError, "file " + locator + " does not exist"));
}

} // namespace octpkg
