#include <doctest/doctest.h>
#include <octpkg/archive.hpp>
#include <octpkg/fetcher.hpp>

#include "test_support.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

using namespace octpkg;
using namespace octpkg::testing;

namespace {

// Minimal ustar writer for building fixtures
class TarBuilder {
public:
    TarBuilder& file(const std::string& name, const std::string& content, unsigned mode = 0644) {
        add_header(name, content.size(), '0', mode, "");
        data_.insert(data_.end(), content.begin(), content.end());
        pad();
        return *this;
    }

    TarBuilder& directory(const std::string& name) {
        add_header(name, 0, '5', 0755, "");
        return *this;
    }

    TarBuilder& symlink(const std::string& name, const std::string& target) {
        add_header(name, 0, '2', 0777, target);
        return *this;
    }

    TarBuilder& long_name(const std::string& name, const std::string& content) {
        std::string payload = name + '\0';
        add_header("././@LongLink", payload.size(), 'L', 0644, "");
        data_.insert(data_.end(), payload.begin(), payload.end());
        pad();
        return file(name.substr(0, 99), content);
    }

    std::vector<uint8_t> finish() const {
        std::vector<uint8_t> out = data_;
        out.resize(out.size() + 1024, 0);
        return out;
    }

private:
    void add_header(const std::string& name, size_t size, char type, unsigned mode, const std::string& link) {
        uint8_t header[512];
        std::memset(header, 0, sizeof(header));
        std::memcpy(header, name.data(), std::min<size_t>(name.size(), 100));
        std::snprintf(reinterpret_cast<char*>(header + 100), 8, "%07o", mode);
        std::snprintf(reinterpret_cast<char*>(header + 108), 8, "%07o", 0u);
        std::snprintf(reinterpret_cast<char*>(header + 116), 8, "%07o", 0u);
        std::snprintf(reinterpret_cast<char*>(header + 124), 12, "%011lo", static_cast<unsigned long>(size));
        std::snprintf(reinterpret_cast<char*>(header + 136), 12, "%011lo", 0ul);
        header[156] = static_cast<uint8_t>(type);
        std::memcpy(header + 157, link.data(), std::min<size_t>(link.size(), 100));
        std::memcpy(header + 257, "ustar", 5);
        header[263] = '0';
        header[264] = '0';

        std::memset(header + 148, ' ', 8);
        unsigned sum = 0;
        for (uint8_t b : header) sum += b;
        std::snprintf(reinterpret_cast<char*>(header + 148), 8, "%06o", sum);

        data_.insert(data_.end(), header, header + sizeof(header));
    }

    void pad() {
        while (data_.size() % 512 != 0) data_.push_back(0);
    }

    std::vector<uint8_t> data_;
};

std::vector<uint8_t> gzip(const std::vector<uint8_t>& input) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    REQUIRE(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                         Z_DEFAULT_STRATEGY) == Z_OK);

    std::vector<uint8_t> out(deflateBound(&stream, static_cast<uLong>(input.size())) + 32);
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    REQUIRE(deflate(&stream, Z_FINISH) == Z_STREAM_END);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return out;
}

void write_bytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

std::vector<uint8_t> package_tarball(const std::string& name, const std::string& version) {
    std::string dir = name + "-" + version + "/";
    return TarBuilder()
        .directory(dir)
        .file(dir + "DESCRIPTION", description_text(name, version))
        .file(dir + "COPYING", "GPL\n")
        .file(dir + "inst/" + name + ".m", "function " + name + "()\nend\n")
        .file(dir + "src/configure", "#!/bin/sh\nexit 0\n", 0755)
        .finish();
}

} // namespace

// ============================================================================
// Path validation
// ============================================================================

TEST_CASE("validate_extraction_path accepts nested relative paths") {
    auto result = validate_extraction_path("pkg-1.0.0/inst/private/f.m", "/extract");
    CHECK(result.safe);
    CHECK(result.normalized_path == "pkg-1.0.0/inst/private/f.m");
}

TEST_CASE("validate_extraction_path drops dot components") {
    auto result = validate_extraction_path("./pkg/./f.m", "/extract");
    CHECK(result.safe);
    CHECK(result.normalized_path == "pkg/f.m");
}

TEST_CASE("validate_extraction_path rejects absolute paths") {
    auto result = validate_extraction_path("/etc/passwd", "/extract");
    CHECK_FALSE(result.safe);
    CHECK(result.error.find("absolute") != std::string::npos);
}

TEST_CASE("validate_extraction_path rejects path traversal") {
    CHECK_FALSE(validate_extraction_path("../etc/passwd", "/extract").safe);
    auto nested = validate_extraction_path("pkg/../../etc/passwd", "/extract");
    CHECK_FALSE(nested.safe);
    CHECK(nested.error.find("traversal") != std::string::npos);
}

// ============================================================================
// Extraction
// ============================================================================

TEST_CASE("extract_tar writes files and directories") {
    TempDir tmp;
    auto result = extract_tar(package_tarball("sig", "1.0.0"), tmp.path());
    REQUIRE(result.ok);
    CHECK(result.entries.size() == 5);
    CHECK(fs::exists(tmp.sub("sig-1.0.0/DESCRIPTION")));
    CHECK(fs::exists(tmp.sub("sig-1.0.0/inst/sig.m")));

    struct stat st;
    REQUIRE(stat(tmp.sub("sig-1.0.0/src/configure").c_str(), &st) == 0);
    CHECK((st.st_mode & S_IXUSR) != 0);
    REQUIRE(stat(tmp.sub("sig-1.0.0/COPYING").c_str(), &st) == 0);
    CHECK((st.st_mode & S_IXUSR) == 0);
}

TEST_CASE("extract_tar skips links instead of following them") {
    TempDir tmp;
    auto tar = TarBuilder().file("pkg/a.m", "x").symlink("pkg/evil", "/etc/passwd").finish();

    auto result = extract_tar(tar, tmp.path());
    REQUIRE(result.ok);
    CHECK(result.skipped == std::vector<std::string>{"pkg/evil"});
    CHECK_FALSE(fs::exists(fs::symlink_status(tmp.sub("pkg/evil"))));
}

TEST_CASE("extract_tar refuses entries escaping the destination") {
    TempDir tmp;
    auto tar = TarBuilder().file("../escape.txt", "x").finish();

    auto result = extract_tar(tar, tmp.sub("dest"));
    CHECK_FALSE(result.ok);
    CHECK_FALSE(fs::exists(tmp.sub("escape.txt")));
}

TEST_CASE("extract_tar reads GNU long names") {
    TempDir tmp;
    std::string name = "pkg/" + std::string(120, 'n') + ".m";
    auto result = extract_tar(TarBuilder().long_name(name, "body").finish(), tmp.path());
    REQUIRE(result.ok);
    CHECK(fs::exists(tmp.sub(name)));
}

TEST_CASE("extract_tar detects truncated archives") {
    TempDir tmp;
    auto tar = TarBuilder().file("pkg/a.m", std::string(2000, 'x')).finish();
    tar.resize(1024);

    auto result = extract_tar(tar, tmp.path());
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("truncated") != std::string::npos);
}

TEST_CASE("extract_tar_gz unpacks a gzip compressed tarball") {
    TempDir tmp;
    write_bytes(tmp.sub("sig-1.0.0.tar.gz"), gzip(package_tarball("sig", "1.0.0")));

    auto result = extract_tar_gz(tmp.sub("sig-1.0.0.tar.gz"), tmp.sub("out"));
    REQUIRE(result.ok);
    CHECK(fs::exists(tmp.sub("out/sig-1.0.0/DESCRIPTION")));
}

TEST_CASE("extract_tar_gz rejects data that is not gzip") {
    TempDir tmp;
    write_text(tmp.sub("bad.tar.gz"), "definitely not gzip");
    auto result = extract_tar_gz(tmp.sub("bad.tar.gz"), tmp.sub("out"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("decompress") != std::string::npos);
}

TEST_CASE("looks_like_tarball") {
    CHECK(looks_like_tarball("signal-1.4.5.tar.gz"));
    CHECK(looks_like_tarball("/tmp/x.tgz"));
    CHECK_FALSE(looks_like_tarball("signal-1.4.5.zip"));
    CHECK_FALSE(looks_like_tarball("signal"));
}

// ============================================================================
// Package root and fetching
// ============================================================================

TEST_CASE("find_package_root accepts the directory itself or a single subdirectory") {
    TempDir tmp;
    std::string root = write_source_package(tmp.sub("one"), "a", "1.0.0");

    auto nested = find_package_root(tmp.sub("one"));
    REQUIRE(nested.isOk());
    CHECK(nested.value() == root);

    auto direct = find_package_root(root);
    REQUIRE(direct.isOk());
    CHECK(direct.value() == root);
}

TEST_CASE("find_package_root rejects ambiguous or incomplete trees") {
    TempDir tmp;
    write_source_package(tmp.sub("two"), "a", "1.0.0");
    write_source_package(tmp.sub("two"), "b", "1.0.0");
    auto two = find_package_root(tmp.sub("two"));
    REQUIRE(two.isErr());
    CHECK(two.error().code() == ErrorCode::FetchError);

    fs::create_directories(tmp.sub("empty/pkg"));
    auto empty = find_package_root(tmp.sub("empty"));
    REQUIRE(empty.isErr());
    CHECK(empty.error().code() == ErrorCode::InvalidDescription);
}

TEST_CASE("DefaultArchiveFetcher unpacks a local tarball into staging") {
    TempDir tmp;
    write_bytes(tmp.sub("sig-1.0.0.tar.gz"), gzip(package_tarball("sig", "1.0.0")));
    fs::create_directories(tmp.sub("staging"));

    DefaultArchiveFetcher fetcher;
    auto root = fetcher.fetch(tmp.sub("sig-1.0.0.tar.gz"), tmp.sub("staging"));
    REQUIRE(root.isOk());
    CHECK(is_regular_file(join_path(root.value(), "DESCRIPTION")));
    CHECK(root.value().rfind(tmp.sub("staging"), 0) == 0);
}

TEST_CASE("DefaultArchiveFetcher copies a source directory") {
    TempDir tmp;
    std::string src = write_source_package(tmp.sub("src"), "a", "1.0.0");
    fs::create_directories(tmp.sub("staging"));

    DefaultArchiveFetcher fetcher;
    auto root = fetcher.fetch(src, tmp.sub("staging"));
    REQUIRE(root.isOk());
    CHECK(root.value() != src);
    CHECK(is_regular_file(join_path(root.value(), "inst/a_fn.m")));
}

TEST_CASE("DefaultArchiveFetcher rejects unusable locators") {
    TempDir tmp;
    write_text(tmp.sub("notes.txt"), "hello");
    DefaultArchiveFetcher fetcher;

    auto text = fetcher.fetch(tmp.sub("notes.txt"), tmp.path());
    REQUIRE(text.isErr());
    CHECK(text.error().code() == ErrorCode::FetchError);

    auto bare = fetcher.fetch("signal", tmp.path());
    REQUIRE(bare.isErr());
    CHECK(bare.error().message().find("--forge") != std::string::npos);
}

TEST_CASE("is_url") {
    CHECK(is_url("https://packages.octave.org/download/signal-1.4.5.tar.gz"));
    CHECK(is_url("http://example.org/a.tar.gz"));
    CHECK(is_url("ftp://example.org/a.tar.gz"));
    CHECK_FALSE(is_url("/tmp/a.tar.gz"));
    CHECK_FALSE(is_url("file:///tmp/a.tar.gz"));
}
