#include "octpkg/archive.hpp"
#include "octpkg/platform.hpp"

#include <zlib.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace octpkg {

namespace fs = std::filesystem;

namespace {

constexpr size_t TAR_BLOCK_SIZE = 512;

// Tar type flags
constexpr char TAR_REGTYPE = '0';
constexpr char TAR_AREGTYPE = '\0';
constexpr char TAR_LNKTYPE = '1';
constexpr char TAR_SYMTYPE = '2';
constexpr char TAR_DIRTYPE = '5';
constexpr char TAR_CONTTYPE = '7';
constexpr char TAR_PAX_EXTENDED = 'x';
constexpr char TAR_PAX_GLOBAL = 'g';
constexpr char TAR_GNU_LONGNAME = 'L';
constexpr char TAR_GNU_LONGLINK = 'K';

// Parse octal value from tar header field
uint64_t parse_octal(const uint8_t* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

std::string field_string(const uint8_t* data, size_t size) {
    const char* p = reinterpret_cast<const char*>(data);
    return std::string(p, strnlen(p, size));
}

bool is_zero_block(const uint8_t* block) {
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

size_t padded(uint64_t size) {
    return static_cast<size_t>(((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE) * TAR_BLOCK_SIZE);
}

} // namespace

PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root) {
    PathValidation result;

    if (entry_path.find('\0') != std::string::npos) {
        result.error = "NUL byte in path";
        return result;
    }
    if (!entry_path.empty() && (entry_path[0] == '/' || entry_path[0] == '\\')) {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    fs::path normalized;
    for (const auto& component : fs::path(entry_path)) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(extraction_root, ec);
    fs::path canonical_full = fs::weakly_canonical(fs::path(extraction_root) / normalized, ec);
    if (canonical_full.string().rfind(canonical_root.string(), 0) != 0) {
        result.error = "path escapes extraction root: " + entry_path;
        return result;
    }

    result.safe = true;
    result.normalized_path = normalized.string();
    return result;
}

std::optional<std::vector<uint8_t>> gzip_decompress(const std::vector<uint8_t>& compressed) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    // 16 + MAX_WBITS tells zlib to handle gzip format
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        return std::nullopt;
    }

    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::vector<uint8_t> decompressed;
    const size_t CHUNK = 16384;
    uint8_t out[CHUNK];

    int ret;
    do {
        stream.avail_out = CHUNK;
        stream.next_out = out;

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
            inflateEnd(&stream);
            return std::nullopt;
        }

        size_t have = CHUNK - stream.avail_out;
        decompressed.insert(decompressed.end(), out, out + have);
    } while (ret != Z_STREAM_END && (stream.avail_in > 0 || stream.avail_out == 0));

    inflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        return std::nullopt;
    }

    return decompressed;
}

UnpackResult extract_tar(const std::vector<uint8_t>& tar_data, const std::string& dest_dir) {
    UnpackResult result;

    if (!create_directories(dest_dir)) {
        result.error = "failed to create directory: " + dest_dir;
        return result;
    }

    size_t offset = 0;
    std::string long_name;

    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        const uint8_t* header = tar_data.data() + offset;
        if (is_zero_block(header)) break;

        uint64_t size = parse_octal(header + 124, 12);
        uint64_t mode = parse_octal(header + 100, 8);
        char typeflag = static_cast<char>(header[156]);
        size_t data_offset = offset + TAR_BLOCK_SIZE;

        if (data_offset + size > tar_data.size()) {
            result.error = "truncated archive";
            return result;
        }

        std::string path;
        if (!long_name.empty()) {
            path = long_name;
            long_name.clear();
        } else {
            std::string prefix = field_string(header + 345, 155);
            path = field_string(header, 100);
            if (!prefix.empty()) path = prefix + "/" + path;
        }

        offset = data_offset + padded(size);

        if (typeflag == TAR_GNU_LONGNAME) {
            long_name = field_string(tar_data.data() + data_offset, static_cast<size_t>(size));
            continue;
        }
        if (typeflag == TAR_PAX_EXTENDED || typeflag == TAR_PAX_GLOBAL || typeflag == TAR_GNU_LONGLINK) {
            continue;
        }

        while (!path.empty() && path.back() == '/') path.pop_back();
        if (path.rfind("./", 0) == 0) path = path.substr(2);
        if (path.empty() || path == ".") continue;

        auto validation = validate_extraction_path(path, dest_dir);
        if (!validation.safe) {
            result.error = validation.error;
            return result;
        }
        std::string full_path = join_path(dest_dir, validation.normalized_path);

        if (typeflag == TAR_DIRTYPE) {
            if (!create_directories(full_path)) {
                result.error = "failed to create directory: " + path;
                return result;
            }
            result.entries.push_back(path);
            continue;
        }

        if (typeflag == TAR_SYMTYPE || typeflag == TAR_LNKTYPE ||
            (typeflag != TAR_REGTYPE && typeflag != TAR_AREGTYPE && typeflag != TAR_CONTTYPE)) {
            result.skipped.push_back(path);
            continue;
        }

        std::string parent = get_parent_directory(full_path);
        if (!parent.empty() && !create_directories(parent)) {
            result.error = "failed to create parent directory for: " + path;
            return result;
        }

        std::ofstream file(full_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            result.error = "failed to create file: " + path;
            return result;
        }
        file.write(reinterpret_cast<const char*>(tar_data.data() + data_offset),
                   static_cast<std::streamsize>(size));
        file.close();
        if (!file) {
            result.error = "failed to write file: " + path;
            return result;
        }

        std::error_code ec;
        if ((mode & 0111) != 0) {
            fs::permissions(full_path, fs::perms::owner_all | fs::perms::group_read |
                            fs::perms::group_exec | fs::perms::others_read |
                            fs::perms::others_exec, ec);
        } else {
            fs::permissions(full_path, fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read, ec);
        }

        result.entries.push_back(path);
    }

    result.ok = true;
    return result;
}

UnpackResult extract_tar_gz(const std::string& archive_path, const std::string& dest_dir) {
    std::ifstream file(archive_path, std::ios::binary);
    if (!file) {
        UnpackResult result;
        result.error = "failed to open archive: " + archive_path;
        return result;
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());

    auto tar_data = gzip_decompress(data);
    if (!tar_data) {
        UnpackResult result;
        result.error = "failed to decompress archive: " + archive_path;
        return result;
    }

    return extract_tar(*tar_data, dest_dir);
}

bool looks_like_tarball(const std::string& path) {
    auto ends_with = [&path](const std::string& suffix) {
        return path.size() >= suffix.size() &&
               path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".tar.gz") || ends_with(".tgz");
}

Result<std::string> find_package_root(const std::string& dir) {
    using R = Result<std::string>;

    if (is_regular_file(join_path(dir, "DESCRIPTION"))) {
        return R::ok(dir);
    }

    std::vector<std::string> subdirs;
    for (const auto& entry : list_directory(dir)) {
        if (is_directory(join_path(dir, entry))) subdirs.push_back(entry);
    }

    if (subdirs.size() != 1) {
        return R::err(Error(ErrorCode::FetchError,
                            dir + " does not contain exactly one package directory"));
    }

    std::string root = join_path(dir, subdirs.front());
    if (!is_regular_file(join_path(root, "DESCRIPTION"))) {
        return R::err(Error(ErrorCode::InvalidDescription,
                            "package " + subdirs.front() + " has no DESCRIPTION file"));
    }
    return R::ok(root);
}

} // namespace octpkg
