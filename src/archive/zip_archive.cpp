#include "mdwf/zip_archive.hpp"
#include "mdwf/path_utils.hpp"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>

#include <zlib.h>

namespace fs = std::filesystem;

namespace mdwf {

// ============================================================================
// ZIP Format Constants (PKWARE APPNOTE 6.3)
// ============================================================================

static constexpr uint32_t ZIP_LOCAL_SIG = 0x04034b50;
static constexpr uint32_t ZIP_CENTRAL_SIG = 0x02014b50;
static constexpr uint32_t ZIP_EOCD_SIG = 0x06054b50;
static constexpr uint32_t ZIP64_EOCD_SIG = 0x06064b50;
static constexpr uint32_t ZIP64_LOCATOR_SIG = 0x07064b50;

static constexpr size_t ZIP_LOCAL_HEADER_SIZE = 30;
static constexpr size_t ZIP_CENTRAL_HEADER_SIZE = 46;
static constexpr size_t ZIP_EOCD_SIZE = 22;
static constexpr size_t ZIP64_LOCATOR_SIZE = 20;
static constexpr size_t ZIP64_EOCD_SIZE = 56;
static constexpr size_t ZIP_MAX_COMMENT = 0xFFFF;

static constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;
static constexpr uint16_t ZIP_FLAG_ENCRYPTED = 0x0001;
static constexpr uint16_t ZIP_FLAG_UTF8 = 0x0800;
static constexpr uint16_t ZIP_HOST_UNIX = 3;
static constexpr uint32_t UNIX_TYPE_MASK = 0xF000;
static constexpr uint32_t UNIX_TYPE_SYMLINK = 0xA000;

// DOS date for 1980-01-01, time 00:00:00
static constexpr uint16_t ZIP_DOS_DATE = (0 << 9) | (1 << 5) | 1;
static constexpr uint16_t ZIP_DOS_TIME = 0;

static constexpr size_t INFLATE_CHUNK = 64 * 1024;

// ============================================================================
// Helper Functions
// ============================================================================

static uint16_t read_u16(const Bytes& d, size_t off) {
    return static_cast<uint16_t>(d[off] | (d[off + 1] << 8));
}

static uint32_t read_u32(const Bytes& d, size_t off) {
    return static_cast<uint32_t>(d[off]) |
           (static_cast<uint32_t>(d[off + 1]) << 8) |
           (static_cast<uint32_t>(d[off + 2]) << 16) |
           (static_cast<uint32_t>(d[off + 3]) << 24);
}

static uint64_t read_u64(const Bytes& d, size_t off) {
    return static_cast<uint64_t>(read_u32(d, off)) |
           (static_cast<uint64_t>(read_u32(d, off + 4)) << 32);
}

static void put_u16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

static void put_u32(Bytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

static bool fits(const Bytes& d, uint64_t offset, uint64_t length) {
    return offset <= d.size() && length <= d.size() - offset;
}

// Locate the End Of Central Directory record, scanning back over the comment
static bool find_eocd(const Bytes& d, size_t& eocd_pos) {
    if (d.size() < ZIP_EOCD_SIZE) return false;
    size_t start = d.size() - ZIP_EOCD_SIZE;
    size_t stop = start > ZIP_MAX_COMMENT ? start - ZIP_MAX_COMMENT : 0;
    for (size_t i = start + 1; i-- > stop;) {
        if (read_u32(d, i) == ZIP_EOCD_SIG) {
            eocd_pos = i;
            return true;
        }
    }
    return false;
}

// Apply ZIP64 extended information to fields saturated at 0xFFFFFFFF
static bool apply_zip64_extra(const Bytes& d, size_t extra_start, size_t extra_len,
                              ZipEntry& entry, bool need_usize, bool need_csize,
                              bool need_offset) {
    size_t pos = extra_start;
    size_t end = extra_start + extra_len;
    while (pos + 4 <= end) {
        uint16_t id = read_u16(d, pos);
        uint16_t len = read_u16(d, pos + 2);
        size_t data = pos + 4;
        if (data + len > end) return false;
        if (id == ZIP64_EXTRA_ID) {
            size_t field = data;
            size_t field_end = data + len;
            if (need_usize) {
                if (field + 8 > field_end) return false;
                entry.uncompressed_size = read_u64(d, field);
                field += 8;
            }
            if (need_csize) {
                if (field + 8 > field_end) return false;
                entry.compressed_size = read_u64(d, field);
                field += 8;
            }
            if (need_offset) {
                if (field + 8 > field_end) return false;
                entry.local_header_offset = read_u64(d, field);
            }
            return true;
        }
        pos = data + len;
    }
    return !(need_usize || need_csize || need_offset);
}

// ============================================================================
// Public API Implementation
// ============================================================================

ZipDirectoryResult read_zip_directory(const Bytes& archive) {
    ZipDirectoryResult result;

    size_t eocd = 0;
    if (!find_eocd(archive, eocd)) {
        result.error = "not a ZIP archive: end of central directory not found";
        return result;
    }

    uint64_t total_entries = read_u16(archive, eocd + 10);
    uint64_t cd_size = read_u32(archive, eocd + 12);
    uint64_t cd_offset = read_u32(archive, eocd + 16);

    if (total_entries == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF) {
        if (eocd < ZIP64_LOCATOR_SIZE ||
            read_u32(archive, eocd - ZIP64_LOCATOR_SIZE) != ZIP64_LOCATOR_SIG) {
            result.error = "ZIP64 locator missing";
            return result;
        }
        uint64_t z64 = read_u64(archive, eocd - ZIP64_LOCATOR_SIZE + 8);
        if (!fits(archive, z64, ZIP64_EOCD_SIZE) || read_u32(archive, z64) != ZIP64_EOCD_SIG) {
            result.error = "ZIP64 end of central directory corrupt";
            return result;
        }
        total_entries = read_u64(archive, z64 + 32);
        cd_size = read_u64(archive, z64 + 40);
        cd_offset = read_u64(archive, z64 + 48);
    }

    if (!fits(archive, cd_offset, cd_size)) {
        result.error = "central directory out of bounds";
        return result;
    }

    size_t pos = static_cast<size_t>(cd_offset);
    for (uint64_t i = 0; i < total_entries; ++i) {
        if (!fits(archive, pos, ZIP_CENTRAL_HEADER_SIZE) ||
            read_u32(archive, pos) != ZIP_CENTRAL_SIG) {
            result.error = "corrupt central directory at entry " + std::to_string(i);
            return result;
        }

        uint16_t made_by = read_u16(archive, pos + 4);
        uint16_t name_len = read_u16(archive, pos + 28);
        uint16_t extra_len = read_u16(archive, pos + 30);
        uint16_t comment_len = read_u16(archive, pos + 32);
        size_t record_len = ZIP_CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
        if (!fits(archive, pos, record_len)) {
            result.error = "truncated central directory at entry " + std::to_string(i);
            return result;
        }

        ZipEntry entry;
        entry.flags = read_u16(archive, pos + 8);
        entry.method = read_u16(archive, pos + 10);
        entry.crc32 = read_u32(archive, pos + 16);
        entry.compressed_size = read_u32(archive, pos + 20);
        entry.uncompressed_size = read_u32(archive, pos + 24);
        entry.local_header_offset = read_u32(archive, pos + 42);
        entry.name.assign(reinterpret_cast<const char*>(archive.data() + pos + ZIP_CENTRAL_HEADER_SIZE),
                          name_len);

        bool need_usize = entry.uncompressed_size == 0xFFFFFFFF;
        bool need_csize = entry.compressed_size == 0xFFFFFFFF;
        bool need_offset = entry.local_header_offset == 0xFFFFFFFF;
        if (need_usize || need_csize || need_offset) {
            if (!apply_zip64_extra(archive, pos + ZIP_CENTRAL_HEADER_SIZE + name_len, extra_len,
                                   entry, need_usize, need_csize, need_offset)) {
                result.error = "corrupt ZIP64 extra field: " + entry.name;
                return result;
            }
        }

        uint32_t external_attr = read_u32(archive, pos + 38);
        if ((made_by >> 8) == ZIP_HOST_UNIX &&
            ((external_attr >> 16) & UNIX_TYPE_MASK) == UNIX_TYPE_SYMLINK) {
            entry.is_symlink = true;
        }
        entry.is_directory = !entry.name.empty() &&
                             (entry.name.back() == '/' || entry.name.back() == '\\');
        entry.encrypted = (entry.flags & ZIP_FLAG_ENCRYPTED) != 0;

        result.entries.push_back(std::move(entry));
        pos += record_len;
    }

    result.ok = true;
    return result;
}

ZipReadResult read_zip_entry(const Bytes& archive, const ZipEntry& entry, uint64_t max_size) {
    ZipReadResult result;

    if (entry.encrypted) {
        result.error = "encrypted entries are not supported: " + entry.name;
        return result;
    }

    uint64_t offset = entry.local_header_offset;
    if (!fits(archive, offset, ZIP_LOCAL_HEADER_SIZE) ||
        read_u32(archive, static_cast<size_t>(offset)) != ZIP_LOCAL_SIG) {
        result.error = "corrupt local header: " + entry.name;
        return result;
    }

    size_t local = static_cast<size_t>(offset);
    uint64_t data_start = offset + ZIP_LOCAL_HEADER_SIZE + read_u16(archive, local + 26) +
                          read_u16(archive, local + 28);
    if (!fits(archive, data_start, entry.compressed_size)) {
        result.error = "truncated entry data: " + entry.name;
        return result;
    }
    const uint8_t* src = archive.data() + data_start;

    if (entry.method == static_cast<uint16_t>(ZipMethod::Stored)) {
        if (entry.compressed_size > max_size) {
            result.too_large = true;
            result.error = "entry exceeds " + std::to_string(max_size) + " bytes: " + entry.name;
            return result;
        }
        result.data.assign(src, src + entry.compressed_size);
    } else if (entry.method == static_cast<uint16_t>(ZipMethod::Deflated)) {
        if (entry.compressed_size > std::numeric_limits<uInt>::max()) {
            result.error = "compressed entry too large: " + entry.name;
            return result;
        }

        z_stream strm;
        std::memset(&strm, 0, sizeof(strm));

        // Raw deflate (negative window bits)
        if (inflateInit2(&strm, -15) != Z_OK) {
            result.error = "inflateInit2 failed: " + entry.name;
            return result;
        }

        strm.next_in = const_cast<Bytef*>(src);
        strm.avail_in = static_cast<uInt>(entry.compressed_size);

        uint8_t buffer[INFLATE_CHUNK];
        int ret = Z_OK;
        while (ret != Z_STREAM_END) {
            strm.next_out = buffer;
            strm.avail_out = static_cast<uInt>(sizeof(buffer));
            ret = inflate(&strm, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                inflateEnd(&strm);
                result.error = "decompression failed (" + std::to_string(ret) + "): " + entry.name;
                return result;
            }
            size_t have = sizeof(buffer) - strm.avail_out;
            if (result.data.size() + have > max_size) {
                inflateEnd(&strm);
                result.data.clear();
                result.too_large = true;
                result.error = "entry exceeds " + std::to_string(max_size) + " bytes: " + entry.name;
                return result;
            }
            result.data.insert(result.data.end(), buffer, buffer + have);
            if (ret == Z_OK && strm.avail_in == 0 && have == 0) {
                inflateEnd(&strm);
                result.data.clear();
                result.error = "truncated deflate stream: " + entry.name;
                return result;
            }
        }
        inflateEnd(&strm);
    } else {
        result.error = "unsupported compression method " + std::to_string(entry.method) + ": " +
                       entry.name;
        return result;
    }

    if (result.data.size() != entry.uncompressed_size) {
        result.data.clear();
        result.error = "size mismatch: " + entry.name;
        return result;
    }

    uint32_t crc = static_cast<uint32_t>(
        crc32(0, result.data.data(), static_cast<uInt>(result.data.size())));
    if (crc != entry.crc32) {
        result.data.clear();
        result.error = "CRC mismatch: " + entry.name;
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Writing
// ============================================================================

static bool deflate_raw(const Bytes& data, Bytes& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    out.resize(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        return false;
    }
    out.resize(strm.total_out);
    return true;
}

ZipWriteResult create_zip_archive(const std::vector<ZipWriteEntry>& entries, bool deflate) {
    ZipWriteResult result;

    if (entries.size() >= 0xFFFF) {
        result.error = "too many entries for a ZIP without ZIP64";
        return result;
    }

    Bytes out;
    Bytes central;

    for (const auto& entry : entries) {
        if (entry.path.empty() || entry.path.size() > 0xFFFF) {
            result.error = "invalid entry path length";
            return result;
        }
        if (entry.data.size() >= 0xFFFFFFFF) {
            result.error = "entry too large for a ZIP without ZIP64: " + entry.path;
            return result;
        }

        bool is_dir = entry.path.back() == '/';
        uint16_t method = static_cast<uint16_t>(ZipMethod::Stored);
        Bytes payload;
        if (!is_dir && deflate && !entry.data.empty()) {
            if (!deflate_raw(entry.data, payload)) {
                result.error = "deflate failed: " + entry.path;
                return result;
            }
            method = static_cast<uint16_t>(ZipMethod::Deflated);
        } else {
            payload = entry.data;
        }

        uint32_t crc = static_cast<uint32_t>(
            crc32(0, entry.data.data(), static_cast<uInt>(entry.data.size())));
        uint32_t local_offset = static_cast<uint32_t>(out.size());
        uint16_t name_len = static_cast<uint16_t>(entry.path.size());

        // Local file header
        put_u32(out, ZIP_LOCAL_SIG);
        put_u16(out, 20);               // version needed
        put_u16(out, ZIP_FLAG_UTF8);
        put_u16(out, method);
        put_u16(out, ZIP_DOS_TIME);
        put_u16(out, ZIP_DOS_DATE);
        put_u32(out, crc);
        put_u32(out, static_cast<uint32_t>(payload.size()));
        put_u32(out, static_cast<uint32_t>(entry.data.size()));
        put_u16(out, name_len);
        put_u16(out, 0);                // extra length
        out.insert(out.end(), entry.path.begin(), entry.path.end());
        out.insert(out.end(), payload.begin(), payload.end());

        // Central directory header
        put_u32(central, ZIP_CENTRAL_SIG);
        put_u16(central, static_cast<uint16_t>((ZIP_HOST_UNIX << 8) | 20));
        put_u16(central, 20);
        put_u16(central, ZIP_FLAG_UTF8);
        put_u16(central, method);
        put_u16(central, ZIP_DOS_TIME);
        put_u16(central, ZIP_DOS_DATE);
        put_u32(central, crc);
        put_u32(central, static_cast<uint32_t>(payload.size()));
        put_u32(central, static_cast<uint32_t>(entry.data.size()));
        put_u16(central, name_len);
        put_u16(central, 0);            // extra length
        put_u16(central, 0);            // comment length
        put_u16(central, 0);            // disk number
        put_u16(central, 0);            // internal attributes
        put_u32(central, is_dir ? ((040755u << 16) | 0x10u) : (0100644u << 16));
        put_u32(central, local_offset);
        central.insert(central.end(), entry.path.begin(), entry.path.end());

        if (out.size() >= 0xFFFFFFFF) {
            result.error = "archive too large for a ZIP without ZIP64";
            return result;
        }
    }

    uint32_t cd_offset = static_cast<uint32_t>(out.size());
    out.insert(out.end(), central.begin(), central.end());

    // End of central directory
    put_u32(out, ZIP_EOCD_SIG);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, static_cast<uint16_t>(entries.size()));
    put_u16(out, static_cast<uint16_t>(entries.size()));
    put_u32(out, static_cast<uint32_t>(central.size()));
    put_u32(out, cd_offset);
    put_u16(out, 0);

    result.archive_data = std::move(out);
    result.ok = true;
    return result;
}

ZipWriteResult pack_directory_zip(const std::string& dir_path) {
    ZipWriteResult result;

    std::error_code ec;
    if (!fs::is_directory(dir_path, ec)) {
        result.error = "directory not found: " + dir_path;
        return result;
    }

    std::vector<ZipWriteEntry> entries;
    fs::path base_path(dir_path);

    try {
        for (const auto& entry : fs::recursive_directory_iterator(dir_path)) {
            std::string path_str = to_portable_path(fs::relative(entry.path(), base_path).string());

            if (fs::is_symlink(entry.symlink_status())) {
                result.error = "symlinks are not permitted: " + path_str;
                return result;
            }
            if (!entry.is_regular_file()) {
                continue;
            }

            std::ifstream file(entry.path(), std::ios::binary);
            if (!file) {
                result.error = "failed to read file: " + path_str;
                return result;
            }
            ZipWriteEntry zip_entry;
            zip_entry.path = path_str;
            zip_entry.data = Bytes((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
            entries.push_back(std::move(zip_entry));
        }
    } catch (const fs::filesystem_error& e) {
        result.error = std::string("filesystem error: ") + e.what();
        return result;
    }

    std::sort(entries.begin(), entries.end(),
              [](const ZipWriteEntry& a, const ZipWriteEntry& b) { return a.path < b.path; });

    return create_zip_archive(entries);
}

} // namespace mdwf
