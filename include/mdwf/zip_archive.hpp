#pragma once

#include "mdwf/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mdwf {

// ============================================================================
// ZIP Reading
// ============================================================================
//
// The container is parsed directly from the End Of Central Directory record
// (ZIP64 aware); entry data is either stored or raw-deflated and inflated
// with zlib. Nothing is written to disk.

enum class ZipMethod : uint16_t {
    Stored = 0,
    Deflated = 8,
};

struct ZipEntry {
    std::string name;               // as stored in the central directory
    uint16_t method = 0;
    uint16_t flags = 0;
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0; // declared, verified on read
    uint64_t local_header_offset = 0;
    bool is_directory = false;
    bool is_symlink = false;        // unix mode S_IFLNK in external attributes
    bool encrypted = false;
};

struct ZipDirectoryResult {
    bool ok = false;
    std::string error;
    std::vector<ZipEntry> entries;  // central directory order
};

// Parse the central directory of an in-memory archive
ZipDirectoryResult read_zip_directory(const Bytes& archive);

struct ZipReadResult {
    bool ok = false;
    bool too_large = false;         // inflation stopped at max_size
    std::string error;
    Bytes data;
};

// Read one entry fully. Inflation stops with too_large once more than
// max_size bytes would be produced, whatever the header declares.
ZipReadResult read_zip_entry(const Bytes& archive, const ZipEntry& entry, uint64_t max_size);

// ============================================================================
// ZIP Writing
// ============================================================================

struct ZipWriteEntry {
    std::string path;   // written verbatim, directories end with '/'
    Bytes data;
};

struct ZipWriteResult {
    bool ok = false;
    std::string error;
    Bytes archive_data;
};

// Write entries in the given order. Timestamps are fixed at 1980-01-01 so
// identical input produces identical bytes.
ZipWriteResult create_zip_archive(const std::vector<ZipWriteEntry>& entries, bool deflate = true);

// Collect a resource tree (regular files only, sorted) and write it as a ZIP.
// Symlinks are rejected.
ZipWriteResult pack_directory_zip(const std::string& dir_path);

} // namespace mdwf
