#pragma once

#include "mdwf/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mdwf {

// ============================================================================
// File System Abstraction
// ============================================================================
//
// Environments that read from disk do so only through this interface so
// tests can substitute or instrument it.

struct DirEntry {
    std::string name;
    bool is_file = false;
    bool is_directory = false;
};

class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::string& path) const = 0;
    virtual bool is_file(const std::string& path) const = 0;
    virtual bool is_directory(const std::string& path) const = 0;

    // Entire file contents, nullopt if missing or unreadable
    virtual std::optional<Bytes> read_file(const std::string& path) const = 0;

    // Entries sorted by name; empty if the directory is missing
    virtual std::vector<DirEntry> list_directory(const std::string& path) const = 0;

    virtual std::optional<uint64_t> file_size(const std::string& path) const = 0;
};

// std::filesystem-backed implementation. Symlinks are not followed when
// classifying directory entries.
class LocalFileSystem : public FileSystem {
public:
    bool exists(const std::string& path) const override;
    bool is_file(const std::string& path) const override;
    bool is_directory(const std::string& path) const override;
    std::optional<Bytes> read_file(const std::string& path) const override;
    std::vector<DirEntry> list_directory(const std::string& path) const override;
    std::optional<uint64_t> file_size(const std::string& path) const override;
};

// Process-wide LocalFileSystem instance
std::shared_ptr<FileSystem> default_file_system();

} // namespace mdwf
