#include "mdwf/file_system.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace mdwf {

namespace stdfs = std::filesystem;

bool LocalFileSystem::exists(const std::string& path) const {
    std::error_code ec;
    return stdfs::exists(path, ec);
}

bool LocalFileSystem::is_file(const std::string& path) const {
    std::error_code ec;
    return stdfs::is_regular_file(path, ec);
}

bool LocalFileSystem::is_directory(const std::string& path) const {
    std::error_code ec;
    return stdfs::is_directory(path, ec);
}

std::optional<Bytes> LocalFileSystem::read_file(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return data;
}

std::vector<DirEntry> LocalFileSystem::list_directory(const std::string& path) const {
    std::vector<DirEntry> entries;
    std::error_code ec;
    if (!stdfs::is_directory(path, ec)) {
        return entries;
    }

    // Stops at the first entry that vanishes or turns unreadable mid-scan
    stdfs::directory_iterator it(path, ec);
    for (; !ec && it != stdfs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        DirEntry de;
        de.name = entry.path().filename().string();
        std::error_code type_ec;
        auto status = entry.symlink_status(type_ec);
        if (type_ec) continue;
        de.is_file = stdfs::is_regular_file(status);
        de.is_directory = stdfs::is_directory(status);
        entries.push_back(std::move(de));
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return entries;
}

std::optional<uint64_t> LocalFileSystem::file_size(const std::string& path) const {
    std::error_code ec;
    auto size = stdfs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

std::shared_ptr<FileSystem> default_file_system() {
    static std::shared_ptr<FileSystem> instance = std::make_shared<LocalFileSystem>();
    return instance;
}

} // namespace mdwf
