#include "mdwf/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace mdwf {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

PathResult resolve_under_root(const std::string& root, const std::string& relative_path) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string rel = to_portable_path(relative_path);
    if (!rel.empty() && rel[0] == '/') {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }
    if (rel.size() >= 2 && std::isalpha(static_cast<unsigned char>(rel[0])) && rel[1] == ':') {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(rel, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::filesystem::path p(root);
    for (const auto& c : normalized) {
        p /= c;
    }
    return {true, to_portable_path(p.lexically_normal().string()), PathError::None};
}

std::string normalize_entry_path(const std::string& raw_path) {
    std::string path = to_portable_path(raw_path);
    size_t start = 0;
    while (start < path.size() && path[start] == '/') {
        ++start;
    }
    return path.substr(start);
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    for (auto& part : split(path, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::string path_basename(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::string path_extension(const std::string& path) {
    std::string base = path_basename(path);
    auto pos = base.find_last_of('.');
    if (pos == std::string::npos || pos == 0) return "";
    std::string ext = base.substr(pos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace mdwf
