#include "mdwf/security_validator.hpp"
#include "mdwf/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include <nlohmann/json.hpp>

namespace mdwf {

namespace {

constexpr uint64_t KIB = 1024;
constexpr uint64_t MIB = 1024 * 1024;

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string normalize_extension(const std::string& ext) {
    std::string e = to_lower(trim(ext));
    if (!e.empty() && e[0] != '.') e = "." + e;
    return e;
}

bool is_reserved_char(unsigned char c) {
    return c < 0x20 || c == 0x7f || c == '<' || c == '>' || c == ':' || c == '"' ||
           c == '|' || c == '?' || c == '*';
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

std::vector<std::string> read_extension_list(const nlohmann::json& j) {
    std::vector<std::string> out;
    for (const auto& elem : j) {
        out.push_back(normalize_extension(elem.get<std::string>()));
    }
    return out;
}

// Limits must be non-negative integers; a negative value would wrap to
// "unlimited" on conversion.
template<typename T>
bool read_limit(const nlohmann::json& j, const std::string& key, T& out) {
    if (!j.contains(key)) return true;
    const auto& v = j.at(key);
    if (!v.is_number_unsigned()) return false;
    out = v.get<T>();
    return true;
}

Error invalid_limit(const std::string& key) {
    return Error::validation(key + " must be a non-negative integer");
}

} // namespace

SecurityConfig default_security_config() {
    SecurityConfig config;
    for (const char* ext : {".yml", ".yaml", ".json", ".md", ".markdown", ".txt", ".css"}) {
        config.file_size_limits[ext] = 100 * KIB;
    }
    for (const char* ext : {".png", ".jpg", ".jpeg", ".gif", ".svg"}) {
        config.file_size_limits[ext] = 500 * KIB;
    }
    for (const char* ext : {".docx", ".pdf"}) {
        config.file_size_limits[ext] = 1 * MIB;
    }
    config.allowed_extensions = {".yml", ".yaml", ".json", ".md", ".markdown", ".txt",
                                 ".css", ".html", ".csv", ".png", ".jpg", ".jpeg",
                                 ".gif", ".svg", ".docx", ".pdf"};
    config.content_extensions = {".yml", ".yaml", ".json", ".md", ".markdown", ".txt"};
    config.denied_yaml_tags = {"!!python", "!!ruby", "!!js", "!!java",
                               "!<tag:yaml.org,2002:python"};
    return config;
}

Result<SecurityConfig> parse_security_config(const std::string& json_text) {
    SecurityConfig config = default_security_config();

    try {
        auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            return Result<SecurityConfig>::err(
                Error::validation("security config must be a JSON object"));
        }

        if (j.contains("file_size_limits")) {
            const auto& limits = j["file_size_limits"];
            if (!limits.is_object()) {
                return Result<SecurityConfig>::err(
                    Error::validation("file_size_limits must be an object"));
            }
            for (auto& [ext, limit] : limits.items()) {
                if (!limit.is_number_unsigned()) {
                    return Result<SecurityConfig>::err(
                        invalid_limit("file_size_limits." + ext));
                }
                config.file_size_limits[normalize_extension(ext)] = limit.get<uint64_t>();
            }
        }
        if (j.contains("allowed_extensions")) {
            config.allowed_extensions = read_extension_list(j["allowed_extensions"]);
        }
        if (j.contains("content_extensions")) {
            config.content_extensions = read_extension_list(j["content_extensions"]);
        }
        if (j.contains("denied_yaml_tags")) {
            config.denied_yaml_tags = j["denied_yaml_tags"].get<std::vector<std::string>>();
        }
        if (!read_limit(j, "max_file_count", config.max_file_count)) {
            return Result<SecurityConfig>::err(invalid_limit("max_file_count"));
        }
        if (!read_limit(j, "max_total_size", config.max_total_size)) {
            return Result<SecurityConfig>::err(invalid_limit("max_total_size"));
        }
        if (!read_limit(j, "max_path_depth", config.max_path_depth)) {
            return Result<SecurityConfig>::err(invalid_limit("max_path_depth"));
        }
        if (!read_limit(j, "max_filename_length", config.max_filename_length)) {
            return Result<SecurityConfig>::err(invalid_limit("max_filename_length"));
        }
        if (!read_limit(j, "max_content_size", config.max_content_size)) {
            return Result<SecurityConfig>::err(invalid_limit("max_content_size"));
        }
        config.enable_content_validation =
            j.value("enable_content_validation", config.enable_content_validation);
        config.require_utf8 = j.value("require_utf8", config.require_utf8);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<SecurityConfig>::err(
            Error::validation(std::string("security config parse error: ") + e.what()));
    } catch (const nlohmann::json::exception& e) {
        return Result<SecurityConfig>::err(
            Error::validation(std::string("security config JSON error: ") + e.what()));
    }

    return Result<SecurityConfig>::ok(std::move(config));
}

FileInfo make_file_info(const std::string& normalized_path, uint64_t size) {
    FileInfo info;
    info.name = path_basename(normalized_path);
    info.path = normalized_path;
    info.extension = path_extension(normalized_path);
    info.size = size;
    return info;
}

// ============================================================================
// Per-file Checks
// ============================================================================

Result<void> SecurityValidator::validate_path(const std::string& path) const {
    if (path.empty()) {
        return Result<void>::err(Error::security("empty path not allowed"));
    }
    if (path.find('\0') != std::string::npos) {
        return Result<void>::err(Error::security("path contains NUL byte: " + path));
    }
    if (path[0] == '/' || path[0] == '\\') {
        return Result<void>::err(Error::security("absolute path not allowed: " + path));
    }
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') {
        return Result<void>::err(Error::security("absolute path not allowed: " + path));
    }

    auto segments = split_path(to_portable_path(path));
    for (const auto& segment : segments) {
        if (segment == "..") {
            return Result<void>::err(Error::security("path traversal not allowed: " + path));
        }
    }

    if (segments.size() > config_.max_path_depth) {
        return Result<void>::err(Error::security(
            "path too deep: " + std::to_string(segments.size()) + " levels, max " +
            std::to_string(config_.max_path_depth) + ": " + path));
    }

    return Result<void>::ok();
}

Result<void> SecurityValidator::validate_filename(const std::string& name) const {
    if (trim(name).empty()) {
        return Result<void>::err(Error::security("empty filename not allowed"));
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return Result<void>::err(Error::security("path separator in filename: " + name));
    }
    if (name == "." || name == "..") {
        return Result<void>::err(Error::security("invalid filename: " + name));
    }
    for (unsigned char c : name) {
        if (is_reserved_char(c)) {
            return Result<void>::err(
                Error::security("filename contains dangerous characters: " + name));
        }
    }
    if (name.size() > config_.max_filename_length) {
        return Result<void>::err(Error::security(
            "filename too long: " + std::to_string(name.size()) + " chars, max " +
            std::to_string(config_.max_filename_length)));
    }
    return Result<void>::ok();
}

Result<void> SecurityValidator::validate_extension(const std::string& extension) const {
    if (config_.allowed_extensions.empty()) {
        return Result<void>::ok();
    }
    std::string ext = to_lower(extension);
    if (!contains(config_.allowed_extensions, ext)) {
        return Result<void>::err(Error::security(
            "file extension not allowed: " + (ext.empty() ? std::string("<none>") : ext)));
    }
    return Result<void>::ok();
}

Result<void> SecurityValidator::validate_file_size(const std::string& extension,
                                                   uint64_t size) const {
    auto it = config_.file_size_limits.find(to_lower(extension));
    if (it != config_.file_size_limits.end() && size > it->second) {
        return Result<void>::err(Error::security(
            "file size " + std::to_string(size) + " bytes exceeds limit for " + extension +
            ": " + std::to_string(it->second) + " bytes"));
    }
    return Result<void>::ok();
}

Result<void> SecurityValidator::validate_file(const FileInfo& file) const {
    auto r = validate_filename(file.name);
    if (r.isErr()) return r;
    r = validate_path(file.path);
    if (r.isErr()) return r;
    r = validate_extension(file.extension);
    if (r.isErr()) return r;
    return validate_file_size(file.extension, file.size);
}

// ============================================================================
// Aggregate Check
// ============================================================================

Result<void> SecurityValidator::validate_files(const std::vector<FileInfo>& files) const {
    if (files.size() > config_.max_file_count) {
        return Result<void>::err(Error::security(
            "too many files: " + std::to_string(files.size()) + " exceeds limit of " +
            std::to_string(config_.max_file_count)));
    }

    uint64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
        if (total > config_.max_total_size) {
            return Result<void>::err(Error::security(
                "total file size exceeds limit of " + std::to_string(config_.max_total_size) +
                " bytes"));
        }
    }
    return Result<void>::ok();
}

// ============================================================================
// Content Sanity
// ============================================================================

bool SecurityValidator::is_content_checked(const std::string& extension) const {
    return contains(config_.content_extensions, to_lower(extension));
}

Result<void> SecurityValidator::validate_content(const std::string& path,
                                                 const std::string& text) const {
    if (!config_.enable_content_validation) {
        return Result<void>::ok();
    }

    if (text.size() > config_.max_content_size) {
        return Result<void>::err(Error::validation(
            "content validation failed for " + path + ": " + std::to_string(text.size()) +
            " bytes exceeds input ceiling of " + std::to_string(config_.max_content_size)));
    }

    if (config_.require_utf8 && !is_valid_utf8(text)) {
        return Result<void>::err(
            Error::validation("content validation failed for " + path + ": not valid UTF-8"));
    }

    std::string ext = path_extension(path);
    if (ext == ".yml" || ext == ".yaml") {
        for (const auto& tag : config_.denied_yaml_tags) {
            if (!tag.empty() && text.find(tag) != std::string::npos) {
                return Result<void>::err(Error::validation(
                    "content validation failed for " + path + ": denied YAML tag " + tag));
            }
        }
    }

    for (const auto& rule : config_.content_rules) {
        if (!rule) continue;
        if (auto message = rule(path, text)) {
            return Result<void>::err(
                Error::validation("content validation failed for " + path + ": " + *message));
        }
    }

    return Result<void>::ok();
}

std::string SecurityValidator::sanitize_filename(const std::string& filename) const {
    std::string result = filename;
    for (auto& c : result) {
        if (is_reserved_char(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }
    return trim(result);
}

bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong encodings, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace mdwf
