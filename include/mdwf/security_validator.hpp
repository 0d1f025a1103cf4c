#pragma once

#include "mdwf/result.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mdwf {

// ============================================================================
// Security Configuration
// ============================================================================

// Caller-supplied content rule: returns an error message to reject the payload
using ContentRule =
    std::function<std::optional<std::string>(const std::string& path, const std::string& text)>;

struct SecurityConfig {
    // extension (".md") -> max bytes; extensions not listed have no per-file limit
    std::unordered_map<std::string, uint64_t> file_size_limits;

    // Empty list disables the allowlist
    std::vector<std::string> allowed_extensions;

    // Aggregate ceilings for one batch (archive or directory snapshot)
    uint64_t max_file_count = 500;
    uint64_t max_total_size = 5 * 1024 * 1024;

    // workflows/<name>/templates/<template>/<file> is 5 levels
    size_t max_path_depth = 5;
    size_t max_filename_length = 255;

    // Content sanity pass applied to text payloads before they are parsed
    bool enable_content_validation = true;
    bool require_utf8 = true;
    uint64_t max_content_size = 1024 * 1024;
    std::vector<std::string> content_extensions;
    std::vector<std::string> denied_yaml_tags;
    std::vector<ContentRule> content_rules;
};

SecurityConfig default_security_config();

// Overlay a JSON document onto the defaults. file_size_limits entries merge
// per extension; every other key replaces the default.
Result<SecurityConfig> parse_security_config(const std::string& json_text);

// ============================================================================
// File Info
// ============================================================================

struct FileInfo {
    std::string name;       // basename
    std::string path;       // normalized relative path
    std::string extension;  // lower-cased, with dot
    uint64_t size = 0;
};

FileInfo make_file_info(const std::string& normalized_path, uint64_t size);

// ============================================================================
// Security Validator
// ============================================================================
//
// Stateless given its configuration. Per-file checks are advisory: callers
// skip the offending file. validate_files() is the aggregate batch check and
// its failure is fatal to the whole load.

class SecurityValidator {
public:
    explicit SecurityValidator(SecurityConfig config = default_security_config())
        : config_(std::move(config)) {}

    const SecurityConfig& config() const { return config_; }

    // Rejects empty, absolute (unix or drive-letter), NUL, ".." segments, too deep
    Result<void> validate_path(const std::string& path) const;

    // Rejects separators, control and reserved characters, "."/"..", overlong names
    Result<void> validate_filename(const std::string& name) const;

    Result<void> validate_extension(const std::string& extension) const;
    Result<void> validate_file_size(const std::string& extension, uint64_t size) const;

    // filename + path + extension + size
    Result<void> validate_file(const FileInfo& file) const;

    // Aggregate: entry count and total bytes
    Result<void> validate_files(const std::vector<FileInfo>& files) const;

    // Size, UTF-8, denied YAML tags and custom rules; VALIDATION_ERROR on failure
    Result<void> validate_content(const std::string& path, const std::string& text) const;

    // Whether validate_content applies to files with this extension
    bool is_content_checked(const std::string& extension) const;

    std::string sanitize_filename(const std::string& filename) const;

private:
    SecurityConfig config_;
};

bool is_valid_utf8(const std::string& text);

} // namespace mdwf
