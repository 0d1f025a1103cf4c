#pragma once

#include <string>
#include <vector>

namespace mdwf {

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

struct PathResult {
    bool ok;
    std::string path;  // normalized path under root when ok
    PathError error;
};

// Join a relative resource path onto a root without touching the filesystem.
// - Rejects NUL bytes
// - Rejects absolute relative_path
// - Collapses "." segments; rejects any ".." that would leave root
PathResult resolve_under_root(const std::string& root, const std::string& relative_path);

// Canonical archive key: backslashes become '/', leading separators are
// stripped. ".." segments are kept so the validator can reject them.
std::string normalize_entry_path(const std::string& raw_path);

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

// Split on '/' dropping empty segments
std::vector<std::string> split_path(const std::string& path);

// Final path component ("a/b/c.md" -> "c.md")
std::string path_basename(const std::string& path);

// Lower-cased extension including the dot ("x/Y.MD" -> ".md"), "" if none
std::string path_extension(const std::string& path);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

} // namespace mdwf
