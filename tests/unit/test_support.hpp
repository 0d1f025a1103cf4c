#pragma once

#include <doctest/doctest.h>
#include <mdwf/file_system.hpp>
#include <mdwf/zip_archive.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace mdwf_test {

namespace fs = std::filesystem;

// ============================================================================
// Temporary Directory
// ============================================================================

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("mdwf_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string path(const std::string& relative) const { return (path_ / relative).string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline mdwf::Bytes to_bytes(const std::string& s) {
    return mdwf::Bytes(s.begin(), s.end());
}

inline std::string to_string(const mdwf::Bytes& b) {
    return std::string(b.begin(), b.end());
}

inline std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

// ============================================================================
// YAML Fixtures
// ============================================================================

inline std::string workflow_yaml(const std::string& name) {
    return "workflow:\n"
           "  name: " + name + "\n"
           "  description: Track " + name + " documents\n"
           "  version: 1.0.0\n"
           "  stages:\n"
           "    - name: draft\n"
           "      description: Being written\n"
           "      color: gray\n"
           "      next: [published]\n"
           "    - name: published\n"
           "      description: Live\n"
           "      color: green\n"
           "      terminal: true\n"
           "  templates:\n"
           "    - name: post\n"
           "      file: templates/post/default.md\n"
           "      output: post.md\n"
           "      description: Main document\n"
           "  statics:\n"
           "    - name: style\n"
           "      file: templates/static/style.css\n"
           "      description: Stylesheet\n"
           "  actions:\n"
           "    - name: format\n"
           "      description: Render the document\n"
           "      templates: [post]\n"
           "      formats: [html]\n"
           "      parameters:\n"
           "        - name: title\n"
           "          type: string\n"
           "          required: true\n"
           "          description: Document title\n"
           "  metadata:\n"
           "    required_fields: [title]\n"
           "    optional_fields: []\n"
           "    auto_generated: [date]\n"
           "  collection_id:\n"
           "    pattern: \"{{date}}_{{title}}\"\n"
           "    max_length: 50\n";
}

inline std::string config_yaml(const std::string& user_name = "Jane Doe") {
    return "user:\n"
           "  name: " + user_name + "\n"
           "  preferred_name: Jane\n"
           "  email: jane@example.com\n"
           "  phone: \"555-0100\"\n"
           "  address: 1 Main St\n"
           "  city: Springfield\n"
           "  state: IL\n"
           "  zip: \"62701\"\n"
           "  linkedin: janedoe\n"
           "  github: janedoe\n"
           "  website: \"https://example.com\"\n"
           "system:\n"
           "  scraper: wget\n"
           "  web_download:\n"
           "    timeout: 30\n"
           "    add_utf8_bom: false\n"
           "    html_cleanup: scripts\n"
           "  output_formats: [docx, html]\n"
           "  git:\n"
           "    auto_commit: false\n"
           "    commit_message_template: \"Add {{collection_id}}\"\n"
           "  collection_id:\n"
           "    date_format: YYYYMMDD\n"
           "    sanitize_spaces: \"_\"\n"
           "    max_length: 50\n"
           "workflows: {}\n";
}

inline std::string processor_yaml(const std::string& name,
                                  const std::string& description = "Render diagrams") {
    return "processor:\n"
           "  name: " + name + "\n"
           "  description: " + description + "\n"
           "  version: 1.0.0\n"
           "  detection:\n"
           "    command: \"" + name + " --version\"\n"
           "  execution:\n"
           "    command_template: \"" + name + " -i {{input}} -o {{output}}\"\n"
           "    mode: file\n";
}

inline std::string converter_yaml(const std::string& name) {
    return "converter:\n"
           "  name: " + name + "\n"
           "  description: Convert documents\n"
           "  version: 2.0.0\n"
           "  supported_formats: [docx, pdf]\n"
           "  detection:\n"
           "    command: \"" + name + " --version\"\n"
           "  execution:\n"
           "    command_template: \"" + name + " {{input}} -o {{output}}\"\n"
           "    mode: output\n";
}

// ============================================================================
// Archives
// ============================================================================

using FileList = std::vector<std::pair<std::string, std::string>>;

inline mdwf::Bytes make_zip(const FileList& files, bool deflate = true) {
    std::vector<mdwf::ZipWriteEntry> entries;
    for (const auto& [path, content] : files) {
        entries.push_back({path, to_bytes(content)});
    }
    auto result = mdwf::create_zip_archive(entries, deflate);
    REQUIRE(result.ok);
    return result.archive_data;
}

inline void write_bytes(const std::string& path, const mdwf::Bytes& data) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

// The blog workflow used throughout the environment tests
inline FileList blog_files() {
    return {
        {"workflows/blog/workflow.yml", workflow_yaml("blog")},
        {"workflows/blog/templates/post/default.md", "# {{title}}"},
        {"workflows/blog/templates/static/style.css", "body{}"},
    };
}

inline void write_tree(const std::string& root, const FileList& files) {
    for (const auto& [path, content] : files) {
        write_file((fs::path(root) / path).string(), content);
    }
}

// ============================================================================
// Instrumented File System
// ============================================================================

// LocalFileSystem that counts whole-file reads
class CountingFileSystem : public mdwf::FileSystem {
public:
    bool exists(const std::string& path) const override { return local_.exists(path); }
    bool is_file(const std::string& path) const override { return local_.is_file(path); }
    bool is_directory(const std::string& path) const override {
        return local_.is_directory(path);
    }
    std::optional<mdwf::Bytes> read_file(const std::string& path) const override {
        ++reads;
        return local_.read_file(path);
    }
    std::vector<mdwf::DirEntry> list_directory(const std::string& path) const override {
        return local_.list_directory(path);
    }
    std::optional<uint64_t> file_size(const std::string& path) const override {
        return local_.file_size(path);
    }

    mutable std::atomic<int> reads{0};

private:
    mdwf::LocalFileSystem local_;
};

} // namespace mdwf_test
