#include "mdwf/archive_environment.hpp"
#include "mdwf/digest.hpp"
#include "mdwf/path_utils.hpp"
#include "mdwf/schema.hpp"
#include "mdwf/zip_archive.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace mdwf {

ArchiveSource ArchiveSource::from_file(const std::string& path, std::string name) {
    ArchiveSource source;
    source.file_path = path;
    source.name = name.empty() ? path : std::move(name);
    return source;
}

ArchiveSource ArchiveSource::from_buffer(Bytes data, std::string name) {
    ArchiveSource source;
    source.buffer = std::move(data);
    source.name = std::move(name);
    return source;
}

ArchiveEnvironment::ArchiveEnvironment(ArchiveSource source,
                                       std::shared_ptr<FileSystem> file_system,
                                       SecurityConfig security)
    : source_(std::move(source)),
      fs_(file_system ? std::move(file_system) : default_file_system()),
      validator_(std::move(security)) {}

// ============================================================================
// Initialization
// ============================================================================

Result<void> ArchiveEnvironment::initialize() {
    return ensureReady();
}

Result<void> ArchiveEnvironment::ensureReady() const {
    if (state_.load(std::memory_order_acquire) == State::Ready) {
        return Result<void>::ok();
    }

    std::lock_guard<std::mutex> lock(init_mutex_);
    if (state_.load(std::memory_order_acquire) == State::Ready) {
        return Result<void>::ok();
    }

    auto result = extract();
    if (result.isErr()) {
        files_.clear();
        skipped_.clear();
        digest_.clear();
        state_.store(State::Uninitialized, std::memory_order_release);
        return Result<void>::err(result.error().withContext(
            "failed to initialize archive environment from " + source_.name));
    }

    state_.store(State::Ready, std::memory_order_release);
    return Result<void>::ok();
}

Result<Bytes> ArchiveEnvironment::acquireArchive() const {
    if (source_.buffer) {
        return Result<Bytes>::ok(*source_.buffer);
    }
    if (!source_.file_path) {
        return Result<Bytes>::err(
            Error::validation("archive source has neither a file path nor a buffer"));
    }

    auto data = fs_->read_file(*source_.file_path);
    if (!data) {
        return Result<Bytes>::err(Error::io("cannot read archive " + *source_.file_path));
    }
    return Result<Bytes>::ok(std::move(*data));
}

Result<void> ArchiveEnvironment::extract() const {
    auto acquired = acquireArchive();
    if (acquired.isErr()) {
        return Result<void>::err(acquired.error());
    }
    const Bytes& archive = acquired.value();

    auto digest = sha256_bytes(archive);
    if (!digest.ok) {
        return Result<void>::err(Error::io("cannot hash archive: " + digest.error));
    }
    if (source_.expected_sha256) {
        if (!is_sha256_hex(*source_.expected_sha256)) {
            return Result<void>::err(
                Error::validation("expected_sha256 is not a SHA-256 hex digest"));
        }
        auto match = match_sha256(archive, *source_.expected_sha256);
        if (!match.ok) {
            return Result<void>::err(Error::security(match.error));
        }
    }

    state_.store(State::Extracting, std::memory_order_release);

    auto directory = read_zip_directory(archive);
    if (!directory.ok) {
        return Result<void>::err(Error::validation("invalid ZIP archive: " + directory.error));
    }
    spdlog::debug("Opened archive {} ({} bytes, {} entries)", source_.name, archive.size(),
                  directory.entries.size());

    const SecurityConfig& config = validator_.config();
    std::map<std::string, ArchiveEntry> files;
    std::vector<SkippedEntry> skipped;
    std::vector<FileInfo> batch;
    uint64_t total = 0;

    auto skip = [&](const std::string& path, const std::string& reason) {
        spdlog::warn("Skipping archive entry {} in {}: {}", path, source_.name, reason);
        skipped.push_back({path, reason});
    };

    for (const auto& entry : directory.entries) {
        if (entry.is_directory) continue;

        std::string path = normalize_entry_path(entry.name);

        auto check = validator_.validate_path(path);
        if (check.isOk()) check = validator_.validate_filename(path_basename(path));
        if (check.isOk()) check = validator_.validate_extension(path_extension(path));
        if (check.isErr()) {
            skip(entry.name, check.error().message());
            continue;
        }
        if (entry.is_symlink) {
            skip(entry.name, "symbolic links are not allowed");
            continue;
        }
        if (files.count(path)) {
            skip(entry.name, "duplicate entry");
            continue;
        }

        // Declared size first, then bound the actual inflation by the same limit
        std::string ext = path_extension(path);
        auto limit_it = config.file_size_limits.find(ext);
        bool has_limit = limit_it != config.file_size_limits.end();
        if (has_limit) {
            auto size_check = validator_.validate_file_size(ext, entry.uncompressed_size);
            if (size_check.isErr()) {
                skip(entry.name, size_check.error().message());
                continue;
            }
        }

        uint64_t cap = has_limit ? limit_it->second : config.max_total_size;
        auto read = read_zip_entry(archive, entry, cap);
        if (!read.ok) {
            if (read.too_large && has_limit) {
                skip(entry.name, "inflated size exceeds limit for " + ext + ": " +
                                     std::to_string(cap) + " bytes");
                continue;
            }
            if (read.too_large) {
                // Larger than the whole batch may be; the aggregate check rejects it
                batch.push_back(make_file_info(path, cap + 1));
                break;
            }
            skip(entry.name, read.error);
            continue;
        }

        uint64_t size = read.data.size();
        batch.push_back(make_file_info(path, size));
        files[path] = ArchiveEntry{path, std::move(read.data), size};
        total += size;

        // Stop early once the batch can no longer pass the aggregate check
        if (files.size() > config.max_file_count || total > config.max_total_size) {
            break;
        }
    }

    auto aggregate = validator_.validate_files(batch);
    if (aggregate.isErr()) {
        return Result<void>::err(
            Error::validation("archive failed validation: " + aggregate.error().message()));
    }
    state_.store(State::Validated, std::memory_order_release);

    for (const auto& [path, file] : files) {
        if (!validator_.is_content_checked(path_extension(path))) continue;
        auto content = validator_.validate_content(
            path, std::string(file.content.begin(), file.content.end()));
        if (content.isErr()) {
            return Result<void>::err(content.error());
        }
    }

    spdlog::debug("Extracted {} entries from {} ({} skipped)", files.size(), source_.name,
                  skipped.size());

    files_ = std::move(files);
    skipped_ = std::move(skipped);
    digest_ = digest.hex_digest;
    return Result<void>::ok();
}

// ============================================================================
// Lookup Helpers
// ============================================================================

const ArchiveEntry* ArchiveEnvironment::lookup(const std::string& path) const {
    auto it = files_.find(path);
    return it == files_.end() ? nullptr : &it->second;
}

std::optional<std::string> ArchiveEnvironment::findFirst(
    const std::vector<std::string>& candidates) const {
    for (const auto& candidate : candidates) {
        if (files_.count(candidate)) return candidate;
    }
    return std::nullopt;
}

std::string ArchiveEnvironment::text(const ArchiveEntry& entry) const {
    return std::string(entry.content.begin(), entry.content.end());
}

// Direct children of dir that are definition files
std::vector<DefinitionSource> ArchiveEnvironment::definitionSources(const std::string& dir) const {
    std::vector<DefinitionSource> sources;
    std::string prefix = dir + "/";
    for (const auto& [path, file] : files_) {
        if (!starts_with(path, prefix)) continue;
        if (path.find('/', prefix.size()) != std::string::npos) continue;
        if (!layout::is_definition_file(path)) continue;
        sources.push_back({path, text(file)});
    }
    return sources;
}

// ============================================================================
// Environment Queries
// ============================================================================

Result<std::optional<ProjectConfig>> ArchiveEnvironment::getConfig() const {
    using R = Result<std::optional<ProjectConfig>>;

    auto ready = ensureReady();
    if (ready.isErr()) return R::err(ready.error());

    auto path = findFirst(layout::config_candidates());
    if (!path) {
        return R::ok(std::nullopt);
    }

    auto config = load_config_yaml(text(*lookup(*path)), *path);
    if (config.isErr()) {
        return R::err(config.error());
    }
    return R::ok(std::move(config.value()));
}

Result<WorkflowFile> ArchiveEnvironment::getWorkflow(const std::string& name) const {
    auto ready = ensureReady();
    if (ready.isErr()) return Result<WorkflowFile>::err(ready.error());

    auto name_check = check_resource_name("workflow", name);
    if (name_check.isErr()) return Result<WorkflowFile>::err(name_check.error());

    std::string path = layout::workflow_path(name);
    const ArchiveEntry* file = lookup(path);
    if (!file) {
        return Result<WorkflowFile>::err(Error::not_found("Workflow", name));
    }
    return load_workflow_yaml(text(*file), path);
}

Result<std::vector<std::string>> ArchiveEnvironment::listWorkflows() const {
    auto ready = ensureReady();
    if (ready.isErr()) return Result<std::vector<std::string>>::err(ready.error());

    std::vector<std::string> workflows;
    for (const auto& [path, file] : files_) {
        auto parts = split_path(path);
        if (parts.size() == 3 && parts[0] == layout::WORKFLOWS_DIR &&
            parts[2] == layout::WORKFLOW_FILE) {
            workflows.push_back(parts[1]);
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(workflows));
}

bool ArchiveEnvironment::hasWorkflow(const std::string& name) const {
    return ensureReady().isOk() && check_resource_name("workflow", name).isOk() &&
           lookup(layout::workflow_path(name)) != nullptr;
}

Result<std::vector<ExternalProcessorDefinition>> ArchiveEnvironment::getProcessorDefinitions() const {
    using R = Result<std::vector<ExternalProcessorDefinition>>;
    auto ready = ensureReady();
    if (ready.isErr()) return R::err(ready.error());
    return R::ok(load_processor_definitions(definitionSources(layout::PROCESSORS_DIR)));
}

Result<std::vector<ExternalConverterDefinition>> ArchiveEnvironment::getConverterDefinitions() const {
    using R = Result<std::vector<ExternalConverterDefinition>>;
    auto ready = ensureReady();
    if (ready.isErr()) return R::err(ready.error());
    return R::ok(load_converter_definitions(definitionSources(layout::CONVERTERS_DIR)));
}

Result<std::string> ArchiveEnvironment::getTemplate(const TemplateRequest& request) const {
    auto ready = ensureReady();
    if (ready.isErr()) return Result<std::string>::err(ready.error());

    auto check = check_template_request(request);
    if (check.isErr()) return Result<std::string>::err(check.error());

    auto path = findFirst(layout::template_candidates(request));
    if (!path) {
        return Result<std::string>::err(Error::not_found("Template", template_key(request)));
    }
    return Result<std::string>::ok(text(*lookup(*path)));
}

bool ArchiveEnvironment::hasTemplate(const TemplateRequest& request) const {
    return ensureReady().isOk() && check_template_request(request).isOk() &&
           findFirst(layout::template_candidates(request)).has_value();
}

Result<Bytes> ArchiveEnvironment::getStatic(const StaticRequest& request) const {
    auto ready = ensureReady();
    if (ready.isErr()) return Result<Bytes>::err(ready.error());

    auto check = check_static_request(request);
    if (check.isErr()) return Result<Bytes>::err(check.error());

    auto path = findFirst(layout::static_candidates(request));
    if (!path) {
        return Result<Bytes>::err(Error::not_found("Static", static_key(request)));
    }
    return Result<Bytes>::ok(lookup(*path)->content);
}

bool ArchiveEnvironment::hasStatic(const StaticRequest& request) const {
    return ensureReady().isOk() && check_static_request(request).isOk() &&
           findFirst(layout::static_candidates(request)).has_value();
}

// ============================================================================
// Manifest
// ============================================================================

Result<EnvironmentManifest> ArchiveEnvironment::getManifest() const {
    auto ready = ensureReady();
    if (ready.isErr()) return Result<EnvironmentManifest>::err(ready.error());

    std::lock_guard<std::mutex> lock(manifest_mutex_);
    if (manifest_cache_) {
        return Result<EnvironmentManifest>::ok(*manifest_cache_);
    }

    EnvironmentManifest manifest;
    manifest.workflows = listWorkflows().value();
    for (const auto& def : getProcessorDefinitions().value()) {
        manifest.processors.push_back(def.name);
    }
    for (const auto& def : getConverterDefinitions().value()) {
        manifest.converters.push_back(def.name);
    }

    for (const auto& workflow : manifest.workflows) {
        std::string templates_prefix = layout::templates_dir(workflow) + "/";
        std::string statics_prefix = layout::statics_dir(workflow) + "/";
        std::set<std::string> templates;
        std::vector<std::string> statics;

        for (const auto& [path, file] : files_) {
            if (starts_with(path, statics_prefix)) {
                std::string rest = path.substr(statics_prefix.size());
                if (rest.find('/') == std::string::npos) statics.push_back(rest);
                continue;
            }
            if (starts_with(path, templates_prefix) && ends_with(path, ".md")) {
                std::string rest = path.substr(templates_prefix.size());
                auto slash = rest.find('/');
                if (slash != std::string::npos && rest.find('/', slash + 1) == std::string::npos) {
                    templates.insert(rest.substr(0, slash));
                }
            }
        }

        manifest.templates[workflow].assign(templates.begin(), templates.end());
        manifest.statics[workflow] = std::move(statics);
    }

    manifest.has_config = findFirst(layout::config_candidates()).has_value();

    spdlog::debug("Built manifest for archive {}: {} workflows", source_.name,
                  manifest.workflows.size());

    manifest_cache_ = manifest;
    return Result<EnvironmentManifest>::ok(std::move(manifest));
}

// ============================================================================
// Diagnostics
// ============================================================================

Result<std::string> ArchiveEnvironment::sha256() const {
    auto ready = ensureReady();
    if (ready.isErr()) return Result<std::string>::err(ready.error());
    return Result<std::string>::ok(digest_);
}

size_t ArchiveEnvironment::entryCount() const {
    return ensureReady().isOk() ? files_.size() : 0;
}

bool ArchiveEnvironment::hasEntry(const std::string& normalized_path) const {
    return ensureReady().isOk() && files_.count(normalized_path) > 0;
}

std::vector<FileInfo> ArchiveEnvironment::entries() const {
    std::vector<FileInfo> infos;
    if (ensureReady().isErr()) return infos;
    for (const auto& [path, file] : files_) {
        infos.push_back(make_file_info(path, file.size));
    }
    return infos;
}

std::vector<SkippedEntry> ArchiveEnvironment::skippedEntries() const {
    if (ensureReady().isErr()) return {};
    return skipped_;
}

} // namespace mdwf
