#include "mdwf/filesystem_environment.hpp"
#include "mdwf/path_utils.hpp"
#include "mdwf/schema.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace mdwf {

namespace {

std::string absolute_root(const std::string& root_path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(root_path, ec);
    if (ec) {
        return root_path;
    }
    return to_portable_path(abs.lexically_normal().string());
}

bool within_root(const std::string& root, const std::string& path) {
    std::error_code ec;
    auto canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) return false;
    auto canonical_path = std::filesystem::weakly_canonical(path, ec);
    if (ec) return false;

    auto rel = canonical_path.lexically_relative(canonical_root);
    if (rel.empty()) return false;
    auto first = rel.begin();
    return first == rel.end() || first->string() != "..";
}

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::ContainsNul: return "contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "escapes root";
        case PathError::None: break;
    }
    return "invalid path";
}

} // namespace

FilesystemEnvironment::FilesystemEnvironment(std::string root_path,
                                             std::shared_ptr<FileSystem> file_system,
                                             SecurityConfig security)
    : root_(absolute_root(root_path)),
      fs_(file_system ? std::move(file_system) : default_file_system()),
      validator_(std::move(security)) {}

// ============================================================================
// Path Resolution and Guarded Reads
// ============================================================================

Result<std::string> FilesystemEnvironment::resolve(const std::string& relative) const {
    auto path_check = validator_.validate_path(relative);
    if (path_check.isErr()) {
        return Result<std::string>::err(path_check.error());
    }

    auto resolved = resolve_under_root(root_, relative);
    if (!resolved.ok) {
        return Result<std::string>::err(Error::security(
            "path " + std::string(path_error_to_string(resolved.error)) + ": " + relative));
    }

    // Symlinks inside the tree must not lead out of it
    if (!within_root(root_, resolved.path)) {
        return Result<std::string>::err(
            Error::security("path escapes root through a symlink: " + relative));
    }
    return Result<std::string>::ok(resolved.path);
}

bool FilesystemEnvironment::isFile(const std::string& relative) const {
    auto path = resolve(relative);
    return path.isOk() && fs_->is_file(path.value());
}

std::optional<std::string> FilesystemEnvironment::findFirst(
    const std::vector<std::string>& candidates) const {
    for (const auto& candidate : candidates) {
        if (isFile(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<Bytes> FilesystemEnvironment::readResource(const std::string& relative) const {
    auto path = resolve(relative);
    if (path.isErr()) {
        return Result<Bytes>::err(path.error());
    }

    auto size = fs_->file_size(path.value());
    if (!size) {
        return Result<Bytes>::err(Error::io("cannot stat " + path.value()));
    }

    auto check = validator_.validate_file(make_file_info(relative, *size));
    if (check.isErr()) {
        return Result<Bytes>::err(check.error());
    }

    auto data = fs_->read_file(path.value());
    if (!data) {
        return Result<Bytes>::err(Error::io("failed to read " + path.value()));
    }

    if (validator_.is_content_checked(path_extension(relative))) {
        auto content = validator_.validate_content(
            relative, std::string(data->begin(), data->end()));
        if (content.isErr()) {
            return Result<Bytes>::err(content.error());
        }
    }

    return Result<Bytes>::ok(std::move(*data));
}

Result<std::string> FilesystemEnvironment::readText(const std::string& relative) const {
    auto data = readResource(relative);
    if (data.isErr()) {
        return Result<std::string>::err(data.error());
    }
    return Result<std::string>::ok(std::string(data.value().begin(), data.value().end()));
}

// ============================================================================
// Environment Queries
// ============================================================================

Result<std::optional<ProjectConfig>> FilesystemEnvironment::getConfig() const {
    using R = Result<std::optional<ProjectConfig>>;

    auto config_path = findFirst(layout::config_candidates());
    if (!config_path) {
        return R::ok(std::nullopt);
    }

    auto text = readText(*config_path);
    if (text.isErr()) {
        return R::err(text.error());
    }

    auto config = load_config_yaml(text.value(), *config_path);
    if (config.isErr()) {
        return R::err(config.error());
    }
    return R::ok(std::move(config.value()));
}

Result<WorkflowFile> FilesystemEnvironment::getWorkflow(const std::string& name) const {
    auto name_check = check_resource_name("workflow", name);
    if (name_check.isErr()) {
        return Result<WorkflowFile>::err(name_check.error());
    }

    std::string relative = layout::workflow_path(name);
    if (!isFile(relative)) {
        return Result<WorkflowFile>::err(Error::not_found("Workflow", name));
    }

    auto text = readText(relative);
    if (text.isErr()) {
        return Result<WorkflowFile>::err(text.error());
    }
    return load_workflow_yaml(text.value(), relative);
}

Result<std::vector<std::string>> FilesystemEnvironment::listWorkflows() const {
    std::vector<std::string> workflows;

    auto dir = resolve(layout::WORKFLOWS_DIR);
    if (dir.isErr()) {
        return Result<std::vector<std::string>>::err(dir.error());
    }

    for (const auto& entry : fs_->list_directory(dir.value())) {
        if (!entry.is_directory) continue;
        if (isFile(layout::workflow_path(entry.name))) {
            workflows.push_back(entry.name);
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(workflows));
}

bool FilesystemEnvironment::hasWorkflow(const std::string& name) const {
    return check_resource_name("workflow", name).isOk() && isFile(layout::workflow_path(name));
}

std::vector<DefinitionSource> FilesystemEnvironment::readDefinitionSources(
    const std::string& dir) const {
    std::vector<DefinitionSource> sources;

    auto dir_path = resolve(dir);
    if (dir_path.isErr()) {
        return sources;
    }

    for (const auto& entry : fs_->list_directory(dir_path.value())) {
        if (!entry.is_file || !layout::is_definition_file(entry.name)) continue;

        std::string relative = dir + "/" + entry.name;
        auto text = readText(relative);
        if (text.isErr()) {
            spdlog::warn("Skipping {}: {}", relative, text.error().message());
            continue;
        }
        sources.push_back({relative, std::move(text.value())});
    }
    return sources;
}

Result<std::vector<ExternalProcessorDefinition>>
FilesystemEnvironment::getProcessorDefinitions() const {
    return Result<std::vector<ExternalProcessorDefinition>>::ok(
        load_processor_definitions(readDefinitionSources(layout::PROCESSORS_DIR)));
}

Result<std::vector<ExternalConverterDefinition>>
FilesystemEnvironment::getConverterDefinitions() const {
    return Result<std::vector<ExternalConverterDefinition>>::ok(
        load_converter_definitions(readDefinitionSources(layout::CONVERTERS_DIR)));
}

Result<std::string> FilesystemEnvironment::getTemplate(const TemplateRequest& request) const {
    auto check = check_template_request(request);
    if (check.isErr()) {
        return Result<std::string>::err(check.error());
    }

    auto path = findFirst(layout::template_candidates(request));
    if (!path) {
        return Result<std::string>::err(Error::not_found("Template", template_key(request)));
    }
    return readText(*path);
}

bool FilesystemEnvironment::hasTemplate(const TemplateRequest& request) const {
    return check_template_request(request).isOk() &&
           findFirst(layout::template_candidates(request)).has_value();
}

Result<Bytes> FilesystemEnvironment::getStatic(const StaticRequest& request) const {
    auto check = check_static_request(request);
    if (check.isErr()) {
        return Result<Bytes>::err(check.error());
    }

    auto path = findFirst(layout::static_candidates(request));
    if (!path) {
        return Result<Bytes>::err(Error::not_found("Static", static_key(request)));
    }
    return readResource(*path);
}

bool FilesystemEnvironment::hasStatic(const StaticRequest& request) const {
    return check_static_request(request).isOk() &&
           findFirst(layout::static_candidates(request)).has_value();
}

// ============================================================================
// Manifest
// ============================================================================

std::vector<std::string> FilesystemEnvironment::scanTemplates(const std::string& workflow) const {
    std::vector<std::string> templates;
    auto dir = resolve(layout::templates_dir(workflow));
    if (dir.isErr()) return templates;

    // A template directory counts once it holds at least one .md file
    for (const auto& entry : fs_->list_directory(dir.value())) {
        if (!entry.is_directory || entry.name == layout::STATIC_DIR) continue;
        for (const auto& child : fs_->list_directory(dir.value() + "/" + entry.name)) {
            if (child.is_file && ends_with(child.name, ".md")) {
                templates.push_back(entry.name);
                break;
            }
        }
    }
    return templates;
}

std::vector<std::string> FilesystemEnvironment::scanStatics(const std::string& workflow) const {
    std::vector<std::string> statics;
    auto dir = resolve(layout::statics_dir(workflow));
    if (dir.isErr()) return statics;

    for (const auto& entry : fs_->list_directory(dir.value())) {
        if (entry.is_file) {
            statics.push_back(entry.name);
        }
    }
    return statics;
}

Result<EnvironmentManifest> FilesystemEnvironment::getManifest() const {
    std::lock_guard<std::mutex> lock(manifest_mutex_);
    if (manifest_cache_) {
        return Result<EnvironmentManifest>::ok(*manifest_cache_);
    }

    EnvironmentManifest manifest;

    auto workflows = listWorkflows();
    if (workflows.isErr()) {
        return Result<EnvironmentManifest>::err(workflows.error());
    }
    manifest.workflows = std::move(workflows.value());

    for (const auto& def : getProcessorDefinitions().value()) {
        manifest.processors.push_back(def.name);
    }
    for (const auto& def : getConverterDefinitions().value()) {
        manifest.converters.push_back(def.name);
    }

    for (const auto& workflow : manifest.workflows) {
        manifest.templates[workflow] = scanTemplates(workflow);
        manifest.statics[workflow] = scanStatics(workflow);
    }

    manifest.has_config = findFirst(layout::config_candidates()).has_value();

    spdlog::debug("Built manifest for {}: {} workflows, {} processors, {} converters", root_,
                  manifest.workflows.size(), manifest.processors.size(),
                  manifest.converters.size());

    manifest_cache_ = manifest;
    return Result<EnvironmentManifest>::ok(std::move(manifest));
}

} // namespace mdwf
