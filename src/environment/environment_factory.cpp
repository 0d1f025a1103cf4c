#include "mdwf/environment_factory.hpp"
#include "mdwf/path_utils.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace mdwf {

namespace fs = std::filesystem;

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out.empty() ? "(none)" : out;
}

} // namespace

EnvironmentFactory::EnvironmentFactory(FactoryOptions options) : options_(std::move(options)) {
    if (!options_.file_system) {
        options_.file_system = default_file_system();
    }
}

std::shared_ptr<FilesystemEnvironment> EnvironmentFactory::createFilesystemEnvironment(
    const std::string& root_path) const {
    return std::make_shared<FilesystemEnvironment>(root_path, options_.file_system,
                                                   options_.security);
}

std::shared_ptr<MemoryEnvironment> EnvironmentFactory::createMemoryEnvironment(
    MemoryEnvironmentData data) const {
    return std::make_shared<MemoryEnvironment>(std::move(data));
}

std::shared_ptr<MergedEnvironment> EnvironmentFactory::createMergedEnvironment(
    std::shared_ptr<Environment> local, std::shared_ptr<Environment> global) const {
    return std::make_shared<MergedEnvironment>(std::move(local), std::move(global));
}

std::shared_ptr<ArchiveEnvironment> EnvironmentFactory::createArchiveEnvironment(
    ArchiveSource source) const {
    return std::make_shared<ArchiveEnvironment>(std::move(source), options_.file_system,
                                                options_.security);
}

std::shared_ptr<ArchiveEnvironment> EnvironmentFactory::createArchiveEnvironment(
    const std::string& zip_path) const {
    return createArchiveEnvironment(ArchiveSource::from_file(zip_path));
}

std::shared_ptr<ArchiveEnvironment> EnvironmentFactory::createArchiveEnvironment(
    Bytes buffer, const std::string& name) const {
    return createArchiveEnvironment(ArchiveSource::from_buffer(std::move(buffer), name));
}

std::shared_ptr<Environment> EnvironmentFactory::createSystemEnvironment(
    const std::string& system_root) const {
    if (path_extension(system_root) == ".zip" && options_.file_system->is_file(system_root)) {
        spdlog::debug("Using archive {} as system environment", system_root);
        return createArchiveEnvironment(system_root);
    }
    return createFilesystemEnvironment(system_root);
}

std::shared_ptr<MergedEnvironment> EnvironmentFactory::createCliEnvironment(
    const std::string& project_root, const std::string& system_root) const {
    std::string local_root = to_portable_path((fs::path(project_root) / PROJECT_DIR_NAME).string());
    return createMergedEnvironment(createFilesystemEnvironment(local_root),
                                   createSystemEnvironment(system_root));
}

Result<std::shared_ptr<MergedEnvironment>> EnvironmentFactory::createWorkflowEnvironment(
    const std::string& project_root, const std::string& system_root,
    const std::string& workflow) const {
    using R = Result<std::shared_ptr<MergedEnvironment>>;

    auto environment = createCliEnvironment(project_root, system_root);
    if (environment->hasWorkflow(workflow)) {
        return R::ok(std::move(environment));
    }

    auto available = environment->listWorkflows();
    if (available.isErr()) {
        return R::err(available.error());
    }
    return R::err(Error::not_found("Workflow", workflow,
                                   "Available workflows: " + join_names(available.value())));
}

std::optional<std::string> EnvironmentFactory::findProjectRoot(const std::string& start_path) const {
    std::error_code ec;
    fs::path current = fs::absolute(start_path, ec);
    if (ec) {
        current = fs::path(start_path);
    }
    current = current.lexically_normal();

    while (true) {
        if (options_.file_system->is_directory((current / PROJECT_DIR_NAME).string())) {
            return to_portable_path(current.string());
        }
        fs::path parent = current.parent_path();
        if (parent.empty() || parent == current) {
            return std::nullopt;
        }
        current = parent;
    }
}

Result<DiscoveredEnvironment> EnvironmentFactory::createFromDiscovery(
    const std::string& start_path, const std::string& system_root) const {
    if (system_root.empty() || !options_.file_system->exists(system_root)) {
        return Result<DiscoveredEnvironment>::err(Error::not_found(
            "System root", system_root.empty() ? std::string("(unset)") : system_root,
            "Set MDWF_SYSTEM_ROOT or pass --system"));
    }

    auto project_root = findProjectRoot(start_path);
    if (!project_root) {
        return Result<DiscoveredEnvironment>::err(Error::not_found(
            "Project root", start_path,
            std::string("No ") + PROJECT_DIR_NAME + " directory in any parent"));
    }

    DiscoveredEnvironment discovered;
    discovered.environment = createCliEnvironment(*project_root, system_root);
    discovered.project_root = *project_root;
    discovered.system_root = system_root;
    return Result<DiscoveredEnvironment>::ok(std::move(discovered));
}

// ============================================================================
// Validation
// ============================================================================

EnvironmentValidation validate_environment(const Environment& environment) {
    EnvironmentValidation report;

    auto manifest = environment.getManifest();
    if (manifest.isErr()) {
        report.issues.push_back("Environment validation failed: " + manifest.error().message());
        report.is_valid = false;
        return report;
    }

    if (manifest.value().workflows.empty()) {
        report.warnings.push_back("No workflows found");
    }

    for (const auto& name : manifest.value().workflows) {
        auto workflow = environment.getWorkflow(name);
        if (workflow.isErr()) {
            report.issues.push_back("Failed to load workflow '" + name + "': " +
                                    workflow.error().message());
        }
    }

    auto config = environment.getConfig();
    if (config.isErr()) {
        report.warnings.push_back("Configuration issues: " + config.error().message());
    }

    report.is_valid = report.issues.empty();
    return report;
}

} // namespace mdwf
