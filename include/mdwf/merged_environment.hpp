#pragma once

#include "mdwf/environment.hpp"

#include <memory>
#include <string>
#include <utility>

namespace mdwf {

// ============================================================================
// Merged Environment
// ============================================================================

/// Which side of a MergedEnvironment serves a resource
enum class ResourceSource {
    Local,
    Global,
    None,
};

const char* resource_source_to_string(ResourceSource source);

/**
 * @brief Local environment layered over a global one
 *
 * Local wins whenever it has an answer. Single-resource lookups fall
 * through to global only on RESOURCE_NOT_FOUND; any other local error is
 * returned as is, so a broken local override is never hidden by the global
 * default. Listings are unions with local entries first. Processor and
 * converter definitions merge by name, local replacing global.
 *
 * Holds no resource state of its own.
 */
class MergedEnvironment : public Environment {
public:
    MergedEnvironment(std::shared_ptr<Environment> local, std::shared_ptr<Environment> global)
        : local_(std::move(local)), global_(std::move(global)) {}

    /// Initializes local then global; the first failure is returned
    Result<void> initialize() override;

    /// Local config if present, else global's (no field-level merge)
    Result<std::optional<ProjectConfig>> getConfig() const override;
    Result<WorkflowFile> getWorkflow(const std::string& name) const override;
    Result<std::vector<std::string>> listWorkflows() const override;
    bool hasWorkflow(const std::string& name) const override;
    Result<std::vector<ExternalProcessorDefinition>> getProcessorDefinitions() const override;
    Result<std::vector<ExternalConverterDefinition>> getConverterDefinitions() const override;
    Result<std::string> getTemplate(const TemplateRequest& request) const override;
    bool hasTemplate(const TemplateRequest& request) const override;
    Result<Bytes> getStatic(const StaticRequest& request) const override;
    bool hasStatic(const StaticRequest& request) const override;
    Result<EnvironmentManifest> getManifest() const override;

    const std::shared_ptr<Environment>& local() const { return local_; }
    const std::shared_ptr<Environment>& global() const { return global_; }

    ResourceSource resourceSource(const std::string& workflow) const;
    ResourceSource resourceSource(const TemplateRequest& request) const;
    ResourceSource resourceSource(const StaticRequest& request) const;

private:
    std::shared_ptr<Environment> local_;
    std::shared_ptr<Environment> global_;
};

} // namespace mdwf
