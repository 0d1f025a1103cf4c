#pragma once

#include "mdwf/environment.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mdwf {

// ============================================================================
// Memory Environment
// ============================================================================

/**
 * @brief Backing maps of a MemoryEnvironment
 *
 * Template keys are "<workflow>/<template>[/<variant>]", static keys are
 * "<workflow>/<static>" (see template_key() and static_key()).
 */
struct MemoryEnvironmentData {
    std::optional<ProjectConfig> config;
    std::map<std::string, WorkflowFile> workflows;
    std::vector<ExternalProcessorDefinition> processors;
    std::vector<ExternalConverterDefinition> converters;
    std::map<std::string, std::string> templates;
    std::map<std::string, Bytes> statics;
};

/**
 * @brief Environment over in-process maps, for tests and embedding
 *
 * Mutators may be called at any time. Not safe for mutation concurrent with
 * reads.
 */
class MemoryEnvironment : public Environment {
public:
    MemoryEnvironment() = default;
    explicit MemoryEnvironment(MemoryEnvironmentData data) : data_(std::move(data)) {}

    Result<std::optional<ProjectConfig>> getConfig() const override;
    Result<WorkflowFile> getWorkflow(const std::string& name) const override;
    Result<std::vector<std::string>> listWorkflows() const override;
    bool hasWorkflow(const std::string& name) const override;
    Result<std::vector<ExternalProcessorDefinition>> getProcessorDefinitions() const override;
    Result<std::vector<ExternalConverterDefinition>> getConverterDefinitions() const override;

    /// Falls back from the variant key to "<workflow>/<template>"
    Result<std::string> getTemplate(const TemplateRequest& request) const override;
    bool hasTemplate(const TemplateRequest& request) const override;
    Result<Bytes> getStatic(const StaticRequest& request) const override;
    bool hasStatic(const StaticRequest& request) const override;

    /// Includes templates/statics of workflows that have no definition
    Result<EnvironmentManifest> getManifest() const override;

    // ------------------------------------------------------------------------
    // Mutators
    // ------------------------------------------------------------------------

    void setConfig(ProjectConfig config);
    void setWorkflow(const std::string& name, WorkflowFile workflow);

    /// Replaces any definition with the same name
    void addProcessor(ExternalProcessorDefinition processor);
    void addConverter(ExternalConverterDefinition converter);

    void setTemplate(const TemplateRequest& request, std::string content);
    void setStatic(const StaticRequest& request, Bytes content);

    /// Also drops every template and static of the workflow
    void removeWorkflow(const std::string& name);
    void removeTemplate(const TemplateRequest& request);
    void removeStatic(const StaticRequest& request);
    void clear();

    /// Snapshot of the backing maps
    MemoryEnvironmentData data() const { return data_; }

    /**
     * @brief Copy from another environment everything this one lacks
     *
     * Existing entries are never overwritten. Templates are copied in their
     * default rendering only; a listed template with no default rendering is
     * skipped. Errors other than not-found abort the merge.
     */
    Result<void> mergeFrom(const Environment& other);

private:
    MemoryEnvironmentData data_;
};

} // namespace mdwf
