#pragma once

/**
 * @file environment.hpp
 * @brief Uniform read access to configuration, workflows, templates and assets
 *
 * Every resource consumer (workflow loader, template engine, CLI) holds an
 * Environment and never branches on which backing store it was handed:
 * a directory tree, an in-process fixture, a ZIP archive, or a local/global
 * composite.
 *
 * All backings share one directory layout:
 *
 *   config.yml | config.yaml
 *   workflows/<name>/workflow.yml
 *   workflows/<name>/templates/<template>/{default.md | <variant>.md}
 *   workflows/<name>/templates/static/<file>
 *   processors/<name>.yml
 *   converters/<name>.yml
 *
 * @example
 * ```cpp
 * mdwf::EnvironmentFactory factory;
 * auto env = factory.createCliEnvironment(project_root, system_root);
 * auto tpl = env->getTemplate({"job", "resume", std::string("mobile")});
 * if (tpl.isOk()) {
 *     render(tpl.value());
 * }
 * ```
 */

#include "mdwf/result.hpp"
#include "mdwf/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mdwf {

// ============================================================================
// Environment Contract
// ============================================================================

class Environment {
public:
    virtual ~Environment() = default;

    /**
     * @brief Perform deferred loading work
     *
     * Cheap backings do nothing. Archive-backed environments extract and
     * validate here; success is memoized, so repeated calls are free. Every
     * query calls it implicitly.
     */
    virtual Result<void> initialize() { return Result<void>::ok(); }

    /**
     * @brief Parsed project configuration
     * @return nullopt when no config file is present; VALIDATION_ERROR only
     *         when a config file is present but invalid
     */
    virtual Result<std::optional<ProjectConfig>> getConfig() const = 0;

    /// RESOURCE_NOT_FOUND when absent, VALIDATION_ERROR when schema-invalid
    virtual Result<WorkflowFile> getWorkflow(const std::string& name) const = 0;

    virtual Result<std::vector<std::string>> listWorkflows() const = 0;
    virtual bool hasWorkflow(const std::string& name) const = 0;

    /// Invalid definition files are skipped with a warning
    virtual Result<std::vector<ExternalProcessorDefinition>> getProcessorDefinitions() const = 0;
    virtual Result<std::vector<ExternalConverterDefinition>> getConverterDefinitions() const = 0;

    /**
     * @brief Template text
     *
     * With a variant: `<variant>.md` first, then `default.md`. Without one:
     * `default.md` only. RESOURCE_NOT_FOUND id is "<workflow>/<template>[/<variant>]".
     */
    virtual Result<std::string> getTemplate(const TemplateRequest& request) const = 0;
    virtual bool hasTemplate(const TemplateRequest& request) const = 0;

    /// `templates/static/<name>` first, then `templates/<name>`
    virtual Result<Bytes> getStatic(const StaticRequest& request) const = 0;
    virtual bool hasStatic(const StaticRequest& request) const = 0;

    /**
     * @brief Inventory of the environment
     *
     * A template is listed once its directory holds a `.md` file directly.
     * Idempotent; implementations memoize it.
     */
    virtual Result<EnvironmentManifest> getManifest() const = 0;
};

// ============================================================================
// Shared Layout
// ============================================================================
//
// Candidate-path lists, first hit wins. Directory and archive backings
// resolve through the same lists; only the membership test differs.

namespace layout {

constexpr const char* WORKFLOWS_DIR = "workflows";
constexpr const char* PROCESSORS_DIR = "processors";
constexpr const char* CONVERTERS_DIR = "converters";
constexpr const char* WORKFLOW_FILE = "workflow.yml";
constexpr const char* TEMPLATES_DIR = "templates";
constexpr const char* STATIC_DIR = "static";
constexpr const char* DEFAULT_VARIANT = "default";

// config.yml, config.yaml
std::vector<std::string> config_candidates();

// workflows/<name>/workflow.yml
std::string workflow_path(const std::string& name);

// workflows/<name>/templates
std::string templates_dir(const std::string& workflow);

// workflows/<name>/templates/static
std::string statics_dir(const std::string& workflow);

std::vector<std::string> template_candidates(const TemplateRequest& request);
std::vector<std::string> static_candidates(const StaticRequest& request);

// Processor and converter definition files: .yml or .yaml
bool is_definition_file(const std::string& name);

} // namespace layout

/**
 * @brief Reject request names that could address anything but one path segment
 *
 * Empty names, separators, NUL, "." and ".." yield SECURITY_ERROR.
 */
Result<void> check_resource_name(const std::string& kind, const std::string& name);

Result<void> check_template_request(const TemplateRequest& request);
Result<void> check_static_request(const StaticRequest& request);

bool has_variant(const TemplateRequest& request);

// ============================================================================
// Definition Loading
// ============================================================================

struct DefinitionSource {
    std::string path;   // used in diagnostics only
    std::string text;
};

// Parse every source; invalid ones are logged and skipped
std::vector<ExternalProcessorDefinition> load_processor_definitions(
    const std::vector<DefinitionSource>& sources);
std::vector<ExternalConverterDefinition> load_converter_definitions(
    const std::vector<DefinitionSource>& sources);

} // namespace mdwf
