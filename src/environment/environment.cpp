#include "mdwf/environment.hpp"
#include "mdwf/path_utils.hpp"
#include "mdwf/schema.hpp"

#include <spdlog/spdlog.h>

namespace mdwf {

namespace layout {

std::vector<std::string> config_candidates() {
    return {"config.yml", "config.yaml"};
}

std::string workflow_path(const std::string& name) {
    return std::string(WORKFLOWS_DIR) + "/" + name + "/" + WORKFLOW_FILE;
}

std::string templates_dir(const std::string& workflow) {
    return std::string(WORKFLOWS_DIR) + "/" + workflow + "/" + TEMPLATES_DIR;
}

std::string statics_dir(const std::string& workflow) {
    return templates_dir(workflow) + "/" + STATIC_DIR;
}

std::vector<std::string> template_candidates(const TemplateRequest& request) {
    std::string base = templates_dir(request.workflow) + "/" + request.template_name + "/";
    std::vector<std::string> candidates;
    if (has_variant(request)) {
        candidates.push_back(base + *request.variant + ".md");
    }
    candidates.push_back(base + DEFAULT_VARIANT + ".md");
    return candidates;
}

std::vector<std::string> static_candidates(const StaticRequest& request) {
    return {
        statics_dir(request.workflow) + "/" + request.static_name,
        templates_dir(request.workflow) + "/" + request.static_name,
    };
}

bool is_definition_file(const std::string& name) {
    std::string ext = path_extension(name);
    return ext == ".yml" || ext == ".yaml";
}

} // namespace layout

Result<void> check_resource_name(const std::string& kind, const std::string& name) {
    if (name.empty()) {
        return Result<void>::err(Error::security(kind + " name must not be empty"));
    }
    if (name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos || name.find('\0') != std::string::npos) {
        return Result<void>::err(Error::security("unsafe " + kind + " name: " + name));
    }
    return Result<void>::ok();
}

bool has_variant(const TemplateRequest& request) {
    return request.variant.has_value() && !request.variant->empty();
}

Result<void> check_template_request(const TemplateRequest& request) {
    auto r = check_resource_name("workflow", request.workflow);
    if (r.isErr()) return r;
    r = check_resource_name("template", request.template_name);
    if (r.isErr()) return r;
    if (has_variant(request)) {
        r = check_resource_name("variant", *request.variant);
    }
    return r;
}

Result<void> check_static_request(const StaticRequest& request) {
    auto r = check_resource_name("workflow", request.workflow);
    if (r.isErr()) return r;
    return check_resource_name("static", request.static_name);
}

// ============================================================================
// Definition Loading
// ============================================================================

std::vector<ExternalProcessorDefinition> load_processor_definitions(
    const std::vector<DefinitionSource>& sources) {
    std::vector<ExternalProcessorDefinition> definitions;
    for (const auto& source : sources) {
        auto result = load_processor_yaml(source.text, source.path);
        if (result.isErr()) {
            spdlog::warn("Skipping processor definition {}: {}", source.path,
                         result.error().message());
            continue;
        }
        definitions.push_back(std::move(result.value()));
    }
    return definitions;
}

std::vector<ExternalConverterDefinition> load_converter_definitions(
    const std::vector<DefinitionSource>& sources) {
    std::vector<ExternalConverterDefinition> definitions;
    for (const auto& source : sources) {
        auto result = load_converter_yaml(source.text, source.path);
        if (result.isErr()) {
            spdlog::warn("Skipping converter definition {}: {}", source.path,
                         result.error().message());
            continue;
        }
        definitions.push_back(std::move(result.value()));
    }
    return definitions;
}

} // namespace mdwf
