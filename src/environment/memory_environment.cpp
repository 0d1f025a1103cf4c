#include "mdwf/memory_environment.hpp"
#include "mdwf/path_utils.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace mdwf {

namespace {

template<typename Def>
void upsert_by_name(std::vector<Def>& list, Def def) {
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const Def& d) { return d.name == def.name; }),
               list.end());
    list.push_back(std::move(def));
}

template<typename Def>
bool contains_name(const std::vector<Def>& list, const std::string& name) {
    return std::any_of(list.begin(), list.end(), [&](const Def& d) { return d.name == name; });
}

// Key without the variant suffix
std::string default_template_key(const TemplateRequest& request) {
    return template_key({request.workflow, request.template_name, std::nullopt});
}

template<typename Map>
void erase_with_prefix(Map& map, const std::string& prefix) {
    for (auto it = map.begin(); it != map.end();) {
        if (starts_with(it->first, prefix)) {
            it = map.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace

// ============================================================================
// Environment Queries
// ============================================================================

Result<std::optional<ProjectConfig>> MemoryEnvironment::getConfig() const {
    return Result<std::optional<ProjectConfig>>::ok(data_.config);
}

Result<WorkflowFile> MemoryEnvironment::getWorkflow(const std::string& name) const {
    auto it = data_.workflows.find(name);
    if (it == data_.workflows.end()) {
        return Result<WorkflowFile>::err(Error::not_found("Workflow", name));
    }
    return Result<WorkflowFile>::ok(it->second);
}

Result<std::vector<std::string>> MemoryEnvironment::listWorkflows() const {
    std::vector<std::string> names;
    for (const auto& [name, workflow] : data_.workflows) {
        names.push_back(name);
    }
    return Result<std::vector<std::string>>::ok(std::move(names));
}

bool MemoryEnvironment::hasWorkflow(const std::string& name) const {
    return data_.workflows.count(name) > 0;
}

Result<std::vector<ExternalProcessorDefinition>> MemoryEnvironment::getProcessorDefinitions() const {
    return Result<std::vector<ExternalProcessorDefinition>>::ok(data_.processors);
}

Result<std::vector<ExternalConverterDefinition>> MemoryEnvironment::getConverterDefinitions() const {
    return Result<std::vector<ExternalConverterDefinition>>::ok(data_.converters);
}

Result<std::string> MemoryEnvironment::getTemplate(const TemplateRequest& request) const {
    auto check = check_template_request(request);
    if (check.isErr()) {
        return Result<std::string>::err(check.error());
    }

    auto it = data_.templates.find(template_key(request));
    if (it == data_.templates.end() && has_variant(request)) {
        it = data_.templates.find(default_template_key(request));
    }
    if (it == data_.templates.end()) {
        return Result<std::string>::err(Error::not_found("Template", template_key(request)));
    }
    return Result<std::string>::ok(it->second);
}

bool MemoryEnvironment::hasTemplate(const TemplateRequest& request) const {
    return getTemplate(request).isOk();
}

Result<Bytes> MemoryEnvironment::getStatic(const StaticRequest& request) const {
    auto check = check_static_request(request);
    if (check.isErr()) {
        return Result<Bytes>::err(check.error());
    }

    auto it = data_.statics.find(static_key(request));
    if (it == data_.statics.end()) {
        return Result<Bytes>::err(Error::not_found("Static", static_key(request)));
    }
    return Result<Bytes>::ok(it->second);
}

bool MemoryEnvironment::hasStatic(const StaticRequest& request) const {
    return check_static_request(request).isOk() && data_.statics.count(static_key(request)) > 0;
}

Result<EnvironmentManifest> MemoryEnvironment::getManifest() const {
    EnvironmentManifest manifest;
    manifest.workflows = listWorkflows().value();
    for (const auto& p : data_.processors) manifest.processors.push_back(p.name);
    for (const auto& c : data_.converters) manifest.converters.push_back(c.name);
    manifest.has_config = data_.config.has_value();

    std::map<std::string, std::set<std::string>> templates;
    for (const auto& [key, content] : data_.templates) {
        auto parts = split_path(key);
        if (parts.size() < 2) continue;
        templates[parts[0]].insert(parts[1]);
    }

    std::map<std::string, std::vector<std::string>> statics;
    for (const auto& [key, content] : data_.statics) {
        auto slash = key.find('/');
        if (slash == std::string::npos) continue;
        statics[key.substr(0, slash)].push_back(key.substr(slash + 1));
    }

    // Every workflow with resources gets both lists, possibly empty
    for (const auto& [workflow, names] : templates) {
        manifest.templates[workflow].assign(names.begin(), names.end());
        manifest.statics[workflow];
    }
    for (const auto& [workflow, names] : statics) {
        manifest.statics[workflow] = names;
        manifest.templates[workflow];
    }

    return Result<EnvironmentManifest>::ok(std::move(manifest));
}

// ============================================================================
// Mutators
// ============================================================================

void MemoryEnvironment::setConfig(ProjectConfig config) {
    data_.config = std::move(config);
}

void MemoryEnvironment::setWorkflow(const std::string& name, WorkflowFile workflow) {
    data_.workflows[name] = std::move(workflow);
}

void MemoryEnvironment::addProcessor(ExternalProcessorDefinition processor) {
    upsert_by_name(data_.processors, std::move(processor));
}

void MemoryEnvironment::addConverter(ExternalConverterDefinition converter) {
    upsert_by_name(data_.converters, std::move(converter));
}

void MemoryEnvironment::setTemplate(const TemplateRequest& request, std::string content) {
    data_.templates[template_key(request)] = std::move(content);
}

void MemoryEnvironment::setStatic(const StaticRequest& request, Bytes content) {
    data_.statics[static_key(request)] = std::move(content);
}

void MemoryEnvironment::removeWorkflow(const std::string& name) {
    data_.workflows.erase(name);
    erase_with_prefix(data_.templates, name + "/");
    erase_with_prefix(data_.statics, name + "/");
}

void MemoryEnvironment::removeTemplate(const TemplateRequest& request) {
    data_.templates.erase(template_key(request));
}

void MemoryEnvironment::removeStatic(const StaticRequest& request) {
    data_.statics.erase(static_key(request));
}

void MemoryEnvironment::clear() {
    data_ = MemoryEnvironmentData{};
}

// ============================================================================
// Merge
// ============================================================================

Result<void> MemoryEnvironment::mergeFrom(const Environment& other) {
    if (!data_.config) {
        auto config = other.getConfig();
        if (config.isErr()) return Result<void>::err(config.error());
        data_.config = config.value();
    }

    auto workflows = other.listWorkflows();
    if (workflows.isErr()) return Result<void>::err(workflows.error());
    for (const auto& name : workflows.value()) {
        if (data_.workflows.count(name)) continue;
        auto workflow = other.getWorkflow(name);
        if (workflow.isErr()) return Result<void>::err(workflow.error());
        data_.workflows[name] = std::move(workflow.value());
    }

    auto processors = other.getProcessorDefinitions();
    if (processors.isErr()) return Result<void>::err(processors.error());
    for (auto& def : processors.value()) {
        if (!contains_name(data_.processors, def.name)) data_.processors.push_back(std::move(def));
    }

    auto converters = other.getConverterDefinitions();
    if (converters.isErr()) return Result<void>::err(converters.error());
    for (auto& def : converters.value()) {
        if (!contains_name(data_.converters, def.name)) data_.converters.push_back(std::move(def));
    }

    auto manifest = other.getManifest();
    if (manifest.isErr()) return Result<void>::err(manifest.error());

    for (const auto& [workflow, names] : manifest.value().templates) {
        for (const auto& name : names) {
            TemplateRequest request{workflow, name, std::nullopt};
            std::string key = template_key(request);
            if (data_.templates.count(key)) continue;

            auto content = other.getTemplate(request);
            if (content.isErr()) {
                if (content.error().is_not_found()) {
                    spdlog::debug("Not copying template {}: {}", key, content.error().message());
                    continue;
                }
                return Result<void>::err(content.error());
            }
            data_.templates[key] = std::move(content.value());
        }
    }

    for (const auto& [workflow, names] : manifest.value().statics) {
        for (const auto& name : names) {
            StaticRequest request{workflow, name};
            std::string key = static_key(request);
            if (data_.statics.count(key)) continue;

            auto content = other.getStatic(request);
            if (content.isErr()) {
                if (content.error().is_not_found()) {
                    spdlog::debug("Not copying static {}: {}", key, content.error().message());
                    continue;
                }
                return Result<void>::err(content.error());
            }
            data_.statics[key] = std::move(content.value());
        }
    }

    return Result<void>::ok();
}

} // namespace mdwf
