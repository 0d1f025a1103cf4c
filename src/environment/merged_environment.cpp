#include "mdwf/merged_environment.hpp"

#include <algorithm>
#include <map>

namespace mdwf {

namespace {

// Local first, then lookup on global only when local reports not-found
template<typename T, typename Fn>
Result<T> local_then_global(const Environment& local, const Environment& global, Fn fn) {
    Result<T> result = fn(local);
    if (result.isErr() && result.error().is_not_found()) {
        return fn(global);
    }
    return result;
}

void append_missing(std::vector<std::string>& into, const std::vector<std::string>& from) {
    for (const auto& name : from) {
        if (std::find(into.begin(), into.end(), name) == into.end()) {
            into.push_back(name);
        }
    }
}

// Global order, local definitions replace same-named ones, local-only appended
template<typename Def>
std::vector<Def> merge_by_name(const std::vector<Def>& local, const std::vector<Def>& global) {
    std::vector<Def> merged = global;
    for (const auto& def : local) {
        auto it = std::find_if(merged.begin(), merged.end(),
                               [&](const Def& d) { return d.name == def.name; });
        if (it != merged.end()) {
            *it = def;
        } else {
            merged.push_back(def);
        }
    }
    return merged;
}

std::map<std::string, std::vector<std::string>> merge_resource_maps(
    const std::map<std::string, std::vector<std::string>>& local,
    const std::map<std::string, std::vector<std::string>>& global) {
    auto merged = local;
    for (const auto& [workflow, names] : global) {
        append_missing(merged[workflow], names);
    }
    return merged;
}

ResourceSource pick_source(bool local_has, bool global_has) {
    if (local_has) return ResourceSource::Local;
    if (global_has) return ResourceSource::Global;
    return ResourceSource::None;
}

} // namespace

const char* resource_source_to_string(ResourceSource source) {
    switch (source) {
        case ResourceSource::Local: return "local";
        case ResourceSource::Global: return "global";
        case ResourceSource::None: return "none";
    }
    return "none";
}

Result<void> MergedEnvironment::initialize() {
    auto local = local_->initialize();
    if (local.isErr()) return local;
    return global_->initialize();
}

Result<std::optional<ProjectConfig>> MergedEnvironment::getConfig() const {
    auto local = local_->getConfig();
    if (local.isErr() || local.value().has_value()) {
        return local;
    }
    return global_->getConfig();
}

Result<WorkflowFile> MergedEnvironment::getWorkflow(const std::string& name) const {
    return local_then_global<WorkflowFile>(
        *local_, *global_, [&](const Environment& env) { return env.getWorkflow(name); });
}

Result<std::vector<std::string>> MergedEnvironment::listWorkflows() const {
    auto local = local_->listWorkflows();
    if (local.isErr()) return local;
    auto global = global_->listWorkflows();
    if (global.isErr()) return global;

    std::vector<std::string> merged;
    append_missing(merged, local.value());
    append_missing(merged, global.value());
    return Result<std::vector<std::string>>::ok(std::move(merged));
}

bool MergedEnvironment::hasWorkflow(const std::string& name) const {
    return local_->hasWorkflow(name) || global_->hasWorkflow(name);
}

Result<std::vector<ExternalProcessorDefinition>> MergedEnvironment::getProcessorDefinitions() const {
    auto local = local_->getProcessorDefinitions();
    if (local.isErr()) return local;
    auto global = global_->getProcessorDefinitions();
    if (global.isErr()) return global;
    return Result<std::vector<ExternalProcessorDefinition>>::ok(
        merge_by_name(local.value(), global.value()));
}

Result<std::vector<ExternalConverterDefinition>> MergedEnvironment::getConverterDefinitions() const {
    auto local = local_->getConverterDefinitions();
    if (local.isErr()) return local;
    auto global = global_->getConverterDefinitions();
    if (global.isErr()) return global;
    return Result<std::vector<ExternalConverterDefinition>>::ok(
        merge_by_name(local.value(), global.value()));
}

Result<std::string> MergedEnvironment::getTemplate(const TemplateRequest& request) const {
    return local_then_global<std::string>(
        *local_, *global_, [&](const Environment& env) { return env.getTemplate(request); });
}

bool MergedEnvironment::hasTemplate(const TemplateRequest& request) const {
    return local_->hasTemplate(request) || global_->hasTemplate(request);
}

Result<Bytes> MergedEnvironment::getStatic(const StaticRequest& request) const {
    return local_then_global<Bytes>(
        *local_, *global_, [&](const Environment& env) { return env.getStatic(request); });
}

bool MergedEnvironment::hasStatic(const StaticRequest& request) const {
    return local_->hasStatic(request) || global_->hasStatic(request);
}

Result<EnvironmentManifest> MergedEnvironment::getManifest() const {
    auto local = local_->getManifest();
    if (local.isErr()) return local;
    auto global = global_->getManifest();
    if (global.isErr()) return global;

    const auto& l = local.value();
    const auto& g = global.value();

    EnvironmentManifest merged;
    append_missing(merged.workflows, l.workflows);
    append_missing(merged.workflows, g.workflows);
    append_missing(merged.processors, l.processors);
    append_missing(merged.processors, g.processors);
    append_missing(merged.converters, l.converters);
    append_missing(merged.converters, g.converters);
    merged.templates = merge_resource_maps(l.templates, g.templates);
    merged.statics = merge_resource_maps(l.statics, g.statics);
    merged.has_config = l.has_config || g.has_config;

    return Result<EnvironmentManifest>::ok(std::move(merged));
}

ResourceSource MergedEnvironment::resourceSource(const std::string& workflow) const {
    return pick_source(local_->hasWorkflow(workflow), global_->hasWorkflow(workflow));
}

ResourceSource MergedEnvironment::resourceSource(const TemplateRequest& request) const {
    return pick_source(local_->hasTemplate(request), global_->hasTemplate(request));
}

ResourceSource MergedEnvironment::resourceSource(const StaticRequest& request) const {
    return pick_source(local_->hasStatic(request), global_->hasStatic(request));
}

} // namespace mdwf
