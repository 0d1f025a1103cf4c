#include "mdwf/result.hpp"
#include "mdwf/types.hpp"

namespace mdwf {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::RESOURCE_NOT_FOUND: return "RESOURCE_NOT_FOUND";
        case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case ErrorCode::SECURITY_ERROR: return "SECURITY_ERROR";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
    }
    return "UNKNOWN";
}

std::string template_key(const TemplateRequest& request) {
    std::string key = request.workflow + "/" + request.template_name;
    if (request.variant && !request.variant->empty()) {
        key += "/" + *request.variant;
    }
    return key;
}

std::string static_key(const StaticRequest& request) {
    return request.workflow + "/" + request.static_name;
}

bool operator==(const EnvironmentManifest& a, const EnvironmentManifest& b) {
    return a.workflows == b.workflows &&
           a.processors == b.processors &&
           a.converters == b.converters &&
           a.templates == b.templates &&
           a.statics == b.statics &&
           a.has_config == b.has_config;
}

nlohmann::json manifest_to_json(const EnvironmentManifest& manifest) {
    nlohmann::json j;
    j["workflows"] = manifest.workflows;
    j["processors"] = manifest.processors;
    j["converters"] = manifest.converters;
    j["templates"] = nlohmann::json::object();
    for (const auto& [workflow, names] : manifest.templates) {
        j["templates"][workflow] = names;
    }
    j["statics"] = nlohmann::json::object();
    for (const auto& [workflow, names] : manifest.statics) {
        j["statics"][workflow] = names;
    }
    j["hasConfig"] = manifest.has_config;
    return j;
}

} // namespace mdwf
