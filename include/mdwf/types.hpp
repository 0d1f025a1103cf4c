#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mdwf {

using Bytes = std::vector<uint8_t>;

// ============================================================================
// Resource Requests
// ============================================================================

struct TemplateRequest {
    std::string workflow;
    std::string template_name;
    std::optional<std::string> variant;
};

struct StaticRequest {
    std::string workflow;
    std::string static_name;
};

// "<workflow>/<template>[/<variant>]"
std::string template_key(const TemplateRequest& request);

// "<workflow>/<static>"
std::string static_key(const StaticRequest& request);

// ============================================================================
// Environment Manifest
// ============================================================================

struct EnvironmentManifest {
    std::vector<std::string> workflows;
    std::vector<std::string> processors;
    std::vector<std::string> converters;
    std::map<std::string, std::vector<std::string>> templates;  // workflow -> template names
    std::map<std::string, std::vector<std::string>> statics;    // workflow -> static names
    bool has_config = false;
};

bool operator==(const EnvironmentManifest& a, const EnvironmentManifest& b);
inline bool operator!=(const EnvironmentManifest& a, const EnvironmentManifest& b) {
    return !(a == b);
}

nlohmann::json manifest_to_json(const EnvironmentManifest& manifest);

// ============================================================================
// Workflow Definition (workflows/<name>/workflow.yml)
// ============================================================================

struct WorkflowStage {
    std::string name;
    std::string description;
    std::string color;
    std::vector<std::string> next;
    bool terminal = false;
};

struct WorkflowTemplate {
    std::string name;
    std::string file;
    std::string output;
    std::string description;
};

struct WorkflowStatic {
    std::string name;
    std::string file;
    std::string description;
};

struct WorkflowActionParameter {
    std::string name;
    std::string type;  // string | number | boolean | enum | array | date
    bool required = false;
    std::optional<nlohmann::json> default_value;
    std::vector<std::string> options;
    std::string description;
};

struct WorkflowAction {
    std::string name;
    std::string description;
    std::vector<std::string> templates;
    std::optional<std::string> converter;
    std::vector<std::string> formats;
    std::vector<WorkflowActionParameter> parameters;
    std::optional<std::string> metadata_file;
};

struct WorkflowDefinition {
    std::string name;
    std::string description;
    std::string version;
    std::vector<WorkflowStage> stages;
    std::vector<WorkflowTemplate> templates;
    std::vector<WorkflowStatic> statics;
    std::vector<WorkflowAction> actions;
    struct {
        std::vector<std::string> required_fields;
        std::vector<std::string> optional_fields;
        std::vector<std::string> auto_generated;
    } metadata;
    struct {
        std::string pattern;
        int64_t max_length = 0;
    } collection_id;
};

struct WorkflowFile {
    WorkflowDefinition workflow;
    nlohmann::json raw;
};

// ============================================================================
// Project Configuration (config.yml)
// ============================================================================

struct UserConfig {
    std::string name;
    std::string preferred_name;
    std::string email;
    std::string phone;
    std::string address;
    std::string city;
    std::string state;
    std::string zip;
    std::string linkedin;
    std::string github;
    std::string website;
};

struct SystemConfig {
    std::string scraper;  // wget | curl | chrome
    struct {
        double timeout = 0;
        bool add_utf8_bom = false;
        std::string html_cleanup;  // none | scripts | markdown
    } web_download;
    std::vector<std::string> output_formats;
    struct {
        bool auto_commit = false;
        std::string commit_message_template;
    } git;
    struct {
        std::string date_format;
        std::string sanitize_spaces;
        int64_t max_length = 0;
    } collection_id;
    std::optional<nlohmann::json> testing;
};

struct ProjectConfig {
    UserConfig user;
    SystemConfig system;
    std::map<std::string, nlohmann::json> workflows;  // per-workflow overrides, passthrough
    nlohmann::json raw;
};

// ============================================================================
// External Processor / Converter Definitions
// ============================================================================

struct ExternalDetection {
    std::string command;
    std::optional<std::string> pattern;
};

struct ExternalExecution {
    std::string command_template;
    std::string mode;
    bool backup = false;
    std::optional<int64_t> timeout;
};

struct ExternalProcessorDefinition {
    std::string name;
    std::string description;
    std::string version;
    ExternalDetection detection;
    ExternalExecution execution;
};

struct ExternalConverterDefinition {
    std::string name;
    std::string description;
    std::string version;
    std::vector<std::string> supported_formats;
    ExternalDetection detection;
    ExternalExecution execution;
};

} // namespace mdwf
