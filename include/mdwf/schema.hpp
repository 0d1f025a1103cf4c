#pragma once

#include "mdwf/result.hpp"
#include "mdwf/types.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace mdwf {

// ============================================================================
// YAML Loading
// ============================================================================

// Parse YAML (or JSON, which is a YAML subset) text into a JSON document.
// Scalars keep their YAML type: booleans, integers, floats, null.
// Syntax errors are reported as VALIDATION_ERROR.
Result<nlohmann::json> parse_yaml_document(const std::string& text,
                                           const std::string& source_name = "");

// ============================================================================
// Schema Parsing
// ============================================================================
//
// Each parser checks required fields and types and returns VALIDATION_ERROR
// naming the first offending field path (e.g. "workflow.stages[2].color").

Result<WorkflowFile> parse_workflow_file(const nlohmann::json& doc);
Result<ProjectConfig> parse_project_config(const nlohmann::json& doc);

// Files of shape { processor: {...} } / { converter: {...} }
Result<ExternalProcessorDefinition> parse_processor_file(const nlohmann::json& doc);
Result<ExternalConverterDefinition> parse_converter_file(const nlohmann::json& doc);

// YAML text -> typed record, source_name is used in error messages
Result<WorkflowFile> load_workflow_yaml(const std::string& text, const std::string& source_name);
Result<ProjectConfig> load_config_yaml(const std::string& text, const std::string& source_name);
Result<ExternalProcessorDefinition> load_processor_yaml(const std::string& text,
                                                        const std::string& source_name);
Result<ExternalConverterDefinition> load_converter_yaml(const std::string& text,
                                                        const std::string& source_name);

} // namespace mdwf
