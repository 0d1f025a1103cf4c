#pragma once

#include "mdwf/environment.hpp"
#include "mdwf/file_system.hpp"
#include "mdwf/security_validator.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mdwf {

// ============================================================================
// Filesystem Environment
// ============================================================================
//
// Serves a directory tree laid out as described in environment.hpp. Every
// read goes through the injected FileSystem and the SecurityValidator: the
// resolved path must stay under the root (lexically, and again after
// following symlinks), and each file is checked for
// filename, extension, size and (for text) content before it is parsed.
// Listings are sorted by name.

class FilesystemEnvironment : public Environment {
public:
    explicit FilesystemEnvironment(std::string root_path,
                                   std::shared_ptr<FileSystem> file_system = default_file_system(),
                                   SecurityConfig security = default_security_config());

    const std::string& root() const { return root_; }
    const SecurityValidator& validator() const { return validator_; }

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

private:
    // Absolute path for a layout-relative one, or SECURITY_ERROR
    Result<std::string> resolve(const std::string& relative) const;
    bool isFile(const std::string& relative) const;
    std::optional<std::string> findFirst(const std::vector<std::string>& candidates) const;

    Result<Bytes> readResource(const std::string& relative) const;
    Result<std::string> readText(const std::string& relative) const;

    std::vector<DefinitionSource> readDefinitionSources(const std::string& dir) const;
    std::vector<std::string> scanTemplates(const std::string& workflow) const;
    std::vector<std::string> scanStatics(const std::string& workflow) const;

    std::string root_;
    std::shared_ptr<FileSystem> fs_;
    SecurityValidator validator_;

    mutable std::mutex manifest_mutex_;
    mutable std::optional<EnvironmentManifest> manifest_cache_;
};

} // namespace mdwf
