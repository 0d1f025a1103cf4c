#pragma once

#include "mdwf/archive_environment.hpp"
#include "mdwf/file_system.hpp"
#include "mdwf/filesystem_environment.hpp"
#include "mdwf/memory_environment.hpp"
#include "mdwf/merged_environment.hpp"
#include "mdwf/security_validator.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mdwf {

// Per-project override directory, looked up under the project root
constexpr const char* PROJECT_DIR_NAME = ".markdown-workflow";

struct FactoryOptions {
    std::shared_ptr<FileSystem> file_system = default_file_system();
    SecurityConfig security = default_security_config();
};

struct DiscoveredEnvironment {
    std::shared_ptr<MergedEnvironment> environment;
    std::string project_root;
    std::string system_root;
};

struct EnvironmentValidation {
    bool is_valid = true;
    std::vector<std::string> issues;    // a workflow that fails to load, unusable environment
    std::vector<std::string> warnings;  // no workflows, config problems
};

// ============================================================================
// Environment Factory
// ============================================================================

/**
 * @brief Builds environments sharing one FileSystem and SecurityConfig
 *
 * @example
 * ```cpp
 * mdwf::EnvironmentFactory factory;
 * auto env = factory.createCliEnvironment("/work/project", "/usr/share/mdwf");
 * auto report = mdwf::validate_environment(*env);
 * ```
 */
class EnvironmentFactory {
public:
    explicit EnvironmentFactory(FactoryOptions options = FactoryOptions{});

    const FactoryOptions& options() const { return options_; }

    std::shared_ptr<FilesystemEnvironment> createFilesystemEnvironment(
        const std::string& root_path) const;

    std::shared_ptr<MemoryEnvironment> createMemoryEnvironment(
        MemoryEnvironmentData data = MemoryEnvironmentData{}) const;

    std::shared_ptr<MergedEnvironment> createMergedEnvironment(
        std::shared_ptr<Environment> local, std::shared_ptr<Environment> global) const;

    std::shared_ptr<ArchiveEnvironment> createArchiveEnvironment(ArchiveSource source) const;
    std::shared_ptr<ArchiveEnvironment> createArchiveEnvironment(const std::string& zip_path) const;
    std::shared_ptr<ArchiveEnvironment> createArchiveEnvironment(Bytes buffer,
                                                                 const std::string& name) const;

    /**
     * @brief Project overrides layered over the system installation
     *
     * Local is `<project_root>/.markdown-workflow`. Global is system_root,
     * served from a ZIP when system_root is a `.zip` file.
     */
    std::shared_ptr<MergedEnvironment> createCliEnvironment(const std::string& project_root,
                                                            const std::string& system_root) const;

    /// createCliEnvironment, failing with RESOURCE_NOT_FOUND (listing what is
    /// available) when the workflow does not exist
    Result<std::shared_ptr<MergedEnvironment>> createWorkflowEnvironment(
        const std::string& project_root, const std::string& system_root,
        const std::string& workflow) const;

    /// Walk up from start_path to the first directory containing `.markdown-workflow`
    Result<DiscoveredEnvironment> createFromDiscovery(const std::string& start_path,
                                                      const std::string& system_root) const;

    /// Project root at or above start_path, if any
    std::optional<std::string> findProjectRoot(const std::string& start_path) const;

    /// Directory environment, or an ArchiveEnvironment when system_root is a `.zip` file
    std::shared_ptr<Environment> createSystemEnvironment(const std::string& system_root) const;

private:
    FactoryOptions options_;
};

/// Load every listed workflow and the config; never fails
EnvironmentValidation validate_environment(const Environment& environment);

} // namespace mdwf
