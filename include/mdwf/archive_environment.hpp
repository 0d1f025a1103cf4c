#pragma once

#include "mdwf/environment.hpp"
#include "mdwf/file_system.hpp"
#include "mdwf/security_validator.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mdwf {

// ============================================================================
// Archive Source
// ============================================================================

/**
 * @brief Where an ArchiveEnvironment gets its ZIP bytes
 *
 * Exactly one of file_path or buffer is set. `name` appears in diagnostics
 * only. When expected_sha256 is set the archive bytes must hash to it.
 */
struct ArchiveSource {
    std::optional<std::string> file_path;
    std::optional<Bytes> buffer;
    std::string name;
    std::optional<std::string> expected_sha256;

    static ArchiveSource from_file(const std::string& path, std::string name = "");
    static ArchiveSource from_buffer(Bytes data, std::string name);
};

/// One accepted archive entry, keyed by its normalized path
struct ArchiveEntry {
    std::string path;
    Bytes content;
    uint64_t size = 0;
};

/// An entry dropped during extraction and why
struct SkippedEntry {
    std::string path;     // as stored in the archive
    std::string reason;
};

// ============================================================================
// Archive Environment
// ============================================================================

/**
 * @brief Environment served from a ZIP archive extracted into memory
 *
 * Construction does no I/O. initialize() (or the first query) reads the
 * archive once, extracts every acceptable entry into a map keyed by
 * normalized path, then runs the aggregate batch check and the content
 * sanity pass. Individual entries failing path, filename, extension or size
 * checks are skipped with a warning; a failing aggregate or content check
 * fails initialization as a whole and nothing is kept.
 *
 * Initialization is single-flight: concurrent callers wait for one
 * extraction. Success is memoized; after a failure the next call retries.
 * The extracted map is never modified once Ready, so queries take no lock.
 */
class ArchiveEnvironment : public Environment {
public:
    enum class State {
        Uninitialized,
        Extracting,
        Validated,
        Ready,
    };

    explicit ArchiveEnvironment(ArchiveSource source,
                                std::shared_ptr<FileSystem> file_system = default_file_system(),
                                SecurityConfig security = default_security_config());

    ArchiveEnvironment(const ArchiveEnvironment&) = delete;
    ArchiveEnvironment& operator=(const ArchiveEnvironment&) = delete;

    Result<void> initialize() override;

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

    // ------------------------------------------------------------------------
    // Diagnostics (initialize on demand; empty when initialization fails)
    // ------------------------------------------------------------------------

    const std::string& name() const { return source_.name; }
    State state() const { return state_.load(std::memory_order_acquire); }

    /// Lowercase hex SHA-256 of the archive bytes
    Result<std::string> sha256() const;

    size_t entryCount() const;
    bool hasEntry(const std::string& normalized_path) const;

    /// Accepted entries sorted by normalized path
    std::vector<FileInfo> entries() const;

    std::vector<SkippedEntry> skippedEntries() const;

private:
    Result<void> ensureReady() const;
    Result<void> extract() const;
    Result<Bytes> acquireArchive() const;

    const ArchiveEntry* lookup(const std::string& path) const;
    std::optional<std::string> findFirst(const std::vector<std::string>& candidates) const;
    std::string text(const ArchiveEntry& entry) const;
    std::vector<DefinitionSource> definitionSources(const std::string& dir) const;

    ArchiveSource source_;
    std::shared_ptr<FileSystem> fs_;
    SecurityValidator validator_;

    mutable std::mutex init_mutex_;
    mutable std::atomic<State> state_{State::Uninitialized};

    // Written once under init_mutex_, read-only after Ready
    mutable std::map<std::string, ArchiveEntry> files_;
    mutable std::vector<SkippedEntry> skipped_;
    mutable std::string digest_;

    mutable std::mutex manifest_mutex_;
    mutable std::optional<EnvironmentManifest> manifest_cache_;
};

} // namespace mdwf
