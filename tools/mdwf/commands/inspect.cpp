/**
 * mdwf CLI - inspect command
 *
 * Extract a ZIP archive in memory and report what it would provide.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace mdwf::cli::commands {

namespace {

struct InspectOptions {
    std::string archive;
    std::string expected_sha256;
};

int cmd_inspect(const GlobalOptions& opts, const InspectOptions& inspect_opts) {
    auto security = load_security_config(opts);
    if (security.isErr()) {
        print_error(security.error().message(), opts.json);
        return 1;
    }

    FactoryOptions factory_opts;
    factory_opts.security = security.value();
    EnvironmentFactory factory(factory_opts);

    auto source = ArchiveSource::from_file(inspect_opts.archive);
    if (!inspect_opts.expected_sha256.empty()) {
        source.expected_sha256 = inspect_opts.expected_sha256;
    }
    auto archive = factory.createArchiveEnvironment(std::move(source));

    auto ready = archive->initialize();
    if (ready.isErr()) {
        print_error(ready.error().message(), opts.json);
        return 1;
    }

    auto manifest = archive->getManifest();
    if (manifest.isErr()) {
        print_error(manifest.error().message(), opts.json);
        return 1;
    }
    auto digest = archive->sha256();
    auto entries = archive->entries();
    auto skipped = archive->skippedEntries();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["archive"] = archive->name();
        j["sha256"] = digest.valueOr("");
        j["entries"] = nlohmann::json::array();
        for (const auto& entry : entries) {
            j["entries"].push_back({{"path", entry.path}, {"size", entry.size}});
        }
        j["skipped"] = nlohmann::json::array();
        for (const auto& entry : skipped) {
            j["skipped"].push_back({{"path", entry.path}, {"reason", entry.reason}});
        }
        j["manifest"] = manifest_to_json(manifest.value());
        output_json(j);
        return 0;
    }

    std::cout << "Archive: " << archive->name() << std::endl;
    std::cout << "SHA-256: " << digest.valueOr("") << std::endl;
    std::cout << "Entries (" << entries.size() << "):" << std::endl;
    for (const auto& entry : entries) {
        std::cout << "  " << entry.path << " (" << entry.size << " bytes)" << std::endl;
    }
    std::cout << "Skipped: " << skipped.size() << std::endl;
    if (opts.verbose) {
        for (const auto& entry : skipped) {
            std::cout << "  " << entry.path << ": " << entry.reason << std::endl;
        }
    }
    std::cout << "Workflows: " << manifest.value().workflows.size() << std::endl;
    return 0;
}

} // anonymous namespace

void setup_inspect(CLI::App* app, GlobalOptions& opts) {
    static InspectOptions inspect_opts;

    app->add_option("archive", inspect_opts.archive, "ZIP archive")->required();
    app->add_option("--sha256", inspect_opts.expected_sha256, "Expected SHA-256 of the archive");

    app->callback([&opts]() {
        std::exit(cmd_inspect(opts, inspect_opts));
    });
}

} // namespace mdwf::cli::commands
