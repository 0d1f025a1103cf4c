/**
 * mdwf CLI - Entry Point
 *
 * Inspect the resources a markdown-workflow project resolves: the system
 * installation (directory or ZIP), layered with project overrides.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace mdwf::cli::commands {
    void setup_manifest(CLI::App* app, GlobalOptions& opts);
    void setup_workflows(CLI::App* app, GlobalOptions& opts);
    void setup_template(CLI::App* app, GlobalOptions& opts);
    void setup_static(CLI::App* app, GlobalOptions& opts);
    void setup_validate(CLI::App* app, GlobalOptions& opts);
    void setup_inspect(CLI::App* app, GlobalOptions& opts);
    void setup_pack(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace mdwf::cli;

    CLI::App app{"mdwf - markdown-workflow resource inspector"};
    app.set_version_flag("-V,--version", MDWF_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--project", opts.project, "Project root (contains .markdown-workflow/)");
    app.add_option("--system", opts.system, "System root directory or .zip");
    app.add_option("--archive", opts.archive, "Serve system resources from a ZIP archive");
    app.add_option("--security-config", opts.security_config, "JSON security limits");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    app.parse_complete_callback([&opts]() { configure_logging(opts); });

    // Commands
    auto* manifest_cmd = app.add_subcommand("manifest", "Show everything the environment serves");
    commands::setup_manifest(manifest_cmd, opts);

    auto* workflows_cmd = app.add_subcommand("workflows", "List workflows");
    commands::setup_workflows(workflows_cmd, opts);

    auto* template_cmd = app.add_subcommand("template", "Print a template");
    commands::setup_template(template_cmd, opts);

    auto* static_cmd = app.add_subcommand("static", "Write a static asset");
    commands::setup_static(static_cmd, opts);

    auto* validate_cmd = app.add_subcommand("validate", "Load every workflow and the config");
    commands::setup_validate(validate_cmd, opts);

    auto* inspect_cmd = app.add_subcommand("inspect", "Show what a ZIP archive would provide");
    commands::setup_inspect(inspect_cmd, opts);

    auto* pack_cmd = app.add_subcommand("pack", "Create a resource archive from a directory");
    commands::setup_pack(pack_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
