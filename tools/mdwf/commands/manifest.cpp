/**
 * mdwf CLI - manifest command
 *
 * Show the aggregated manifest of the active environment.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace mdwf::cli::commands {

namespace {

void print_names(const std::string& label, const std::vector<std::string>& names) {
    std::cout << label << ":";
    if (names.empty()) {
        std::cout << " (none)" << std::endl;
        return;
    }
    std::cout << std::endl;
    for (const auto& name : names) {
        std::cout << "  " << name << std::endl;
    }
}

int cmd_manifest(const GlobalOptions& opts) {
    auto env = open_environment(opts);
    if (env.isErr()) {
        print_error(env.error().message(), opts.json);
        return 1;
    }

    auto manifest = env.value()->getManifest();
    if (manifest.isErr()) {
        print_error(manifest.error().message(), opts.json);
        return 1;
    }
    const auto& m = manifest.value();

    if (opts.json) {
        output_json(manifest_to_json(m));
        return 0;
    }

    std::cout << "Config: " << (m.has_config ? "present" : "absent") << std::endl;
    print_names("Workflows", m.workflows);
    for (const auto& workflow : m.workflows) {
        auto templates = m.templates.find(workflow);
        auto statics = m.statics.find(workflow);
        if (templates != m.templates.end()) {
            print_names("  " + workflow + " templates", templates->second);
        }
        if (statics != m.statics.end()) {
            print_names("  " + workflow + " statics", statics->second);
        }
    }
    print_names("Processors", m.processors);
    print_names("Converters", m.converters);
    return 0;
}

} // anonymous namespace

void setup_manifest(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_manifest(opts));
    });
}

} // namespace mdwf::cli::commands
