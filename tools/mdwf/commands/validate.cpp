/**
 * mdwf CLI - validate command
 *
 * Load every workflow and the config; non-zero exit on issues.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace mdwf::cli::commands {

namespace {

int cmd_validate(const GlobalOptions& opts) {
    auto env = open_environment(opts);
    if (env.isErr()) {
        print_error(env.error().message(), opts.json);
        return 1;
    }

    auto report = validate_environment(*env.value());

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.is_valid;
        j["issues"] = report.issues;
        j["warnings"] = report.warnings;
        output_json(j);
    } else {
        for (const auto& warning : report.warnings) {
            spdlog::warn("{}", warning);
        }
        for (const auto& issue : report.issues) {
            spdlog::error("{}", issue);
        }
        if (report.is_valid && !opts.quiet) {
            std::cout << "Environment is valid." << std::endl;
        }
    }
    return report.is_valid ? 0 : 1;
}

} // anonymous namespace

void setup_validate(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_validate(opts));
    });
}

} // namespace mdwf::cli::commands
