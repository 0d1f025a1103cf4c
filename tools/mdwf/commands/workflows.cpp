/**
 * mdwf CLI - workflows command
 *
 * List workflows and, when project overrides are active, where each resolves.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace mdwf::cli::commands {

namespace {

int cmd_workflows(const GlobalOptions& opts) {
    auto env = open_environment(opts);
    if (env.isErr()) {
        print_error(env.error().message(), opts.json);
        return 1;
    }

    auto workflows = env.value()->listWorkflows();
    if (workflows.isErr()) {
        print_error(workflows.error().message(), opts.json);
        return 1;
    }

    auto merged = std::dynamic_pointer_cast<MergedEnvironment>(env.value());

    nlohmann::json result = nlohmann::json::array();
    for (const auto& name : workflows.value()) {
        nlohmann::json entry;
        entry["name"] = name;
        if (merged) {
            entry["source"] = resource_source_to_string(merged->resourceSource(name));
        }
        result.push_back(entry);
    }

    if (opts.json) {
        output_json(result);
        return 0;
    }

    if (result.empty()) {
        std::cout << "No workflows found." << std::endl;
        return 0;
    }
    for (const auto& entry : result) {
        std::cout << entry["name"].get<std::string>();
        if (entry.contains("source")) {
            std::cout << " (" << entry["source"].get<std::string>() << ")";
        }
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_workflows(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_workflows(opts));
    });
}

} // namespace mdwf::cli::commands
