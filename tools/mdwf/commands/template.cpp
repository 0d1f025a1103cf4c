/**
 * mdwf CLI - template command
 *
 * Print a template, resolving variants and project overrides.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace mdwf::cli::commands {

namespace {

struct TemplateOptions {
    std::string workflow;
    std::string name;
    std::string variant;
};

int cmd_template(const GlobalOptions& opts, const TemplateOptions& tpl_opts) {
    auto env = open_environment(opts);
    if (env.isErr()) {
        print_error(env.error().message(), opts.json);
        return 1;
    }

    TemplateRequest request;
    request.workflow = tpl_opts.workflow;
    request.template_name = tpl_opts.name;
    if (!tpl_opts.variant.empty()) {
        request.variant = tpl_opts.variant;
    }

    auto content = env.value()->getTemplate(request);
    if (content.isErr()) {
        print_error(describe_error(content.error(), *env.value()), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["key"] = template_key(request);
        j["content"] = content.value();
        auto merged = std::dynamic_pointer_cast<MergedEnvironment>(env.value());
        if (merged) {
            j["source"] = resource_source_to_string(merged->resourceSource(request));
        }
        output_json(j);
    } else {
        std::cout << content.value();
    }
    return 0;
}

} // anonymous namespace

void setup_template(CLI::App* app, GlobalOptions& opts) {
    static TemplateOptions tpl_opts;

    app->add_option("workflow", tpl_opts.workflow, "Workflow name")->required();
    app->add_option("template", tpl_opts.name, "Template name")->required();
    app->add_option("--variant", tpl_opts.variant, "Variant, falls back to default");

    app->callback([&opts]() {
        std::exit(cmd_template(opts, tpl_opts));
    });
}

} // namespace mdwf::cli::commands
