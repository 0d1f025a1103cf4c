/**
 * mdwf CLI - static command
 *
 * Write a static asset to a file or stdout.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <fstream>

namespace mdwf::cli::commands {

namespace {

struct StaticOptions {
    std::string workflow;
    std::string name;
    std::string output;
};

int cmd_static(const GlobalOptions& opts, const StaticOptions& static_opts) {
    auto env = open_environment(opts);
    if (env.isErr()) {
        print_error(env.error().message(), opts.json);
        return 1;
    }

    StaticRequest request{static_opts.workflow, static_opts.name};
    auto content = env.value()->getStatic(request);
    if (content.isErr()) {
        print_error(describe_error(content.error(), *env.value()), opts.json);
        return 1;
    }
    const Bytes& data = content.value();

    if (static_opts.output.empty()) {
        std::cout.write(reinterpret_cast<const char*>(data.data()),
                        static_cast<std::streamsize>(data.size()));
        std::cout.flush();
        return 0;
    }

    std::ofstream out(static_opts.output, std::ios::binary);
    if (!out) {
        print_error("cannot write " + static_opts.output, opts.json);
        return 1;
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        print_error("failed writing " + static_opts.output, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["key"] = static_key(request);
        j["output"] = static_opts.output;
        j["size"] = data.size();
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Wrote " << data.size() << " bytes to " << static_opts.output << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_static(CLI::App* app, GlobalOptions& opts) {
    static StaticOptions static_opts;

    app->add_option("workflow", static_opts.workflow, "Workflow name")->required();
    app->add_option("name", static_opts.name, "Static file name")->required();
    app->add_option("-o,--output", static_opts.output, "Output file (default: stdout)");

    app->callback([&opts]() {
        std::exit(cmd_static(opts, static_opts));
    });
}

} // namespace mdwf::cli::commands
