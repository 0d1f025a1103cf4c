/**
 * mdwf CLI - Common utilities and types
 */

#pragma once

#include <mdwf/environment_factory.hpp>
#include <mdwf/security_validator.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace mdwf::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string project;           // --project
    std::string system;            // --system
    std::string archive;           // --archive
    std::string security_config;   // --security-config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route library logging to stderr so stdout stays clean for output.
 */
inline void configure_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("mdwf");
    if (!logger) {
        logger = spdlog::stderr_color_mt("mdwf");
        spdlog::set_default_logger(logger);
    }
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        spdlog::error("{}", msg);
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

/**
 * Security configuration: defaults, overlaid with --security-config if given.
 */
inline Result<SecurityConfig> load_security_config(const GlobalOptions& opts) {
    if (opts.security_config.empty()) {
        return Result<SecurityConfig>::ok(default_security_config());
    }
    auto text = read_text_file(opts.security_config);
    if (!text) {
        return Result<SecurityConfig>::err(
            Error::io("cannot read security config " + opts.security_config));
    }
    auto config = parse_security_config(*text);
    if (config.isErr()) {
        config.error().withContext(opts.security_config);
    }
    return config;
}

/**
 * Resolve the system root.
 * Priority: --system flag > MDWF_SYSTEM_ROOT env
 */
inline std::string resolve_system_root(const GlobalOptions& opts) {
    if (!opts.system.empty()) {
        return opts.system;
    }
    return safe_getenv("MDWF_SYSTEM_ROOT");
}

/**
 * Resolve the project root.
 * Priority: --project flag > MDWF_PROJECT_ROOT env > discovery from the cwd
 */
inline std::optional<std::string> resolve_project_root(const GlobalOptions& opts,
                                                       const EnvironmentFactory& factory) {
    if (!opts.project.empty()) {
        return opts.project;
    }
    std::string env_root = safe_getenv("MDWF_PROJECT_ROOT");
    if (!env_root.empty()) {
        return env_root;
    }
    return factory.findProjectRoot(".");
}

/**
 * Build the environment the command operates on.
 *
 * Global side: --archive if given, else the system root. With a project
 * root the result is the project's overrides layered over it.
 */
inline Result<std::shared_ptr<Environment>> open_environment(const GlobalOptions& opts) {
    using R = Result<std::shared_ptr<Environment>>;

    auto security = load_security_config(opts);
    if (security.isErr()) {
        return R::err(security.error());
    }

    FactoryOptions factory_opts;
    factory_opts.security = security.value();
    EnvironmentFactory factory(factory_opts);

    auto project_root = resolve_project_root(opts, factory);

    std::shared_ptr<Environment> global;
    if (!opts.archive.empty()) {
        global = factory.createArchiveEnvironment(opts.archive);
    } else {
        std::string system_root = resolve_system_root(opts);
        if (!system_root.empty()) {
            global = factory.createSystemEnvironment(system_root);
        }
    }

    if (project_root) {
        auto local = factory.createFilesystemEnvironment(*project_root + "/" + PROJECT_DIR_NAME);
        if (!global) {
            return R::ok(local);
        }
        return R::ok(factory.createMergedEnvironment(local, global));
    }
    if (!global) {
        return R::err(
            Error::validation("no resources to serve: pass --system, --archive or --project"));
    }
    return R::ok(global);
}

/**
 * Error text with remediation for missing resources.
 */
inline std::string describe_error(const Error& error, const Environment& env) {
    std::string msg = error.message();
    if (!error.is_not_found()) {
        return msg;
    }

    if (error.resource_kind() == "Workflow") {
        auto workflows = env.listWorkflows();
        if (workflows.isOk() && !workflows.value().empty()) {
            msg += ". Did you mean one of: ";
            for (size_t i = 0; i < workflows.value().size(); ++i) {
                if (i > 0) msg += ", ";
                msg += workflows.value()[i];
            }
        }
    } else if (error.resource_kind() == "Template" || error.resource_kind() == "Static") {
        auto manifest = env.getManifest();
        std::string workflow = error.resource_id().substr(0, error.resource_id().find('/'));
        if (manifest.isOk()) {
            const auto& m = manifest.value();
            const auto& names = error.resource_kind() == "Template" ? m.templates : m.statics;
            auto it = names.find(workflow);
            if (it != names.end() && !it->second.empty()) {
                msg += ". Available in " + workflow + ": ";
                for (size_t i = 0; i < it->second.size(); ++i) {
                    if (i > 0) msg += ", ";
                    msg += it->second[i];
                }
            }
        }
    }
    return msg;
}

} // namespace mdwf::cli
