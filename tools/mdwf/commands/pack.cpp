/**
 * mdwf CLI - pack command
 *
 * Create a resource archive from a directory laid out like a system root.
 */

#include "../common.hpp"
#include <mdwf/digest.hpp>
#include <mdwf/zip_archive.hpp>
#include <CLI/CLI.hpp>
#include <fstream>

namespace mdwf::cli::commands {

namespace {

struct PackOptions {
    std::string dir;
    std::string output;
};

int cmd_pack(const GlobalOptions& opts, const PackOptions& pack_opts) {
    auto packed = pack_directory_zip(pack_opts.dir);
    if (!packed.ok) {
        print_error("failed to pack " + pack_opts.dir + ": " + packed.error, opts.json);
        return 1;
    }

    std::ofstream out(pack_opts.output, std::ios::binary);
    if (!out) {
        print_error("cannot write " + pack_opts.output, opts.json);
        return 1;
    }
    out.write(reinterpret_cast<const char*>(packed.archive_data.data()),
              static_cast<std::streamsize>(packed.archive_data.size()));
    out.close();
    if (!out) {
        print_error("failed writing " + pack_opts.output, opts.json);
        return 1;
    }

    // Report what a consumer would accept from the new archive
    auto security = load_security_config(opts);
    if (security.isErr()) {
        print_error(security.error().message(), opts.json);
        return 1;
    }
    ArchiveEnvironment archive(ArchiveSource::from_buffer(packed.archive_data, pack_opts.output),
                               default_file_system(), security.value());
    auto ready = archive.initialize();
    auto digest = sha256_bytes(packed.archive_data);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = ready.isOk();
        j["output"] = pack_opts.output;
        j["size"] = packed.archive_data.size();
        j["sha256"] = digest.hex_digest;
        if (ready.isErr()) {
            j["error"] = ready.error().message();
        } else {
            j["skipped"] = archive.skippedEntries().size();
        }
        output_json(j);
    } else if (ready.isErr()) {
        print_error(ready.error().message(), opts.json);
    } else if (!opts.quiet) {
        std::cout << "Created " << pack_opts.output << " (" << packed.archive_data.size()
                  << " bytes, " << archive.entryCount() << " entries)" << std::endl;
        std::cout << "SHA-256: " << digest.hex_digest << std::endl;
        if (!archive.skippedEntries().empty()) {
            std::cout << archive.skippedEntries().size()
                      << " entries would be skipped by consumers; run inspect -v for details"
                      << std::endl;
        }
    }
    return ready.isOk() ? 0 : 1;
}

} // anonymous namespace

void setup_pack(CLI::App* app, GlobalOptions& opts) {
    static PackOptions pack_opts;

    app->add_option("dir", pack_opts.dir, "Resource directory")->required();
    app->add_option("-o,--output", pack_opts.output, "Output .zip file")->required();

    app->callback([&opts]() {
        std::exit(cmd_pack(opts, pack_opts));
    });
}

} // namespace mdwf::cli::commands
