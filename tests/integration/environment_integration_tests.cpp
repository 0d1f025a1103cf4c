#include <doctest/doctest.h>
#include <mdwf/digest.hpp>
#include <mdwf/environment_factory.hpp>
#include <mdwf/zip_archive.hpp>

#include "../unit/test_support.hpp"

using namespace mdwf;
using mdwf_test::TempDir;
using mdwf_test::to_bytes;
using mdwf_test::write_file;

// A complete system installation, shipped as a pinned ZIP, with a project
// overriding parts of it on disk
TEST_CASE("packed system archive with project overrides") {
    TempDir tmp;
    const std::string system_dir = tmp.path("system");
    write_file(tmp.path("system/config.yml"), mdwf_test::config_yaml("System User"));
    write_file(tmp.path("system/workflows/job/workflow.yml"), mdwf_test::workflow_yaml("job"));
    write_file(tmp.path("system/workflows/job/templates/resume/default.md"), "System resume");
    write_file(tmp.path("system/workflows/job/templates/resume/mobile.md"), "System mobile");
    write_file(tmp.path("system/workflows/job/templates/cover/default.md"), "System cover");
    write_file(tmp.path("system/workflows/job/templates/static/reference.docx"), "DOCX");
    write_file(tmp.path("system/workflows/blog/workflow.yml"), mdwf_test::workflow_yaml("blog"));
    write_file(tmp.path("system/workflows/blog/templates/post/default.md"), "# {{title}}");
    write_file(tmp.path("system/processors/mmdc.yml"), mdwf_test::processor_yaml("mmdc", "system"));
    write_file(tmp.path("system/converters/pandoc.yml"), mdwf_test::converter_yaml("pandoc"));

    auto packed = pack_directory_zip(system_dir);
    REQUIRE(packed.ok);
    auto digest = sha256_bytes(packed.archive_data);
    REQUIRE(digest.ok);

    const std::string local = tmp.path("project/.markdown-workflow");
    write_file(local + "/config.yml", mdwf_test::config_yaml("Project User"));
    write_file(local + "/workflows/job/templates/resume/default.md", "Project resume");
    write_file(local + "/processors/mmdc.yml", mdwf_test::processor_yaml("mmdc", "project"));
    write_file(local + "/workflows/notes/workflow.yml", mdwf_test::workflow_yaml("notes"));

    EnvironmentFactory factory;
    auto source = ArchiveSource::from_buffer(packed.archive_data, "system.zip");
    source.expected_sha256 = digest.hex_digest;
    auto global = factory.createArchiveEnvironment(std::move(source));
    auto env = factory.createMergedEnvironment(factory.createFilesystemEnvironment(local), global);

    REQUIRE(env->initialize().isOk());
    CHECK(global->skippedEntries().empty());

    SUBCASE("workflows union local first") {
        CHECK(env->listWorkflows().value() == std::vector<std::string>{"notes", "blog", "job"});
    }

    SUBCASE("project config wins") {
        CHECK(env->getConfig().value()->user.name == "Project User");
    }

    SUBCASE("templates resolve local default before global variant") {
        CHECK(env->getTemplate({"job", "resume", std::string("mobile")}).value() ==
              "Project resume");
        CHECK(env->getTemplate({"job", "cover", std::string("mobile")}).value() ==
              "System cover");
    }

    SUBCASE("statics come from the archive") {
        CHECK(env->getStatic({"job", "reference.docx"}).value() == to_bytes("DOCX"));
    }

    SUBCASE("processor overrides by name") {
        auto processors = env->getProcessorDefinitions().value();
        REQUIRE(processors.size() == 1);
        CHECK(processors[0].description == "project");
    }

    SUBCASE("manifest and validation") {
        auto manifest = env->getManifest();
        REQUIRE(manifest.isOk());
        CHECK(manifest.value().templates.at("job") ==
              std::vector<std::string>{"cover", "resume"});
        CHECK(manifest.value().statics.at("job") ==
              std::vector<std::string>{"reference.docx"});
        CHECK(manifest.value().converters == std::vector<std::string>{"pandoc"});

        auto report = validate_environment(*env);
        CHECK(report.is_valid);
        CHECK(report.issues.empty());
    }
}

TEST_CASE("memory snapshot of a merged environment") {
    TempDir tmp;
    mdwf_test::write_tree(tmp.path("system"), mdwf_test::blog_files());
    write_file(tmp.path("project/.markdown-workflow/workflows/blog/templates/post/default.md"),
               "# Local");

    EnvironmentFactory factory;
    auto merged = factory.createCliEnvironment(tmp.path("project"), tmp.path("system"));

    auto snapshot = factory.createMemoryEnvironment();
    REQUIRE(snapshot->mergeFrom(*merged).isOk());

    CHECK(snapshot->getTemplate({"blog", "post", std::nullopt}).value() == "# Local");
    CHECK(snapshot->getStatic({"blog", "style.css"}).value() == to_bytes("body{}"));
    CHECK(snapshot->getManifest().value() == merged->getManifest().value());
}
