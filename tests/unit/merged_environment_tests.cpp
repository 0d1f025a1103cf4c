#include <doctest/doctest.h>
#include <mdwf/filesystem_environment.hpp>
#include <mdwf/memory_environment.hpp>
#include <mdwf/merged_environment.hpp>
#include <mdwf/schema.hpp>

#include "test_support.hpp"

using namespace mdwf;
using mdwf_test::to_bytes;

namespace {

WorkflowFile workflow(const std::string& name, const std::string& description = "") {
    auto r = load_workflow_yaml(mdwf_test::workflow_yaml(name), name);
    REQUIRE(r.isOk());
    if (!description.empty()) r.value().workflow.description = description;
    return r.value();
}

template<typename Def>
Def definition(Result<Def> r) {
    REQUIRE(r.isOk());
    return r.value();
}

std::shared_ptr<MemoryEnvironment> memory_with(std::initializer_list<std::string> workflows,
                                               const std::string& description) {
    auto env = std::make_shared<MemoryEnvironment>();
    for (const auto& name : workflows) {
        env->setWorkflow(name, workflow(name, description));
    }
    return env;
}

// Reports every workflow and template as present but corrupt
class CorruptEnvironment : public MemoryEnvironment {
public:
    Result<WorkflowFile> getWorkflow(const std::string& name) const override {
        return Result<WorkflowFile>::err(Error::validation("corrupt workflow " + name));
    }
    Result<std::string> getTemplate(const TemplateRequest& request) const override {
        return Result<std::string>::err(Error::security("unsafe template " + template_key(request)));
    }
};

} // namespace

// ============================================================================
// Single-resource Lookups
// ============================================================================

TEST_CASE("getWorkflow prefers local, falls back to global, then not found") {
    auto local = memory_with({"job"}, "local job");
    auto global = memory_with({"job", "blog"}, "global");
    MergedEnvironment merged(local, global);

    CHECK(merged.getWorkflow("job").value().workflow.description == "local job");
    CHECK(merged.getWorkflow("blog").value().workflow.description == "global");

    auto missing = merged.getWorkflow("nope");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::RESOURCE_NOT_FOUND);
    CHECK(missing.error().resource_kind() == "Workflow");
    CHECK(missing.error().resource_id() == "nope");
}

TEST_CASE("local validation errors are not masked by global") {
    auto local = std::make_shared<CorruptEnvironment>();
    auto global = memory_with({"job"}, "global");
    global->setTemplate({"job", "resume", std::nullopt}, "global resume");
    MergedEnvironment merged(local, global);

    auto wf = merged.getWorkflow("job");
    REQUIRE(wf.isErr());
    CHECK(wf.error().code() == ErrorCode::VALIDATION_ERROR);

    auto tpl = merged.getTemplate({"job", "resume", std::nullopt});
    REQUIRE(tpl.isErr());
    CHECK(tpl.error().code() == ErrorCode::SECURITY_ERROR);
}

TEST_CASE("corrupt local workflow file on disk is reported, not hidden") {
    mdwf_test::TempDir tmp;
    mdwf_test::write_file(tmp.path("workflows/job/workflow.yml"), "workflow:\n  name: job\n");
    auto local = std::make_shared<FilesystemEnvironment>(tmp.path());
    auto global = memory_with({"job"}, "global");
    MergedEnvironment merged(local, global);

    auto r = merged.getWorkflow("job");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::VALIDATION_ERROR);
    CHECK(merged.resourceSource("job") == ResourceSource::Local);
}

TEST_CASE("template lookup resolves the variant chain per side") {
    auto local = std::make_shared<MemoryEnvironment>();
    auto global = std::make_shared<MemoryEnvironment>();
    local->setTemplate({"job", "resume", std::nullopt}, "local default");
    global->setTemplate({"job", "resume", std::string("mobile")}, "global mobile");
    global->setTemplate({"job", "cover", std::nullopt}, "global cover");
    MergedEnvironment merged(local, global);

    // Local answers with its default before global's variant is consulted
    CHECK(merged.getTemplate({"job", "resume", std::string("mobile")}).value() == "local default");
    CHECK(merged.getTemplate({"job", "cover", std::nullopt}).value() == "global cover");
    CHECK(merged.hasTemplate({"job", "cover", std::nullopt}));
    CHECK_FALSE(merged.hasTemplate({"job", "letter", std::nullopt}));
}

TEST_CASE("static lookup falls through to global") {
    auto local = std::make_shared<MemoryEnvironment>();
    auto global = std::make_shared<MemoryEnvironment>();
    local->setStatic({"blog", "style.css"}, to_bytes("local{}"));
    global->setStatic({"blog", "style.css"}, to_bytes("global{}"));
    global->setStatic({"blog", "logo.svg"}, to_bytes("<svg/>"));
    MergedEnvironment merged(local, global);

    CHECK(merged.getStatic({"blog", "style.css"}).value() == to_bytes("local{}"));
    CHECK(merged.getStatic({"blog", "logo.svg"}).value() == to_bytes("<svg/>"));
    CHECK(merged.getStatic({"blog", "none"}).error().is_not_found());
    CHECK(merged.hasStatic({"blog", "logo.svg"}));
    CHECK_FALSE(merged.hasStatic({"blog", "none"}));

    CHECK(merged.resourceSource(StaticRequest{"blog", "style.css"}) == ResourceSource::Local);
    CHECK(merged.resourceSource(StaticRequest{"blog", "logo.svg"}) == ResourceSource::Global);
    CHECK(merged.resourceSource(StaticRequest{"blog", "none"}) == ResourceSource::None);
}

TEST_CASE("config comes from local when present, else global") {
    auto local = std::make_shared<MemoryEnvironment>();
    auto global = std::make_shared<MemoryEnvironment>();
    global->setConfig(definition(load_config_yaml(mdwf_test::config_yaml("Global"), "g")));
    MergedEnvironment merged(local, global);

    CHECK(merged.getConfig().value()->user.name == "Global");

    local->setConfig(definition(load_config_yaml(mdwf_test::config_yaml("Local"), "l")));
    CHECK(merged.getConfig().value()->user.name == "Local");

    MergedEnvironment empty(std::make_shared<MemoryEnvironment>(),
                            std::make_shared<MemoryEnvironment>());
    CHECK_FALSE(empty.getConfig().value().has_value());
}

// ============================================================================
// Listings
// ============================================================================

TEST_CASE("listWorkflows is the deduplicated union, local first") {
    SUBCASE("overlapping") {
        MergedEnvironment merged(memory_with({"job", "blog"}, "l"),
                                 memory_with({"blog", "notes", "job"}, "g"));
        CHECK(merged.listWorkflows().value() ==
              std::vector<std::string>{"blog", "job", "notes"});
    }
    SUBCASE("disjoint") {
        MergedEnvironment merged(memory_with({"a"}, "l"), memory_with({"b", "c"}, "g"));
        CHECK(merged.listWorkflows().value() == std::vector<std::string>{"a", "b", "c"});
    }
    SUBCASE("local only") {
        MergedEnvironment merged(memory_with({"a"}, "l"), memory_with({}, "g"));
        CHECK(merged.listWorkflows().value() == std::vector<std::string>{"a"});
    }
}

TEST_CASE("definitions merge by name with local replacing global") {
    auto local = std::make_shared<MemoryEnvironment>();
    auto global = std::make_shared<MemoryEnvironment>();
    global->addProcessor(definition(load_processor_yaml(mdwf_test::processor_yaml("mmdc", "g"), "")));
    global->addProcessor(definition(load_processor_yaml(mdwf_test::processor_yaml("plantuml", "g"), "")));
    local->addProcessor(definition(load_processor_yaml(mdwf_test::processor_yaml("mmdc", "l"), "")));
    local->addProcessor(definition(load_processor_yaml(mdwf_test::processor_yaml("graphviz", "l"), "")));
    global->addConverter(definition(load_converter_yaml(mdwf_test::converter_yaml("pandoc"), "")));
    MergedEnvironment merged(local, global);

    auto processors = merged.getProcessorDefinitions().value();
    REQUIRE(processors.size() == 3);
    CHECK(processors[0].name == "mmdc");
    CHECK(processors[0].description == "l");
    CHECK(processors[1].name == "plantuml");
    CHECK(processors[2].name == "graphviz");

    auto converters = merged.getConverterDefinitions().value();
    REQUIRE(converters.size() == 1);
    CHECK(converters[0].name == "pandoc");
}

TEST_CASE("merged manifest unions every field") {
    auto local = memory_with({"job"}, "l");
    local->setTemplate({"job", "resume", std::nullopt}, "r");
    local->setStatic({"job", "local.css"}, to_bytes("x"));
    auto global = memory_with({"job", "blog"}, "g");
    global->setTemplate({"job", "resume", std::nullopt}, "r");
    global->setTemplate({"job", "cover", std::nullopt}, "c");
    global->setStatic({"blog", "style.css"}, to_bytes("y"));
    global->setConfig(definition(load_config_yaml(mdwf_test::config_yaml(), "g")));
    MergedEnvironment merged(local, global);

    auto r = merged.getManifest();
    REQUIRE(r.isOk());
    const auto& m = r.value();
    CHECK(m.workflows == std::vector<std::string>{"job", "blog"});
    CHECK(m.templates.at("job") == std::vector<std::string>{"resume", "cover"});
    CHECK(m.statics.at("job") == std::vector<std::string>{"local.css"});
    CHECK(m.statics.at("blog") == std::vector<std::string>{"style.css"});
    CHECK(m.has_config);
}

TEST_CASE("resource_source_to_string") {
    CHECK(std::string(resource_source_to_string(ResourceSource::Local)) == "local");
    CHECK(std::string(resource_source_to_string(ResourceSource::Global)) == "global");
    CHECK(std::string(resource_source_to_string(ResourceSource::None)) == "none");
}
