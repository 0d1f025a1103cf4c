#include "mdwf/schema.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace mdwf {

using nlohmann::json;

namespace {

// Reads typed fields out of a JSON object. The first failure is kept in
// `error` as "<path>: <reason>"; later reads become no-ops so a parser can
// run straight through and check ok() once at the end.
class FieldReader {
public:
    FieldReader(const json& obj, std::string path, std::string& error)
        : obj_(obj), path_(std::move(path)), error_(error) {
        if (!obj_.is_object()) {
            fail("", "expected object");
        }
    }

    bool ok() const { return error_.empty(); }

    std::string field_path(const std::string& key) const {
        if (path_.empty()) return key;
        if (key.empty()) return path_;
        return path_ + "." + key;
    }

    const json* get(const std::string& key, bool required) {
        if (!ok() || !obj_.is_object()) return nullptr;
        auto it = obj_.find(key);
        if (it == obj_.end() || it->is_null()) {
            if (required) fail(key, "required");
            return nullptr;
        }
        return &*it;
    }

    std::string str(const std::string& key) {
        auto v = opt_str(key, true);
        return v ? *v : std::string();
    }

    std::optional<std::string> opt_str(const std::string& key, bool required = false) {
        const json* v = get(key, required);
        if (!v) return std::nullopt;
        if (!v->is_string()) {
            fail(key, "expected string");
            return std::nullopt;
        }
        return v->get<std::string>();
    }

    std::vector<std::string> str_array(const std::string& key, bool required = true) {
        std::vector<std::string> out;
        const json* v = get(key, required);
        if (!v) return out;
        if (!v->is_array()) {
            fail(key, "expected array");
            return out;
        }
        for (size_t i = 0; i < v->size(); ++i) {
            const auto& elem = (*v)[i];
            if (!elem.is_string()) {
                fail(key + "[" + std::to_string(i) + "]", "expected string");
                return {};
            }
            out.push_back(elem.get<std::string>());
        }
        return out;
    }

    std::optional<bool> opt_bool(const std::string& key, bool required = false) {
        const json* v = get(key, required);
        if (!v) return std::nullopt;
        if (!v->is_boolean()) {
            fail(key, "expected boolean");
            return std::nullopt;
        }
        return v->get<bool>();
    }

    bool boolean(const std::string& key) { return opt_bool(key, true).value_or(false); }

    std::optional<double> opt_number(const std::string& key, bool required = false) {
        const json* v = get(key, required);
        if (!v) return std::nullopt;
        if (!v->is_number()) {
            fail(key, "expected number");
            return std::nullopt;
        }
        return v->get<double>();
    }

    double number(const std::string& key) { return opt_number(key, true).value_or(0); }

    int64_t integer(const std::string& key) {
        const json* v = get(key, true);
        if (!v) return 0;
        if (v->is_number_unsigned() &&
            v->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            fail(key, "integer out of range");
            return 0;
        }
        if (!v->is_number_integer()) {
            fail(key, "expected integer");
            return 0;
        }
        return v->get<int64_t>();
    }

    std::string one_of(const std::string& key, const std::vector<std::string>& allowed) {
        std::string value = str(key);
        if (!ok()) return value;
        if (std::find(allowed.begin(), allowed.end(), value) == allowed.end()) {
            std::string list;
            for (const auto& a : allowed) {
                if (!list.empty()) list += ", ";
                list += a;
            }
            fail(key, "must be one of: " + list);
        }
        return value;
    }

    const json* object(const std::string& key, bool required = true) {
        const json* v = get(key, required);
        if (!v) return nullptr;
        if (!v->is_object()) {
            fail(key, "expected object");
            return nullptr;
        }
        return v;
    }

    const json* array(const std::string& key, bool required = true) {
        const json* v = get(key, required);
        if (!v) return nullptr;
        if (!v->is_array()) {
            fail(key, "expected array");
            return nullptr;
        }
        return v;
    }

    void fail(const std::string& key, const std::string& reason) {
        if (error_.empty()) {
            std::string where = field_path(key);
            error_ = (where.empty() ? std::string("<root>") : where) + ": " + reason;
        }
    }

private:
    const json& obj_;
    std::string path_;
    std::string& error_;
};

std::string index_path(const std::string& base, const std::string& key, size_t i) {
    return (base.empty() ? key : base + "." + key) + "[" + std::to_string(i) + "]";
}

WorkflowStage read_stage(const json& j, const std::string& path, std::string& error) {
    FieldReader r(j, path, error);
    WorkflowStage stage;
    stage.name = r.str("name");
    stage.description = r.str("description");
    stage.color = r.str("color");
    stage.next = r.str_array("next", false);
    stage.terminal = r.opt_bool("terminal").value_or(false);
    return stage;
}

WorkflowTemplate read_template(const json& j, const std::string& path, std::string& error) {
    FieldReader r(j, path, error);
    WorkflowTemplate t;
    t.name = r.str("name");
    t.file = r.str("file");
    t.output = r.str("output");
    t.description = r.str("description");
    return t;
}

WorkflowStatic read_static(const json& j, const std::string& path, std::string& error) {
    FieldReader r(j, path, error);
    WorkflowStatic s;
    s.name = r.str("name");
    s.file = r.str("file");
    s.description = r.str("description");
    return s;
}

WorkflowActionParameter read_parameter(const json& j, const std::string& path,
                                       std::string& error) {
    FieldReader r(j, path, error);
    WorkflowActionParameter p;
    p.name = r.str("name");
    p.type = r.one_of("type", {"string", "number", "boolean", "enum", "array", "date"});
    p.required = r.opt_bool("required").value_or(false);
    if (const json* def = r.get("default", false)) {
        bool valid = def->is_string() || def->is_number() || def->is_boolean();
        if (def->is_array()) {
            valid = std::all_of(def->begin(), def->end(),
                                [](const json& e) { return e.is_string(); });
        }
        if (!valid) {
            r.fail("default", "expected string, number, boolean or string array");
        } else {
            p.default_value = *def;
        }
    }
    p.options = r.str_array("options", false);
    p.description = r.str("description");
    return p;
}

WorkflowAction read_action(const json& j, const std::string& path, std::string& error) {
    FieldReader r(j, path, error);
    WorkflowAction a;
    a.name = r.str("name");
    a.description = r.str("description");
    a.templates = r.str_array("templates", false);
    a.converter = r.opt_str("converter");
    a.formats = r.str_array("formats", false);
    if (const json* params = r.array("parameters", false)) {
        for (size_t i = 0; i < params->size() && r.ok(); ++i) {
            a.parameters.push_back(
                read_parameter((*params)[i], index_path(path, "parameters", i), error));
        }
    }
    a.metadata_file = r.opt_str("metadata_file");
    return a;
}

template<typename T, typename Fn>
std::vector<T> read_list(FieldReader& r, const std::string& base, const std::string& key,
                         std::string& error, Fn read_one) {
    std::vector<T> out;
    const json* arr = r.array(key);
    if (!arr) return out;
    for (size_t i = 0; i < arr->size() && error.empty(); ++i) {
        out.push_back(read_one((*arr)[i], index_path(base, key, i), error));
    }
    return out;
}

ExternalDetection read_detection(FieldReader& parent, std::string& error) {
    ExternalDetection d;
    const json* obj = parent.object("detection");
    if (!obj) return d;
    FieldReader r(*obj, parent.field_path("detection"), error);
    d.command = r.str("command");
    d.pattern = r.opt_str("pattern");
    return d;
}

ExternalExecution read_execution(FieldReader& parent, std::string& error) {
    ExternalExecution e;
    const json* obj = parent.object("execution");
    if (!obj) return e;
    FieldReader r(*obj, parent.field_path("execution"), error);
    e.command_template = r.str("command_template");
    e.mode = r.str("mode");
    e.backup = r.opt_bool("backup").value_or(false);
    if (auto timeout = r.opt_number("timeout")) {
        e.timeout = static_cast<int64_t>(*timeout);
    }
    return e;
}

bool looks_like_email(const std::string& s) {
    auto at = s.find('@');
    if (at == std::string::npos || at == 0) return false;
    auto dot = s.find('.', at + 2);
    return dot != std::string::npos && dot + 1 < s.size();
}

} // namespace

Result<WorkflowFile> parse_workflow_file(const json& doc) {
    std::string error;
    WorkflowFile file;
    file.raw = doc;

    FieldReader root(doc, "", error);
    const json* wf_json = root.object("workflow");
    if (wf_json) {
        const std::string base = "workflow";
        FieldReader r(*wf_json, base, error);
        auto& wf = file.workflow;
        wf.name = r.str("name");
        wf.description = r.str("description");
        wf.version = r.str("version");
        wf.stages = read_list<WorkflowStage>(r, base, "stages", error, read_stage);
        wf.templates = read_list<WorkflowTemplate>(r, base, "templates", error, read_template);
        wf.statics = read_list<WorkflowStatic>(r, base, "statics", error, read_static);
        wf.actions = read_list<WorkflowAction>(r, base, "actions", error, read_action);

        if (const json* meta = r.object("metadata")) {
            FieldReader m(*meta, base + ".metadata", error);
            wf.metadata.required_fields = m.str_array("required_fields");
            wf.metadata.optional_fields = m.str_array("optional_fields");
            wf.metadata.auto_generated = m.str_array("auto_generated");
        }
        if (const json* cid = r.object("collection_id")) {
            FieldReader c(*cid, base + ".collection_id", error);
            wf.collection_id.pattern = c.str("pattern");
            wf.collection_id.max_length = c.integer("max_length");
        }
    }

    if (!error.empty()) {
        return Result<WorkflowFile>::err(Error::validation("invalid workflow definition: " + error));
    }
    return Result<WorkflowFile>::ok(std::move(file));
}

Result<ProjectConfig> parse_project_config(const json& doc) {
    std::string error;
    ProjectConfig config;
    config.raw = doc;

    FieldReader root(doc, "", error);

    if (const json* user = root.object("user")) {
        FieldReader u(*user, "user", error);
        config.user.name = u.str("name");
        config.user.preferred_name = u.str("preferred_name");
        config.user.email = u.str("email");
        if (u.ok() && !looks_like_email(config.user.email)) {
            u.fail("email", "invalid email address");
        }
        config.user.phone = u.str("phone");
        config.user.address = u.str("address");
        config.user.city = u.str("city");
        config.user.state = u.str("state");
        config.user.zip = u.str("zip");
        config.user.linkedin = u.str("linkedin");
        config.user.github = u.str("github");
        config.user.website = u.str("website");
    }

    if (const json* system = root.object("system")) {
        FieldReader s(*system, "system", error);
        auto& sys = config.system;
        sys.scraper = s.one_of("scraper", {"wget", "curl", "chrome"});
        if (const json* wd = s.object("web_download")) {
            FieldReader w(*wd, "system.web_download", error);
            sys.web_download.timeout = w.number("timeout");
            sys.web_download.add_utf8_bom = w.boolean("add_utf8_bom");
            sys.web_download.html_cleanup = w.one_of("html_cleanup", {"none", "scripts", "markdown"});
        }
        sys.output_formats = s.str_array("output_formats");
        if (const json* git = s.object("git")) {
            FieldReader g(*git, "system.git", error);
            sys.git.auto_commit = g.boolean("auto_commit");
            sys.git.commit_message_template = g.str("commit_message_template");
        }
        if (const json* cid = s.object("collection_id")) {
            FieldReader c(*cid, "system.collection_id", error);
            sys.collection_id.date_format = c.str("date_format");
            sys.collection_id.sanitize_spaces = c.str("sanitize_spaces");
            sys.collection_id.max_length = c.integer("max_length");
        }
        if (const json* testing = s.object("testing", false)) {
            sys.testing = *testing;
        }
    }

    if (const json* workflows = root.object("workflows")) {
        for (auto& [name, override_json] : workflows->items()) {
            if (!override_json.is_object()) {
                root.fail("workflows." + name, "expected object");
                break;
            }
            config.workflows[name] = override_json;
        }
    }

    if (!error.empty()) {
        return Result<ProjectConfig>::err(Error::validation("invalid project config: " + error));
    }
    return Result<ProjectConfig>::ok(std::move(config));
}

Result<ExternalProcessorDefinition> parse_processor_file(const json& doc) {
    std::string error;
    ExternalProcessorDefinition def;

    FieldReader root(doc, "", error);
    if (const json* p = root.object("processor")) {
        FieldReader r(*p, "processor", error);
        def.name = r.str("name");
        def.description = r.str("description");
        def.version = r.str("version");
        def.detection = read_detection(r, error);
        def.execution = read_execution(r, error);
    }

    if (!error.empty()) {
        return Result<ExternalProcessorDefinition>::err(
            Error::validation("invalid processor definition: " + error));
    }
    return Result<ExternalProcessorDefinition>::ok(std::move(def));
}

Result<ExternalConverterDefinition> parse_converter_file(const json& doc) {
    std::string error;
    ExternalConverterDefinition def;

    FieldReader root(doc, "", error);
    if (const json* c = root.object("converter")) {
        FieldReader r(*c, "converter", error);
        def.name = r.str("name");
        def.description = r.str("description");
        def.version = r.str("version");
        def.supported_formats = r.str_array("supported_formats");
        def.detection = read_detection(r, error);
        def.execution = read_execution(r, error);
    }

    if (!error.empty()) {
        return Result<ExternalConverterDefinition>::err(
            Error::validation("invalid converter definition: " + error));
    }
    return Result<ExternalConverterDefinition>::ok(std::move(def));
}

// ============================================================================
// YAML Text Entry Points
// ============================================================================

namespace {

template<typename T>
Result<T> load_yaml_as(const std::string& text, const std::string& source_name,
                       Result<T> (*parse)(const json&)) {
    auto doc = parse_yaml_document(text, source_name);
    if (doc.isErr()) {
        return Result<T>::err(doc.error());
    }
    auto parsed = parse(doc.value());
    if (parsed.isErr() && !source_name.empty()) {
        parsed.error().withContext(source_name);
    }
    return parsed;
}

} // namespace

Result<WorkflowFile> load_workflow_yaml(const std::string& text, const std::string& source_name) {
    return load_yaml_as<WorkflowFile>(text, source_name, &parse_workflow_file);
}

Result<ProjectConfig> load_config_yaml(const std::string& text, const std::string& source_name) {
    return load_yaml_as<ProjectConfig>(text, source_name, &parse_project_config);
}

Result<ExternalProcessorDefinition> load_processor_yaml(const std::string& text,
                                                        const std::string& source_name) {
    return load_yaml_as<ExternalProcessorDefinition>(text, source_name, &parse_processor_file);
}

Result<ExternalConverterDefinition> load_converter_yaml(const std::string& text,
                                                        const std::string& source_name) {
    return load_yaml_as<ExternalConverterDefinition>(text, source_name, &parse_converter_file);
}

} // namespace mdwf
