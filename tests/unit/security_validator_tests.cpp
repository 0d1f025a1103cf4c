#include <doctest/doctest.h>
#include <mdwf/security_validator.hpp>

using namespace mdwf;

// ============================================================================
// Path Checks
// ============================================================================

TEST_CASE("validate_path accepts layout paths") {
    SecurityValidator v;
    CHECK(v.validate_path("config.yml").isOk());
    CHECK(v.validate_path("workflows/blog/workflow.yml").isOk());
    CHECK(v.validate_path("workflows/blog/templates/post/default.md").isOk());
    CHECK(v.validate_path("workflows/blog/templates/static/style.css").isOk());
}

TEST_CASE("validate_path rejects traversal segments") {
    SecurityValidator v;
    auto r = v.validate_path("workflows/../../etc/passwd");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::SECURITY_ERROR);
    CHECK(r.error().message().find("workflows/../../etc/passwd") != std::string::npos);

    CHECK(v.validate_path("..").isErr());
    CHECK(v.validate_path("a\\..\\b").isErr());
}

TEST_CASE("validate_path rejects absolute paths") {
    SecurityValidator v;
    CHECK(v.validate_path("/etc/passwd").isErr());
    CHECK(v.validate_path("\\windows\\system32").isErr());
    CHECK(v.validate_path("C:\\temp\\x.md").isErr());
    CHECK(v.validate_path("c:/temp/x.md").isErr());
}

TEST_CASE("validate_path rejects NUL bytes and empty paths") {
    SecurityValidator v;
    CHECK(v.validate_path(std::string("a\0b.md", 6)).isErr());
    CHECK(v.validate_path("").isErr());
}

TEST_CASE("validate_path enforces the depth limit") {
    SecurityValidator v;
    CHECK(v.validate_path("a/b/c/d/e.md").isOk());
    auto r = v.validate_path("a/b/c/d/e/f.md");
    REQUIRE(r.isErr());
    CHECK(r.error().message().find("too deep") != std::string::npos);
}

// ============================================================================
// Filename, Extension and Size Checks
// ============================================================================

TEST_CASE("validate_filename rejects separators and control characters") {
    SecurityValidator v;
    CHECK(v.validate_filename("style.css").isOk());
    CHECK(v.validate_filename("a/b.md").isErr());
    CHECK(v.validate_filename("a\\b.md").isErr());
    CHECK(v.validate_filename("bad\x01name.md").isErr());
    CHECK(v.validate_filename("what?.md").isErr());
    CHECK(v.validate_filename("..").isErr());
    CHECK(v.validate_filename("   ").isErr());
}

TEST_CASE("validate_filename enforces the length limit") {
    SecurityConfig config = default_security_config();
    config.max_filename_length = 8;
    SecurityValidator v(config);
    CHECK(v.validate_filename("short.md").isOk());
    CHECK(v.validate_filename("too_long.md").isErr());
}

TEST_CASE("validate_extension honours the allowlist") {
    SecurityValidator v;
    CHECK(v.validate_extension(".md").isOk());
    CHECK(v.validate_extension(".MD").isOk());
    CHECK(v.validate_extension(".exe").isErr());
    CHECK(v.validate_extension("").isErr());

    SecurityConfig open = default_security_config();
    open.allowed_extensions.clear();
    CHECK(SecurityValidator(open).validate_extension(".exe").isOk());
}

TEST_CASE("validate_file_size compares against the per-extension limit") {
    SecurityValidator v;
    CHECK(v.validate_file_size(".md", 100 * 1024).isOk());

    auto r = v.validate_file_size(".md", 100 * 1024 + 1);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::SECURITY_ERROR);

    CHECK(v.validate_file_size(".png", 400 * 1024).isOk());
    CHECK(v.validate_file_size(".html", 50 * 1024 * 1024).isOk());
}

TEST_CASE("validate_file combines every per-file check") {
    SecurityValidator v;
    CHECK(v.validate_file(make_file_info("workflows/blog/workflow.yml", 10)).isOk());
    CHECK(v.validate_file(make_file_info("workflows/blog/run.sh", 10)).isErr());
    CHECK(v.validate_file(make_file_info("workflows/blog/big.yml", 200 * 1024)).isErr());
    CHECK(v.validate_file(make_file_info("../x.md", 1)).isErr());
}

// ============================================================================
// Aggregate Check
// ============================================================================

TEST_CASE("validate_files rejects too many entries") {
    SecurityConfig config = default_security_config();
    config.max_file_count = 2;
    SecurityValidator v(config);

    std::vector<FileInfo> files = {make_file_info("a.md", 1), make_file_info("b.md", 1)};
    CHECK(v.validate_files(files).isOk());

    files.push_back(make_file_info("c.md", 1));
    auto r = v.validate_files(files);
    REQUIRE(r.isErr());
    CHECK(r.error().message().find("too many files") != std::string::npos);
}

TEST_CASE("validate_files rejects excessive total size") {
    SecurityConfig config = default_security_config();
    config.max_total_size = 100;
    SecurityValidator v(config);

    CHECK(v.validate_files({make_file_info("a.md", 60), make_file_info("b.md", 40)}).isOk());
    CHECK(v.validate_files({make_file_info("a.md", 60), make_file_info("b.md", 41)}).isErr());
}

// ============================================================================
// Content Sanity
// ============================================================================

TEST_CASE("validate_content rejects invalid UTF-8") {
    SecurityValidator v;
    auto r = v.validate_content("workflows/blog/workflow.yml", "name: \xff\xfe");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::VALIDATION_ERROR);
    CHECK(r.error().message().find("UTF-8") != std::string::npos);
}

TEST_CASE("validate_content rejects text above the input ceiling") {
    SecurityConfig config = default_security_config();
    config.max_content_size = 16;
    SecurityValidator v(config);
    CHECK(v.validate_content("a.md", "short").isOk());
    CHECK(v.validate_content("a.md", std::string(17, 'x')).isErr());
}

TEST_CASE("validate_content rejects denied YAML tags in YAML only") {
    SecurityValidator v;
    const std::string payload = "x: !!python/object:os.system ls\n";
    CHECK(v.validate_content("config.yml", payload).isErr());
    CHECK(v.validate_content("notes.md", payload).isOk());
}

TEST_CASE("validate_content applies custom rules") {
    SecurityConfig config = default_security_config();
    config.content_rules.push_back(
        [](const std::string&, const std::string& text) -> std::optional<std::string> {
            if (text.find("<script") != std::string::npos) return std::string("script tag");
            return std::nullopt;
        });
    SecurityValidator v(config);

    auto r = v.validate_content("post.md", "<script>alert(1)</script>");
    REQUIRE(r.isErr());
    CHECK(r.error().message().find("script tag") != std::string::npos);
    CHECK(v.validate_content("post.md", "# Title").isOk());
}

TEST_CASE("validate_content can be disabled") {
    SecurityConfig config = default_security_config();
    config.enable_content_validation = false;
    CHECK(SecurityValidator(config).validate_content("a.yml", "\xff").isOk());
}

TEST_CASE("is_content_checked covers text formats only") {
    SecurityValidator v;
    CHECK(v.is_content_checked(".yml"));
    CHECK(v.is_content_checked(".JSON"));
    CHECK(v.is_content_checked(".md"));
    CHECK_FALSE(v.is_content_checked(".png"));
    CHECK_FALSE(v.is_content_checked(".css"));
}

TEST_CASE("is_valid_utf8 rejects overlong forms and surrogates") {
    CHECK(is_valid_utf8("plain ascii"));
    CHECK(is_valid_utf8("h\xc3\xa9llo"));
    CHECK(is_valid_utf8("\xf0\x9f\x98\x80"));
    CHECK_FALSE(is_valid_utf8("\xc0\xaf"));
    CHECK_FALSE(is_valid_utf8("\xed\xa0\x80"));
    CHECK_FALSE(is_valid_utf8("\xe2\x82"));
}

TEST_CASE("sanitize_filename replaces reserved characters") {
    SecurityValidator v;
    CHECK(v.sanitize_filename("a<b>:c?.md ") == "a_b__c_.md");
    CHECK(v.sanitize_filename("clean.md") == "clean.md");
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("default_security_config limits") {
    auto config = default_security_config();
    CHECK(config.file_size_limits.at(".md") == 100 * 1024);
    CHECK(config.file_size_limits.at(".png") == 500 * 1024);
    CHECK(config.file_size_limits.at(".pdf") == 1024 * 1024);
    CHECK(config.max_file_count == 500);
    CHECK(config.max_total_size == 5 * 1024 * 1024);
    CHECK(config.file_size_limits.count(".html") == 0);
}

TEST_CASE("parse_security_config overlays the defaults") {
    auto r = parse_security_config(R"({
        "file_size_limits": {"md": 10240, ".PNG": 1},
        "max_file_count": 3,
        "allowed_extensions": ["md", ".yml"]
    })");
    REQUIRE(r.isOk());
    const auto& config = r.value();
    CHECK(config.file_size_limits.at(".md") == 10240);
    CHECK(config.file_size_limits.at(".png") == 1);
    CHECK(config.file_size_limits.at(".yml") == 100 * 1024);
    CHECK(config.max_file_count == 3);
    CHECK(config.max_total_size == 5 * 1024 * 1024);
    CHECK(config.allowed_extensions == std::vector<std::string>{".md", ".yml"});
}

TEST_CASE("parse_security_config rejects malformed input") {
    auto bad_json = parse_security_config("{not json");
    REQUIRE(bad_json.isErr());
    CHECK(bad_json.error().code() == ErrorCode::VALIDATION_ERROR);

    CHECK(parse_security_config("[1, 2]").isErr());
    CHECK(parse_security_config(R"({"max_file_count": "many"})").isErr());
}

TEST_CASE("parse_security_config rejects negative or fractional limits") {
    for (const char* key : {"max_file_count", "max_total_size", "max_path_depth",
                            "max_filename_length", "max_content_size"}) {
        CAPTURE(key);
        for (const char* value : {"-1", "2.5"}) {
            auto r = parse_security_config(std::string("{\"") + key + "\": " + value + "}");
            REQUIRE(r.isErr());
            CHECK(r.error().code() == ErrorCode::VALIDATION_ERROR);
            CHECK(r.error().message() == std::string(key) + " must be a non-negative integer");
        }
    }

    auto limit = parse_security_config(R"({"file_size_limits": {".md": -1}})");
    REQUIRE(limit.isErr());
    CHECK(limit.error().message().find("file_size_limits..md") != std::string::npos);

    CHECK(parse_security_config(R"({"file_size_limits": [1]})").isErr());

    auto zero = parse_security_config(R"({"max_file_count": 0})");
    REQUIRE(zero.isOk());
    CHECK(zero.value().max_file_count == 0);
}
