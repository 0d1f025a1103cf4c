#include <doctest/doctest.h>
#include <mdwf/path_utils.hpp>

using mdwf::PathError;
using mdwf::resolve_under_root;

TEST_CASE("resolve simple relative path under root") {
    auto r = resolve_under_root("/srv/mdwf", "workflows/blog/workflow.yml");
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/mdwf/workflows/blog/workflow.yml");
}

TEST_CASE("collapse dot segments and repeated slashes") {
    auto r = resolve_under_root("/srv/mdwf", "./workflows//blog/./workflow.yml");
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/mdwf/workflows/blog/workflow.yml");
}

TEST_CASE("dotdot inside root is collapsed") {
    auto r = resolve_under_root("/srv/mdwf", "workflows/blog/../job/workflow.yml");
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/mdwf/workflows/job/workflow.yml");
}

TEST_CASE("reject escape above root") {
    auto r = resolve_under_root("/srv/mdwf", "workflows/../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute relative paths") {
    auto unix_abs = resolve_under_root("/srv/mdwf", "/etc/passwd");
    CHECK_FALSE(unix_abs.ok);
    CHECK(unix_abs.error == PathError::AbsoluteNotAllowed);

    auto drive = resolve_under_root("/srv/mdwf", "C:\\Windows\\win.ini");
    CHECK_FALSE(drive.ok);
    CHECK(drive.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("reject NUL bytes") {
    std::string bad = std::string("workflows/\0blog", 15);
    auto r = resolve_under_root("/srv/mdwf", bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::ContainsNul);
}

TEST_CASE("empty relative path resolves to root") {
    auto r = resolve_under_root("/srv/mdwf", "");
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/mdwf");
}

TEST_CASE("normalize_entry_path converts separators and strips leading slashes") {
    CHECK(mdwf::normalize_entry_path("workflows\\blog\\workflow.yml") ==
          "workflows/blog/workflow.yml");
    CHECK(mdwf::normalize_entry_path("//config.yml") == "config.yml");
    CHECK(mdwf::normalize_entry_path("a/../b.md") == "a/../b.md");
}

TEST_CASE("split_path drops empty segments") {
    auto parts = mdwf::split_path("/workflows//blog/");
    REQUIRE(parts.size() == 2);
    CHECK(parts[0] == "workflows");
    CHECK(parts[1] == "blog");
}

TEST_CASE("path_basename and path_extension") {
    CHECK(mdwf::path_basename("a/b/c.md") == "c.md");
    CHECK(mdwf::path_basename("c.md") == "c.md");
    CHECK(mdwf::path_extension("x/Y.MD") == ".md");
    CHECK(mdwf::path_extension("archive.tar.gz") == ".gz");
    CHECK(mdwf::path_extension(".hidden") == "");
    CHECK(mdwf::path_extension("dir.d/noext") == "");
}

TEST_CASE("starts_with and ends_with") {
    CHECK(mdwf::starts_with("workflows/blog", "workflows/"));
    CHECK_FALSE(mdwf::starts_with("work", "workflows/"));
    CHECK(mdwf::ends_with("default.md", ".md"));
    CHECK_FALSE(mdwf::ends_with("md", "default.md"));
}
