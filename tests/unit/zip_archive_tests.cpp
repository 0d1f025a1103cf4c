#include <doctest/doctest.h>
#include <mdwf/zip_archive.hpp>

#include "test_support.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace mdwf;
using mdwf_test::make_zip;
using mdwf_test::TempDir;
using mdwf_test::to_bytes;
using mdwf_test::to_string;
using mdwf_test::write_file;

// ============================================================================
// Reading
// ============================================================================

TEST_CASE("read_zip_directory lists entries in central directory order") {
    auto zip = make_zip({
        {"workflows/blog/workflow.yml", "workflow: {}"},
        {"config.yml", "user: {}"},
        {"workflows/", ""},
    });

    auto dir = read_zip_directory(zip);
    REQUIRE(dir.ok);
    REQUIRE(dir.entries.size() == 3);
    CHECK(dir.entries[0].name == "workflows/blog/workflow.yml");
    CHECK(dir.entries[1].name == "config.yml");
    CHECK(dir.entries[2].is_directory);
    CHECK_FALSE(dir.entries[0].is_directory);
    CHECK_FALSE(dir.entries[0].is_symlink);
    CHECK_FALSE(dir.entries[0].encrypted);
}

TEST_CASE("read_zip_entry returns deflated and stored content") {
    std::string text(4096, 'x');
    for (bool deflate : {true, false}) {
        auto zip = make_zip({{"a.md", text}, {"b.txt", "short"}}, deflate);
        auto dir = read_zip_directory(zip);
        REQUIRE(dir.ok);
        CHECK(dir.entries[0].method ==
              static_cast<uint16_t>(deflate ? ZipMethod::Deflated : ZipMethod::Stored));

        auto a = read_zip_entry(zip, dir.entries[0], 1024 * 1024);
        REQUIRE(a.ok);
        CHECK(to_string(a.data) == text);

        auto b = read_zip_entry(zip, dir.entries[1], 1024 * 1024);
        REQUIRE(b.ok);
        CHECK(to_string(b.data) == "short");
    }
}

TEST_CASE("read_zip_entry stops inflating at max_size") {
    auto zip = make_zip({{"big.md", std::string(200 * 1024, 'a')}});
    auto dir = read_zip_directory(zip);
    REQUIRE(dir.ok);

    auto r = read_zip_entry(zip, dir.entries[0], 10 * 1024);
    CHECK_FALSE(r.ok);
    CHECK(r.too_large);
    CHECK(r.data.size() <= 10 * 1024);
}

TEST_CASE("read_zip_entry detects corrupted data") {
    auto zip = make_zip({{"a.txt", "hello world"}}, false);
    auto dir = read_zip_directory(zip);
    REQUIRE(dir.ok);

    // Stored data follows the 30-byte local header and the name
    size_t data_offset = 30 + std::string("a.txt").size();
    zip[data_offset] ^= 0xff;

    auto r = read_zip_entry(zip, dir.entries[0], 1024);
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.too_large);
    CHECK(r.error.find("CRC") != std::string::npos);
}

TEST_CASE("read_zip_directory rejects non-archives") {
    CHECK_FALSE(read_zip_directory(to_bytes("definitely not a zip file")).ok);
    CHECK_FALSE(read_zip_directory(Bytes{}).ok);
}

TEST_CASE("read_zip_directory rejects a truncated archive") {
    auto zip = make_zip({{"a.txt", "hello"}, {"b.txt", "world"}});
    Bytes truncated(zip.begin(), zip.begin() + static_cast<std::ptrdiff_t>(zip.size() / 2));
    CHECK_FALSE(read_zip_directory(truncated).ok);
}

// ============================================================================
// Writing
// ============================================================================

TEST_CASE("create_zip_archive is deterministic") {
    std::vector<ZipWriteEntry> entries = {
        {"workflows/blog/workflow.yml", to_bytes("workflow: {}")},
        {"workflows/blog/templates/post/default.md", to_bytes("# {{title}}")},
    };
    auto first = create_zip_archive(entries);
    auto second = create_zip_archive(entries);
    REQUIRE(first.ok);
    REQUIRE(second.ok);
    CHECK(first.archive_data == second.archive_data);
}

TEST_CASE("create_zip_archive rejects empty entry paths") {
    auto r = create_zip_archive({{"", to_bytes("x")}});
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.error.empty());
}

TEST_CASE("pack_directory_zip collects regular files in sorted order") {
    TempDir tmp;
    write_file(tmp.path("workflows/blog/workflow.yml"), "workflow: {}");
    write_file(tmp.path("config.yml"), "user: {}");
    write_file(tmp.path("workflows/blog/templates/post/default.md"), "# post");
    fs::create_directories(tmp.path("empty"));

    auto packed = pack_directory_zip(tmp.path());
    REQUIRE(packed.ok);

    auto dir = read_zip_directory(packed.archive_data);
    REQUIRE(dir.ok);
    REQUIRE(dir.entries.size() == 3);
    CHECK(dir.entries[0].name == "config.yml");
    CHECK(dir.entries[1].name == "workflows/blog/templates/post/default.md");
    CHECK(dir.entries[2].name == "workflows/blog/workflow.yml");

    auto content = read_zip_entry(packed.archive_data, dir.entries[1], 1024);
    REQUIRE(content.ok);
    CHECK(to_string(content.data) == "# post");
}

TEST_CASE("pack_directory_zip rejects symlinks") {
    TempDir tmp;
    write_file(tmp.path("config.yml"), "user: {}");

    std::error_code ec;
    fs::create_symlink(tmp.path("config.yml"), tmp.path("link.yml"), ec);
    if (ec) {
        MESSAGE("symlinks unavailable, skipping");
        return;
    }

    auto packed = pack_directory_zip(tmp.path());
    CHECK_FALSE(packed.ok);
    CHECK(packed.error.find("symlink") != std::string::npos);
}

TEST_CASE("pack_directory_zip fails for a missing directory") {
    TempDir tmp;
    auto packed = pack_directory_zip(tmp.path("missing"));
    CHECK_FALSE(packed.ok);
    CHECK(packed.error.find("directory not found") != std::string::npos);
}
