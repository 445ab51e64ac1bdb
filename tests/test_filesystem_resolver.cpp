#include <catch2/catch_test_macros.hpp>
#include "document/filesystem_resolver.hpp"

#include <filesystem>
#include <fstream>

using namespace docgate;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "docgate_test_resolver") {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

FilesystemResolver make_resolver(const TmpDir& tmp, size_t max_bytes = 10 * 1024 * 1024) {
    FilesystemResolver::Config cfg;
    cfg.root = tmp.path.string();
    cfg.allowed_base_dirs = {"docs", "examples"};
    cfg.max_file_size_bytes = max_bytes;
    return FilesystemResolver(cfg);
}

} // anonymous namespace

TEST_CASE("FilesystemResolver: resolves inside allowed directories", "[resolver]") {
    TmpDir tmp;
    tmp.file("docs/guide.md", "guide");
    tmp.file("examples/sample.md", "sample");
    const auto resolver = make_resolver(tmp);

    const auto guide = resolver.resolve("guide.md");
    REQUIRE(guide.exists);
    CHECK_FALSE(guide.error.has_value());
    const auto text = resolver.read(guide);
    REQUIRE(text.is_ok());
    CHECK(text.value() == "guide");

    // Second base directory is searched too
    const auto sample = resolver.resolve("sample.md");
    REQUIRE(sample.exists);
    CHECK(resolver.read(sample).value() == "sample");
}

TEST_CASE("FilesystemResolver: missing file", "[resolver]") {
    TmpDir tmp;
    tmp.file("docs/guide.md", "guide");
    const auto resolver = make_resolver(tmp);

    const auto r = resolver.resolve("nope.md");
    CHECK_FALSE(r.exists);
    REQUIRE(r.error.has_value());
    CHECK(*r.error == "File not found in allowed directories");

    const auto text = resolver.read(r);
    CHECK(text.is_error());
    CHECK(text.error_category() == ErrorCategory::NOT_FOUND);
}

TEST_CASE("FilesystemResolver: directory traversal is refused", "[resolver][security]") {
    TmpDir tmp;
    tmp.file("docs/guide.md", "guide");
    tmp.file("secret.txt", "top secret");
    const auto resolver = make_resolver(tmp);

    for (const char* path : {"../secret.txt", "../../etc/passwd", "/etc/passwd",
                             "sub/../../secret.txt"}) {
        INFO(path);
        const auto r = resolver.resolve(path);
        CHECK_FALSE(r.exists);
        REQUIRE(r.error.has_value());
        CHECK(*r.error == "Path escapes allowed directories");
        CHECK_FALSE(resolver.is_path_allowed(path));
    }
}

TEST_CASE("FilesystemResolver: sibling directory with shared prefix is refused", "[resolver][security]") {
    TmpDir tmp;
    tmp.file("docs/guide.md", "guide");
    tmp.file("docs-private/key.md", "private");
    const auto resolver = make_resolver(tmp);

    const auto r = resolver.resolve("../docs-private/key.md");
    CHECK_FALSE(r.exists);
    CHECK(*r.error == "Path escapes allowed directories");
}

TEST_CASE("FilesystemResolver: normalized paths inside a base are allowed", "[resolver]") {
    TmpDir tmp;
    tmp.file("docs/team/notes.md", "notes");
    const auto resolver = make_resolver(tmp);

    CHECK(resolver.is_path_allowed("team/../team/notes.md"));
    const auto r = resolver.resolve("team/./notes.md");
    REQUIRE(r.exists);
    CHECK(resolver.read(r).value() == "notes");
}

TEST_CASE("FilesystemResolver: oversized file is rejected on read", "[resolver]") {
    TmpDir tmp;
    tmp.file("docs/big.md", std::string(64, 'x'));
    const auto resolver = make_resolver(tmp, 16);

    const auto r = resolver.resolve("big.md");
    REQUIRE(r.exists);
    const auto text = resolver.read(r);
    CHECK(text.is_error());
    CHECK(text.error_category() == ErrorCategory::VALIDATION_ERROR);
}

TEST_CASE("FilesystemResolver: empty path is invalid", "[resolver]") {
    TmpDir tmp;
    const auto resolver = make_resolver(tmp);

    const auto r = resolver.resolve("");
    CHECK_FALSE(r.exists);
    CHECK(*r.error == "Invalid document path");
}
