#include <catch2/catch.hpp>
#include <tsorg/files.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace tsorg;
namespace fs = std::filesystem;

// RAII temp directory
namespace {

struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("tsorg_files_test_" + std::to_string(
            std::hash<std::string>{}(std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()))));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
        return full.generic_string();
    }

    std::string str() const { return path.generic_string(); }
};

} // namespace

TEST_CASE("typescript extensions", "[files]") {
    REQUIRE(is_typescript_file("a.ts"));
    REQUIRE(is_typescript_file("dir/a.tsx"));
    REQUIRE(is_typescript_file("a.mts"));
    REQUIRE(is_typescript_file("a.cts"));
    REQUIRE_FALSE(is_typescript_file("a.js"));
    REQUIRE_FALSE(is_typescript_file("a.ts.bak"));
}

TEST_CASE("discover explicit files", "[files]") {
    TempDir tmp;
    auto a = tmp.write_file("a.ts", "");
    auto js = tmp.write_file("b.js", "");
    auto r = discover_files({a, js, a});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{a});
}

TEST_CASE("discover files in a directory", "[files]") {
    TempDir tmp;
    auto a = tmp.write_file("src/a.ts", "");
    auto b = tmp.write_file("src/deep/b.tsx", "");
    tmp.write_file("src/readme.md", "");
    tmp.write_file("node_modules/pkg/index.ts", "");
    tmp.write_file(".cache/c.ts", "");
    auto r = discover_files({tmp.str()});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{a, b});
}

TEST_CASE("discover files with a glob", "[files]") {
    TempDir tmp;
    auto a = tmp.write_file("src/a.ts", "");
    tmp.write_file("src/b.tsx", "");
    tmp.write_file("lib/c.ts", "");
    auto r = discover_files({tmp.str() + "/src/*.ts"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{a});
}

TEST_CASE("discover with exclusions", "[files]") {
    TempDir tmp;
    auto a = tmp.write_file("a.ts", "");
    tmp.write_file("gen/b.ts", "");
    auto r = discover_files({tmp.str(), "!**/gen/**"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{a});
}

TEST_CASE("discover missing path", "[files]") {
    auto r = discover_files({"/definitely/not/here.ts"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TsorgError::NotFound);
}

TEST_CASE("glob without matches is empty", "[files]") {
    TempDir tmp;
    auto r = discover_files({tmp.str() + "/none/*.ts"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("read and write files", "[files]") {
    TempDir tmp;
    auto p = tmp.write_file("x.ts", "old");
    auto r = read_file(p);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "old");

    REQUIRE(write_file(p, "new", true).is_ok());
    REQUIRE(read_file(p).value() == "new");
    REQUIRE(backup_path(p) == p + ".bak");
    REQUIRE(read_file(backup_path(p)).value() == "old");
}

TEST_CASE("write without backup", "[files]") {
    TempDir tmp;
    auto p = tmp.write_file("x.ts", "old");
    REQUIRE(write_file(p, "new", false).is_ok());
    REQUIRE_FALSE(fs::exists(backup_path(p)));
}

TEST_CASE("read missing file", "[files]") {
    auto r = read_file("/definitely/not/here.ts");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TsorgError::IO);
}
