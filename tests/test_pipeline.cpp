#include <catch2/catch.hpp>
#include <tsorg/format/pipeline.hpp>
#include <tsorg/files.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace tsorg;
namespace fs = std::filesystem;

static std::string organized(const std::string& src, const std::string& fname = "<test>.ts") {
    auto r = organize_source(src, fname);
    REQUIRE(r.is_ok());
    return r.value();
}

static std::string formatted(const std::string& src, const std::string& fname = "<test>.ts") {
    auto r = format_source(src, fname);
    REQUIRE(r.is_ok());
    return r.value();
}

// RAII temp directory
namespace {

struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("tsorg_pipeline_test_" + std::to_string(
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
        std::ofstream f(full);
        f << content;
        return full.generic_string();
    }
};

} // namespace

static const char* kWidget =
    "import { z } from './z';\n"
    "import React from 'react';\n"
    "\n"
    "// Helper used by the widget\n"
    "function helper(x: number) {\n"
    "  return x * 2; // doubled\n"
    "}\n"
    "\n"
    "/** The main widget */\n"
    "export class Widget {\n"
    "  render() {\n"
    "    return helper(1);\n"
    "  }\n"
    "\n"
    "  // state\n"
    "  private count = 0;\n"
    "}\n"
    "\n"
    "export const config = {\n"
    "  zeta: 1,\n"
    "  alpha: 2, // first\n"
    "};\n";

// ===== Comment ownership through reordering =====

TEST_CASE("leading comment stays on its function", "[pipeline]") {
    REQUIRE(organized("// lead\nfunction foo(){}") == "// lead\nfunction foo(){}");
}

TEST_CASE("trailing comment stays on its line", "[pipeline]") {
    REQUIRE(organized("const x = 1; // ans") == "const x = 1; // ans");
}

TEST_CASE("comments travel with reordered declarations", "[pipeline]") {
    REQUIRE(organized("// b\nfunction b(){}\n// a\nfunction a(){}") ==
            "// a\nfunction a(){}\n\n// b\nfunction b(){}");
}

TEST_CASE("leading comment after a blank line hugs its statement", "[pipeline]") {
    REQUIRE(organized("a();\n\n// note\nb();") == "a();\n// note\nb();");
}

TEST_CASE("several leading comments keep their order", "[pipeline]") {
    REQUIRE(organized("// one\n/* two */\nfunction b() {}\nfunction a() {}") ==
            "function a() {}\n\n// one\n/* two */\nfunction b() {}");
}

TEST_CASE("member comments travel with their members", "[pipeline]") {
    REQUIRE(organized("class A {\n  // the b method\n  b() {}\n  // the a method\n  a() {}\n}") ==
            "class A {\n  // the a method\n  a() {}\n  // the b method\n  b() {}\n}");
}

TEST_CASE("property trailing comments travel with their properties", "[pipeline]") {
    REQUIRE(organized("const o = {\n  b: 1, // bee\n  a: 2, // ay\n};") ==
            "const o = {\n  a: 2, // ay\n  b: 1, // bee\n};");
}

TEST_CASE("header comment stays at the top", "[pipeline]") {
    REQUIRE(organized("// header\n\nimport b from './b';\nimport a from 'a';\n") ==
            "// header\n\nimport a from 'a';\nimport b from './b';");
}

TEST_CASE("inline comments are untouched", "[pipeline]") {
    REQUIRE(organized("foo(/* x */ 1);") == "foo(/* x */ 1);");
}

TEST_CASE("comments inside bodies are untouched", "[pipeline]") {
    std::string src = "function f() {\n  // inside\n  return 1;\n}";
    REQUIRE(organized(src) == src);
}

TEST_CASE("markup attributes are organized in tsx files", "[pipeline]") {
    REQUIRE(formatted("const el = <A b=\"1\" key=\"k\" />;\n", "view.tsx") ==
            "const el = <A key=\"k\" b=\"1\" />;\n");
}

// ===== Whole files =====

TEST_CASE("format a realistic file", "[pipeline]") {
    std::string out = formatted(kWidget);
    REQUIRE(out.find("import React from 'react';\nimport { z } from './z';") == 0);
    auto helper = out.find("function helper");
    auto config = out.find("export const config");
    auto widget = out.find("export class Widget");
    REQUIRE(helper < config);
    REQUIRE(config < widget);
    REQUIRE(out.find("// Helper used by the widget\nfunction helper") != std::string::npos);
    REQUIRE(out.find("/** The main widget */\nexport class Widget") != std::string::npos);
    REQUIRE(out.find("  // state\n  private count = 0;") != std::string::npos);
    REQUIRE(out.find("  alpha: 2, // first\n  zeta: 1,") != std::string::npos);
    REQUIRE(out.find("return x * 2; // doubled") != std::string::npos);
    REQUIRE(out.back() == '\n');
}

TEST_CASE("formatting is idempotent", "[pipeline]") {
    std::string once = formatted(kWidget);
    REQUIRE(formatted(once) == once);

    SECTION("standalone comment inside a reordered class") {
        std::string cls = formatted("class C {\n  z() {}\n\n  // section\n\n  a() {}\n  m() {}\n}\n");
        REQUIRE(formatted(cls) == cls);
    }

    SECTION("standalone comment between reordered declarations") {
        std::string top = formatted(
            "const x = 1;\n\n// note\n\nfunction longfn() {\n  a;\n  b;\n}\n");
        REQUIRE(formatted(top) == top);
    }
}

TEST_CASE("standalone comment stays with the member after it", "[pipeline]") {
    REQUIRE(organized("class C {\n  z() {}\n\n  // section\n\n  a() {}\n  m() {}\n}") ==
            "class C {\n\n  // section\n\n  a() {}\n  m() {}\n  z() {}\n}");
}

TEST_CASE("standalone comment never lands inside another body", "[pipeline]") {
    REQUIRE(organized("const x = 1;\n\n// note\n\nfunction longfn() {\n  a;\n  b;\n}\n") ==
            "// note\n\nfunction longfn() {\n  a;\n  b;\n}\n\nconst x = 1;");
}

TEST_CASE("organized output is stable", "[pipeline]") {
    std::string src = "// b\nfunction b(){}\n// a\nfunction a(){}";
    std::string once = organized(src);
    REQUIRE(organized(once) == once);
}

TEST_CASE("disabled rules keep the source order", "[pipeline]") {
    PipelineOptions opts;
    opts.organize.imports = false;
    opts.organize.declarations = false;
    auto r = format_source("function b() {}\n\nfunction a() {}\n", "<test>.ts", opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "function b() {}\n\nfunction a() {}\n");
}

TEST_CASE("pipeline options come from config", "[pipeline]") {
    Config cfg;
    cfg.organize.enum_members = false;
    cfg.format.indent_width = 2;
    cfg.format.final_newline = false;
    cfg.format.backup = false;
    auto opts = PipelineOptions::from_config(cfg);
    REQUIRE_FALSE(opts.organize.enum_members);
    REQUIRE(opts.print.indent_width == 2);
    REQUIRE_FALSE(opts.style.final_newline);
    REQUIRE_FALSE(opts.backup);
}

// ===== Failures =====

TEST_CASE("parse errors leave the file alone", "[pipeline]") {
    auto r = organize_source("function f( {", "bad.ts");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TsorgError::Parse);
    REQUIRE(r.error().file == "bad.ts");
    REQUIRE(r.error().hint == "the file was left unchanged");
    REQUIRE(r.error().message.find("cannot parse bad.ts") == 0);
}

// ===== Files =====

TEST_CASE("check mode reports without writing", "[pipeline]") {
    TempDir tmp;
    std::string src = "function b() {}\nfunction a() {}\n";
    auto path = tmp.write_file("x.ts", src);
    auto r = format_file(path, PipelineOptions(), FormatMode::Check);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().changed);
    REQUIRE(read_file(path).value() == src);
}

TEST_CASE("write mode rewrites changed files with a backup", "[pipeline]") {
    TempDir tmp;
    std::string src = "function b() {}\nfunction a() {}\n";
    auto path = tmp.write_file("x.ts", src);
    auto r = format_file(path, PipelineOptions(), FormatMode::Write);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().changed);
    REQUIRE(read_file(path).value() == "function a() {}\n\nfunction b() {}\n");
    REQUIRE(read_file(backup_path(path)).value() == src);
}

TEST_CASE("write mode leaves formatted files alone", "[pipeline]") {
    TempDir tmp;
    auto path = tmp.write_file("x.ts", "function a() {}\n");
    auto r = format_file(path, PipelineOptions(), FormatMode::Write);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().changed);
    REQUIRE_FALSE(fs::exists(backup_path(path)));
}

TEST_CASE("stdout mode returns the result only", "[pipeline]") {
    TempDir tmp;
    std::string src = "function b() {}\nfunction a() {}\n";
    auto path = tmp.write_file("x.ts", src);
    auto r = format_file(path, PipelineOptions(), FormatMode::Stdout);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().output == "function a() {}\n\nfunction b() {}\n");
    REQUIRE(read_file(path).value() == src);
}

TEST_CASE("missing file is an io error", "[pipeline]") {
    auto r = format_file("/definitely/not/here.ts", PipelineOptions(), FormatMode::Check);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TsorgError::IO);
}
