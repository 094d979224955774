#include <catch2/catch.hpp>
#include <tsorg/format/organizer.hpp>
#include <tsorg/lang/parser.hpp>

using namespace tsorg;

static Module parse_module(const std::string& src, const std::string& fname = "<test>.ts") {
    auto r = parse_source(src, fname);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().diagnostics.empty());
    return std::move(r.value().module);
}

static std::vector<std::string> names_of(const std::vector<Node>& nodes) {
    std::vector<std::string> out;
    for (const auto& n : nodes) out.push_back(n.name);
    return out;
}

static std::vector<NodeKind> kinds_of(const std::vector<Node>& nodes) {
    std::vector<NodeKind> out;
    for (const auto& n : nodes) out.push_back(n.kind);
    return out;
}

static Node make_attr(const std::string& name, PropKind kind = PropKind::KeyValue) {
    Node n;
    n.kind = NodeKind::JsxAttribute;
    n.name = name;
    n.prop_kind = kind;
    return n;
}

// ===== Top-level layout =====

TEST_CASE("organize imports by category then path", "[organizer]") {
    auto m = organize(parse_module(
        "import b from './b';\n"
        "import r from 'react';\n"
        "import a from '@/a';\n"
        "import z from 'zod';\n"
        "import c from '../c';\n"));
    std::vector<std::string> sources;
    for (const auto& n : m.items) sources.push_back(n.source);
    REQUIRE(sources == std::vector<std::string>{"react", "zod", "@/a", "../c", "./b"});
}

TEST_CASE("organize top-level sections", "[organizer]") {
    auto m = organize(parse_module(
        "'use strict';\n"
        "foo();\n"
        "export { a };\n"
        "function a() {}\n"
        "import x from 'x';\n"
        "export * from './all';\n"));
    REQUIRE(kinds_of(m.items) == std::vector<NodeKind>{
        NodeKind::Statement, NodeKind::Import, NodeKind::ExportAll,
        NodeKind::Function, NodeKind::Statement, NodeKind::ExportList});
    REQUIRE(m.items[0].is_directive);
}

TEST_CASE("export default stays last", "[organizer]") {
    auto m = organize(parse_module(
        "export default function main() {}\nfunction b() {}\n"));
    REQUIRE(m.items.back().kind == NodeKind::ExportDefault);
}

// ===== Declarations =====

TEST_CASE("exported declarations follow their hoisted helpers", "[organizer]") {
    auto m = organize(parse_module(
        "function helper() {}\n"
        "function zeta() {}\n"
        "export function main() { return helper(); }\n"
        "function alpha() {}\n"));
    REQUIRE(names_of(m.items) ==
            std::vector<std::string>{"helper", "main", "alpha", "zeta"});
}

TEST_CASE("dependencies come before their users", "[organizer]") {
    auto m = organize(parse_module(
        "export function b() {}\nexport function a() { return b(); }\n"));
    REQUIRE(names_of(m.items) == std::vector<std::string>{"b", "a"});
}

TEST_CASE("export lists make declarations public", "[organizer]") {
    auto m = organize(parse_module(
        "function b() {}\nfunction a() {}\nexport { b };\n"));
    REQUIRE(m.items.size() == 3);
    REQUIRE(m.items[0].name == "b");
    REQUIRE(m.items[1].name == "a");
    REQUIRE(m.items[2].kind == NodeKind::ExportList);
}

TEST_CASE("export default identifier makes its declaration public", "[organizer]") {
    auto m = organize(parse_module(
        "const b = 1;\nconst a = 2;\nexport default b;\n"));
    REQUIRE(m.items[0].name == "b");
    REQUIRE(m.items[1].name == "a");
}

TEST_CASE("names sort case-insensitively", "[organizer]") {
    auto m = organize(parse_module("function beta() {}\nfunction Alpha() {}\n"));
    REQUIRE(names_of(m.items) == std::vector<std::string>{"Alpha", "beta"});
}

TEST_CASE("overloads stay together in source order", "[organizer]") {
    auto m = organize(parse_module(
        "function f(a: string): void;\n"
        "function f(a: number): void;\n"
        "function f(a: any) {}\n"
        "function e() {}\n"));
    REQUIRE(names_of(m.items) == std::vector<std::string>{"e", "f", "f", "f"});
    REQUIRE(m.items[1].sig.params[0].type_tag == "string");
    REQUIRE(m.items[3].sig.params[0].type_tag == "any");
}

TEST_CASE("mutually recursive declarations are emitted once", "[organizer]") {
    auto m = organize(parse_module(
        "function b() { return a(); }\nfunction a() { return b(); }\n"));
    REQUIRE(m.items.size() == 2);
    REQUIRE(names_of(m.items) == std::vector<std::string>{"a", "b"});
}

TEST_CASE("statements keep their relative order", "[organizer]") {
    auto m = organize(parse_module("second();\nfunction f() {}\nfirst();\n"));
    REQUIRE(m.items[0].name == "f");
    REQUIRE(m.items[1].fingerprint == "second ( ) ;");
    REQUIRE(m.items[2].fingerprint == "first ( ) ;");
}

TEST_CASE("disabled import and declaration rules leave the order", "[organizer]") {
    OrganizeConfig config;
    config.imports = false;
    config.declarations = false;
    auto m = organize(parse_module("function b() {}\nimport x from 'x';\nfunction a() {}\n"),
                      config);
    REQUIRE(kinds_of(m.items) == std::vector<NodeKind>{
        NodeKind::Function, NodeKind::Import, NodeKind::Function});
    REQUIRE(m.items[0].name == "b");
}

TEST_CASE("disabled declaration rule only moves imports", "[organizer]") {
    OrganizeConfig config;
    config.declarations = false;
    auto m = organize(parse_module(
        "function b() {}\nimport y from 'y';\nfunction a() {}\nimport x from 'x';\n"),
        config);
    REQUIRE(names_of(m.items) == std::vector<std::string>{"x", "y", "b", "a"});
}

TEST_CASE("declared names split destructuring patterns", "[organizer]") {
    auto m = parse_module("const { x, y: z } = o;\nvar [p, ...q] = arr;\nfunction f() {}\n");
    REQUIRE(declared_names(m.items[0]) == std::vector<std::string>{"x", "z"});
    REQUIRE(declared_names(m.items[1]) == std::vector<std::string>{"p", "q"});
    REQUIRE(declared_names(m.items[2]) == std::vector<std::string>{"f"});
}

TEST_CASE("dependency graph links references", "[organizer]") {
    auto m = parse_module("const a = 1;\nfunction f() { return a; }\nfunction g() {}\n");
    auto graph = dependency_graph(m.items);
    REQUIRE(graph.node_count() == 3);
    REQUIRE(graph.inner().has_edge(graph.node_id("f"), graph.node_id("a")));
    REQUIRE_FALSE(graph.inner().has_edge(graph.node_id("a"), graph.node_id("f")));
    REQUIRE(graph.reachable("g").empty());
}

// ===== Containers =====

TEST_CASE("class members sort by category then name", "[organizer]") {
    auto m = organize(parse_module(
        "class A {\n"
        "  m() {}\n"
        "  #p = 1;\n"
        "  static s = 1;\n"
        "  constructor() {}\n"
        "  b = 2;\n"
        "  a() {}\n"
        "}\n"));
    REQUIRE(names_of(m.items[0].children) ==
            std::vector<std::string>{"s", "b", "#p", "constructor", "a", "m"});
}

TEST_CASE("private names sort without their marker", "[organizer]") {
    auto m = parse_module("class A {\n  #b = 1;\n  #a = 2;\n}\n");
    sort_class_members(m.items[0].children);
    REQUIRE(names_of(m.items[0].children) == std::vector<std::string>{"#a", "#b"});
}

TEST_CASE("object properties sort between spreads", "[organizer]") {
    auto m = organize(parse_module("const o = { d: 1, c: 2, ...x, b: 3, A: 4 };"));
    REQUIRE(names_of(m.items[0].embedded[0].children) ==
            std::vector<std::string>{"c", "d", "...", "A", "b"});
}

TEST_CASE("nested objects are organized", "[organizer]") {
    auto m = organize(parse_module("function f() { return { b: 1, a: { z: 1, y: 2 } }; }"));
    const auto& obj = m.items[0].embedded.at(0);
    REQUIRE(names_of(obj.children) == std::vector<std::string>{"a", "b"});
    REQUIRE(names_of(obj.children[0].embedded.at(0).children) ==
            std::vector<std::string>{"y", "z"});
}

TEST_CASE("markup attributes sort by category", "[organizer]") {
    std::vector<Node> attrs = {
        make_attr("onClick"), make_attr("id"), make_attr("key"),
        make_attr("className"), make_attr("ref"), make_attr("once")};
    sort_jsx_attributes(attrs);
    REQUIRE(names_of(attrs) == std::vector<std::string>{
        "key", "ref", "className", "id", "once", "onClick"});
}

TEST_CASE("markup spread attributes are barriers", "[organizer]") {
    std::vector<Node> attrs = {
        make_attr("b"), make_attr("a"), make_attr("...", PropKind::Spread),
        make_attr("d"), make_attr("c")};
    sort_jsx_attributes(attrs);
    REQUIRE(names_of(attrs) == std::vector<std::string>{"a", "b", "...", "c", "d"});
}

TEST_CASE("markup attributes in a tree are organized", "[organizer]") {
    auto m = organize(parse_module("const el = <A b=\"1\" key=\"k\" />;", "view.tsx"));
    REQUIRE(names_of(m.items[0].embedded.at(0).children) ==
            std::vector<std::string>{"key", "b"});
}

TEST_CASE("string enums sort", "[organizer]") {
    auto m = parse_module("enum E { B = 'b', a = 'a' }");
    REQUIRE(sort_enum_members(m.items[0].children));
    REQUIRE(names_of(m.items[0].children) == std::vector<std::string>{"a", "B"});
}

TEST_CASE("enums with implicit values keep their order", "[organizer]") {
    auto m = parse_module("enum E { B, A = 'a' }");
    REQUIRE_FALSE(sort_enum_members(m.items[0].children));
    REQUIRE(names_of(m.items[0].children) == std::vector<std::string>{"B", "A"});
}

TEST_CASE("disabled container rules leave children alone", "[organizer]") {
    OrganizeConfig config;
    config.class_members = false;
    config.object_properties = false;
    auto m = organize(parse_module("class A {\n  b() {}\n  a() {}\n}\nconst o = { b: 1, a: 2 };\n"),
                      config);
    for (const auto& item : m.items) {
        if (item.kind == NodeKind::Class) {
            REQUIRE(names_of(item.children) == std::vector<std::string>{"b", "a"});
        } else {
            REQUIRE(names_of(item.embedded[0].children) == std::vector<std::string>{"b", "a"});
        }
    }
}
