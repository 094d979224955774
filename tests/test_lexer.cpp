#include <catch2/catch.hpp>
#include <tsorg/lang/lexer.hpp>

using namespace tsorg;

static std::vector<TsTokenType> types_of(const LexResult& r) {
    std::vector<TsTokenType> out;
    for (const auto& t : r.tokens) out.push_back(t.type);
    return out;
}

// ===== Basic tokenization =====

TEST_CASE("lex empty string", "[lexer]") {
    auto r = lex("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens.size() == 1); // just Eof
    REQUIRE(r.value().tokens[0].type == TsTokenType::Eof);
}

TEST_CASE("lex single identifier", "[lexer]") {
    auto r = lex("foo");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens.size() == 2); // foo + Eof
    REQUIRE(r.value().tokens[0].type == TsTokenType::Identifier);
    REQUIRE(r.value().tokens[0].text == "foo");
    REQUIRE(r.value().tokens[0].span.lo == 0);
    REQUIRE(r.value().tokens[0].span.hi == 3);
}

TEST_CASE("lex reserved words", "[lexer]") {
    auto r = lex("import export function class const enum");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks[0].type == TsTokenType::KwImport);
    REQUIRE(toks[1].type == TsTokenType::KwExport);
    REQUIRE(toks[2].type == TsTokenType::KwFunction);
    REQUIRE(toks[3].type == TsTokenType::KwClass);
    REQUIRE(toks[4].type == TsTokenType::KwConst);
    REQUIRE(toks[5].type == TsTokenType::KwEnum);
}

TEST_CASE("contextual words stay identifiers", "[lexer]") {
    auto r = lex("type interface from as");
    REQUIRE(r.is_ok());
    for (size_t i = 0; i < 4; ++i) {
        REQUIRE(r.value().tokens[i].type == TsTokenType::Identifier);
    }
}

TEST_CASE("keywords after a dot are property names", "[lexer]") {
    auto r = lex("obj.default?.class");
    REQUIRE(r.is_ok());
    auto types = types_of(r.value());
    REQUIRE(types == std::vector<TsTokenType>{
        TsTokenType::Identifier, TsTokenType::Dot, TsTokenType::Identifier,
        TsTokenType::QuestionDot, TsTokenType::Identifier, TsTokenType::Eof});
}

TEST_CASE("lex private names", "[lexer]") {
    auto r = lex("this.#count");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens[2].type == TsTokenType::PrivateName);
    REQUIRE(r.value().tokens[2].text == "#count");
}

TEST_CASE("lex numbers", "[lexer]") {
    auto r = lex("42 3.14 0xff 1e-3 10n 1_000");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks.size() == 7);
    for (size_t i = 0; i < 6; ++i) REQUIRE(toks[i].type == TsTokenType::Number);
    REQUIRE(toks[2].text == "0xff");
    REQUIRE(toks[3].text == "1e-3");
    REQUIRE(toks[4].text == "10n");
}

TEST_CASE("lex strings with escapes", "[lexer]") {
    auto r = lex(R"('it\'s' "a \"b\"")");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks[0].type == TsTokenType::String);
    REQUIRE(toks[0].text == R"('it\'s')");
    REQUIRE(toks[1].type == TsTokenType::String);
}

TEST_CASE("template literal is one token including substitutions", "[lexer]") {
    auto r = lex("const s = `a ${b + `c${d}`} // not a comment`;");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks[3].type == TsTokenType::Template);
    REQUIRE(toks[4].type == TsTokenType::Semicolon);
    REQUIRE(r.value().comments.empty());
}

TEST_CASE("operators", "[lexer]") {
    auto r = lex("a => b ?? c === d ... e");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks[1].type == TsTokenType::Arrow);
    REQUIRE(toks[3].type == TsTokenType::Operator);
    REQUIRE(toks[3].text == "??");
    REQUIRE(toks[5].text == "===");
    REQUIRE(toks[7].type == TsTokenType::Ellipsis);
}

TEST_CASE("greater-than is always a single token", "[lexer]") {
    auto r = lex("Map<string, Array<number>>");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks[toks.size() - 2].type == TsTokenType::Greater);
    REQUIRE(toks[toks.size() - 3].type == TsTokenType::Greater);
}

// ===== Regex vs division =====

TEST_CASE("slash after expression is division", "[lexer]") {
    auto r = lex("a / b / c");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens[1].type == TsTokenType::Slash);
    REQUIRE(r.value().tokens[3].type == TsTokenType::Slash);
}

TEST_CASE("slash in expression position is a regex", "[lexer]") {
    auto r = lex("const re = /[/]+\\d/gi;");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks[3].type == TsTokenType::Regex);
    REQUIRE(toks[3].text == "/[/]+\\d/gi");
}

// ===== Comments =====

TEST_CASE("line and block comments are preserved", "[lexer]") {
    auto r = lex("// one\nconst a = 1; /* two */\n/** doc\n * more */");
    REQUIRE(r.is_ok());
    auto& cs = r.value().comments;
    REQUIRE(cs.size() == 3);
    REQUIRE(cs[0].kind == CommentKind::Line);
    REQUIRE(cs[0].text == " one");
    REQUIRE(cs[0].pos.line == 1);
    REQUIRE(cs[1].kind == CommentKind::Block);
    REQUIRE(cs[1].text == " two ");
    REQUIRE(cs[2].text == "* doc\n * more ");
    REQUIRE(cs[2].pos.line == 3);
}

TEST_CASE("comment render reproduces source bytes", "[lexer]") {
    std::string src = "x; //  spaced  \n/*\n  block\n*/";
    auto r = lex(src);
    REQUIRE(r.is_ok());
    for (const auto& c : r.value().comments) {
        REQUIRE(c.render() == src.substr(c.span.lo, c.span.hi - c.span.lo));
    }
}

TEST_CASE("newline_before tracks line breaks", "[lexer]") {
    auto r = lex("a\nb /* x\n */ c");
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE_FALSE(toks[0].newline_before);
    REQUIRE(toks[1].newline_before);
    REQUIRE(toks[2].newline_before);
}

TEST_CASE("shebang is a single leading token", "[lexer]") {
    auto r = lex("#!/usr/bin/env node\nrun();");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens[0].type == TsTokenType::Unknown);
    REQUIRE(r.value().tokens[0].text == "#!/usr/bin/env node");
}

// ===== Markup =====

TEST_CASE("markup element tokens", "[lexer]") {
    auto r = lex("const el = <div key=\"a\" {...rest} onClick={go}>hi</div>;", "<input>", true);
    REQUIRE(r.is_ok());
    auto types = types_of(r.value());
    std::vector<TsTokenType> expected = {
        TsTokenType::KwConst, TsTokenType::Identifier, TsTokenType::Assign,
        TsTokenType::JsxTagOpen, TsTokenType::JsxName,
        TsTokenType::JsxName, TsTokenType::Assign, TsTokenType::String,
        TsTokenType::JsxExprStart, TsTokenType::Ellipsis, TsTokenType::Identifier,
        TsTokenType::JsxExprEnd,
        TsTokenType::JsxName, TsTokenType::Assign,
        TsTokenType::JsxExprStart, TsTokenType::Identifier, TsTokenType::JsxExprEnd,
        TsTokenType::JsxTagEnd, TsTokenType::JsxText,
        TsTokenType::JsxCloseOpen, TsTokenType::JsxName, TsTokenType::JsxTagEnd,
        TsTokenType::Semicolon, TsTokenType::Eof};
    REQUIRE(types == expected);
}

TEST_CASE("self-closing element", "[lexer]") {
    auto r = lex("f(<Icon name=\"x\" />)", "<input>", true);
    REQUIRE(r.is_ok());
    auto& toks = r.value().tokens;
    REQUIRE(toks[2].type == TsTokenType::JsxTagOpen);
    REQUIRE(toks[toks.size() - 3].type == TsTokenType::JsxSelfClose);
}

TEST_CASE("generic arrow is not markup", "[lexer]") {
    auto r = lex("const id = <T,>(x: T) => x;", "<input>", true);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens[3].type == TsTokenType::Less);
}

TEST_CASE("angle brackets are comparisons without markup", "[lexer]") {
    auto r = lex("a <b> c", "<input>", false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens[1].type == TsTokenType::Less);
}

TEST_CASE("detect_jsx by extension and content", "[lexer]") {
    REQUIRE(detect_jsx("App.tsx", ""));
    REQUIRE_FALSE(detect_jsx("app.ts", "<div></div>"));
    REQUIRE_FALSE(detect_jsx("lib.mts", "<a/>"));
    REQUIRE(detect_jsx("<input>", "const x = <div>hi</div>;"));
    REQUIRE_FALSE(detect_jsx("<input>", "if (a < b) {}"));
}

TEST_CASE("token positions are 1-based line and column", "[lexer]") {
    auto r = lex("a\n  bb");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tokens[1].pos.line == 2);
    REQUIRE(r.value().tokens[1].pos.col == 3);
}
