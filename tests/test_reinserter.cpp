#include <catch2/catch.hpp>
#include <tsorg/comments/reinserter.hpp>

using namespace tsorg;

static Comment line_comment(const std::string& text) {
    Comment c;
    c.kind = CommentKind::Line;
    c.text = text;
    return c;
}

static Comment block_comment(const std::string& text) {
    Comment c;
    c.kind = CommentKind::Block;
    c.text = text;
    return c;
}

static void own(ExtractionResult& ex, NodeIdentity id, CommentRole role,
                const Comment& c, int ordinal, const std::string& source_indent = "") {
    ExtractedComment ec;
    ec.identity = id;
    ec.role = role;
    ec.comment = c;
    ec.ordinal = ordinal;
    ec.source_indent = source_indent;
    ex.by_identity[id].push_back(ec);
}

static NodePosition at(size_t start, size_t end, size_t end_column,
                       const std::string& indentation = "") {
    NodePosition p;
    p.start_line = start;
    p.end_line = end;
    p.end_column = end_column;
    p.indentation = indentation;
    return p;
}

static std::string reinsert_ok(const ExtractionResult& ex, const std::string& skeleton,
                               const PositionMap& positions) {
    auto r = reinsert(ex, skeleton, positions);
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== Leading =====

TEST_CASE("leading comment goes above its node", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 1, CommentRole::Leading, line_comment(" lead"), 0);
    PositionMap positions = {{1, at(0, 0, 14)}};
    REQUIRE(reinsert_ok(ex, "function foo(){}", positions) == "// lead\nfunction foo(){}");
}

TEST_CASE("leading comments keep their ordinal order", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 1, CommentRole::Leading, line_comment(" one"), 0);
    own(ex, 1, CommentRole::Leading, line_comment(" two"), 1);
    PositionMap positions = {{1, at(1, 1, 6)}};
    REQUIRE(reinsert_ok(ex, "a();\nfoo();", positions) == "a();\n// one\n// two\nfoo();");
}

TEST_CASE("leading comment takes the node indentation", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 7, CommentRole::Leading, block_comment("*\n   * doc\n   "), 0, "  ");
    PositionMap positions = {{7, at(1, 1, 10, "    ")}};
    REQUIRE(reinsert_ok(ex, "class A {\n    m() {}\n}", positions) ==
            "class A {\n    /**\n     * doc\n     */\n    m() {}\n}");
}

TEST_CASE("leading comment goes above an unowned preamble line", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 1, CommentRole::Leading, line_comment(" c"), 0);
    PositionMap positions = {{1, at(3, 3, 6)}};
    REQUIRE(reinsert_ok(ex, "x();\n\npreamble\nfoo();", positions) ==
            "x();\n\n// c\npreamble\nfoo();");
}

TEST_CASE("leading comment stays below a line owned by another node", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 1, CommentRole::Leading, line_comment(" c"), 0);
    PositionMap positions = {{1, at(3, 3, 6)}, {2, at(2, 2, 4)}};
    REQUIRE(reinsert_ok(ex, "x();\n\ny();\nfoo();", positions) ==
            "x();\n\ny();\n// c\nfoo();");
}

// ===== Trailing =====

TEST_CASE("trailing comment is appended to the node's last line", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 1, CommentRole::Trailing, line_comment(" ans"), 0);
    PositionMap positions = {{1, at(0, 0, 12)}};
    REQUIRE(reinsert_ok(ex, "const x = 1;", positions) == "const x = 1; // ans");
}

TEST_CASE("several trailing comments keep source order", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 1, CommentRole::Trailing, block_comment(" a "), 0);
    own(ex, 1, CommentRole::Trailing, block_comment(" b "), 1);
    PositionMap positions = {{1, at(0, 0, 6)}};
    REQUIRE(reinsert_ok(ex, "foo();", positions) == "foo(); /* a */ /* b */");
}

TEST_CASE("leading and trailing on the same node", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 1, CommentRole::Leading, line_comment(" doc"), 0);
    own(ex, 1, CommentRole::Trailing, line_comment(" end"), 0);
    PositionMap positions = {{1, at(0, 2, 1)}};
    REQUIRE(reinsert_ok(ex, "f({\n  a,\n});", positions) == "// doc\nf({\n  a,\n}); // end");
}

// ===== Standalone =====

TEST_CASE("standalone comment is padded with blank lines", "[reinserter]") {
    ExtractionResult ex;
    StandaloneComment s;
    s.comment = line_comment(" note");
    s.original_line = 2;
    ex.standalone.push_back(s);
    REQUIRE(reinsert_ok(ex, "a();\nb();\nc();\nd();", {}) ==
            "a();\nb();\n\n// note\n\nc();\nd();");
}

TEST_CASE("standalone comments on one line stay together", "[reinserter]") {
    ExtractionResult ex;
    StandaloneComment first;
    first.comment = block_comment(" a ");
    first.comment.span = {0, 7};
    first.original_line = 0;
    StandaloneComment second = first;
    second.comment = block_comment(" b ");
    second.comment.span = {8, 15};
    ex.standalone.push_back(second);
    ex.standalone.push_back(first);
    REQUIRE(reinsert_ok(ex, "x();", {}) == "/* a */ /* b */\n\nx();");
}

TEST_CASE("standalone comment past the end is appended", "[reinserter]") {
    ExtractionResult ex;
    StandaloneComment s;
    s.comment = line_comment(" tail");
    s.original_line = 40;
    ex.standalone.push_back(s);
    REQUIRE(reinsert_ok(ex, "x();", {}) == "x();\n\n// tail");
}

TEST_CASE("comment-only result from an empty skeleton", "[reinserter]") {
    ExtractionResult ex;
    StandaloneComment s;
    s.comment = line_comment(" only");
    ex.standalone.push_back(s);
    REQUIRE(reinsert_ok(ex, "", {}) == "// only");
}

// ===== Standalone next to its siblings =====

static StandaloneComment standalone_note(const std::string& text,
                                         std::vector<NodeIdentity> siblings) {
    StandaloneComment s;
    s.comment = line_comment(text);
    s.original_line = 40;
    s.siblings = std::move(siblings);
    return s;
}

TEST_CASE("standalone comment stays above the sibling it introduced", "[reinserter]") {
    ExtractionResult ex;
    auto s = standalone_note(" note", {1, 2});
    s.next = 2;
    ex.standalone.push_back(s);
    PositionMap positions = {{2, at(0, 0, 4)}, {1, at(1, 1, 4)}};
    REQUIRE(reinsert_ok(ex, "a();\nb();", positions) == "// note\n\na();\nb();");
}

TEST_CASE("standalone comment goes above the node's own comments", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 2, CommentRole::Leading, line_comment(" doc"), 0);
    auto s = standalone_note(" section", {1, 2});
    s.next = 2;
    ex.standalone.push_back(s);
    PositionMap positions = {{1, at(0, 0, 4)}, {2, at(1, 1, 4)}};
    REQUIRE(reinsert_ok(ex, "b();\na();", positions) ==
            "b();\n\n// section\n\n// doc\na();");
}

TEST_CASE("standalone comment at the head goes above the first sibling", "[reinserter]") {
    ExtractionResult ex;
    ex.standalone.push_back(standalone_note(" header", {1, 2}));
    PositionMap positions = {{2, at(0, 0, 4)}, {1, at(1, 1, 4)}};
    REQUIRE(reinsert_ok(ex, "a();\nb();", positions) == "// header\n\na();\nb();");
}

TEST_CASE("standalone comment at the tail goes below the last sibling", "[reinserter]") {
    ExtractionResult ex;
    auto s = standalone_note(" end", {1, 2});
    s.after_siblings = true;
    ex.standalone.push_back(s);
    PositionMap positions = {{1, at(1, 1, 8, "  ")}, {2, at(2, 2, 8, "  ")}};
    REQUIRE(reinsert_ok(ex, "class C {\n  a() {}\n  b() {}\n}", positions) ==
            "class C {\n  a() {}\n  b() {}\n\n  // end\n\n}");
}

TEST_CASE("standalone comment takes the sibling indentation", "[reinserter]") {
    ExtractionResult ex;
    auto s = standalone_note(" section", {1, 2});
    s.indentation = "  ";
    s.next = 2;
    ex.standalone.push_back(s);
    PositionMap positions = {{1, at(2, 2, 10, "    ")}, {2, at(1, 1, 10, "    ")}};
    REQUIRE(reinsert_ok(ex, "class C {\n    a() {}\n    z() {}\n}", positions) ==
            "class C {\n\n    // section\n\n    a() {}\n    z() {}\n}");
}

TEST_CASE("standalone comments before one sibling keep source order", "[reinserter]") {
    ExtractionResult ex;
    auto first = standalone_note(" one", {1, 2});
    first.next = 2;
    first.original_line = 2;
    first.comment.span = {5, 11};
    auto second = first;
    second.comment = line_comment(" two");
    second.original_line = 4;
    second.comment.span = {13, 19};
    ex.standalone.push_back(second);
    ex.standalone.push_back(first);
    PositionMap positions = {{1, at(0, 0, 4)}, {2, at(1, 1, 4)}};
    REQUIRE(reinsert_ok(ex, "b();\na();", positions) ==
            "b();\n\n// one\n\n// two\n\na();");
}

// ===== Failures =====

TEST_CASE("missing positions name every lost node", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 0x2a, CommentRole::Leading, line_comment(" a"), 0);
    own(ex, 0x10, CommentRole::Leading, line_comment(" b"), 0);
    own(ex, 0x10, CommentRole::Trailing, line_comment(" c"), 0);
    own(ex, 0x99, CommentRole::Leading, line_comment(" kept"), 0);
    PositionMap positions = {{0x99, at(0, 0, 4)}};

    auto r = reinsert(ex, "x();", positions);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TsorgError::MissingPosition);
    REQUIRE(r.error().message ==
            "Failed to find positions for 2 nodes with comments:\n"
            "No position found for node with hash 0000000000000010 (has 2 comments)\n"
            "No position found for node with hash 000000000000002a (has 1 comments)");
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("plan lists insertions in application order", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 1, CommentRole::Leading, line_comment(" top"), 0);
    own(ex, 2, CommentRole::Leading, line_comment(" bottom"), 0);
    own(ex, 2, CommentRole::Trailing, line_comment(" t"), 0);
    PositionMap positions = {{1, at(0, 0, 4)}, {2, at(1, 1, 4)}};
    auto r = plan_insertions(ex, "a();\nb();", positions);
    REQUIRE(r.is_ok());
    const auto& points = r.value();
    REQUIRE(points.size() == 3);
    REQUIRE(points[0].line == 1);
    REQUIRE(points[0].role == CommentRole::Trailing);
    REQUIRE(points[1].line == 0);
    REQUIRE(points[1].text == "// bottom");
    REQUIRE(points[2].line == -1);
}

TEST_CASE("position outside the skeleton is a missing position", "[reinserter]") {
    ExtractionResult ex;
    own(ex, 0x7, CommentRole::Trailing, line_comment(" t"), 0);
    PositionMap positions = {{0x7, at(3, 3, 0)}};

    auto r = reinsert(ex, "x();", positions);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TsorgError::MissingPosition);
    REQUIRE(r.error().message ==
            "Failed to find positions for 1 nodes with comments:\n"
            "Position for node with hash 0000000000000007 lies outside the "
            "regenerated text (has 1 comments)");
}
