#pragma once

#include <tsorg/lang/ast.hpp>
#include <tsorg/lang/comment_store.hpp>
#include <tsorg/lang/lexer.hpp>
#include <tsorg/result.hpp>
#include <string>
#include <vector>

namespace tsorg {

struct ParseResult {
    Module module;
    CommentStore comments;
    std::vector<Diagnostic> diagnostics;
};

// Parse a lexed TypeScript file into the structural tree and anchor its
// comments. Always produces partial results even on errors (diagnostics
// accumulate); unrecognized regions become opaque statements.
Result<ParseResult> parse(const LexResult& lex_result,
                          const std::string& source,
                          const std::string& filename = "<input>");

// Lex + parse with markup detection from the filename and text
Result<ParseResult> parse_source(const std::string& source,
                                 const std::string& filename = "<input>");

} // namespace tsorg
