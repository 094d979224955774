#pragma once

#include <tsorg/lang/ts_token.hpp>
#include <tsorg/result.hpp>
#include <string>
#include <vector>

namespace tsorg {

struct LexResult {
    std::vector<TsToken> tokens;
    std::vector<Comment> comments;
    bool jsx = false;
};

// Lex TypeScript source into tokens + preserved comments.
// The jsx flag enables markup elements (TSX).
Result<LexResult> lex(const std::string& source,
                      const std::string& filename = "<input>",
                      bool jsx = false);

// Markup is enabled for .tsx/.jsx files and for sources that look like
// they contain elements.
bool detect_jsx(const std::string& filename, const std::string& source);

} // namespace tsorg
