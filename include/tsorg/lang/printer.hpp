#pragma once

#include <tsorg/lang/ast.hpp>
#include <tsorg/lang/comment_store.hpp>
#include <string>
#include <vector>

namespace tsorg {

struct PrintOptions {
    // Indentation width used when the source shows no indentation to copy
    int indent_width = 4;
};

// Regenerate source text from a (possibly reordered) tree. Node text is
// copied from `source` by span; class, enum, object literal and markup
// attribute lists are rebuilt in their current child order.
//
// `comments` lists every comment of `source`. Comments present in `keep`
// are printed in place; every other comment is removed. With keep == nullptr
// no comment is printed. The result has no trailing newline.
std::string print(const Module& module, const std::string& source,
                  const std::vector<Comment>& comments,
                  const CommentStore* keep,
                  const PrintOptions& options = PrintOptions());

// Indentation unit of the source: a tab, the smallest non-zero run of
// leading spaces, or `fallback_width` spaces
std::string detect_indent_unit(const std::string& source, int fallback_width);

} // namespace tsorg
