#pragma once

#include <tsorg/comments/extractor.hpp>
#include <tsorg/comments/recoverer.hpp>
#include <tsorg/result.hpp>
#include <string>
#include <vector>

namespace tsorg {

// One splice into the skeleton. For leading and standalone comments `line`
// is the line after which the comment goes (-1 is the top of the text).
// Standalone points use the leading role with negative ordinals so they land
// above the node's own leading comments.
struct InsertionPoint {
    long line = 0;
    size_t column = 0;
    CommentRole role = CommentRole::Leading;
    int ordinal = 0;
    bool standalone = false;   // padded with blank lines
    std::string text;          // rendered comment, possibly several lines
    std::string indentation;
    std::string source_indent;
};

// Insertion points for every extracted comment and every standalone comment
// with a positioned sibling, in application order. MissingPosition error
// naming every identity without a position, or whose position lies outside
// the skeleton.
Result<std::vector<InsertionPoint>> plan_insertions(const ExtractionResult& extraction,
                                                    const std::string& skeleton,
                                                    const PositionMap& positions);

// Splice extracted and standalone comments back into regenerated text.
// Never returns partial output.
Result<std::string> reinsert(const ExtractionResult& extraction,
                             const std::string& skeleton,
                             const PositionMap& positions);

} // namespace tsorg
