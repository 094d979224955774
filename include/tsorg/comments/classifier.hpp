#pragma once

#include <tsorg/lang/token.hpp>
#include <tsorg/line_index.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace tsorg {

// Structural role of a comment relative to the code around it
enum class Classification {
    Inline,      // inside an expression; stays in the printed text
    Leading,     // on its own line, documents the code below
    Trailing,    // after code on the same line
    Standalone   // isolated by blank lines; owned by no node
};

const char* classification_name(Classification c);

// Classification from the text around the comment only:
//
//   code before | code after | result
//   ------------+------------+------------------------------------------
//   yes         | yes        | Inline
//   yes         | no         | Trailing
//   no          | yes        | Inline
//   no          | no         | Standalone if blank-line isolated, Leading
Classification classify(const Comment& comment, const std::string& source);
Classification classify(const Comment& comment, const LineIndex& lines,
                        const std::string& source);

// Keyed by the comment's start byte
using ClassificationMap = std::unordered_map<uint32_t, Classification>;

ClassificationMap classify_all(const std::vector<Comment>& comments,
                               const std::string& source);

} // namespace tsorg
