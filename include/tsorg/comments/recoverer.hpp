#pragma once

#include <tsorg/comments/identity.hpp>
#include <tsorg/lang/ast.hpp>
#include <tsorg/result.hpp>
#include <string>
#include <unordered_map>

namespace tsorg {

// Where a node landed in regenerated text. Lines and columns are 0-based.
struct NodePosition {
    size_t start_line = 0;
    size_t end_line = 0;
    size_t end_column = 0;
    std::string indentation;  // leading whitespace of start_line
};

using PositionMap = std::unordered_map<NodeIdentity, NodePosition>;

// Positions of every identified node of an already parsed tree over `text`.
// The first occurrence of an identity wins.
PositionMap collect_positions(const Module& module, const std::string& text);

// Re-lex and re-parse regenerated text, then collect its positions
Result<PositionMap> recover(const std::string& skeleton,
                            const std::string& filename = "<skeleton>",
                            bool jsx = false);

} // namespace tsorg
