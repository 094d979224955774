#pragma once

#include <tsorg/comments/classifier.hpp>
#include <tsorg/comments/identity.hpp>
#include <tsorg/lang/ast.hpp>
#include <tsorg/lang/comment_store.hpp>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tsorg {

enum class CommentRole { Leading, Trailing };

const char* role_name(CommentRole role);

// A comment owned by a node identity
struct ExtractedComment {
    NodeIdentity identity = 0;
    CommentRole role = CommentRole::Leading;
    Comment comment;
    int ordinal = 0;            // order among same-role comments of the node
    std::string source_indent;  // indentation of the comment's original line
};

// A comment owned by no node. It keeps its neighbours in its sibling list:
// above `next` when it sat between two siblings, otherwise at the head or
// the tail of the list. With no positioned sibling it goes back to
// original_line.
struct StandaloneComment {
    Comment comment;
    size_t original_line = 0;   // 0-based
    int nesting_depth = 0;
    std::string indentation;
    std::optional<NodeIdentity> next;    // sibling the comment introduces
    bool after_siblings = false;         // no identified sibling follows it
    std::vector<NodeIdentity> siblings;  // identified nodes of its list
};

struct ExtractionResult {
    std::map<NodeIdentity, std::vector<ExtractedComment>> by_identity;
    std::vector<StandaloneComment> standalone;
    // Start bytes of every comment moved out of the tree (extracted or
    // standalone). The rest stay in the printed text.
    std::unordered_set<uint32_t> claimed;

    size_t extracted_count() const;
};

// Pair every non-inline comment with the identity of its owning node.
// Standalone comments and comments in gaps between nodes go to
// `standalone`; a trailing comment on a later line than its node moves to
// the next sibling when nothing separates them. Never fails.
ExtractionResult extract(const Module& module, const CommentStore& store,
                         const std::string& source);

ExtractionResult extract(const Module& module, const CommentStore& store,
                         const std::string& source,
                         const ClassificationMap& classes);

} // namespace tsorg
