#pragma once

#include <tsorg/lang/ts_token.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tsorg {

// Position-keyed comment store. A comment is anchored either as leading
// of the token starting at a byte, or as trailing of the token ending there.
class CommentStore {
public:
    void add_leading(uint32_t pos, Comment c);
    void add_trailing(uint32_t pos, Comment c);

    // Comments anchored at pos in source order; empty when none
    const std::vector<Comment>& get_leading(uint32_t pos) const;
    const std::vector<Comment>& get_trailing(uint32_t pos) const;

    bool has_leading(uint32_t pos) const { return leading_.count(pos) > 0; }
    bool has_trailing(uint32_t pos) const { return trailing_.count(pos) > 0; }

    // True when a comment starting at lo is stored under any anchor
    bool contains(uint32_t comment_lo) const;

    // Every stored comment, sorted by position
    std::vector<Comment> all() const;

    size_t size() const;
    bool empty() const { return size() == 0; }

    // Copy keeping only comments for which keep(comment) is true
    CommentStore filtered(const std::function<bool(const Comment&)>& keep) const;

    const std::map<uint32_t, std::vector<Comment>>& leading() const { return leading_; }
    const std::map<uint32_t, std::vector<Comment>>& trailing() const { return trailing_; }

private:
    std::map<uint32_t, std::vector<Comment>> leading_;
    std::map<uint32_t, std::vector<Comment>> trailing_;
};

// Anchor each comment to the surrounding tokens:
//   same line as the previous token       -> trailing of that token
//   otherwise before a non-closing token  -> leading of the next token
//   otherwise                             -> trailing of the previous token
//   comment-only source                   -> leading of byte 0
CommentStore attach_comments(const std::vector<TsToken>& tokens,
                             const std::vector<Comment>& comments,
                             const std::string& source);

} // namespace tsorg
