#include <tsorg/lang/comment_store.hpp>
#include <algorithm>

namespace tsorg {

void CommentStore::add_leading(uint32_t pos, Comment c) {
    leading_[pos].push_back(std::move(c));
}

void CommentStore::add_trailing(uint32_t pos, Comment c) {
    trailing_[pos].push_back(std::move(c));
}

static const std::vector<Comment>& empty_comments() {
    static const std::vector<Comment> none;
    return none;
}

const std::vector<Comment>& CommentStore::get_leading(uint32_t pos) const {
    auto it = leading_.find(pos);
    return it == leading_.end() ? empty_comments() : it->second;
}

const std::vector<Comment>& CommentStore::get_trailing(uint32_t pos) const {
    auto it = trailing_.find(pos);
    return it == trailing_.end() ? empty_comments() : it->second;
}

bool CommentStore::contains(uint32_t comment_lo) const {
    for (const auto* table : {&leading_, &trailing_}) {
        for (const auto& [pos, list] : *table) {
            for (const auto& c : list) {
                if (c.span.lo == comment_lo) return true;
            }
        }
    }
    return false;
}

std::vector<Comment> CommentStore::all() const {
    std::vector<Comment> result;
    for (const auto* table : {&leading_, &trailing_}) {
        for (const auto& [pos, list] : *table) {
            result.insert(result.end(), list.begin(), list.end());
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Comment& a, const Comment& b) { return a.span.lo < b.span.lo; });
    return result;
}

size_t CommentStore::size() const {
    size_t n = 0;
    for (const auto& [pos, list] : leading_) n += list.size();
    for (const auto& [pos, list] : trailing_) n += list.size();
    return n;
}

CommentStore CommentStore::filtered(
        const std::function<bool(const Comment&)>& keep) const {
    CommentStore out;
    for (const auto& [pos, list] : leading_) {
        for (const auto& c : list) {
            if (keep(c)) out.add_leading(pos, c);
        }
    }
    for (const auto& [pos, list] : trailing_) {
        for (const auto& c : list) {
            if (keep(c)) out.add_trailing(pos, c);
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Attachment
// ---------------------------------------------------------------------------

static bool is_closing(TsTokenType t) {
    return t == TsTokenType::RBrace || t == TsTokenType::RParen ||
           t == TsTokenType::RBracket || t == TsTokenType::JsxExprEnd;
}

static bool has_newline(const std::string& source, uint32_t lo, uint32_t hi) {
    for (uint32_t i = lo; i < hi && i < source.size(); ++i) {
        if (source[i] == '\n') return true;
    }
    return false;
}

CommentStore attach_comments(const std::vector<TsToken>& tokens,
                             const std::vector<Comment>& comments,
                             const std::string& source) {
    CommentStore store;

    // Significant tokens only; Eof carries no anchor
    std::vector<const TsToken*> sig;
    sig.reserve(tokens.size());
    for (const auto& t : tokens) {
        if (t.type != TsTokenType::Eof) sig.push_back(&t);
    }

    size_t next = 0;  // first token starting at or after the comment
    for (const auto& c : comments) {
        while (next < sig.size() && sig[next]->span.lo < c.span.lo) ++next;
        const TsToken* prev = next > 0 ? sig[next - 1] : nullptr;
        const TsToken* after = next < sig.size() ? sig[next] : nullptr;

        // A comment inside a token (e.g. a template substitution) has no
        // separate anchor; the token text keeps it.
        if (prev && prev->span.hi > c.span.lo) continue;

        if (prev && !has_newline(source, prev->span.hi, c.span.lo)) {
            store.add_trailing(prev->span.hi, c);
        } else if (after && !is_closing(after->type)) {
            store.add_leading(after->span.lo, c);
        } else if (prev) {
            store.add_trailing(prev->span.hi, c);
        } else {
            store.add_leading(0, c);
        }
    }
    return store;
}

} // namespace tsorg
