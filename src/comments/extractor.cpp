#include <tsorg/comments/extractor.hpp>
#include <tsorg/line_index.hpp>
#include <tsorg/log.hpp>
#include <algorithm>
#include <optional>

namespace tsorg {

const char* role_name(CommentRole role) {
    return role == CommentRole::Leading ? "leading" : "trailing";
}

size_t ExtractionResult::extracted_count() const {
    size_t n = 0;
    for (const auto& [id, list] : by_identity) n += list.size();
    return n;
}

namespace {

struct Pending {
    std::optional<NodeIdentity> id;
    std::vector<Comment> leading;
    std::vector<Comment> trailing;
};

bool by_position(const Comment& a, const Comment& b) {
    return a.span.lo < b.span.lo;
}

struct Extractor {
    const CommentStore& store;
    const std::string& source;
    const ClassificationMap& classes;
    LineIndex lines;

    ExtractionResult result;
    std::unordered_set<uint32_t> seen;
    std::unordered_set<uint32_t> heads;  // body.lo of every container

    Extractor(const CommentStore& s, const std::string& src, const ClassificationMap& cls)
        : store(s), source(src), classes(cls), lines(src) {}

    Classification class_of(const Comment& c) const {
        auto it = classes.find(c.span.lo);
        return it == classes.end() ? classify(c, lines, source) : it->second;
    }

    size_t first_line(const Comment& c) const { return lines.line_of(c.span.lo); }

    size_t last_line(const Comment& c) const {
        return lines.line_of(c.span.hi > c.span.lo ? c.span.hi - 1 : c.span.lo);
    }

    void add_standalone(const Comment& c, int depth, const std::vector<Node>& siblings) {
        StandaloneComment s;
        s.comment = c;
        s.original_line = first_line(c);
        s.nesting_depth = depth;
        s.indentation = lines.indentation(s.original_line);

        bool has_prev = false;
        for (const auto& n : siblings) {
            auto id = identity(n);
            if (!id) continue;
            s.siblings.push_back(*id);
            if (n.span.hi <= c.span.lo) {
                has_prev = true;
            } else if (has_prev && !s.next && n.span.lo >= c.span.hi) {
                s.next = id;
            }
        }
        s.after_siblings = has_prev && !s.next;

        result.claimed.insert(c.span.lo);
        result.standalone.push_back(std::move(s));
    }

    // Comments anchored at one position that this node may own
    void pull(const std::vector<Comment>& anchored, std::vector<Comment>& out, int depth,
              const std::vector<Node>& siblings) {
        for (const auto& c : anchored) {
            if (!seen.insert(c.span.lo).second) continue;
            switch (class_of(c)) {
            case Classification::Inline:
                break;
            case Classification::Standalone:
                add_standalone(c, depth, siblings);
                break;
            default:
                out.push_back(c);
                break;
            }
        }
    }

    void record(NodeIdentity id, CommentRole role, std::vector<Comment>& list) {
        if (list.empty()) return;
        std::sort(list.begin(), list.end(), by_position);
        auto& entries = result.by_identity[id];
        int base = 0;
        for (const auto& e : entries) {
            if (e.role == role) ++base;
        }
        for (size_t i = 0; i < list.size(); ++i) {
            ExtractedComment ec;
            ec.identity = id;
            ec.role = role;
            ec.comment = list[i];
            ec.ordinal = base + static_cast<int>(i);
            ec.source_indent = lines.indentation(lines.line_of(list[i].span.lo));
            result.claimed.insert(list[i].span.lo);
            entries.push_back(std::move(ec));
        }
    }

    void walk_list(const std::vector<Node>& nodes, int depth, bool top_level) {
        std::vector<Pending> pending(nodes.size());
        for (size_t i = 0; i < nodes.size(); ++i) {
            const Node& n = nodes[i];
            pending[i].id = identity(n);
            if (!pending[i].id) continue;
            pull(store.get_leading(n.span.lo), pending[i].leading, depth, nodes);
            pull(store.get_trailing(n.span.hi), pending[i].trailing, depth, nodes);
            if (n.anchor.hi != n.span.hi) {
                pull(store.get_trailing(n.anchor.hi), pending[i].trailing, depth, nodes);
            }
        }

        // A trailing comment that sits on a later line than its node really
        // introduces whatever follows it on the next line.
        for (size_t i = 0; i < nodes.size(); ++i) {
            auto& trailing = pending[i].trailing;
            std::vector<Comment> keep;
            size_t node_end = lines.line_of(nodes[i].span.hi > nodes[i].span.lo
                                                ? nodes[i].span.hi - 1 : nodes[i].span.lo);
            for (const auto& c : trailing) {
                if (first_line(c) <= node_end) {
                    keep.push_back(c);
                    continue;
                }
                bool next_owns = i + 1 < nodes.size() && pending[i + 1].id &&
                                 lines.line_of(nodes[i + 1].span.lo) <= last_line(c) + 1;
                if (next_owns) {
                    log::trace("reassigning comment at byte %u to the next %s",
                               c.span.lo, node_kind_name(nodes[i + 1].kind));
                    pending[i + 1].leading.push_back(c);
                } else if (top_level) {
                    add_standalone(c, depth, nodes);
                }
                // Inside a container the printer keeps it at the end of the body
            }
            trailing = std::move(keep);
        }

        for (size_t i = 0; i < nodes.size(); ++i) {
            if (!pending[i].id) continue;
            record(*pending[i].id, CommentRole::Leading, pending[i].leading);
            record(*pending[i].id, CommentRole::Trailing, pending[i].trailing);
        }

        for (const auto& n : nodes) walk_nested(n, depth);
    }

    void walk_nested(const Node& n, int depth) {
        if (!n.children.empty()) {
            heads.insert(n.body.lo);
            walk_list(n.children, depth + 1, false);
        }
        for (const auto& e : n.embedded) walk_nested(e, depth);
    }

    // -- Gap detection ------------------------------------------------------

    // The reorderable list whose gap holds pos; list is null when pos lies
    // inside opaque text
    struct Gap {
        const std::vector<Node>* list = nullptr;
        int depth = -1;
    };

    Gap find_gap(const Node& n, uint32_t pos, int depth) const {
        if (!n.children.empty() && pos >= n.body.lo && pos < n.body.hi) {
            for (const auto& c : n.children) {
                if (pos >= c.span.lo && pos < c.span.hi) return find_gap(c, pos, depth + 1);
            }
            return Gap{&n.children, depth + 1};
        }
        for (const auto& e : n.embedded) {
            if (e.span.contains(pos)) return find_gap(e, pos, depth);
        }
        return Gap{};
    }

    Gap find_gap(const Module& module, uint32_t pos) const {
        for (const auto& item : module.items) {
            if (pos >= item.span.lo && pos < item.span.hi) return find_gap(item, pos, 0);
        }
        return Gap{&module.items, 0};
    }

    void collect_gaps(const Module& module) {
        auto visit = [&](const std::map<uint32_t, std::vector<Comment>>& table,
                         bool trailing) {
            for (const auto& [anchor, list] : table) {
                for (const auto& c : list) {
                    if (seen.count(c.span.lo)) continue;
                    if (class_of(c) == Classification::Inline) continue;
                    if (trailing && heads.count(anchor)) continue;
                    Gap gap = find_gap(module, c.span.lo);
                    if (!gap.list) continue;
                    seen.insert(c.span.lo);
                    add_standalone(c, gap.depth, *gap.list);
                }
            }
        };
        visit(store.leading(), false);
        visit(store.trailing(), true);
    }
};

} // anonymous namespace

ExtractionResult extract(const Module& module, const CommentStore& store,
                         const std::string& source,
                         const ClassificationMap& classes) {
    Extractor ex(store, source, classes);
    ex.walk_list(module.items, 0, true);
    ex.collect_gaps(module);

    std::stable_sort(ex.result.standalone.begin(), ex.result.standalone.end(),
        [](const StandaloneComment& a, const StandaloneComment& b) {
            return a.comment.span.lo < b.comment.span.lo;
        });

    log::debug("extracted %zu comments for %zu nodes, %zu standalone",
               ex.result.extracted_count(), ex.result.by_identity.size(),
               ex.result.standalone.size());
    return std::move(ex.result);
}

ExtractionResult extract(const Module& module, const CommentStore& store,
                         const std::string& source) {
    return extract(module, store, source, classify_all(store.all(), source));
}

} // namespace tsorg
