#include <tsorg/lang/printer.hpp>
#include <tsorg/line_index.hpp>
#include <algorithm>
#include <unordered_set>

namespace tsorg {

std::string detect_indent_unit(const std::string& source, int fallback_width) {
    size_t smallest = 0;
    size_t line_start = 0;
    while (line_start < source.size()) {
        size_t end = source.find('\n', line_start);
        if (end == std::string::npos) end = source.size();
        if (end > line_start && source[line_start] == '\t') return "\t";
        size_t n = 0;
        while (line_start + n < end && source[line_start + n] == ' ') ++n;
        bool content = line_start + n < end && source[line_start + n] != '\r' &&
                       source[line_start + n] != '*';
        if (n > 0 && content && (smallest == 0 || n < smallest)) smallest = n;
        line_start = end + 1;
    }
    if (smallest == 0) smallest = static_cast<size_t>(std::max(fallback_width, 1));
    return std::string(smallest, ' ');
}

namespace {

struct Replacement {
    uint32_t lo;
    uint32_t hi;
    std::string text;
};

// Rendered list element
struct Piece {
    std::string core;       // leading comments, node text, same-line trailing
    std::string after_sep;  // comments that followed the list separator
    bool core_open = false;  // core ends in a line comment
    bool sep_open = false;
    bool multiline = false;
    int category = 0;
};

bool is_class_like(const Node& n) {
    return n.kind == NodeKind::Class ||
           (n.kind == NodeKind::ExportDefault && n.inner_kind == NodeKind::Class);
}

int group_of(const Node& n) {
    switch (n.kind) {
    case NodeKind::Import:
        return 1 + static_cast<int>(categorize_import(n.source));
    case NodeKind::ReExport:
    case NodeKind::ExportAll:
        return 10;
    case NodeKind::Variable:
        return 20;
    case NodeKind::TypeAlias:
        return 30;
    case NodeKind::Statement:
        return 40;
    default:
        return -1;
    }
}

std::string reindent(const std::string& text, const std::string& from,
                     const std::string& to) {
    if (from == to || text.find('\n') == std::string::npos) return text;
    std::string out;
    size_t start = 0;
    bool first = true;
    while (true) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos
                                                                    : nl - start);
        if (!first && line.compare(0, from.size(), from) == 0) {
            line = to + line.substr(from.size());
        }
        out += line;
        first = false;
        if (nl == std::string::npos) break;
        out += '\n';
        start = nl + 1;
    }
    return out;
}

struct Printer {
    const std::string& source;
    const std::vector<Comment>& comments;
    const CommentStore* keep;
    LineIndex lines;
    std::string unit;
    std::unordered_set<uint32_t> kept;

    Printer(const std::string& src, const std::vector<Comment>& cmts,
            const CommentStore* k, const PrintOptions& options)
        : source(src), comments(cmts), keep(k), lines(src),
          unit(detect_indent_unit(src, options.indent_width)) {
        if (keep) {
            for (const auto& c : keep->all()) kept.insert(c.span.lo);
        }
    }

    bool is_kept(const Comment& c) const { return kept.count(c.span.lo) > 0; }

    std::string indent_at(uint32_t offset) const {
        return lines.indentation(lines.line_of(offset));
    }

    bool is_space(char c) const { return c == ' ' || c == '\t' || c == '\r'; }

    // Bytes to delete so that comment c disappears cleanly
    Replacement deletion_for(const Comment& c) const {
        size_t first = lines.line_of(c.span.lo);
        size_t last = lines.line_of(c.span.hi > c.span.lo ? c.span.hi - 1 : c.span.lo);
        uint32_t ls = lines.line_start(first);
        uint32_t le = lines.line_end(last);

        uint32_t before = c.span.lo;
        while (before > ls && is_space(source[before - 1])) --before;
        uint32_t after = c.span.hi;
        while (after < le && is_space(source[after])) ++after;

        if (before == ls && after == le) {
            // Alone on its line(s): the whole line goes
            uint32_t hi = le < source.size() ? le + 1 : le;
            return {ls, hi, ""};
        }
        if (after == le) {
            // After code: drop the comment with the spaces before it
            return {before, c.span.hi, ""};
        }
        return {c.span.lo, after, ""};
    }

    // Source text of [lo, hi) with replacements applied and comments that
    // are not kept removed
    std::string render_range(uint32_t lo, uint32_t hi, std::vector<Replacement> reps) const {
        std::sort(reps.begin(), reps.end(),
                  [](const Replacement& a, const Replacement& b) { return a.lo < b.lo; });

        auto inside_rep = [&](uint32_t pos) {
            for (const auto& r : reps) {
                if (pos >= r.lo && pos < r.hi) return true;
            }
            return false;
        };

        std::vector<Replacement> dels;
        auto first = std::lower_bound(comments.begin(), comments.end(), lo,
            [](const Comment& c, uint32_t v) { return c.span.lo < v; });
        for (auto it = first; it != comments.end() && it->span.lo < hi; ++it) {
            if (it->span.hi > hi || is_kept(*it) || inside_rep(it->span.lo)) continue;
            Replacement d = deletion_for(*it);
            d.lo = std::max(d.lo, lo);
            d.hi = std::min(d.hi, hi);
            for (const auto& r : reps) {
                if (d.lo < r.lo && d.hi > r.lo) d.hi = r.lo;
                if (d.lo < r.hi && d.hi > r.hi) d.lo = r.hi;
            }
            if (d.lo >= d.hi) continue;
            if (!dels.empty() && d.lo <= dels.back().hi) {
                dels.back().hi = std::max(dels.back().hi, d.hi);
            } else {
                dels.push_back(d);
            }
        }

        reps.insert(reps.end(), dels.begin(), dels.end());
        std::sort(reps.begin(), reps.end(),
                  [](const Replacement& a, const Replacement& b) { return a.lo < b.lo; });

        std::string out;
        uint32_t pos = lo;
        for (const auto& r : reps) {
            if (r.lo < pos) continue;
            out.append(source, pos, r.lo - pos);
            out += r.text;
            pos = r.hi;
        }
        if (pos < hi) out.append(source, pos, hi - pos);
        return out;
    }

    std::string render_node(const Node& n) const {
        std::vector<Replacement> reps;
        bool has_body = !n.children.empty();
        if (has_body) reps.push_back({n.body.lo, n.body.hi, render_body(n)});
        for (const auto& e : n.embedded) {
            if (has_body && e.span.lo >= n.body.lo && e.span.hi <= n.body.hi) continue;
            reps.push_back({e.span.lo, e.span.hi, render_node(e)});
        }
        return render_range(n.span.lo, n.span.hi, reps);
    }

    // Kept comments anchored at pos, restricted to [lo, hi)
    std::vector<Comment> kept_at(bool trailing, uint32_t pos, uint32_t lo, uint32_t hi) const {
        std::vector<Comment> out;
        if (!keep) return out;
        const auto& list = trailing ? keep->get_trailing(pos) : keep->get_leading(pos);
        for (const auto& c : list) {
            if (c.span.lo >= lo && c.span.hi <= hi) out.push_back(c);
        }
        return out;
    }

    bool has_newline(uint32_t lo, uint32_t hi) const {
        for (uint32_t i = lo; i < hi && i < source.size(); ++i) {
            if (source[i] == '\n') return true;
        }
        return false;
    }

    std::string comment_text(const Comment& c, const std::string& indent) const {
        return reindent(c.render(), indent_at(c.span.lo), indent);
    }

    // Appends a comment inline; a line comment ends the line
    void append_inline(std::string& out, bool& open_line_comment, const Comment& c,
                       const std::string& indent) const {
        if (open_line_comment) out += "\n" + indent;
        else if (!out.empty()) out += ' ';
        out += comment_text(c, indent);
        open_line_comment = c.kind == CommentKind::Line;
    }

    Piece render_child(const Node& parent, const Node& child, const std::string& indent,
                       bool reindent_child, std::vector<Comment>& tail) const {
        Piece p;
        bool open = false;
        std::string lead;
        for (const auto& c : kept_at(false, child.span.lo, parent.body.lo, child.span.lo)) {
            append_inline(lead, open, c, indent);
        }
        std::string text = render_node(child);
        if (reindent_child && lines.starts_line(child.span.lo)) {
            text = reindent(text, indent_at(child.span.lo), indent);
        }
        p.core = lead;
        if (open) p.core += "\n" + indent;
        else if (!lead.empty()) p.core += ' ';
        p.core += text;

        auto trailing = [&](uint32_t pos, std::string& into, bool& into_open) {
            for (const auto& c : kept_at(true, pos, child.span.hi, parent.body.hi)) {
                if (has_newline(child.span.hi, c.span.lo)) {
                    tail.push_back(c);
                } else {
                    append_inline(into, into_open, c, indent);
                }
            }
        };
        trailing(child.span.hi, p.core, p.core_open);
        if (child.anchor.hi != child.span.hi) {
            trailing(child.anchor.hi, p.after_sep, p.sep_open);
        }

        p.multiline = text.find('\n') != std::string::npos;
        p.category = member_category(child);
        return p;
    }

    std::string render_body(const Node& n) const {
        bool is_class = is_class_like(n);
        bool commas = n.kind == NodeKind::Enum || n.kind == NodeKind::ObjectLiteral;
        bool multiline = is_class || n.multiline;

        std::string close_indent = lines.starts_line(n.body.hi) ? indent_at(n.body.hi)
                                                                : indent_at(n.span.lo);
        const Node* first = &n.children.front();
        for (const auto& c : n.children) {
            if (c.span.lo < first->span.lo) first = &c;
        }
        std::string indent = lines.starts_line(first->span.lo) && multiline
                                 ? indent_at(first->span.lo)
                                 : close_indent + unit;

        std::vector<Comment> tail;
        std::vector<Piece> pieces;
        for (const auto& c : n.children) {
            pieces.push_back(render_child(n, c, indent, multiline, tail));
        }
        std::sort(tail.begin(), tail.end(),
                  [](const Comment& a, const Comment& b) { return a.span.lo < b.span.lo; });

        std::string head;
        bool head_open = false;
        for (const auto& c : kept_at(true, n.body.lo, n.body.lo, n.body.hi)) {
            append_inline(head, head_open, c, indent);
        }

        bool open_lines = head_open;
        for (const auto& p : pieces) open_lines = open_lines || p.core_open || p.sep_open;

        std::string out;
        if (multiline || open_lines || !tail.empty()) {
            if (!head.empty()) out += ' ' + head;
            out += '\n';
            for (size_t i = 0; i < pieces.size(); ++i) {
                const Piece& p = pieces[i];
                if (is_class && i > 0 &&
                    (p.category != pieces[i - 1].category || p.multiline ||
                     pieces[i - 1].multiline)) {
                    out += '\n';
                }
                out += indent + p.core;
                if (commas) {
                    if (p.core_open) out += '\n' + indent;
                    out += ',';
                }
                if (!p.after_sep.empty()) out += ' ' + p.after_sep;
                out += '\n';
            }
            for (const auto& c : tail) {
                out += indent + comment_text(c, indent) + '\n';
            }
            out += close_indent;
            return out;
        }

        out += ' ';
        if (!head.empty()) out += head + ' ';
        for (size_t i = 0; i < pieces.size(); ++i) {
            const Piece& p = pieces[i];
            out += p.core;
            if (commas && i + 1 < pieces.size()) out += ',';
            if (!p.after_sep.empty()) out += ' ' + p.after_sep;
            if (i + 1 < pieces.size()) out += ' ';
        }
        if (commas || n.self_closing) out += ' ';
        return out;
    }

    std::string render_item(const Node& item) const {
        std::string out;
        bool open = false;
        for (const auto& c : kept_at(false, item.span.lo, 0, item.span.lo)) {
            append_inline(out, open, c, "");
        }
        if (open) out += '\n';
        else if (!out.empty()) out += ' ';
        out += render_node(item);
        open = false;

        uint32_t limit = static_cast<uint32_t>(source.size());
        std::vector<Comment> trailing = kept_at(true, item.span.hi, item.span.hi, limit);
        if (item.anchor.hi != item.span.hi) {
            auto more = kept_at(true, item.anchor.hi, item.span.hi, limit);
            trailing.insert(trailing.end(), more.begin(), more.end());
        }
        for (const auto& c : trailing) {
            if (has_newline(item.span.hi, c.span.lo)) {
                out += '\n' + c.render();
                open = c.kind == CommentKind::Line;
            } else {
                append_inline(out, open, c, "");
            }
        }
        return out;
    }

    std::string print_module(const Module& module) const {
        std::string out;
        std::string prev_text;
        const Node* prev = nullptr;
        for (const auto& item : module.items) {
            std::string text = render_item(item);
            if (prev) {
                bool tight = group_of(*prev) >= 0 && group_of(*prev) == group_of(item) &&
                             prev_text.find('\n') == std::string::npos &&
                             text.find('\n') == std::string::npos;
                out += tight ? "\n" : "\n\n";
            }
            out += text;
            prev = &item;
            prev_text = std::move(text);
        }
        return out;
    }
};

} // anonymous namespace

std::string print(const Module& module, const std::string& source,
                  const std::vector<Comment>& comments,
                  const CommentStore* keep,
                  const PrintOptions& options) {
    std::vector<Comment> sorted = comments;
    std::sort(sorted.begin(), sorted.end(),
              [](const Comment& a, const Comment& b) { return a.span.lo < b.span.lo; });
    Printer printer(source, sorted, keep, options);
    return printer.print_module(module);
}

} // namespace tsorg
