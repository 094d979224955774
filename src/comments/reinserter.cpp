#include <tsorg/comments/reinserter.hpp>
#include <tsorg/line_index.hpp>
#include <tsorg/log.hpp>
#include <algorithm>
#include <map>

namespace tsorg {

namespace {

// Lines of a leading comment, continuation lines moved from the comment's
// original indentation to the node's
std::vector<std::string> leading_lines(const InsertionPoint& p) {
    std::vector<std::string> out;
    auto parts = split_lines(p.text);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i == 0) {
            out.push_back(p.indentation + parts[i]);
        } else if (!p.source_indent.empty() &&
                   parts[i].compare(0, p.source_indent.size(), p.source_indent) == 0) {
            out.push_back(p.indentation + parts[i].substr(p.source_indent.size()));
        } else {
            out.push_back(parts[i]);
        }
    }
    return out;
}

bool application_order(const InsertionPoint& a, const InsertionPoint& b) {
    if (a.line != b.line) return a.line > b.line;
    if (a.role != b.role) return a.role == CommentRole::Leading;
    if (a.role == CommentRole::Trailing) {
        // Appends: earlier columns and ordinals go first
        if (a.column != b.column) return a.column < b.column;
        return a.ordinal < b.ordinal;
    }
    return a.ordinal > b.ordinal;
}

// Standalone comments sharing an original line travel as one group
using StandaloneGroups = std::map<size_t, std::vector<const StandaloneComment*>>;

StandaloneGroups group_standalone(const std::vector<StandaloneComment>& standalone) {
    StandaloneGroups by_line;
    for (const auto& s : standalone) by_line[s.original_line].push_back(&s);
    for (auto& [line, group] : by_line) {
        std::stable_sort(group.begin(), group.end(),
            [](const StandaloneComment* a, const StandaloneComment* b) {
                return a->comment.span.lo < b->comment.span.lo;
            });
    }
    return by_line;
}

std::string render_group(const std::vector<const StandaloneComment*>& group) {
    std::string text;
    for (size_t i = 0; i < group.size(); ++i) {
        if (i > 0) text += ' ';
        text += group[i]->comment.render();
    }
    return text;
}

class Planner {
public:
    Planner(const std::string& skeleton, const PositionMap& positions)
        : lines_(skeleton), positions_(positions),
          line_total_(skeleton.empty() ? 0 : lines_.line_count()),
          covered_(line_total_, false) {
        for (const auto& [id, pos] : positions) {
            for (size_t l = pos.start_line; l <= pos.end_line && l < covered_.size(); ++l) {
                covered_[l] = true;
            }
        }
    }

    bool in_range(const NodePosition& pos) const {
        return pos.start_line < line_total_ && pos.end_line < line_total_;
    }

    // Line after which a comment introducing the node goes
    long above(const NodePosition& pos) const {
        long target = static_cast<long>(pos.start_line) - 1;
        // A non-blank line above the node that no node owns is its
        // preamble; the comment goes above it
        if (target >= 1 && !lines_.is_blank_line(target) &&
            lines_.is_blank_line(target - 1) &&
            !covered_[static_cast<size_t>(target)]) {
            --target;
        }
        return target;
    }

    // Point for a standalone group next to its siblings, or false when none
    // of them landed in the skeleton
    bool place(const StandaloneComment& s, InsertionPoint& p) const {
        const NodePosition* anchor = nullptr;
        if (s.next) {
            auto it = positions_.find(*s.next);
            if (it != positions_.end() && in_range(it->second)) {
                anchor = &it->second;
                p.line = above(*anchor);
                p.indentation = anchor->indentation;
                return true;
            }
        }
        for (NodeIdentity id : s.siblings) {
            auto it = positions_.find(id);
            if (it == positions_.end() || !in_range(it->second)) continue;
            const NodePosition& pos = it->second;
            if (!anchor) {
                anchor = &pos;
            } else if (s.after_siblings ? pos.end_line > anchor->end_line
                                        : pos.start_line < anchor->start_line) {
                anchor = &pos;
            }
        }
        if (!anchor) return false;
        p.line = s.after_siblings ? static_cast<long>(anchor->end_line) : above(*anchor);
        p.indentation = anchor->indentation;
        return true;
    }

private:
    LineIndex lines_;
    const PositionMap& positions_;
    size_t line_total_;
    std::vector<bool> covered_;
};

void insert_padded(std::vector<std::string>& lines, size_t idx,
                   const std::vector<std::string>& parts) {
    if (idx > lines.size()) idx = lines.size();
    if (idx > 0 && !is_blank(lines[idx - 1])) {
        lines.insert(lines.begin() + static_cast<long>(idx), "");
        ++idx;
    }
    lines.insert(lines.begin() + static_cast<long>(idx), parts.begin(), parts.end());
    size_t after = idx + parts.size();
    if (after < lines.size() && !is_blank(lines[after])) {
        lines.insert(lines.begin() + static_cast<long>(after), "");
    }
}

// Groups with no positioned sibling return to their original line
void insert_at_original_lines(std::vector<std::string>& lines,
                              const std::vector<std::vector<const StandaloneComment*>>& groups) {
    for (const auto& group : groups) {
        const StandaloneComment& first = *group.front();
        log::debug("standalone comment at line %zu (depth %d) has no positioned sibling",
                   first.original_line, first.nesting_depth);
        insert_padded(lines, std::min(first.original_line, lines.size()),
                      split_lines(first.indentation + render_group(group)));
    }
}

} // anonymous namespace

Result<std::vector<InsertionPoint>> plan_insertions(const ExtractionResult& extraction,
                                                    const std::string& skeleton,
                                                    const PositionMap& positions) {
    Planner planner(skeleton, positions);

    // by_identity is ordered, so missing identities list in sorted order
    std::vector<std::string> missing;
    for (const auto& [id, comments] : extraction.by_identity) {
        auto it = positions.find(id);
        if (it == positions.end()) {
            missing.push_back("No position found for node with hash " + format_identity(id) +
                              " (has " + std::to_string(comments.size()) + " comments)");
        } else if (!planner.in_range(it->second)) {
            missing.push_back("Position for node with hash " + format_identity(id) +
                              " lies outside the regenerated text (has " +
                              std::to_string(comments.size()) + " comments)");
        }
    }
    if (!missing.empty()) {
        std::string msg = "Failed to find positions for " + std::to_string(missing.size()) +
                          " nodes with comments:\n";
        for (size_t i = 0; i < missing.size(); ++i) {
            if (i > 0) msg += '\n';
            msg += missing[i];
        }
        return TsorgError{TsorgError::MissingPosition, msg,
            "the regenerated text lost a node that owns comments; the file was left unchanged"};
    }

    std::vector<InsertionPoint> points;
    for (const auto& [id, comments] : extraction.by_identity) {
        const NodePosition& pos = positions.at(id);
        for (const auto& ec : comments) {
            InsertionPoint p;
            p.role = ec.role;
            p.ordinal = ec.ordinal;
            p.text = ec.comment.render();
            p.source_indent = ec.source_indent;
            if (ec.role == CommentRole::Leading) {
                p.line = planner.above(pos);
                p.column = 0;
                p.indentation = pos.indentation;
            } else {
                p.line = static_cast<long>(pos.end_line);
                p.column = pos.end_column;
            }
            points.push_back(std::move(p));
        }
    }

    // Standalone groups landing after the same line keep source order, top
    // to bottom: the first group gets the lowest ordinal and is applied last
    std::map<long, std::vector<InsertionPoint>> standalone_at;
    for (const auto& [line, group] : group_standalone(extraction.standalone)) {
        InsertionPoint p;
        p.standalone = true;
        if (!planner.place(*group.front(), p)) continue;
        p.text = render_group(group);
        p.source_indent = group.front()->indentation;
        standalone_at[p.line].push_back(std::move(p));
    }
    for (auto& [line, list] : standalone_at) {
        int n = static_cast<int>(list.size());
        for (int i = 0; i < n; ++i) {
            list[static_cast<size_t>(i)].ordinal = i - n;
            points.push_back(std::move(list[static_cast<size_t>(i)]));
        }
    }

    std::stable_sort(points.begin(), points.end(), application_order);
    return Result<std::vector<InsertionPoint>>::ok(std::move(points));
}

Result<std::string> reinsert(const ExtractionResult& extraction,
                             const std::string& skeleton,
                             const PositionMap& positions) {
    auto planned = plan_insertions(extraction, skeleton, positions);
    if (planned.is_err()) return std::move(planned).error();

    std::vector<std::string> lines;
    if (!skeleton.empty()) lines = split_lines(skeleton);

    size_t anchored = 0;
    for (const auto& p : planned.value()) {
        if (p.role == CommentRole::Leading) {
            size_t idx = static_cast<size_t>(p.line + 1);
            if (p.standalone) {
                insert_padded(lines, idx, leading_lines(p));
                ++anchored;
                continue;
            }
            if (idx > lines.size()) idx = lines.size();
            auto parts = leading_lines(p);
            lines.insert(lines.begin() + static_cast<long>(idx), parts.begin(), parts.end());
        } else {
            // plan_insertions only yields trailing lines inside the skeleton
            auto& line = lines[static_cast<size_t>(p.line)];
            if (!line.empty()) line += ' ';
            line += p.text;
        }
    }

    Planner planner(skeleton, positions);
    std::vector<std::vector<const StandaloneComment*>> unplaced;
    for (const auto& [line, group] : group_standalone(extraction.standalone)) {
        InsertionPoint p;
        if (!planner.place(*group.front(), p)) unplaced.push_back(group);
    }
    insert_at_original_lines(lines, unplaced);

    log::debug("reinserted %zu node comments, %zu standalone groups by sibling, %zu by line",
               planned.value().size() - anchored, anchored, unplaced.size());
    return Result<std::string>::ok(join_lines(lines));
}

} // namespace tsorg
