#include <tsorg/format/style.hpp>
#include <tsorg/lang/lexer.hpp>
#include <tsorg/line_index.hpp>
#include <tsorg/log.hpp>
#include <vector>

namespace tsorg {

namespace {

struct Protection {
    std::vector<bool> ends_inside;    // the line's newline is literal text
    std::vector<bool> starts_inside;  // the line begins inside a literal
};

void protect(Protection& p, const LineIndex& lines, const Span& span) {
    if (span.empty()) return;
    size_t first = lines.line_of(span.lo);
    size_t last = lines.line_of(span.hi - 1);
    for (size_t l = first; l < last; ++l) {
        p.ends_inside[l] = true;
        p.starts_inside[l + 1] = true;
    }
}

std::string trim_right(const std::string& s) {
    size_t n = s.size();
    while (n > 0 && (s[n - 1] == ' ' || s[n - 1] == '\t' || s[n - 1] == '\r')) --n;
    return s.substr(0, n);
}

} // anonymous namespace

std::string apply_style(const std::string& text, const StyleOptions& options) {
    LineIndex index(text);
    Protection p;
    p.ends_inside.assign(index.line_count(), false);
    p.starts_inside.assign(index.line_count(), false);

    auto lexed = lex(text, "<style>", options.jsx);
    if (lexed.is_err()) {
        log::debug("style pass skipped: %s", lexed.error().message.c_str());
        if (options.final_newline && (text.empty() || text.back() != '\n')) return text + "\n";
        return text;
    }
    for (const auto& t : lexed.value().tokens) {
        if (t.type == TsTokenType::String || t.type == TsTokenType::Template ||
            t.type == TsTokenType::JsxText) {
            protect(p, index, t.span);
        }
    }
    for (const auto& c : lexed.value().comments) {
        if (c.kind == CommentKind::Block) protect(p, index, c.span);
    }

    auto lines = split_lines(text);
    std::vector<std::string> out;
    out.reserve(lines.size());
    bool previous_blank = true;  // drops leading blank lines
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (p.starts_inside[i]) {
            out.push_back(p.ends_inside[i] || !options.trim_trailing_whitespace
                              ? line : trim_right(line));
            previous_blank = false;
            continue;
        }
        if (is_blank(line)) {
            if (!previous_blank) out.push_back("");
            previous_blank = true;
            continue;
        }
        out.push_back(options.trim_trailing_whitespace && !p.ends_inside[i]
                          ? trim_right(line) : line);
        previous_blank = false;
    }
    while (!out.empty() && out.back().empty()) out.pop_back();

    std::string result = join_lines(out);
    if (options.final_newline && !result.empty()) result += '\n';
    return result;
}

} // namespace tsorg
