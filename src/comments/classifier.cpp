#include <tsorg/comments/classifier.hpp>
#include <cctype>

namespace tsorg {

const char* classification_name(Classification c) {
    switch (c) {
    case Classification::Inline:     return "inline";
    case Classification::Leading:    return "leading";
    case Classification::Trailing:   return "trailing";
    case Classification::Standalone: return "standalone";
    }
    return "unknown";
}

static bool is_code_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
           c == ')' || c == '}' || c == ']' || c == ';';
}

static bool is_trivial_after(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == ';' || c == ')' || c == ',';
}

Classification classify(const Comment& comment, const LineIndex& lines,
                        const std::string& source) {
    uint32_t lo = comment.span.lo;
    uint32_t hi = comment.span.hi;
    size_t first = lines.line_of(lo);
    size_t last = lines.line_of(hi > lo ? hi - 1 : lo);

    bool code_before = false;
    for (uint32_t i = lines.line_start(first); i < lo; ++i) {
        if (is_code_char(source[i])) {
            code_before = true;
            break;
        }
    }

    bool code_after = false;
    uint32_t end = lines.line_end(last);
    for (uint32_t i = hi; i < end; ++i) {
        if (!is_trivial_after(source[i])) {
            code_after = true;
            break;
        }
    }

    if (code_after) return Classification::Inline;
    if (code_before) return Classification::Trailing;

    bool blank_above = first == 0 || lines.is_blank(first - 1);
    bool blank_below = last + 1 >= lines.line_count() || lines.is_blank(last + 1);
    return blank_above && blank_below ? Classification::Standalone
                                      : Classification::Leading;
}

Classification classify(const Comment& comment, const std::string& source) {
    LineIndex lines(source);
    return classify(comment, lines, source);
}

ClassificationMap classify_all(const std::vector<Comment>& comments,
                               const std::string& source) {
    LineIndex lines(source);
    ClassificationMap out;
    out.reserve(comments.size());
    for (const auto& c : comments) {
        out[c.span.lo] = classify(c, lines, source);
    }
    return out;
}

} // namespace tsorg
