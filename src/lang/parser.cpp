#include <tsorg/lang/parser.hpp>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace tsorg {

namespace {

using TT = TsTokenType;

constexpr size_t npos = static_cast<size_t>(-1);

bool is_open(TT t) {
    return t == TT::LParen || t == TT::LBracket || t == TT::LBrace ||
           t == TT::JsxExprStart;
}

bool is_close(TT t) {
    return t == TT::RParen || t == TT::RBracket || t == TT::RBrace ||
           t == TT::JsxExprEnd;
}

TT closer_for(TT open) {
    switch (open) {
    case TT::LParen:       return TT::RParen;
    case TT::LBracket:     return TT::RBracket;
    case TT::LBrace:       return TT::RBrace;
    case TT::JsxExprStart: return TT::JsxExprEnd;
    default:               return TT::Eof;
    }
}

bool is_name(const TsToken& t) {
    return t.type == TT::Identifier || is_keyword(t.type) ||
           t.type == TT::String || t.type == TT::Number;
}

// Tokens after which a line break may terminate a statement
bool can_end_statement(const TsToken& t) {
    switch (t.type) {
    case TT::Identifier:
    case TT::PrivateName:
    case TT::Number:
    case TT::String:
    case TT::Template:
    case TT::Regex:
    case TT::RParen:
    case TT::RBracket:
    case TT::RBrace:
    case TT::JsxExprEnd:
    case TT::Greater:
    case TT::JsxTagEnd:
    case TT::JsxSelfClose:
    case TT::KwThis:
    case TT::KwSuper:
    case TT::KwNull:
    case TT::KwTrue:
    case TT::KwFalse:
    case TT::KwBreak:
    case TT::KwContinue:
    case TT::KwReturn:
    case TT::KwDebugger:
    case TT::KwVoid:
    case TT::Unknown:
        return true;
    case TT::Operator:
        return t.text == "++" || t.text == "--";
    default:
        return false;
    }
}

// Tokens that continue the previous line's expression
bool continues_statement(const TsToken& t) {
    switch (t.type) {
    case TT::Dot:
    case TT::QuestionDot:
    case TT::Arrow:
    case TT::Comma:
    case TT::Question:
    case TT::Colon:
    case TT::Assign:
    case TT::Less:
    case TT::Greater:
    case TT::Slash:
    case TT::Star:
    case TT::LParen:
    case TT::LBracket:
    case TT::Template:
    case TT::KwInstanceof:
    case TT::KwIn:
    case TT::KwElse:
    case TT::KwCatch:
    case TT::KwFinally:
    case TT::KwExtends:
    case TT::JsxName:
    case TT::JsxText:
    case TT::JsxTagEnd:
    case TT::JsxSelfClose:
    case TT::JsxCloseOpen:
    case TT::JsxExprStart:
        return true;
    case TT::Operator:
        return t.text != "++" && t.text != "--" && t.text != "!" && t.text != "~";
    case TT::Identifier:
        return t.text == "as" || t.text == "satisfies";
    default:
        return false;
    }
}

// Tokens after which `{` opens a type literal rather than a body
bool type_may_start_after(const TsToken& t) {
    switch (t.type) {
    case TT::Colon:
    case TT::Less:
    case TT::LParen:
    case TT::LBracket:
    case TT::Comma:
    case TT::Arrow:
    case TT::Question:
    case TT::Assign:
    case TT::KwExtends:
    case TT::KwTypeof:
        return true;
    case TT::Operator:
        return t.text == "|" || t.text == "&";
    case TT::Identifier:
        return t.text == "keyof" || t.text == "readonly";
    default:
        return false;
    }
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s[0] == '"' || s[0] == '\'' || s[0] == '`') &&
        s.back() == s[0]) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// ---------------------------------------------------------------------------
// Parser state machine
// ---------------------------------------------------------------------------

struct Parser {
    const std::vector<TsToken>& tokens;
    const std::string& source;
    const std::string& filename;
    size_t pos;

    ParseResult result;
    std::vector<size_t> match;      // matching bracket, npos when unbalanced
    std::vector<size_t> enclosing;  // innermost open bracket around a token
    std::unordered_map<std::string, int> ordinals;
    int statement_count;

    Parser(const std::vector<TsToken>& toks, const std::string& src,
           const std::string& fname)
        : tokens(toks), source(src), filename(fname), pos(0), statement_count(0) {
        build_match_table();
    }

    // -- Navigation ---------------------------------------------------------

    bool at_end() const {
        return pos >= tokens.size() || tokens[pos].type == TT::Eof;
    }

    const TsToken& peek() const {
        return tokens[std::min(pos, tokens.size() - 1)];
    }

    const TsToken& peek_at(size_t offset) const {
        size_t idx = pos + offset;
        if (idx >= tokens.size()) return tokens.back(); // Eof
        return tokens[idx];
    }

    const TsToken& advance() {
        const auto& tok = peek();
        if (!at_end()) ++pos;
        return tok;
    }

    bool check(TT type) const {
        return !at_end() && peek().type == type;
    }

    bool check_word(const char* word) const {
        return check(TT::Identifier) && peek().text == word;
    }

    bool match_tok(TT type) {
        if (check(type)) {
            advance();
            return true;
        }
        return false;
    }

    bool match_word(const char* word) {
        if (check_word(word)) {
            advance();
            return true;
        }
        return false;
    }

    bool expect(TT type) {
        if (match_tok(type)) return true;
        diag("expected " + std::string(ts_token_name(type)) +
             ", got '" + peek().text + "'");
        return false;
    }

    // -- Diagnostics --------------------------------------------------------

    void diag_at(size_t idx, const std::string& msg) {
        const auto& p = tokens[std::min(idx, tokens.size() - 1)].pos;
        result.diagnostics.push_back({msg, filename, p.line, p.col});
    }

    void diag(const std::string& msg) {
        diag_at(pos, msg);
    }

    // -- Bracket table ------------------------------------------------------

    void build_match_table() {
        match.assign(tokens.size(), npos);
        enclosing.assign(tokens.size(), npos);
        std::vector<size_t> stack;
        for (size_t i = 0; i < tokens.size(); ++i) {
            TT t = tokens[i].type;
            enclosing[i] = stack.empty() ? npos : stack.back();
            if (is_open(t)) {
                stack.push_back(i);
            } else if (is_close(t)) {
                if (!stack.empty() && closer_for(tokens[stack.back()].type) == t) {
                    match[stack.back()] = i;
                    match[i] = stack.back();
                    stack.pop_back();
                } else {
                    diag_at(i, "unexpected '" + tokens[i].text + "'");
                }
            }
        }
        for (size_t open : stack) {
            diag_at(open, "unclosed '" + tokens[open].text + "'");
        }
    }

    // -- Skip helpers -------------------------------------------------------

    void skip_group() {
        if (match[pos] == npos) {
            pos = tokens.size() - 1;
            return;
        }
        pos = match[pos] + 1;
    }

    // Index after the `>` closing type arguments that start at i, or npos
    // when the `<` is not followed by something type-like
    size_t type_args_end(size_t i) const {
        int depth = 0;
        while (i < tokens.size()) {
            const auto& t = tokens[i];
            switch (t.type) {
            case TT::Less:
                ++depth;
                break;
            case TT::Greater:
                if (--depth == 0) return i + 1;
                break;
            case TT::LParen:
            case TT::LBracket:
            case TT::LBrace:
                if (match[i] == npos) return npos;
                i = match[i];
                break;
            case TT::Identifier:
            case TT::Comma:
            case TT::Dot:
            case TT::String:
            case TT::Number:
            case TT::Question:
            case TT::Colon:
            case TT::Arrow:
            case TT::Assign:
            case TT::KwExtends:
            case TT::KwTypeof:
            case TT::KwVoid:
            case TT::KwNull:
            case TT::KwTrue:
            case TT::KwFalse:
            case TT::KwThis:
                break;
            case TT::Operator:
                if (t.text != "|" && t.text != "&") return npos;
                break;
            default:
                return npos;
            }
            ++i;
        }
        return npos;
    }

    void skip_angles() {
        size_t end = type_args_end(pos);
        if (end == npos) {
            advance();
            return;
        }
        pos = end;
    }

    // End (exclusive) of an expression or statement starting at i. The
    // terminating ';' is not included.
    size_t find_end(size_t i, bool stop_at_comma) const {
        size_t start = i;
        while (i < tokens.size()) {
            const auto& t = tokens[i];
            if (t.type == TT::Eof) return i;
            if (i > start && t.newline_before && can_end_statement(tokens[i - 1]) &&
                !continues_statement(t)) {
                return i;
            }
            if (t.type == TT::Semicolon) return i;
            if (stop_at_comma && t.type == TT::Comma) return i;
            if (is_close(t.type)) return i;
            if (is_open(t.type)) {
                if (match[i] == npos) return tokens.size() - 1;
                i = match[i] + 1;
                continue;
            }
            if (stop_at_comma && t.type == TT::Less && i > start &&
                tokens[i - 1].type == TT::Identifier) {
                size_t end = type_args_end(i);
                if (end != npos) {
                    i = end;
                    continue;
                }
            }
            ++i;
        }
        return tokens.size() - 1;
    }

    // End (exclusive) of a type annotation starting at i
    size_t find_type_end(size_t i, bool stop_at_comma, bool stop_at_assign) const {
        size_t start = i;
        int angle = 0;
        while (i < tokens.size()) {
            const auto& t = tokens[i];
            if (t.type == TT::Eof) return i;
            if (is_close(t.type)) return i;
            if (angle == 0) {
                if (t.type == TT::Semicolon) return i;
                if (stop_at_comma && t.type == TT::Comma) return i;
                if (stop_at_assign && t.type == TT::Assign) return i;
                if (i > start && t.newline_before &&
                    can_end_statement(tokens[i - 1]) && !continues_statement(t)) {
                    return i;
                }
                if (t.type == TT::LBrace && i > start &&
                    !type_may_start_after(tokens[i - 1])) {
                    return i;
                }
            }
            if (t.type == TT::Less) {
                ++angle;
            } else if (t.type == TT::Greater && angle > 0) {
                --angle;
            } else if (is_open(t.type)) {
                if (match[i] == npos) return tokens.size() - 1;
                i = match[i] + 1;
                continue;
            }
            ++i;
        }
        return tokens.size() - 1;
    }

    // End (exclusive) of one comma-separated element before close
    size_t find_list_item_end(size_t i, size_t close) const {
        while (i < close) {
            TT t = tokens[i].type;
            if (t == TT::Comma) return i;
            if (is_open(t)) {
                if (match[i] == npos || match[i] > close) return close;
                i = match[i] + 1;
                continue;
            }
            ++i;
        }
        return close;
    }

    // -- Node helpers -------------------------------------------------------

    Span span_of(size_t first, size_t end) const {
        if (end <= first) return {tokens[first].span.lo, tokens[first].span.lo};
        return {tokens[first].span.lo, tokens[end - 1].span.hi};
    }

    bool has_newline(uint32_t lo, uint32_t hi) const {
        for (uint32_t i = lo; i < hi && i < source.size(); ++i) {
            if (source[i] == '\n') return true;
        }
        return false;
    }

    std::string join_tokens(size_t a, size_t b) const {
        std::string out;
        for (size_t i = a; i < b; ++i) out += tokens[i].text;
        return out;
    }

    std::string type_tag(size_t a, size_t b) const {
        if (a >= b) return "";
        const auto& t = tokens[a];
        if ((t.type == TT::Identifier || is_keyword(t.type)) &&
            (b - a == 1 || tokens[a + 1].type == TT::Less)) {
            return t.text;
        }
        return "complex";
    }

    std::vector<std::string> collect_refs(size_t a, size_t b) const {
        std::vector<std::string> refs;
        std::unordered_set<std::string> seen;
        for (size_t i = a; i < b; ++i) {
            if (tokens[i].type != TT::Identifier) continue;
            if (i > 0 && (tokens[i - 1].type == TT::Dot ||
                          tokens[i - 1].type == TT::QuestionDot)) {
                continue;
            }
            if (seen.insert(tokens[i].text).second) refs.push_back(tokens[i].text);
        }
        return refs;
    }

    // Token texts with each embedded container collapsed to a marker
    std::string fingerprint(size_t a, size_t b, const std::vector<Node>& embedded) const {
        std::string out;
        size_t i = a;
        while (i < b) {
            uint32_t lo = tokens[i].span.lo;
            const Node* inside = nullptr;
            for (const auto& e : embedded) {
                if (e.span.contains(lo)) {
                    inside = &e;
                    break;
                }
            }
            if (inside) {
                out += inside->kind == NodeKind::ObjectLiteral ? "{}" : "<>";
                out += ' ';
                while (i < b && tokens[i].span.lo < inside->span.hi) ++i;
                continue;
            }
            out += tokens[i].text;
            out += ' ';
            ++i;
        }
        if (!out.empty()) out.pop_back();
        return out;
    }

    int next_ordinal(const std::string& path) {
        return ordinals[path]++;
    }

    static void sort_embedded(Node& n) {
        std::stable_sort(n.embedded.begin(), n.embedded.end(),
            [](const Node& a, const Node& b) { return a.span.lo < b.span.lo; });
    }

    // -- Embedded containers ------------------------------------------------

    bool is_call_paren(size_t k) const {
        if (k == 0 || match[k] == npos) return false;
        const auto& prev = tokens[k - 1];
        bool callee = prev.type == TT::Identifier || prev.type == TT::RParen ||
                      prev.type == TT::RBracket || prev.type == TT::Greater ||
                      prev.type == TT::KwSuper || prev.type == TT::KwImport ||
                      prev.type == TT::QuestionDot || prev.type == TT::Template;
        if (!callee) return false;
        if (prev.type == TT::Identifier && k >= 2 &&
            (tokens[k - 2].type == TT::KwFunction || tokens[k - 2].type == TT::Star)) {
            return false;
        }
        size_t after = match[k] + 1;
        if (after < tokens.size()) {
            TT t = tokens[after].type;
            if (t == TT::Arrow || t == TT::LBrace || t == TT::Colon) return false;
        }
        return true;
    }

    bool is_array_bracket(size_t k) const {
        if (k == 0) return true;
        switch (tokens[k - 1].type) {
        case TT::Identifier:
        case TT::PrivateName:
        case TT::RParen:
        case TT::RBracket:
        case TT::RBrace:
        case TT::String:
        case TT::Template:
        case TT::Number:
        case TT::KwThis:
        case TT::QuestionDot:
        case TT::Greater:
            return false;
        default:
            return true;
        }
    }

    bool is_object_start(size_t i, size_t region_start, bool value_start) const {
        if (i == region_start && value_start) return true;
        if (i == 0) return false;
        const auto& p = tokens[i - 1];
        switch (p.type) {
        case TT::Assign:
        case TT::KwReturn:
        case TT::Question:
        case TT::Ellipsis:
        case TT::JsxExprStart:
        case TT::KwYield:
        case TT::KwThrow:
            return true;
        case TT::Operator:
            return p.text == "||" || p.text == "&&" || p.text == "??" ||
                   p.text == "||=" || p.text == "&&=" || p.text == "??=";
        case TT::LParen:
            if (i >= 2 && tokens[i - 2].type == TT::Arrow) return true;
            return is_call_paren(i - 1);
        case TT::LBracket:
            return is_array_bracket(i - 1);
        case TT::Comma: {
            size_t parent = enclosing[i];
            if (parent == npos) return false;
            if (tokens[parent].type == TT::LParen) return is_call_paren(parent);
            if (tokens[parent].type == TT::LBracket) return is_array_bracket(parent);
            return false;
        }
        default:
            return false;
        }
    }

    // Finds object literals and markup openings in [a, b)
    void scan_region(size_t a, size_t b, const std::string& path,
                     std::vector<Node>& out, bool value_start) {
        size_t i = a;
        while (i < b) {
            const auto& t = tokens[i];
            if (t.type == TT::JsxTagOpen) {
                Node el;
                size_t next = parse_jsx_opening(i, b, path, el);
                if (!el.children.empty()) out.push_back(std::move(el));
                i = std::max(next, i + 1);
                continue;
            }
            if (t.type == TT::LBrace && match[i] != npos && match[i] < b &&
                is_object_start(i, a, value_start)) {
                Node obj = parse_object(i, path);
                if (!obj.children.empty()) out.push_back(std::move(obj));
                i = match[i] + 1;
                continue;
            }
            ++i;
        }
    }

    Node parse_object(size_t open, const std::string& parent_path) {
        Node obj;
        obj.kind = NodeKind::ObjectLiteral;
        size_t close = match[open];
        obj.owner = parent_path;
        obj.name = parent_path + "#" + std::to_string(next_ordinal(parent_path));
        obj.span = {tokens[open].span.lo, tokens[close].span.hi};
        obj.anchor = obj.span;
        obj.body = {tokens[open].span.hi, tokens[close].span.lo};
        obj.multiline = has_newline(obj.body.lo, obj.body.hi);

        size_t i = open + 1;
        while (i < close) {
            if (tokens[i].type == TT::Comma) {
                ++i;
                continue;
            }
            size_t end = find_list_item_end(i, close);
            Node p = parse_property(i, end, obj.name);
            p.span = span_of(i, end);
            p.anchor = p.span;
            if (end < close) p.anchor.hi = tokens[end].span.hi;
            sort_embedded(p);
            obj.children.push_back(std::move(p));
            i = end;
        }
        return obj;
    }

    Node parse_property(size_t i, size_t end, const std::string& path) {
        Node p;
        p.kind = NodeKind::ObjectProperty;
        p.owner = path;

        if (tokens[i].type == TT::Ellipsis) {
            p.prop_kind = PropKind::Spread;
            p.name = "...";
            scan_region(i + 1, end, path + ".<spread>", p.embedded, true);
            p.fingerprint = fingerprint(i + 1, end, p.embedded);
            return p;
        }

        auto name_follows = [&](size_t at) {
            return at < end && (is_name(tokens[at]) ||
                                tokens[at].type == TT::LBracket ||
                                tokens[at].type == TT::PrivateName);
        };

        size_t k = i;
        bool getter = false;
        bool setter = false;
        if (tokens[k].type == TT::Identifier && tokens[k].text == "async" &&
            name_follows(k + 1)) {
            p.is_async = true;
            ++k;
        }
        if (k < end && tokens[k].type == TT::Star) ++k;
        if (k < end && tokens[k].type == TT::Identifier &&
            (tokens[k].text == "get" || tokens[k].text == "set") && name_follows(k + 1)) {
            getter = tokens[k].text == "get";
            setter = !getter;
            ++k;
        }
        if (k >= end) {
            p.prop_kind = PropKind::Shorthand;
            p.name = tokens[i].text;
            return p;
        }

        if (tokens[k].type == TT::LBracket && match[k] != npos && match[k] < end) {
            p.name = "[" + join_tokens(k + 1, match[k]) + "]";
            k = match[k] + 1;
        } else {
            p.name = unquote(tokens[k].text);
            ++k;
        }

        std::string value_path = path + "." +
            (getter ? "get " : setter ? "set " : "") + p.name;
        if (k >= end) {
            p.prop_kind = PropKind::Shorthand;
        } else if (tokens[k].type == TT::Colon) {
            p.prop_kind = PropKind::KeyValue;
            scan_region(k + 1, end, value_path, p.embedded, true);
        } else if (tokens[k].type == TT::LParen || tokens[k].type == TT::Less) {
            p.prop_kind = getter ? PropKind::Getter
                        : setter ? PropKind::Setter : PropKind::Method;
            scan_region(k, end, value_path, p.embedded, false);
        } else if (tokens[k].type == TT::Assign) {
            p.prop_kind = PropKind::Shorthand;
            scan_region(k + 1, end, value_path, p.embedded, true);
        } else {
            p.prop_kind = PropKind::KeyValue;
            scan_region(k, end, value_path, p.embedded, false);
        }
        return p;
    }

    // Opening tag starting at the JsxTagOpen token j. Returns the index after
    // the tag; el keeps no children when the tag cannot be reordered.
    size_t parse_jsx_opening(size_t j, size_t limit, const std::string& parent_path,
                             Node& el) {
        el.kind = NodeKind::JsxOpening;
        size_t k = j + 1;
        std::string tag;
        if (k < limit && tokens[k].type == TT::JsxName) {
            tag = tokens[k].text;
            ++k;
        }
        std::string base = parent_path + "<" + tag + ">";
        el.owner = parent_path;
        el.name = base + "#" + std::to_string(next_ordinal(base));
        el.body.lo = tokens[k - 1].span.hi;

        while (k < limit) {
            TT t = tokens[k].type;
            if (t == TT::JsxTagEnd || t == TT::JsxSelfClose) break;
            size_t start = k;
            Node a;
            a.kind = NodeKind::JsxAttribute;
            a.owner = el.name;
            if (t == TT::JsxExprStart && match[k] != npos && match[k] < limit) {
                size_t close = match[k];
                a.prop_kind = PropKind::Spread;
                a.name = "...";
                scan_region(k + 1, close, el.name + ".<spread>", a.embedded, false);
                a.fingerprint = fingerprint(k + 1, close, a.embedded);
                k = close + 1;
            } else if (t == TT::JsxName) {
                a.name = tokens[k].text;
                ++k;
                if (k < limit && tokens[k].type == TT::Assign) {
                    ++k;
                    if (k < limit && tokens[k].type == TT::String) {
                        ++k;
                    } else if (k < limit && tokens[k].type == TT::JsxExprStart &&
                               match[k] != npos && match[k] < limit) {
                        scan_region(k + 1, match[k], el.name + "." + a.name,
                                    a.embedded, true);
                        k = match[k] + 1;
                    } else {
                        // Element-valued attribute: leave this tag as it is
                        el.children.clear();
                        return j + 1;
                    }
                }
            } else {
                ++k;
                continue;
            }
            a.span = span_of(start, k);
            a.anchor = a.span;
            sort_embedded(a);
            el.children.push_back(std::move(a));
        }

        if (k >= limit) {
            el.children.clear();
            return k;
        }
        el.self_closing = tokens[k].type == TT::JsxSelfClose;
        el.body.hi = tokens[k].span.lo;
        el.span = {tokens[j].span.lo, tokens[k].span.hi};
        el.anchor = el.span;
        el.multiline = has_newline(el.body.lo, el.body.hi);
        return k + 1;
    }

    // -- Top-level dispatch -------------------------------------------------

    void parse_file() {
        bool prologue = true;
        while (!at_end()) {
            size_t start = pos;
            Node item = parse_item();
            if (pos == start) {
                diag("unexpected '" + peek().text + "'");
                advance();
                continue;
            }
            if (prologue && item.kind == NodeKind::Statement && item.is_directive) {
                result.module.items.push_back(std::move(item));
                continue;
            }
            item.is_directive = false;
            prologue = false;
            result.module.items.push_back(std::move(item));
        }
    }

    std::vector<std::pair<size_t, size_t>> parse_decorators() {
        std::vector<std::pair<size_t, size_t>> ranges;
        while (check(TT::At)) {
            size_t start = pos;
            advance();
            if (is_name(peek())) advance();
            while ((check(TT::Dot) || check(TT::QuestionDot)) && is_name(peek_at(1))) {
                advance();
                advance();
            }
            if (check(TT::Less)) skip_angles();
            if (check(TT::LParen)) skip_group();
            ranges.push_back({start, pos});
        }
        return ranges;
    }

    static std::string item_path(const Node& n) {
        if (n.kind == NodeKind::ExportDefault) return "default";
        if (n.kind == NodeKind::Variable) {
            std::string path;
            for (const auto& b : n.bindings) {
                if (!path.empty()) path += ",";
                path += b;
            }
            return path;
        }
        return n.name.empty() ? "default" : n.name;
    }

    Node parse_item() {
        size_t first = pos;
        auto decorators = parse_decorators();
        Node n;

        if (check(TT::KwImport) && peek_at(1).type != TT::LParen &&
            peek_at(1).type != TT::Dot && !is_import_equals()) {
            parse_import(n);
        } else if (check(TT::KwExport)) {
            parse_export(n, first);
        } else {
            parse_declaration(n, first);
        }
        if (pos == first) return n;

        for (const auto& range : decorators) {
            scan_region(range.first, range.second, item_path(n) + "@", n.embedded, false);
        }
        sort_embedded(n);
        n.span = span_of(first, pos);
        n.anchor = n.span;
        n.refs = collect_refs(first, pos);
        return n;
    }

    bool is_import_equals() const {
        // import X = require("...") / import X = A.B
        size_t k = 1;
        if (peek_at(k).type == TT::Identifier && peek_at(k).text == "type") ++k;
        return is_name(peek_at(k)) && peek_at(k + 1).type == TT::Assign;
    }

    // -- Imports and exports ------------------------------------------------

    void parse_specifiers(std::vector<ImportSpecifier>& out) {
        size_t close = match[pos];
        if (close == npos) {
            advance();
            return;
        }
        advance(); // {
        while (pos < close) {
            if (match_tok(TT::Comma)) continue;
            if (check_word("type") && is_name(peek_at(1)) &&
                !(peek_at(1).type == TT::Identifier && peek_at(1).text == "as")) {
                advance();
            }
            if (!is_name(peek())) {
                advance();
                continue;
            }
            ImportSpecifier s;
            s.kind = SpecifierKind::Named;
            s.imported = unquote(advance().text);
            if (match_word("as") && is_name(peek())) {
                s.local = unquote(advance().text);
            } else {
                s.local = s.imported;
            }
            out.push_back(std::move(s));
        }
        pos = close + 1;
    }

    void parse_module_path(Node& n) {
        if (check(TT::String)) {
            n.source = unquote(advance().text);
        } else {
            diag("expected module path");
        }
    }

    void skip_import_attributes() {
        if ((check_word("assert") || check(TT::KwWith)) &&
            peek_at(1).type == TT::LBrace && !peek().newline_before) {
            advance();
            skip_group();
        }
    }

    void parse_import(Node& n) {
        n.kind = NodeKind::Import;
        advance(); // import

        if (check_word("type") && !(peek_at(1).type == TT::Identifier &&
                                    peek_at(1).text == "from") &&
            peek_at(1).type != TT::Comma) {
            n.is_type_only = true;
            advance();
        }

        if (check(TT::String)) {
            parse_module_path(n);
        } else {
            if (check(TT::Identifier) || (is_keyword(peek().type) && !check(TT::LBrace))) {
                ImportSpecifier s;
                s.kind = SpecifierKind::Default;
                s.local = advance().text;
                s.imported = "default";
                n.specifiers.push_back(std::move(s));
                match_tok(TT::Comma);
            }
            if (match_tok(TT::Star)) {
                match_word("as");
                ImportSpecifier s;
                s.kind = SpecifierKind::Namespace;
                if (is_name(peek())) s.local = advance().text;
                s.imported = "*";
                n.specifiers.push_back(std::move(s));
            }
            if (check(TT::LBrace)) parse_specifiers(n.specifiers);
            if (!match_word("from")) diag("expected 'from' in import");
            parse_module_path(n);
        }
        skip_import_attributes();
        match_tok(TT::Semicolon);
        n.name = n.source;
    }

    void parse_export(Node& n, size_t first) {
        advance(); // export
        n.is_exported = true;

        if (match_tok(TT::KwDefault)) {
            parse_export_default(n);
            return;
        }
        if (check(TT::Assign) || check_word("as") || check(TT::KwImport)) {
            parse_statement(n, first);
            return;
        }
        if (match_tok(TT::Star)) {
            n.kind = NodeKind::ExportAll;
            if (match_word("as") && is_name(peek())) n.name = unquote(advance().text);
            if (!match_word("from")) diag("expected 'from' in export");
            parse_module_path(n);
            skip_import_attributes();
            match_tok(TT::Semicolon);
            return;
        }
        if (check_word("type") && peek_at(1).type == TT::LBrace) {
            n.is_type_only = true;
            advance();
        }
        if (check(TT::LBrace)) {
            parse_specifiers(n.specifiers);
            if (match_word("from")) {
                n.kind = NodeKind::ReExport;
                parse_module_path(n);
                skip_import_attributes();
            } else {
                n.kind = NodeKind::ExportList;
            }
            match_tok(TT::Semicolon);
            return;
        }
        parse_declaration(n, first);
    }

    void parse_export_default(Node& n) {
        if (check(TT::KwFunction) ||
            (check_word("async") && peek_at(1).type == TT::KwFunction &&
             !peek_at(1).newline_before)) {
            if (match_word("async")) n.is_async = true;
            parse_function(n);
            n.inner_kind = NodeKind::Function;
        } else if (check(TT::KwClass) ||
                   (check_word("abstract") && peek_at(1).type == TT::KwClass)) {
            if (match_word("abstract")) n.is_abstract = true;
            parse_class(n);
            n.inner_kind = NodeKind::Class;
        } else if (check_word("interface") && is_name(peek_at(1))) {
            parse_interface(n);
            n.inner_kind = NodeKind::Interface;
        } else {
            size_t a = pos;
            size_t end = find_end(pos, false);
            scan_region(a, end, "default", n.embedded, true);
            n.fingerprint = fingerprint(a, end, n.embedded);
            pos = end;
            match_tok(TT::Semicolon);
        }
        n.kind = NodeKind::ExportDefault;
        n.is_default = true;
    }

    // -- Declarations -------------------------------------------------------

    bool declaration_follows(size_t k) const {
        const auto& t = peek_at(k);
        switch (t.type) {
        case TT::KwFunction:
        case TT::KwClass:
        case TT::KwConst:
        case TT::KwLet:
        case TT::KwVar:
        case TT::KwEnum:
            return true;
        case TT::Identifier:
            return t.text == "interface" || t.text == "type" || t.text == "abstract" ||
                   t.text == "async" || t.text == "namespace" || t.text == "module" ||
                   t.text == "global";
        default:
            return false;
        }
    }

    void parse_declaration(Node& n, size_t first) {
        while (true) {
            if (check_word("declare") && declaration_follows(1)) {
                n.is_declare = true;
                advance();
                continue;
            }
            if (check_word("abstract") && peek_at(1).type == TT::KwClass) {
                n.is_abstract = true;
                advance();
                continue;
            }
            break;
        }
        if (check_word("async") && peek_at(1).type == TT::KwFunction &&
            !peek_at(1).newline_before) {
            n.is_async = true;
            advance();
        }

        if (check(TT::KwFunction)) {
            parse_function(n);
        } else if (check(TT::KwClass)) {
            parse_class(n);
        } else if (check(TT::KwConst) && peek_at(1).type == TT::KwEnum) {
            advance();
            parse_enum(n);
        } else if (check(TT::KwEnum)) {
            parse_enum(n);
        } else if ((check(TT::KwConst) || check(TT::KwVar) || check(TT::KwLet)) &&
                   (is_name(peek_at(1)) || peek_at(1).type == TT::LBrace ||
                    peek_at(1).type == TT::LBracket)) {
            parse_variable(n);
        } else if (check_word("interface") && is_name(peek_at(1))) {
            parse_interface(n);
        } else if (check_word("type") && peek_at(1).type == TT::Identifier &&
                   (peek_at(2).type == TT::Assign || peek_at(2).type == TT::Less)) {
            parse_type_alias(n);
        } else {
            parse_statement(n, first);
        }
    }

    void parse_statement(Node& n, size_t first) {
        n.kind = NodeKind::Statement;
        std::string path = "stmt#" + std::to_string(statement_count++);

        if (check(TT::Unknown) && peek().text.rfind("#!", 0) == 0) {
            advance();
            n.is_directive = true;
            n.fingerprint = tokens[pos - 1].text;
            return;
        }

        size_t end = find_end(pos, false);
        scan_region(pos, end, path, n.embedded, false);
        pos = end;
        match_tok(TT::Semicolon);
        if (pos == first) return;
        n.fingerprint = fingerprint(first, pos, n.embedded);
        n.is_directive = tokens[first].type == TT::String &&
                         (pos == first + 1 ||
                          (pos == first + 2 && tokens[first + 1].type == TT::Semicolon));
    }

    void parse_params(Signature& sig) {
        if (!check(TT::LParen)) {
            diag("expected parameter list");
            return;
        }
        size_t close = match[pos];
        if (close == npos) {
            skip_group();
            return;
        }
        advance(); // (
        static const std::unordered_set<std::string> param_modifiers = {
            "public", "private", "protected", "readonly", "override"
        };
        while (pos < close) {
            if (match_tok(TT::Comma)) continue;
            parse_decorators();
            while (check(TT::Identifier) && param_modifiers.count(peek().text) &&
                   (is_name(peek_at(1)) || peek_at(1).type == TT::LBrace ||
                    peek_at(1).type == TT::LBracket)) {
                advance();
            }

            Param p;
            if (match_tok(TT::Ellipsis)) {
                p.pattern = ParamPattern::Rest;
                if (is_name(peek())) {
                    p.name = advance().text;
                } else if (check(TT::LBrace) || check(TT::LBracket)) {
                    skip_group();
                }
            } else if (check(TT::LBrace)) {
                p.pattern = ParamPattern::Object;
                skip_group();
            } else if (check(TT::LBracket)) {
                p.pattern = ParamPattern::Array;
                skip_group();
            } else if (check(TT::KwThis)) {
                p.pattern = ParamPattern::This;
                p.name = advance().text;
            } else if (is_name(peek())) {
                p.name = advance().text;
            } else {
                advance();
                continue;
            }
            match_tok(TT::Question);
            if (match_tok(TT::Colon)) {
                size_t a = pos;
                size_t e = std::min(find_type_end(pos, true, true), close);
                p.type_tag = type_tag(a, e);
                pos = e;
            }
            if (match_tok(TT::Assign)) {
                pos = std::min(find_end(pos, true), close);
            }
            sig.params.push_back(std::move(p));
            if (pos < close && !check(TT::Comma)) {
                // Unrecognized tail of a parameter
                pos = find_list_item_end(pos, close);
            }
        }
        pos = close + 1;
    }

    void parse_return_type(Signature& sig) {
        if (!match_tok(TT::Colon)) return;
        size_t a = pos;
        size_t e = find_type_end(pos, false, false);
        sig.return_tag = type_tag(a, e);
        pos = e;
    }

    void parse_function(Node& n) {
        n.kind = NodeKind::Function;
        advance(); // function
        match_tok(TT::Star);
        if (is_name(peek()) && !check(TT::String) && !check(TT::Number)) {
            n.name = advance().text;
        }
        if (check(TT::Less)) skip_angles();
        parse_params(n.sig);
        n.has_sig = true;
        parse_return_type(n.sig);
        if (check(TT::LBrace)) {
            if (match[pos] != npos) {
                scan_region(pos + 1, match[pos], n.name.empty() ? "default" : n.name,
                            n.embedded, false);
            }
            skip_group();
        } else {
            match_tok(TT::Semicolon);
        }
    }

    void parse_class(Node& n) {
        n.kind = NodeKind::Class;
        advance(); // class
        if (is_name(peek()) && !check(TT::KwExtends) && !check_word("implements")) {
            n.name = advance().text;
        }
        if (check(TT::Less)) skip_angles();
        if (match_tok(TT::KwExtends)) {
            std::string sup;
            while (is_name(peek())) {
                sup += advance().text;
                if (!check(TT::Dot)) break;
                sup += advance().text;
            }
            n.super_name = sup;
            // Type arguments or mixin calls
            while (!at_end() && !check(TT::LBrace) && !check_word("implements")) {
                if (is_open(peek().type)) skip_group();
                else if (check(TT::Less)) skip_angles();
                else advance();
            }
        }
        if (match_word("implements")) {
            while (!at_end() && !check(TT::LBrace)) {
                if (check(TT::Less)) {
                    skip_angles();
                    continue;
                }
                if (check(TT::Identifier)) n.heritage.push_back(peek().text);
                advance();
            }
        }
        if (!check(TT::LBrace)) {
            diag("expected class body");
            return;
        }
        parse_class_body(n);
    }

    void parse_class_body(Node& n) {
        size_t open = pos;
        size_t close = match[open];
        if (close == npos) {
            skip_group();
            return;
        }
        n.body = {tokens[open].span.hi, tokens[close].span.lo};
        n.multiline = true;
        pos = open + 1;
        std::string cls = n.name.empty() ? "default" : n.name;
        while (pos < close) {
            if (match_tok(TT::Semicolon)) continue;
            size_t first = pos;
            Node m = parse_member(cls, close);
            if (pos == first) {
                diag("unexpected '" + peek().text + "' in class body");
                advance();
                continue;
            }
            pos = std::min(pos, close);
            m.span = span_of(first, pos);
            m.anchor = m.span;
            sort_embedded(m);
            n.children.push_back(std::move(m));
        }
        pos = close + 1;
    }

    bool member_name_follows(size_t k) const {
        const auto& t = peek_at(k);
        if (t.type == TT::LBracket || t.type == TT::PrivateName || t.type == TT::Star) {
            return true;
        }
        return is_name(t);
    }

    Node parse_member(const std::string& cls, size_t close) {
        Node m;
        m.kind = NodeKind::Property;
        m.owner = cls;
        auto decorators = parse_decorators();

        static const std::unordered_set<std::string> modifiers = {
            "public", "private", "protected", "static", "readonly", "abstract",
            "override", "declare", "accessor", "async"
        };
        while (check(TT::Identifier) && modifiers.count(peek().text)) {
            if (check_word("static") && peek_at(1).type == TT::LBrace) break;
            if (!member_name_follows(1)) break;
            const std::string& word = peek().text;
            if (word == "public") m.access = Accessibility::Public;
            else if (word == "private") m.access = Accessibility::Private;
            else if (word == "protected") m.access = Accessibility::Protected;
            else if (word == "static") m.is_static = true;
            else if (word == "abstract") m.is_abstract = true;
            else if (word == "async") m.is_async = true;
            advance();
        }

        if (check_word("static") && peek_at(1).type == TT::LBrace) {
            m.kind = NodeKind::StaticBlock;
            m.name = "static";
            m.is_static = true;
            advance();
            if (match[pos] != npos) {
                scan_region(pos + 1, match[pos], cls + ".static{}", m.embedded, false);
            }
            skip_group();
            return m;
        }

        match_tok(TT::Star);
        if ((check_word("get") || check_word("set")) && member_name_follows(1) &&
            peek_at(1).type != TT::Star) {
            m.method_kind = check_word("get") ? MethodKind::Getter : MethodKind::Setter;
            advance();
        }

        if (check(TT::PrivateName)) {
            m.is_private_name = true;
            m.name = advance().text;
        } else if (check(TT::LBracket)) {
            size_t close_b = match[pos];
            if (close_b != npos && close_b >= pos + 3 && is_name(peek_at(1)) &&
                peek_at(2).type == TT::Colon) {
                m.kind = NodeKind::IndexSignature;
                m.name = join_tokens(pos, close_b + 1);
                skip_group();
                if (match_tok(TT::Colon)) pos = std::min(find_type_end(pos, false, false), close);
                match_tok(TT::Semicolon);
                return m;
            }
            if (close_b == npos) {
                skip_group();
                return m;
            }
            m.name = "[" + join_tokens(pos + 1, close_b) + "]";
            skip_group();
        } else if (is_name(peek())) {
            m.name = unquote(advance().text);
        } else {
            return m;
        }

        std::string member_path = cls + "." + (m.is_static ? "static " : "") +
            (m.method_kind == MethodKind::Getter ? "get "
             : m.method_kind == MethodKind::Setter ? "set " : "") + m.name;

        match_tok(TT::Question);
        if (check(TT::Operator) && peek().text == "!") advance();

        if (check(TT::LParen) || check(TT::Less)) {
            bool ctor = m.name == "constructor" && !m.is_private_name && !m.is_static;
            m.kind = ctor ? NodeKind::Constructor : NodeKind::Method;
            if (check(TT::Less)) skip_angles();
            parse_params(m.sig);
            m.has_sig = true;
            parse_return_type(m.sig);
            if (check(TT::LBrace)) {
                if (match[pos] != npos) {
                    scan_region(pos + 1, match[pos], member_path, m.embedded, false);
                }
                skip_group();
            } else {
                match_tok(TT::Semicolon);
            }
        } else {
            m.kind = NodeKind::Property;
            if (match_tok(TT::Colon)) pos = std::min(find_type_end(pos, false, true), close);
            if (match_tok(TT::Assign)) {
                size_t a = pos;
                size_t e = std::min(find_end(pos, false), close);
                scan_region(a, e, member_path, m.embedded, true);
                pos = e;
            }
            match_tok(TT::Semicolon);
        }

        for (const auto& range : decorators) {
            scan_region(range.first, range.second, member_path + "@", m.embedded, false);
        }
        return m;
    }

    void parse_enum(Node& n) {
        n.kind = NodeKind::Enum;
        advance(); // enum
        if (is_name(peek())) n.name = advance().text;
        if (!check(TT::LBrace)) {
            diag("expected enum body");
            return;
        }
        size_t open = pos;
        size_t close = match[open];
        if (close == npos) {
            skip_group();
            return;
        }
        n.body = {tokens[open].span.hi, tokens[close].span.lo};
        n.multiline = has_newline(n.body.lo, n.body.hi);

        size_t i = open + 1;
        while (i < close) {
            if (tokens[i].type == TT::Comma) {
                ++i;
                continue;
            }
            size_t end = find_list_item_end(i, close);
            Node m;
            m.kind = NodeKind::EnumMember;
            m.owner = n.name;
            if (tokens[i].type == TT::LBracket && match[i] != npos && match[i] < end) {
                m.name = "[" + join_tokens(i + 1, match[i]) + "]";
            } else {
                m.name = unquote(tokens[i].text);
            }
            size_t eq = i + 1;
            if (eq < end && tokens[eq].type == TT::Assign) {
                size_t v = eq + 1;
                size_t len = end - v;
                if (len == 1 && tokens[v].type == TT::String) {
                    m.enum_init = EnumInit::String;
                } else if ((len == 1 && tokens[v].type == TT::Number) ||
                           (len == 2 && tokens[v].type == TT::Operator &&
                            tokens[v].text == "-" && tokens[v + 1].type == TT::Number)) {
                    m.enum_init = EnumInit::Number;
                } else {
                    m.enum_init = EnumInit::Other;
                    scan_region(v, end, n.name + "." + m.name, m.embedded, true);
                }
            }
            m.span = span_of(i, end);
            m.anchor = m.span;
            if (end < close) m.anchor.hi = tokens[end].span.hi;
            n.children.push_back(std::move(m));
            i = end;
        }
        pos = close + 1;
    }

    void parse_interface(Node& n) {
        n.kind = NodeKind::Interface;
        advance(); // interface
        if (is_name(peek())) n.name = advance().text;
        if (check(TT::Less)) skip_angles();
        if (match_tok(TT::KwExtends)) {
            while (!at_end() && !check(TT::LBrace)) {
                if (check(TT::Less)) {
                    skip_angles();
                    continue;
                }
                if (check(TT::Identifier) && !(pos > 0 && tokens[pos - 1].type == TT::Dot)) {
                    n.heritage.push_back(peek().text);
                }
                advance();
            }
        }
        if (check(TT::LBrace)) {
            skip_group();
        } else {
            diag("expected interface body");
        }
    }

    void parse_type_alias(Node& n) {
        n.kind = NodeKind::TypeAlias;
        advance(); // type
        n.name = advance().text;
        if (check(TT::Less)) skip_angles();
        expect(TT::Assign);
        pos = find_end(pos, false);
        match_tok(TT::Semicolon);
    }

    // Composite name of a destructuring pattern: {a,b} or [a,b]
    std::string pattern_name(size_t open) const {
        size_t close = match[open];
        if (close == npos) return tokens[open].text;
        bool object = tokens[open].type == TT::LBrace;
        std::string out = object ? "{" : "[";
        size_t i = open + 1;
        bool first = true;
        while (i <= close) {
            size_t end = find_list_item_end(i, close);
            if (!(object && end == i && i == close)) {
                if (!first) out += ",";
                first = false;
                if (end > i) {
                    size_t k = i;
                    // { key: target } binds the target
                    if (object && k + 2 < end && tokens[k + 1].type == TT::Colon) k += 2;
                    const auto& t = tokens[k];
                    if (t.type == TT::Ellipsis && k + 1 < end) {
                        out += "..." + tokens[k + 1].text;
                    } else if (t.type == TT::LBrace || t.type == TT::LBracket) {
                        out += pattern_name(k);
                    } else {
                        out += unquote(t.text);
                    }
                }
            }
            if (end >= close) break;
            i = end + 1;
        }
        out += object ? "}" : "]";
        return out;
    }

    void parse_variable(Node& n) {
        n.kind = NodeKind::Variable;
        n.var_kind = check(TT::KwConst) ? VarKind::Const
                   : check(TT::KwLet) ? VarKind::Let : VarKind::Var;
        advance();
        while (true) {
            std::string binding;
            if (check(TT::LBrace) || check(TT::LBracket)) {
                binding = pattern_name(pos);
                skip_group();
            } else if (is_name(peek())) {
                binding = advance().text;
            } else {
                diag("expected variable name");
                break;
            }
            n.bindings.push_back(binding);
            if (check(TT::Operator) && peek().text == "!") advance();
            if (match_tok(TT::Colon)) pos = find_type_end(pos, true, true);
            if (match_tok(TT::Assign)) {
                size_t a = pos;
                size_t e = find_end(pos, true);
                scan_region(a, e, binding, n.embedded, true);
                pos = e;
            }
            if (!match_tok(TT::Comma)) break;
        }
        match_tok(TT::Semicolon);
        n.name = n.bindings.empty() ? "" : n.bindings.front();
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<ParseResult> parse(const LexResult& lex_result,
                          const std::string& source,
                          const std::string& filename) {
    if (lex_result.tokens.empty()) {
        return Result<ParseResult>::ok(ParseResult{});
    }

    Parser parser(lex_result.tokens, source, filename);
    parser.parse_file();
    parser.result.module.jsx = lex_result.jsx;
    parser.result.comments = attach_comments(lex_result.tokens,
                                             lex_result.comments, source);
    return Result<ParseResult>::ok(std::move(parser.result));
}

Result<ParseResult> parse_source(const std::string& source,
                                 const std::string& filename) {
    auto lexed = lex(source, filename, detect_jsx(filename, source));
    if (lexed.is_err()) return std::move(lexed).error();
    return parse(lexed.value(), source, filename);
}

} // namespace tsorg
