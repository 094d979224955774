#include <tsorg/lang/lexer.hpp>
#include <cctype>
#include <algorithm>

namespace tsorg {

// ---------------------------------------------------------------------------
// Keyword tables
// ---------------------------------------------------------------------------

const std::unordered_map<std::string, TsTokenType>& ts_keywords() {
    static const std::unordered_map<std::string, TsTokenType> table = {
        {"import",     TsTokenType::KwImport},
        {"export",     TsTokenType::KwExport},
        {"default",    TsTokenType::KwDefault},
        {"function",   TsTokenType::KwFunction},
        {"class",      TsTokenType::KwClass},
        {"const",      TsTokenType::KwConst},
        {"let",        TsTokenType::KwLet},
        {"var",        TsTokenType::KwVar},
        {"enum",       TsTokenType::KwEnum},
        {"extends",    TsTokenType::KwExtends},
        {"return",     TsTokenType::KwReturn},
        {"new",        TsTokenType::KwNew},
        {"if",         TsTokenType::KwIf},
        {"else",       TsTokenType::KwElse},
        {"for",        TsTokenType::KwFor},
        {"while",      TsTokenType::KwWhile},
        {"do",         TsTokenType::KwDo},
        {"switch",     TsTokenType::KwSwitch},
        {"case",       TsTokenType::KwCase},
        {"break",      TsTokenType::KwBreak},
        {"continue",   TsTokenType::KwContinue},
        {"throw",      TsTokenType::KwThrow},
        {"try",        TsTokenType::KwTry},
        {"catch",      TsTokenType::KwCatch},
        {"finally",    TsTokenType::KwFinally},
        {"typeof",     TsTokenType::KwTypeof},
        {"instanceof", TsTokenType::KwInstanceof},
        {"in",         TsTokenType::KwIn},
        {"void",       TsTokenType::KwVoid},
        {"delete",     TsTokenType::KwDelete},
        {"this",       TsTokenType::KwThis},
        {"super",      TsTokenType::KwSuper},
        {"null",       TsTokenType::KwNull},
        {"true",       TsTokenType::KwTrue},
        {"false",      TsTokenType::KwFalse},
        {"yield",      TsTokenType::KwYield},
        {"await",      TsTokenType::KwAwait},
        {"debugger",   TsTokenType::KwDebugger},
        {"with",       TsTokenType::KwWith},
    };
    return table;
}

const char* ts_token_name(TsTokenType t) {
    switch (t) {
    case TsTokenType::Identifier:   return "Identifier";
    case TsTokenType::PrivateName:  return "PrivateName";
    case TsTokenType::Number:       return "Number";
    case TsTokenType::String:       return "String";
    case TsTokenType::Template:     return "Template";
    case TsTokenType::Regex:        return "Regex";
    case TsTokenType::LParen:       return "LParen";
    case TsTokenType::RParen:       return "RParen";
    case TsTokenType::LBracket:     return "LBracket";
    case TsTokenType::RBracket:     return "RBracket";
    case TsTokenType::LBrace:       return "LBrace";
    case TsTokenType::RBrace:       return "RBrace";
    case TsTokenType::Semicolon:    return "Semicolon";
    case TsTokenType::Comma:        return "Comma";
    case TsTokenType::Dot:          return "Dot";
    case TsTokenType::QuestionDot:  return "QuestionDot";
    case TsTokenType::Ellipsis:     return "Ellipsis";
    case TsTokenType::Colon:        return "Colon";
    case TsTokenType::Question:     return "Question";
    case TsTokenType::Assign:       return "Assign";
    case TsTokenType::Arrow:        return "Arrow";
    case TsTokenType::Less:         return "Less";
    case TsTokenType::Greater:      return "Greater";
    case TsTokenType::Slash:        return "Slash";
    case TsTokenType::Star:         return "Star";
    case TsTokenType::At:           return "At";
    case TsTokenType::Operator:     return "Operator";
    case TsTokenType::JsxTagOpen:   return "JsxTagOpen";
    case TsTokenType::JsxName:      return "JsxName";
    case TsTokenType::JsxText:      return "JsxText";
    case TsTokenType::JsxTagEnd:    return "JsxTagEnd";
    case TsTokenType::JsxSelfClose: return "JsxSelfClose";
    case TsTokenType::JsxCloseOpen: return "JsxCloseOpen";
    case TsTokenType::JsxExprStart: return "JsxExprStart";
    case TsTokenType::JsxExprEnd:   return "JsxExprEnd";
    case TsTokenType::Eof:          return "Eof";
    case TsTokenType::Unknown:      return "Unknown";
    default:
        // Keywords: return generic name
        return "Keyword";
    }
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

namespace {

bool is_ident_start(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || c == '$' || u >= 0x80;
}

bool is_ident_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '$' || u >= 0x80;
}

bool is_jsx_name_char(char c) {
    return is_ident_char(c) || c == '-' || c == '.' || c == ':';
}

struct Lexer {
    const std::string& source;
    const std::string& filename;
    bool jsx;
    size_t pos;
    int line;
    int col;

    // Start of the token being lexed
    size_t start;
    SourcePos start_pos;
    bool pending_newline;

    std::vector<TsToken> tokens;
    std::vector<Comment> comments;

    Lexer(const std::string& src, const std::string& fname, bool jsx_mode)
        : source(src), filename(fname), jsx(jsx_mode), pos(0), line(1), col(1),
          start(0), pending_newline(false) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return at_end() ? '\0' : source[pos]; }

    char peek_next() const {
        return (pos + 1 < source.size()) ? source[pos + 1] : '\0';
    }

    char peek_at(size_t offset) const {
        return (pos + offset < source.size()) ? source[pos + offset] : '\0';
    }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
        return c;
    }

    SourcePos current_pos() const {
        return {filename, line, col};
    }

    void begin() {
        start = pos;
        start_pos = current_pos();
    }

    void emit(TsTokenType type) {
        TsToken tok;
        tok.type = type;
        tok.text = source.substr(start, pos - start);
        tok.pos = start_pos;
        tok.span = {static_cast<uint32_t>(start), static_cast<uint32_t>(pos)};
        tok.newline_before = pending_newline;
        pending_newline = false;
        tokens.push_back(std::move(tok));
    }

    Result<LexResult> run() {
        while (true) {
            skip_trivia();
            if (at_end()) break;
            lex_token();
        }

        begin();
        emit(TsTokenType::Eof);

        LexResult result;
        result.tokens = std::move(tokens);
        result.comments = std::move(comments);
        result.jsx = jsx;
        return Result<LexResult>::ok(std::move(result));
    }

    // Whitespace and comments; comments are recorded
    void skip_trivia() {
        while (!at_end()) {
            char c = peek();
            if (c == '\n') {
                pending_newline = true;
                advance();
            } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
                advance();
            } else if (c == '/' && peek_next() == '/') {
                lex_line_comment();
            } else if (c == '/' && peek_next() == '*') {
                lex_block_comment();
            } else {
                break;
            }
        }
    }

    void lex_line_comment() {
        auto p = current_pos();
        size_t lo = pos;
        advance(); // /
        advance(); // /
        size_t text_start = pos;
        while (!at_end() && peek() != '\n' && peek() != '\r') {
            advance();
        }
        Comment c;
        c.kind = CommentKind::Line;
        c.text = source.substr(text_start, pos - text_start);
        c.pos = p;
        c.span = {static_cast<uint32_t>(lo), static_cast<uint32_t>(pos)};
        comments.push_back(std::move(c));
    }

    void lex_block_comment() {
        auto p = current_pos();
        size_t lo = pos;
        advance(); // /
        advance(); // *
        size_t text_start = pos;
        size_t text_end = std::string::npos;
        while (!at_end()) {
            if (peek() == '*' && peek_next() == '/') {
                text_end = pos;
                advance(); // *
                advance(); // /
                break;
            }
            if (peek() == '\n') pending_newline = true;
            advance();
        }
        // Unclosed block comment: store what we have
        if (text_end == std::string::npos) text_end = pos;
        Comment c;
        c.kind = CommentKind::Block;
        c.text = source.substr(text_start, text_end - text_start);
        c.pos = p;
        c.span = {static_cast<uint32_t>(lo), static_cast<uint32_t>(pos)};
        comments.push_back(std::move(c));
    }

    // Type of the last significant token, or Eof when there is none
    TsTokenType last_type() const {
        return tokens.empty() ? TsTokenType::Eof : tokens.back().type;
    }

    // True when the next token starts an expression (regex and markup
    // are only possible there)
    bool expression_allowed() const {
        if (tokens.empty()) return true;
        const auto& last = tokens.back();
        switch (last.type) {
        case TsTokenType::Identifier:
        case TsTokenType::PrivateName:
        case TsTokenType::Number:
        case TsTokenType::String:
        case TsTokenType::Template:
        case TsTokenType::Regex:
        case TsTokenType::RParen:
        case TsTokenType::RBracket:
        case TsTokenType::RBrace:
        case TsTokenType::KwThis:
        case TsTokenType::KwSuper:
        case TsTokenType::KwNull:
        case TsTokenType::KwTrue:
        case TsTokenType::KwFalse:
        case TsTokenType::JsxTagEnd:
        case TsTokenType::JsxSelfClose:
        case TsTokenType::JsxExprEnd:
        case TsTokenType::Greater:
            return false;
        case TsTokenType::Operator:
            return last.text != "++" && last.text != "--";
        default:
            return true;
        }
    }

    void lex_token() {
        begin();
        char c = peek();

        if (c == '"' || c == '\'') {
            lex_string(c);
            emit(TsTokenType::String);
            return;
        }
        if (c == '`') {
            advance();
            skip_template();
            emit(TsTokenType::Template);
            return;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(peek_next())))) {
            lex_number();
            return;
        }
        if (is_ident_start(c)) {
            lex_identifier();
            return;
        }
        if (c == '#') {
            if (pos == 0 && peek_next() == '!') {
                // Shebang line
                while (!at_end() && peek() != '\n') advance();
                emit(TsTokenType::Unknown);
                return;
            }
            advance();
            if (is_ident_start(peek())) {
                while (!at_end() && is_ident_char(peek())) advance();
                emit(TsTokenType::PrivateName);
            } else {
                emit(TsTokenType::Unknown);
            }
            return;
        }
        if (c == '/' && expression_allowed() && lex_regex()) {
            emit(TsTokenType::Regex);
            return;
        }
        if (c == '<' && jsx && expression_allowed() && lex_jsx_element()) {
            return;
        }
        lex_operator();
    }

    void lex_string(char quote) {
        advance(); // opening quote
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                advance();
                if (!at_end()) advance();
                continue;
            }
            if (c == quote) {
                advance();
                return;
            }
            if (c == '\n') {
                // Unterminated string at end of line
                return;
            }
            advance();
        }
    }

    // Consumes a template body after the opening backtick, including
    // nested ${...} substitutions.
    void skip_template() {
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                advance();
                if (!at_end()) advance();
                continue;
            }
            if (c == '`') {
                advance();
                return;
            }
            if (c == '$' && peek_next() == '{') {
                advance();
                advance();
                skip_substitution();
                continue;
            }
            advance();
        }
    }

    void skip_substitution() {
        int depth = 1;
        while (!at_end()) {
            char c = peek();
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    advance();
                    return;
                }
            } else if (c == '"' || c == '\'') {
                lex_string(c);
                continue;
            } else if (c == '`') {
                advance();
                skip_template();
                continue;
            } else if (c == '/' && peek_next() == '/') {
                while (!at_end() && peek() != '\n') advance();
                continue;
            } else if (c == '/' && peek_next() == '*') {
                advance();
                advance();
                while (!at_end() && !(peek() == '*' && peek_next() == '/')) advance();
                if (!at_end()) {
                    advance();
                    advance();
                }
                continue;
            }
            advance();
        }
    }

    // Regex literal starting at '/'. Restores the position and returns
    // false when no closing slash exists on the line.
    bool lex_regex() {
        size_t save_pos = pos;
        int save_line = line;
        int save_col = col;
        advance(); // /
        bool in_class = false;
        while (!at_end()) {
            char c = peek();
            if (c == '\n' || c == '\r') break;
            if (c == '\\') {
                advance();
                if (!at_end() && peek() != '\n') advance();
                continue;
            }
            if (c == '[') in_class = true;
            else if (c == ']') in_class = false;
            else if (c == '/' && !in_class) {
                advance();
                while (!at_end() && is_ident_char(peek())) advance();
                return true;
            }
            advance();
        }
        pos = save_pos;
        line = save_line;
        col = save_col;
        return false;
    }

    void lex_number() {
        if (peek() == '0' && std::isalpha(static_cast<unsigned char>(peek_next())) &&
            peek_next() != 'n' && peek_next() != 'e' && peek_next() != 'E') {
            // 0x / 0o / 0b
            advance();
            advance();
            while (!at_end() && (std::isxdigit(static_cast<unsigned char>(peek())) ||
                                 peek() == '_')) {
                advance();
            }
        } else {
            while (!at_end() && (std::isdigit(static_cast<unsigned char>(peek())) ||
                                 peek() == '_')) {
                advance();
            }
            if (peek() == '.' && peek_next() != '.') {
                advance();
                while (!at_end() && (std::isdigit(static_cast<unsigned char>(peek())) ||
                                     peek() == '_')) {
                    advance();
                }
            }
            if (peek() == 'e' || peek() == 'E') {
                char sign = peek_next();
                if (std::isdigit(static_cast<unsigned char>(sign)) ||
                    ((sign == '+' || sign == '-') &&
                     std::isdigit(static_cast<unsigned char>(peek_at(2))))) {
                    advance();
                    if (peek() == '+' || peek() == '-') advance();
                    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
                        advance();
                    }
                }
            }
        }
        if (peek() == 'n') advance(); // bigint
        emit(TsTokenType::Number);
    }

    void lex_identifier() {
        while (!at_end() && is_ident_char(peek())) {
            advance();
        }
        std::string text = source.substr(start, pos - start);

        // Keywords after '.' or '?.' are property names
        auto prev = last_type();
        if (prev != TsTokenType::Dot && prev != TsTokenType::QuestionDot) {
            auto& kws = ts_keywords();
            auto it = kws.find(text);
            if (it != kws.end()) {
                emit(it->second);
                return;
            }
        }
        emit(TsTokenType::Identifier);
    }

    // Emits the longest operator starting at pos from the candidates
    bool match_op(const char* op, TsTokenType type) {
        size_t n = std::char_traits<char>::length(op);
        if (source.compare(pos, n, op) != 0) return false;
        for (size_t i = 0; i < n; ++i) advance();
        emit(type);
        return true;
    }

    void lex_operator() {
        char c = peek();
        switch (c) {
        case '(': advance(); emit(TsTokenType::LParen); return;
        case ')': advance(); emit(TsTokenType::RParen); return;
        case '[': advance(); emit(TsTokenType::LBracket); return;
        case ']': advance(); emit(TsTokenType::RBracket); return;
        case '{': advance(); emit(TsTokenType::LBrace); return;
        case '}': advance(); emit(TsTokenType::RBrace); return;
        case ';': advance(); emit(TsTokenType::Semicolon); return;
        case ',': advance(); emit(TsTokenType::Comma); return;
        case ':': advance(); emit(TsTokenType::Colon); return;
        case '@': advance(); emit(TsTokenType::At); return;
        case '>': advance(); emit(TsTokenType::Greater); return;
        case '~': advance(); emit(TsTokenType::Operator); return;
        default: break;
        }

        if (match_op("...", TsTokenType::Ellipsis)) return;
        if (c == '.') {
            advance();
            emit(TsTokenType::Dot);
            return;
        }
        if (c == '?') {
            if (peek_next() == '.' &&
                !std::isdigit(static_cast<unsigned char>(peek_at(2)))) {
                match_op("?.", TsTokenType::QuestionDot);
                return;
            }
            if (match_op("??=", TsTokenType::Operator)) return;
            if (match_op("??", TsTokenType::Operator)) return;
            advance();
            emit(TsTokenType::Question);
            return;
        }
        if (c == '=') {
            if (match_op("=>", TsTokenType::Arrow)) return;
            if (match_op("===", TsTokenType::Operator)) return;
            if (match_op("==", TsTokenType::Operator)) return;
            advance();
            emit(TsTokenType::Assign);
            return;
        }
        if (c == '<') {
            if (match_op("<<=", TsTokenType::Operator)) return;
            if (match_op("<<", TsTokenType::Operator)) return;
            if (match_op("<=", TsTokenType::Operator)) return;
            advance();
            emit(TsTokenType::Less);
            return;
        }
        if (c == '*') {
            if (match_op("**=", TsTokenType::Operator)) return;
            if (match_op("**", TsTokenType::Operator)) return;
            if (match_op("*=", TsTokenType::Operator)) return;
            advance();
            emit(TsTokenType::Star);
            return;
        }
        if (c == '/') {
            if (match_op("/=", TsTokenType::Operator)) return;
            advance();
            emit(TsTokenType::Slash);
            return;
        }

        static const char* const multi_ops[] = {
            "!==", "!=", "&&=", "&&", "&=", "||=", "||", "|=",
            "++", "+=", "--", "-=", "%=", "^=",
        };
        for (const char* op : multi_ops) {
            if (match_op(op, TsTokenType::Operator)) return;
        }
        if (c == '!' || c == '&' || c == '|' || c == '+' || c == '-' ||
            c == '%' || c == '^') {
            advance();
            emit(TsTokenType::Operator);
            return;
        }

        advance();
        emit(TsTokenType::Unknown);
    }

    // -----------------------------------------------------------------------
    // Markup
    // -----------------------------------------------------------------------

    void skip_jsx_space() {
        while (!at_end()) {
            char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
                advance();
            } else if (c == '/' && (peek_next() == '/' || peek_next() == '*')) {
                skip_trivia();
            } else {
                break;
            }
        }
    }

    void lex_jsx_name() {
        begin();
        while (!at_end() && is_jsx_name_char(peek())) advance();
        emit(TsTokenType::JsxName);
    }

    // Element starting at '<'. Returns false (and restores all state) when
    // the text does not look like markup, e.g. a generic arrow `<T,>`.
    bool lex_jsx_element() {
        size_t save_pos = pos;
        int save_line = line;
        int save_col = col;
        size_t save_tokens = tokens.size();
        size_t save_comments = comments.size();
        bool save_newline = pending_newline;

        auto restore = [&]() {
            pos = save_pos;
            line = save_line;
            col = save_col;
            tokens.resize(save_tokens);
            comments.resize(save_comments);
            pending_newline = save_newline;
            begin();
            return false;
        };

        begin();
        advance(); // <
        emit(TsTokenType::JsxTagOpen);
        skip_jsx_space();

        if (peek() == '>') {
            // Fragment
            begin();
            advance();
            emit(TsTokenType::JsxTagEnd);
            lex_jsx_children();
            return true;
        }
        if (!is_ident_start(peek())) return restore();
        lex_jsx_name();

        bool first = true;
        while (true) {
            skip_jsx_space();
            if (at_end()) return true;
            char c = peek();
            if (c == '/' && peek_next() == '>') {
                begin();
                advance();
                advance();
                emit(TsTokenType::JsxSelfClose);
                return true;
            }
            if (c == '>') {
                begin();
                advance();
                emit(TsTokenType::JsxTagEnd);
                lex_jsx_children();
                return true;
            }
            if (c == '{') {
                lex_jsx_expression();
            } else if (is_ident_start(c)) {
                lex_jsx_name();
                skip_jsx_space();
                if (peek() == '=') {
                    begin();
                    advance();
                    emit(TsTokenType::Assign);
                    skip_jsx_space();
                    char v = peek();
                    if (v == '"' || v == '\'') {
                        begin();
                        advance();
                        while (!at_end() && peek() != v) advance();
                        if (!at_end()) advance();
                        emit(TsTokenType::String);
                    } else if (v == '{') {
                        lex_jsx_expression();
                    } else if (v == '<') {
                        if (!lex_jsx_element()) return restore();
                    } else if (first) {
                        return restore();
                    }
                } else if (first && peek() != '>' && peek() != '/' &&
                           peek() != '{' && !is_ident_start(peek())) {
                    // `<T,>` or `<T extends`-style generics
                    return restore();
                }
            } else {
                return restore();
            }
            first = false;
        }
    }

    void lex_jsx_children() {
        while (!at_end()) {
            char c = peek();
            if (c == '<' && peek_next() == '/') {
                begin();
                advance();
                advance();
                emit(TsTokenType::JsxCloseOpen);
                skip_jsx_space();
                if (is_ident_start(peek())) lex_jsx_name();
                skip_jsx_space();
                if (peek() == '>') {
                    begin();
                    advance();
                    emit(TsTokenType::JsxTagEnd);
                }
                return;
            }
            if (c == '<') {
                if (!lex_jsx_element()) {
                    begin();
                    advance();
                    emit(TsTokenType::Less);
                }
                continue;
            }
            if (c == '{') {
                lex_jsx_expression();
                continue;
            }
            begin();
            while (!at_end() && peek() != '<' && peek() != '{') {
                advance();
            }
            emit(TsTokenType::JsxText);
        }
    }

    // { expression } inside markup, lexed as ordinary code
    void lex_jsx_expression() {
        begin();
        advance(); // {
        emit(TsTokenType::JsxExprStart);
        int depth = 0;
        while (true) {
            skip_trivia();
            if (at_end()) return;
            char c = peek();
            if (c == '}' && depth == 0) {
                begin();
                advance();
                emit(TsTokenType::JsxExprEnd);
                return;
            }
            if (c == '{') ++depth;
            else if (c == '}') --depth;
            lex_token();
        }
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<LexResult> lex(const std::string& source,
                      const std::string& filename,
                      bool jsx) {
    Lexer lexer(source, filename, jsx);
    return lexer.run();
}

bool detect_jsx(const std::string& filename, const std::string& source) {
    auto ends_with = [&](const char* ext) {
        size_t n = std::char_traits<char>::length(ext);
        return filename.size() >= n &&
               filename.compare(filename.size() - n, n, ext) == 0;
    };
    if (ends_with(".tsx") || ends_with(".jsx")) return true;
    if (ends_with(".ts") || ends_with(".mts") || ends_with(".cts")) return false;

    bool has_open = false;
    for (size_t i = 0; i + 1 < source.size(); ++i) {
        if (source[i] == '<' &&
            std::isalpha(static_cast<unsigned char>(source[i + 1]))) {
            has_open = true;
            break;
        }
    }
    return has_open && (source.find("</") != std::string::npos ||
                        source.find("/>") != std::string::npos);
}

} // namespace tsorg
