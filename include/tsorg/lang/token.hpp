#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tsorg {

// Source position for error reporting
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
};

// Half-open byte range [lo, hi) into the source text
struct Span {
    uint32_t lo = 0;
    uint32_t hi = 0;

    bool contains(uint32_t pos) const { return pos >= lo && pos < hi; }
    bool encloses(const Span& other) const {
        return other.lo >= lo && other.hi <= hi;
    }
    bool empty() const { return hi <= lo; }
    uint32_t size() const { return hi > lo ? hi - lo : 0; }
};

// Generic token with type parameter
template<typename T>
struct Token {
    T type;
    std::string text;
    SourcePos pos;
    Span span;
    bool newline_before = false;  // a line terminator precedes this token
};

enum class CommentKind {
    Line,   // // comment
    Block   // /* block comment */ (also /** doc */)
};

// Raw comment as found in the source. Never mutated after lexing.
struct Comment {
    CommentKind kind;
    std::string text;     // content without markers, untrimmed
    SourcePos pos;
    Span span;            // covers the markers

    // Source form: "//" + text or "/*" + text + "*/"
    std::string render() const {
        return kind == CommentKind::Line ? "//" + text : "/*" + text + "*/";
    }
};

} // namespace tsorg
