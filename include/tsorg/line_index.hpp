#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tsorg {

// Byte offset <-> 0-based line/column lookups over a text buffer, built by
// one linear scan. The text must outlive the index.
class LineIndex {
public:
    explicit LineIndex(const std::string& text);

    size_t line_count() const { return starts_.size(); }

    size_t line_of(uint32_t offset) const;
    size_t column_of(uint32_t offset) const;

    uint32_t line_start(size_t line) const;
    // Offset of the terminating '\n' (or the text size on the last line)
    uint32_t line_end(size_t line) const;

    std::string line_text(size_t line) const;

    // Lines outside the text count as blank
    bool is_blank(size_t line) const;
    bool is_blank_line(long line) const;

    // Leading spaces and tabs of a line
    std::string indentation(size_t line) const;

    // True when only whitespace precedes offset on its line
    bool starts_line(uint32_t offset) const;

private:
    const std::string& text_;
    std::vector<uint32_t> starts_;
};

// Split on '\n'; "a\n" gives {"a", ""}
std::vector<std::string> split_lines(const std::string& text);

std::string join_lines(const std::vector<std::string>& lines);

// Leading spaces and tabs of s
std::string leading_whitespace(const std::string& s);

bool is_blank(const std::string& s);

} // namespace tsorg
