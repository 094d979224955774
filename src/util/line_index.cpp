#include <tsorg/line_index.hpp>
#include <algorithm>

namespace tsorg {

LineIndex::LineIndex(const std::string& text) : text_(text) {
    starts_.push_back(0);
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') starts_.push_back(static_cast<uint32_t>(i + 1));
    }
}

size_t LineIndex::line_of(uint32_t offset) const {
    auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
    return static_cast<size_t>(it - starts_.begin()) - 1;
}

size_t LineIndex::column_of(uint32_t offset) const {
    return offset - starts_[line_of(offset)];
}

uint32_t LineIndex::line_start(size_t line) const {
    if (line >= starts_.size()) return static_cast<uint32_t>(text_.size());
    return starts_[line];
}

uint32_t LineIndex::line_end(size_t line) const {
    if (line + 1 >= starts_.size()) return static_cast<uint32_t>(text_.size());
    return starts_[line + 1] - 1;
}

std::string LineIndex::line_text(size_t line) const {
    if (line >= starts_.size()) return "";
    uint32_t lo = line_start(line);
    return text_.substr(lo, line_end(line) - lo);
}

bool LineIndex::is_blank(size_t line) const {
    if (line >= starts_.size()) return true;
    for (uint32_t i = line_start(line); i < line_end(line); ++i) {
        char c = text_[i];
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}

bool LineIndex::is_blank_line(long line) const {
    if (line < 0) return true;
    return is_blank(static_cast<size_t>(line));
}

std::string LineIndex::indentation(size_t line) const {
    return leading_whitespace(line_text(line));
}

bool LineIndex::starts_line(uint32_t offset) const {
    for (uint32_t i = line_start(line_of(offset)); i < offset; ++i) {
        if (text_[i] != ' ' && text_[i] != '\t') return false;
    }
    return true;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string leading_whitespace(const std::string& s) {
    size_t n = 0;
    while (n < s.size() && (s[n] == ' ' || s[n] == '\t')) ++n;
    return s.substr(0, n);
}

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r') return false;
    }
    return true;
}

} // namespace tsorg
