#pragma once

#include <string>

namespace tsorg {

struct StyleOptions {
    bool trim_trailing_whitespace = true;
    bool final_newline = true;
    bool jsx = false;   // lex markup when locating literals
};

// Cosmetic cleanup: trailing whitespace, blank line runs collapsed to one,
// no leading blank lines, exactly one final newline. Text inside multi-line
// strings, template literals and block comments is left untouched.
std::string apply_style(const std::string& text, const StyleOptions& options = StyleOptions());

} // namespace tsorg
