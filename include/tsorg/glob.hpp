#pragma once

#include <tsorg/result.hpp>
#include <string>
#include <utility>
#include <vector>
#include <filesystem>

namespace tsorg {

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// True when the pattern contains any of * ? [
bool glob_has_magic(const std::string& pattern);

// Check if pattern is a negation pattern (prefixed with '!').
// If so, stores the inner pattern (without '!') in `inner` and returns true.
bool glob_is_negation(const std::string& pattern, std::string& inner);

// Split a pattern into the directory before its first wildcard segment and
// the remaining pattern: "src/**/*.ts" -> {"src", "**/*.ts"}
std::pair<std::string, std::string> glob_split_base(const std::string& pattern);

// Expand a glob pattern against the filesystem rooted at root_dir.
// Returns matching regular files relative to root_dir, sorted.
// node_modules and dot-directories are never entered.
Result<std::vector<std::string>> glob_expand(
    const std::string& pattern,
    const std::filesystem::path& root_dir);

// Apply ordered include/exclude patterns to a list of paths.
// Patterns prefixed with '!' exclude; others include.
// The last matching pattern decides.
std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& paths);

} // namespace tsorg
