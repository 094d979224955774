#pragma once

#include <tsorg/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace tsorg {

// .ts, .tsx, .mts and .cts
bool is_typescript_file(const std::filesystem::path& path);

// Resolve command-line paths to TypeScript files. Each argument is a file,
// a directory (searched recursively, skipping node_modules and
// dot-directories) or a glob pattern. Arguments starting with '!' exclude
// matching files. Results are sorted and de-duplicated.
Result<std::vector<std::string>> discover_files(const std::vector<std::string>& args);

Result<std::string> read_file(const std::string& path);

// "x.ts" -> "x.ts.bak"
std::string backup_path(const std::string& path);

// Copy path to its backup, replacing an older backup
Status create_backup(const std::string& path);

// Overwrite path with content, backing the old file up first when asked
Status write_file(const std::string& path, const std::string& content, bool backup);

} // namespace tsorg
