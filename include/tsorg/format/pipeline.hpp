#pragma once

#include <tsorg/config.hpp>
#include <tsorg/format/style.hpp>
#include <tsorg/lang/printer.hpp>
#include <tsorg/result.hpp>
#include <string>

namespace tsorg {

struct PipelineOptions {
    OrganizeConfig organize;
    PrintOptions print;
    StyleOptions style;
    bool backup = true;

    static PipelineOptions from_config(const Config& config);
};

enum class FormatMode {
    Write,   // rewrite changed files in place
    Check,   // only report whether the file would change
    Stdout   // return the result without touching the file
};

struct FileOutcome {
    std::string path;
    bool changed = false;
    std::string output;
};

// lex -> parse -> classify -> extract -> organize -> print -> recover ->
// reinsert. Parse diagnostics fail the file; nothing is rewritten.
Result<std::string> organize_source(const std::string& source,
                                    const std::string& filename = "<input>",
                                    const PipelineOptions& options = PipelineOptions());

// organize_source followed by the style pass
Result<std::string> format_source(const std::string& source,
                                  const std::string& filename = "<input>",
                                  const PipelineOptions& options = PipelineOptions());

Result<FileOutcome> format_file(const std::string& path,
                                const PipelineOptions& options,
                                FormatMode mode);

} // namespace tsorg
