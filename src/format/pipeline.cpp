#include <tsorg/format/pipeline.hpp>
#include <tsorg/comments/classifier.hpp>
#include <tsorg/comments/extractor.hpp>
#include <tsorg/comments/recoverer.hpp>
#include <tsorg/comments/reinserter.hpp>
#include <tsorg/files.hpp>
#include <tsorg/format/organizer.hpp>
#include <tsorg/lang/lexer.hpp>
#include <tsorg/lang/parser.hpp>
#include <tsorg/log.hpp>

namespace tsorg {

namespace {

// Parse diagnostics listed in the error, at most this many
constexpr size_t kMaxReportedDiagnostics = 3;

TsorgError parse_failure(const std::string& filename, const std::vector<Diagnostic>& diags) {
    std::string msg = "cannot parse " + filename + " (" + std::to_string(diags.size()) +
                      (diags.size() == 1 ? " error)" : " errors)");
    for (size_t i = 0; i < diags.size() && i < kMaxReportedDiagnostics; ++i) {
        msg += "\n  " + std::to_string(diags[i].line) + ":" +
               std::to_string(diags[i].col) + ": " + diags[i].message;
    }
    return TsorgError{TsorgError::Parse, msg,
        "the file was left unchanged", filename, diags.front().line};
}

void trace_extraction(const ExtractionResult& extraction) {
    if (!log::enabled(log::Trace)) return;
    for (const auto& [id, comments] : extraction.by_identity) {
        for (const auto& ec : comments) {
            log::trace("node %s owns %s comment #%d at line %d",
                       format_identity(id).c_str(), role_name(ec.role), ec.ordinal,
                       ec.comment.pos.line);
        }
    }
    for (const auto& s : extraction.standalone) {
        log::trace("standalone comment at line %zu (depth %d)",
                   s.original_line + 1, s.nesting_depth);
    }
}

} // anonymous namespace

PipelineOptions PipelineOptions::from_config(const Config& config) {
    PipelineOptions opts;
    opts.organize = config.organize;
    opts.print.indent_width = config.format.indent_width;
    opts.style.trim_trailing_whitespace = config.format.trim_trailing_whitespace;
    opts.style.final_newline = config.format.final_newline;
    opts.backup = config.format.backup;
    return opts;
}

Result<std::string> organize_source(const std::string& source,
                                    const std::string& filename,
                                    const PipelineOptions& options) {
    bool jsx = detect_jsx(filename, source);
    auto lexed = lex(source, filename, jsx);
    if (lexed.is_err()) return std::move(lexed).error();

    auto parsed = parse(lexed.value(), source, filename);
    if (parsed.is_err()) return std::move(parsed).error();
    const ParseResult& tree = parsed.value();
    if (!tree.diagnostics.empty()) return parse_failure(filename, tree.diagnostics);

    log::debug("%s: %zu top-level items, %zu comments", filename.c_str(),
               tree.module.items.size(), tree.comments.size());

    ClassificationMap classes = classify_all(tree.comments.all(), source);
    ExtractionResult extraction = extract(tree.module, tree.comments, source, classes);
    trace_extraction(extraction);

    Module organized = organize(tree.module, options.organize);

    CommentStore retained = tree.comments.filtered([&](const Comment& c) {
        return extraction.claimed.count(c.span.lo) == 0;
    });
    std::string skeleton = print(organized, source, lexed.value().comments, &retained,
                                 options.print);
    log::debug("%s: skeleton has %zu bytes, %zu comments retained", filename.c_str(),
               skeleton.size(), retained.size());

    auto positions = recover(skeleton, filename, jsx);
    if (positions.is_err()) return std::move(positions).error();

    auto text = reinsert(extraction, skeleton, positions.value());
    if (text.is_err()) {
        auto err = std::move(text).error();
        if (err.file.empty()) err.file = filename;
        return err;
    }
    return text;
}

Result<std::string> format_source(const std::string& source,
                                  const std::string& filename,
                                  const PipelineOptions& options) {
    auto organized = organize_source(source, filename, options);
    if (organized.is_err()) return organized;

    StyleOptions style = options.style;
    style.jsx = detect_jsx(filename, organized.value());
    return Result<std::string>::ok(apply_style(organized.value(), style));
}

Result<FileOutcome> format_file(const std::string& path,
                                const PipelineOptions& options,
                                FormatMode mode) {
    auto source = read_file(path);
    if (source.is_err()) return std::move(source).error();

    auto formatted = format_source(source.value(), path, options);
    if (formatted.is_err()) return std::move(formatted).error();

    FileOutcome outcome;
    outcome.path = path;
    outcome.output = std::move(formatted).value();
    outcome.changed = outcome.output != source.value();

    if (mode == FormatMode::Write && outcome.changed) {
        TSORG_TRY(write_file(path, outcome.output, options.backup));
        log::debug("wrote %s", path.c_str());
    }
    return Result<FileOutcome>::ok(std::move(outcome));
}

} // namespace tsorg
