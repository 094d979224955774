#include <tsorg/comments/recoverer.hpp>
#include <tsorg/lang/lexer.hpp>
#include <tsorg/lang/parser.hpp>
#include <tsorg/line_index.hpp>
#include <tsorg/log.hpp>

namespace tsorg {

namespace {

void collect(const Node& n, const LineIndex& lines, PositionMap& out) {
    if (auto id = identity(n)) {
        if (out.find(*id) == out.end()) {
            // A list separator belongs to the node's line in regenerated text
            uint32_t end = n.anchor.hi > n.span.hi ? n.anchor.hi : n.span.hi;
            uint32_t last = end > n.span.lo ? end - 1 : n.span.lo;
            NodePosition pos;
            pos.start_line = lines.line_of(n.span.lo);
            pos.end_line = lines.line_of(last);
            pos.end_column = lines.column_of(last) + 1;
            pos.indentation = lines.indentation(pos.start_line);
            out.emplace(*id, std::move(pos));
        }
    }
    for (const auto& c : n.children) collect(c, lines, out);
    for (const auto& e : n.embedded) collect(e, lines, out);
}

} // anonymous namespace

PositionMap collect_positions(const Module& module, const std::string& text) {
    LineIndex lines(text);
    PositionMap out;
    for (const auto& item : module.items) collect(item, lines, out);
    return out;
}

Result<PositionMap> recover(const std::string& skeleton, const std::string& filename,
                            bool jsx) {
    auto lexed = lex(skeleton, filename, jsx);
    if (lexed.is_err()) return std::move(lexed).error();

    auto parsed = parse(lexed.value(), skeleton, filename);
    if (parsed.is_err()) return std::move(parsed).error();

    const auto& result = parsed.value();
    if (!result.diagnostics.empty()) {
        log::debug("%s: regenerated text has %zu parse diagnostics; first: %s",
                   filename.c_str(), result.diagnostics.size(),
                   result.diagnostics.front().message.c_str());
    }

    PositionMap positions = collect_positions(result.module, skeleton);
    log::debug("%s: recovered %zu node positions", filename.c_str(), positions.size());
    return Result<PositionMap>::ok(std::move(positions));
}

} // namespace tsorg
