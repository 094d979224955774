#include <tsorg/comments/classifier.hpp>
#include <tsorg/comments/extractor.hpp>
#include <tsorg/comments/identity.hpp>
#include <tsorg/files.hpp>
#include <tsorg/format/organizer.hpp>
#include <tsorg/lang/lexer.hpp>
#include <tsorg/lang/parser.hpp>
#include <tsorg/lang/printer.hpp>
#include <iostream>
#include <string>

using namespace tsorg;

static void dump_node(const Node& n, int depth) {
    std::string indent(depth * 2, ' ');
    auto id = identity(n);
    std::cout << indent << node_kind_name(n.kind);
    if (!n.name.empty()) std::cout << " " << n.name;
    if (n.is_exported) std::cout << "  [exported]";
    std::cout << "  @" << n.span.lo << ".." << n.span.hi;
    std::cout << "  " << (id ? format_identity(*id) : std::string("(no identity)")) << "\n";

    if (!n.refs.empty()) {
        std::cout << indent << "  refs:";
        for (const auto& r : n.refs) std::cout << " " << r;
        std::cout << "\n";
    }
    for (const auto& c : n.children) dump_node(c, depth + 1);
    for (const auto& e : n.embedded) dump_node(e, depth + 1);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: demo_dump <file.ts|file.tsx> [--tokens]\n";
        return 1;
    }

    std::string path = argv[1];
    bool show_tokens = (argc > 2 && std::string(argv[2]) == "--tokens");

    auto file = read_file(path);
    if (file.is_err()) {
        std::cerr << file.error().format() << "\n";
        return 1;
    }
    const std::string& source = file.value();

    // Lex
    bool jsx = detect_jsx(path, source);
    auto lr = lex(source, path, jsx);
    if (lr.is_err()) {
        std::cerr << "lex error: " << lr.error().message << "\n";
        return 1;
    }

    auto& lex_result = lr.value();
    std::cout << "--- " << path << (jsx ? " (tsx)" : "") << " ---\n";
    std::cout << "Tokens: " << lex_result.tokens.size()
              << "  Comments: " << lex_result.comments.size() << "\n";

    if (show_tokens) {
        std::cout << "\n-- Tokens --\n";
        for (auto& t : lex_result.tokens) {
            std::cout << "  " << t.pos.line << ":" << t.pos.col
                      << "  " << ts_token_name(t.type)
                      << "  \"" << t.text << "\"\n";
        }
    }

    // Parse
    auto pr = parse(lex_result, source, path);
    if (pr.is_err()) {
        std::cerr << "parse error: " << pr.error().message << "\n";
        return 1;
    }
    auto& result = pr.value();
    for (const auto& d : result.diagnostics) {
        std::cout << "diagnostic " << d.line << ":" << d.col << ": " << d.message << "\n";
    }

    std::cout << "\n-- Comments --\n";
    auto classes = classify_all(result.comments.all(), source);
    for (const auto& c : result.comments.all()) {
        std::cout << "  " << c.pos.line << ":" << c.pos.col << "  "
                  << classification_name(classes.at(c.span.lo)) << "  "
                  << c.render() << "\n";
    }

    std::cout << "\n-- Tree (" << result.module.items.size() << " items) --\n";
    for (const auto& item : result.module.items) dump_node(item, 1);

    auto extraction = extract(result.module, result.comments, source, classes);
    std::cout << "\n-- Ownership --\n";
    for (const auto& [id, comments] : extraction.by_identity) {
        for (const auto& ec : comments) {
            std::cout << "  " << format_identity(id) << "  " << role_name(ec.role)
                      << " #" << ec.ordinal << "  " << ec.comment.render() << "\n";
        }
    }
    for (const auto& s : extraction.standalone) {
        std::cout << "  standalone line " << s.original_line + 1
                  << "  " << s.comment.render() << "\n";
    }

    CommentStore retained = result.comments.filtered([&](const Comment& c) {
        return extraction.claimed.count(c.span.lo) == 0;
    });
    Module organized = organize(result.module);
    std::cout << "\n-- Skeleton --\n"
              << print(organized, source, lex_result.comments, &retained) << "\n";
    return 0;
}
