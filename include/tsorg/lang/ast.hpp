#pragma once

#include <tsorg/lang/token.hpp>
#include <string>
#include <vector>

namespace tsorg {

// ---------------------------------------------------------------------------
// Structural tree. Nodes refer back into the source text by byte span; the
// printer copies those slices and only rebuilds reorderable containers.
// ---------------------------------------------------------------------------

enum class NodeKind {
    // Top-level items
    Import,
    ReExport,       // export { a } from "m"
    ExportAll,      // export * from "m"
    ExportList,     // export { a, b }
    ExportDefault,
    Function,
    Class,
    Variable,
    Interface,
    TypeAlias,
    Enum,
    Statement,

    // Class members
    Constructor,
    Method,
    Property,
    IndexSignature,
    StaticBlock,

    EnumMember,

    // Containers embedded in otherwise opaque text
    ObjectLiteral,
    ObjectProperty,
    JsxOpening,
    JsxAttribute
};

enum class Accessibility { Public, Protected, Private };
enum class MethodKind { Normal, Getter, Setter };
enum class ParamPattern { Ident, Array, Object, Rest, This };
enum class VarKind { Const, Let, Var };
enum class SpecifierKind { Default, Named, Namespace };
enum class PropKind { KeyValue, Shorthand, Method, Getter, Setter, Spread };
enum class EnumInit { None, String, Number, Other };

struct Param {
    ParamPattern pattern = ParamPattern::Ident;
    std::string name;
    std::string type_tag;   // "" when unannotated, "complex" for non-reference types
};

struct Signature {
    std::vector<Param> params;
    std::string return_tag;
};

struct ImportSpecifier {
    SpecifierKind kind = SpecifierKind::Named;
    std::string local;
    std::string imported;   // equals local unless renamed with `as`
};

struct Node {
    NodeKind kind = NodeKind::Statement;
    Span span;              // printed text
    Span anchor;            // span extended over a trailing list separator
    std::string name;
    std::string owner;      // enclosing class / enum / container path

    // Modifiers
    bool is_exported = false;
    bool is_default = false;
    bool is_declare = false;
    bool is_static = false;
    bool is_async = false;
    bool is_abstract = false;
    bool is_type_only = false;
    bool is_private_name = false;  // #name
    bool is_directive = false;     // shebang or "use strict"-style prologue
    Accessibility access = Accessibility::Public;
    MethodKind method_kind = MethodKind::Normal;
    PropKind prop_kind = PropKind::KeyValue;
    VarKind var_kind = VarKind::Const;
    EnumInit enum_init = EnumInit::None;
    NodeKind inner_kind = NodeKind::Statement;  // ExportDefault: declared kind

    Signature sig;
    bool has_sig = false;
    std::string super_name;
    std::vector<std::string> heritage;  // interface extends / class implements

    std::string source;                 // module path of imports and re-exports
    std::vector<ImportSpecifier> specifiers;
    std::vector<std::string> bindings;  // declared variable names

    // Token texts joined by spaces, embedded containers replaced by a marker.
    // Identifies statements and expressions that have no declared name.
    std::string fingerprint;

    // Identifiers referenced by a top-level item (dependency ordering)
    std::vector<std::string> refs;

    // Reorderable children, printed in place of `body`
    Span body;
    bool multiline = false;
    bool self_closing = false;
    std::vector<Node> children;

    // Containers nested in this node's opaque text
    std::vector<Node> embedded;
};

struct Module {
    std::vector<Node> items;
    bool jsx = false;
};

struct Diagnostic {
    std::string message;
    std::string file;
    int line = 0;
    int col = 0;
};

// Import path category used for ordering and grouping
enum class ImportCategory { External, Absolute, Relative };

ImportCategory categorize_import(const std::string& path);

// Class member ordering category, 0..8, 9 for members that always go last
int member_category(const Node& member);

const char* node_kind_name(NodeKind kind);

// True for kinds that appear at the top level of a module
bool is_top_level_kind(NodeKind kind);

} // namespace tsorg
