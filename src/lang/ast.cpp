#include <tsorg/lang/ast.hpp>

namespace tsorg {

ImportCategory categorize_import(const std::string& path) {
    if (path.rfind("./", 0) == 0 || path.rfind("../", 0) == 0 ||
        path == "." || path == "..") {
        return ImportCategory::Relative;
    }
    if (!path.empty() && (path[0] == '@' || path[0] == '~')) {
        return ImportCategory::Absolute;
    }
    return ImportCategory::External;
}

int member_category(const Node& member) {
    switch (member.kind) {
    case NodeKind::Property:
        if (member.is_static) return member.is_private_name ? 1 : 0;
        return member.is_private_name ? 5 : 4;
    case NodeKind::Method:
        if (member.is_static) return member.is_private_name ? 3 : 2;
        return member.is_private_name ? 8 : 7;
    case NodeKind::Constructor:
        return 6;
    default:
        return 9;
    }
}

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
    case NodeKind::Import:         return "import";
    case NodeKind::ReExport:       return "re-export";
    case NodeKind::ExportAll:      return "export-all";
    case NodeKind::ExportList:     return "export-list";
    case NodeKind::ExportDefault:  return "export-default";
    case NodeKind::Function:       return "function";
    case NodeKind::Class:          return "class";
    case NodeKind::Variable:       return "variable";
    case NodeKind::Interface:      return "interface";
    case NodeKind::TypeAlias:      return "type";
    case NodeKind::Enum:           return "enum";
    case NodeKind::Statement:      return "statement";
    case NodeKind::Constructor:    return "constructor";
    case NodeKind::Method:         return "method";
    case NodeKind::Property:       return "property";
    case NodeKind::IndexSignature: return "index-signature";
    case NodeKind::StaticBlock:    return "static-block";
    case NodeKind::EnumMember:     return "enum-member";
    case NodeKind::ObjectLiteral:  return "object";
    case NodeKind::ObjectProperty: return "prop";
    case NodeKind::JsxOpening:     return "jsx-opening";
    case NodeKind::JsxAttribute:   return "jsx-attr";
    }
    return "unknown";
}

bool is_top_level_kind(NodeKind kind) {
    return kind <= NodeKind::Statement;
}

} // namespace tsorg
