#pragma once

#include <tsorg/config.hpp>
#include <tsorg/graph.hpp>
#include <tsorg/lang/ast.hpp>
#include <string>
#include <vector>

namespace tsorg {

// Names a top-level item declares (variables may declare several)
std::vector<std::string> declared_names(const Node& item);

// Reference graph between top-level declarations, keyed by each
// declaration's primary name. An edge A -> B means A mentions B.
GraphMap dependency_graph(const std::vector<Node>& items);

// Top-level order: directives, imports, re-exports, declarations by
// visibility with dependencies first, statements, export lists and
// export default.
std::vector<Node> organize_items(std::vector<Node> items, const OrganizeConfig& config);

// Stable in-place sorts of one container's children
void sort_class_members(std::vector<Node>& members);
void sort_object_properties(std::vector<Node>& props);
void sort_jsx_attributes(std::vector<Node>& attrs);
// Sorts only when every member has a string initializer; returns whether it did
bool sort_enum_members(std::vector<Node>& members);

// Reorders the module and every nested container the config enables.
// Nodes are moved, never renamed, so every identity survives.
Module organize(Module module, const OrganizeConfig& config = OrganizeConfig());

} // namespace tsorg
