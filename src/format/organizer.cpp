#include <tsorg/format/organizer.hpp>
#include <tsorg/log.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace tsorg {

namespace {

std::string lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool is_declaration(const Node& n) {
    switch (n.kind) {
    case NodeKind::Function:
    case NodeKind::Class:
    case NodeKind::Variable:
    case NodeKind::Interface:
    case NodeKind::TypeAlias:
    case NodeKind::Enum:
        return !n.name.empty();
    default:
        return false;
    }
}

bool is_import_like(const Node& n) {
    return n.kind == NodeKind::Import;
}

bool is_reexport(const Node& n) {
    return n.kind == NodeKind::ReExport || n.kind == NodeKind::ExportAll;
}

bool is_tail_export(const Node& n) {
    return n.kind == NodeKind::ExportList || n.kind == NodeKind::ExportDefault;
}

// Sorts each run between barrier elements separately
template<typename IsBarrier, typename Less>
void sort_runs(std::vector<Node>& nodes, IsBarrier is_barrier, Less less) {
    auto begin = nodes.begin();
    while (begin != nodes.end()) {
        auto end = begin;
        while (end != nodes.end() && !is_barrier(*end)) ++end;
        std::stable_sort(begin, end, less);
        if (end == nodes.end()) break;
        begin = end + 1;
    }
}

void sort_by_module_path(std::vector<Node>& nodes) {
    std::stable_sort(nodes.begin(), nodes.end(), [](const Node& a, const Node& b) {
        auto ca = categorize_import(a.source);
        auto cb = categorize_import(b.source);
        if (ca != cb) return ca < cb;
        return a.source < b.source;
    });
}

std::string member_key(const Node& m) {
    if (m.is_private_name && !m.name.empty() && m.name[0] == '#') {
        return lower(m.name.substr(1));
    }
    return lower(m.name);
}

int jsx_category(const Node& a) {
    if (a.name == "key") return 0;
    if (a.name == "ref") return 1;
    if (a.name.size() > 2 && a.name.compare(0, 2, "on") == 0 &&
        std::isupper(static_cast<unsigned char>(a.name[2]))) {
        return 3;
    }
    return 2;
}

bool is_class_like(const Node& n) {
    return n.kind == NodeKind::Class ||
           (n.kind == NodeKind::ExportDefault && n.inner_kind == NodeKind::Class);
}

void organize_node(Node& n, const OrganizeConfig& config) {
    if (!n.children.empty()) {
        if (is_class_like(n) && config.class_members) {
            sort_class_members(n.children);
        } else if (n.kind == NodeKind::Enum && config.enum_members) {
            sort_enum_members(n.children);
        } else if (n.kind == NodeKind::ObjectLiteral && config.object_properties) {
            sort_object_properties(n.children);
        } else if (n.kind == NodeKind::JsxOpening && config.jsx_attributes) {
            sort_jsx_attributes(n.children);
        }
        for (auto& c : n.children) organize_node(c, config);
    }
    for (auto& e : n.embedded) organize_node(e, config);
}

// Names made public by `export { a, b }` and `export default a`
std::unordered_set<std::string> exported_elsewhere(const std::vector<Node>& items) {
    std::unordered_set<std::string> names;
    for (const auto& n : items) {
        if (n.kind == NodeKind::ExportList) {
            for (const auto& s : n.specifiers) names.insert(s.imported);
        } else if (n.kind == NodeKind::ExportDefault && n.inner_kind == NodeKind::Statement &&
                   !n.fingerprint.empty() &&
                   n.fingerprint.find(' ') == std::string::npos) {
            names.insert(n.fingerprint);
        }
    }
    return names;
}

// Declarations ordered by visibility with dependencies first
std::vector<Node> order_declarations(std::vector<Node> decls,
                                     const std::unordered_set<std::string>& exported_names) {
    // Items sharing a name (overloads, merged declarations) travel together
    std::vector<std::string> keys;
    std::unordered_map<std::string, std::vector<Node>> groups;
    for (auto& d : decls) {
        auto& group = groups[d.name];
        if (group.empty()) keys.push_back(d.name);
        group.push_back(std::move(d));
    }

    std::vector<std::string> exported;
    std::vector<std::string> internal;
    for (const auto& key : keys) {
        bool is_exported = exported_names.count(key) > 0;
        for (const auto& n : groups[key]) {
            if (n.is_exported) is_exported = true;
            for (const auto& name : declared_names(n)) {
                if (exported_names.count(name)) is_exported = true;
            }
        }
        (is_exported ? exported : internal).push_back(key);
    }
    auto alphabetical = [](const std::string& a, const std::string& b) {
        return lower(a) < lower(b);
    };
    std::stable_sort(exported.begin(), exported.end(), alphabetical);
    std::stable_sort(internal.begin(), internal.end(), alphabetical);

    std::vector<Node> flat;
    for (const auto& key : keys) {
        for (const auto& n : groups[key]) flat.push_back(n);
    }
    GraphMap graph = dependency_graph(flat);
    if (graph.has_cycle()) {
        log::debug("declarations reference each other in a cycle; keeping alphabetical order inside it");
    }

    std::unordered_set<std::string> exported_set(exported.begin(), exported.end());
    std::vector<std::string> hoisted;
    std::unordered_set<std::string> hoisted_set;
    for (const auto& key : exported) {
        for (const auto& dep : graph.reachable(key)) {
            if (!exported_set.count(dep) && hoisted_set.insert(dep).second) {
                hoisted.push_back(dep);
            }
        }
    }
    std::stable_sort(hoisted.begin(), hoisted.end(), alphabetical);

    std::vector<Node> out;
    std::unordered_set<size_t> visited;
    auto emit = [&](const std::string& key) {
        if (!graph.has_node(key)) return;
        graph.inner().dfs_postorder(graph.node_id(key), visited, [&](size_t id) {
            auto& group = groups[graph.inner().node(id)];
            for (auto& n : group) out.push_back(std::move(n));
            group.clear();
        });
    };
    for (const auto& key : hoisted) emit(key);
    for (const auto& key : exported) emit(key);
    for (const auto& key : internal) emit(key);
    return out;
}

} // anonymous namespace

std::vector<std::string> declared_names(const Node& item) {
    std::vector<std::string> names;
    if (item.kind != NodeKind::Variable) {
        if (!item.name.empty()) names.push_back(item.name);
        return names;
    }
    for (const auto& binding : item.bindings) {
        std::string cur;
        for (char c : binding) {
            unsigned char u = static_cast<unsigned char>(c);
            if (std::isalnum(u) || c == '_' || c == '$' || u >= 0x80) {
                cur += c;
            } else if (!cur.empty()) {
                names.push_back(cur);
                cur.clear();
            }
        }
        if (!cur.empty()) names.push_back(cur);
    }
    return names;
}

GraphMap dependency_graph(const std::vector<Node>& items) {
    GraphMap graph;
    std::unordered_map<std::string, std::string> owner;
    for (const auto& n : items) {
        if (!is_declaration(n)) continue;
        graph.add_node(n.name);
        for (const auto& name : declared_names(n)) owner.emplace(name, n.name);
    }
    for (const auto& n : items) {
        if (!is_declaration(n)) continue;
        for (const auto& ref : n.refs) {
            auto it = owner.find(ref);
            if (it == owner.end() || it->second == n.name) continue;
            graph.add_edge(n.name, it->second);
        }
    }
    return graph;
}

std::vector<Node> organize_items(std::vector<Node> items, const OrganizeConfig& config) {
    if (!config.imports && !config.declarations) return items;

    std::vector<Node> directives, imports, reexports, middle, tail;
    std::unordered_set<std::string> exported_names = exported_elsewhere(items);
    for (auto& n : items) {
        if (n.is_directive) directives.push_back(std::move(n));
        else if (is_import_like(n)) imports.push_back(std::move(n));
        else if (is_reexport(n)) reexports.push_back(std::move(n));
        else if (config.declarations && is_tail_export(n)) tail.push_back(std::move(n));
        else middle.push_back(std::move(n));
    }

    if (config.imports) {
        sort_by_module_path(imports);
        sort_by_module_path(reexports);
    }

    std::vector<Node> ordered_middle;
    if (config.declarations) {
        std::vector<Node> decls, statements;
        for (auto& n : middle) {
            (is_declaration(n) ? decls : statements).push_back(std::move(n));
        }
        ordered_middle = order_declarations(std::move(decls), exported_names);
        for (auto& n : statements) ordered_middle.push_back(std::move(n));
    } else {
        ordered_middle = std::move(middle);
    }

    std::vector<Node> out;
    out.reserve(items.size());
    for (auto* part : {&directives, &imports, &reexports, &ordered_middle, &tail}) {
        for (auto& n : *part) out.push_back(std::move(n));
    }
    return out;
}

void sort_class_members(std::vector<Node>& members) {
    std::stable_sort(members.begin(), members.end(), [](const Node& a, const Node& b) {
        int ca = member_category(a);
        int cb = member_category(b);
        if (ca != cb) return ca < cb;
        return member_key(a) < member_key(b);
    });
}

void sort_object_properties(std::vector<Node>& props) {
    sort_runs(props,
        [](const Node& p) { return p.prop_kind == PropKind::Spread; },
        [](const Node& a, const Node& b) { return lower(a.name) < lower(b.name); });
}

void sort_jsx_attributes(std::vector<Node>& attrs) {
    sort_runs(attrs,
        [](const Node& a) { return a.prop_kind == PropKind::Spread; },
        [](const Node& a, const Node& b) {
            int ca = jsx_category(a);
            int cb = jsx_category(b);
            if (ca != cb) return ca < cb;
            return lower(a.name) < lower(b.name);
        });
}

bool sort_enum_members(std::vector<Node>& members) {
    for (const auto& m : members) {
        if (m.enum_init != EnumInit::String) return false;
    }
    std::stable_sort(members.begin(), members.end(), [](const Node& a, const Node& b) {
        return lower(a.name) < lower(b.name);
    });
    return true;
}

Module organize(Module module, const OrganizeConfig& config) {
    module.items = organize_items(std::move(module.items), config);
    for (auto& item : module.items) organize_node(item, config);
    return module;
}

} // namespace tsorg
