#include <tsorg/comments/identity.hpp>
#include <algorithm>
#include <cstdio>
#include <vector>

namespace tsorg {

// ---------------------------------------------------------------------------
// IdentityHasher
// ---------------------------------------------------------------------------

static constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

void IdentityHasher::bytes(const char* data, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        h_ ^= static_cast<unsigned char>(data[i]);
        h_ *= kFnvPrime;
    }
}

void IdentityHasher::str(const std::string& s) {
    u64(s.size());
    bytes(s.data(), s.size());
}

void IdentityHasher::tag(const char* s) {
    std::string t(s);
    str(t);
}

void IdentityHasher::u64(uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        h_ ^= static_cast<unsigned char>(v >> (i * 8));
        h_ *= kFnvPrime;
    }
}

void IdentityHasher::flag(bool b) {
    h_ ^= b ? 1u : 2u;
    h_ *= kFnvPrime;
}

// ---------------------------------------------------------------------------
// Per-kind content
// ---------------------------------------------------------------------------

namespace {

void hash_signature(IdentityHasher& h, const Signature& sig) {
    h.u64(sig.params.size());
    for (const auto& p : sig.params) {
        h.u64(static_cast<uint64_t>(p.pattern));
        h.str(p.name);
        h.str(p.type_tag);
    }
    h.str(sig.return_tag);
}

// Specifier sets hash the same in any order
void hash_specifiers(IdentityHasher& h, const std::vector<ImportSpecifier>& specs) {
    std::vector<uint64_t> parts;
    parts.reserve(specs.size());
    for (const auto& s : specs) {
        IdentityHasher sh;
        sh.u64(static_cast<uint64_t>(s.kind));
        sh.str(s.imported);
        sh.str(s.local);
        parts.push_back(sh.value());
    }
    std::sort(parts.begin(), parts.end());
    h.u64(parts.size());
    for (uint64_t p : parts) h.u64(p);
}

void hash_declaration(IdentityHasher& h, const Node& n, NodeKind kind) {
    h.str(n.name);
    switch (kind) {
    case NodeKind::Function:
        h.flag(n.is_async);
        hash_signature(h, n.sig);
        break;
    case NodeKind::Class:
        h.flag(n.is_abstract);
        h.str(n.super_name);
        break;
    case NodeKind::Interface:
        h.u64(n.heritage.size());
        for (const auto& e : n.heritage) h.str(e);
        break;
    default:
        break;
    }
}

} // anonymous namespace

std::optional<NodeIdentity> identity(const Node& n) {
    IdentityHasher h;
    h.tag(node_kind_name(n.kind));

    switch (n.kind) {
    case NodeKind::Function:
    case NodeKind::Class:
    case NodeKind::Interface:
    case NodeKind::TypeAlias:
    case NodeKind::Enum:
        h.flag(n.is_exported);
        h.flag(n.is_declare);
        hash_declaration(h, n, n.kind);
        break;

    case NodeKind::Variable:
        h.flag(n.is_exported);
        h.flag(n.is_declare);
        h.u64(static_cast<uint64_t>(n.var_kind));
        h.u64(n.bindings.size());
        for (const auto& b : n.bindings) h.str(b);
        break;

    case NodeKind::Import:
        h.str(n.source);
        h.flag(n.is_type_only);
        hash_specifiers(h, n.specifiers);
        break;

    case NodeKind::ReExport:
    case NodeKind::ExportAll:
    case NodeKind::ExportList:
        h.str(n.source);
        h.str(n.name);
        h.flag(n.is_type_only);
        hash_specifiers(h, n.specifiers);
        break;

    case NodeKind::ExportDefault:
        h.tag(node_kind_name(n.inner_kind));
        if (n.inner_kind == NodeKind::Statement) {
            h.str(n.fingerprint);
        } else {
            hash_declaration(h, n, n.inner_kind);
        }
        break;

    case NodeKind::Statement:
        if (n.fingerprint.empty()) return std::nullopt;
        h.str(n.fingerprint);
        break;

    case NodeKind::Constructor:
    case NodeKind::Method:
    case NodeKind::Property:
    case NodeKind::IndexSignature:
    case NodeKind::StaticBlock:
        h.str(n.owner);
        h.flag(n.is_static);
        h.u64(static_cast<uint64_t>(n.access));
        h.flag(n.is_private_name);
        h.u64(static_cast<uint64_t>(n.method_kind));
        h.str(n.name);
        if (n.has_sig) hash_signature(h, n.sig);
        break;

    case NodeKind::EnumMember:
        h.str(n.owner);
        h.str(n.name);
        break;

    case NodeKind::ObjectProperty:
    case NodeKind::JsxAttribute:
        h.str(n.owner);
        h.u64(static_cast<uint64_t>(n.prop_kind));
        if (n.prop_kind == PropKind::Spread) {
            h.str(n.fingerprint);
        } else {
            h.str(n.name);
        }
        break;

    case NodeKind::ObjectLiteral:
    case NodeKind::JsxOpening:
        return std::nullopt;
    }
    return h.value();
}

std::string format_identity(NodeIdentity id) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(id));
    return std::string(buf);
}

} // namespace tsorg
