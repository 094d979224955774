#pragma once

#include <tsorg/lang/ast.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace tsorg {

// Content-derived node identity. Never depends on byte positions, so the
// same declaration hashes identically before and after reordering.
// Structurally identical siblings in one scope collide.
using NodeIdentity = uint64_t;

// FNV-1a accumulator used to build identities
class IdentityHasher {
public:
    void bytes(const char* data, size_t n);
    void str(const std::string& s);   // length-delimited
    void tag(const char* s);
    void u64(uint64_t v);
    void flag(bool b);

    uint64_t value() const { return h_; }

private:
    uint64_t h_ = 0xcbf29ce484222325ULL;
};

// Identity of a node that can carry comments; nullopt for container nodes
// (object literals, markup openings) and empty statements.
std::optional<NodeIdentity> identity(const Node& node);

// 16 lowercase hex digits
std::string format_identity(NodeIdentity id);

} // namespace tsorg
