#pragma once
#include "ast/Document.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Prism {

// Position of a node in the pre-order arena. Stable for the lifetime of a
// document because the view shape never changes; ordering NodeRefs is
// ordering by pre-order.
using NodeRef = std::uint32_t;

/**
 * ViewTree: the static view AST flattened into a pre-order arena.
 *
 * Holds non-owning pointers into the Document's ViewNodes, so the Document
 * must outlive the ViewTree. Child links are arena indices; the previous and
 * next materialized trees use the same indices.
 */
class ViewTree {
public:
    struct Entry {
        ViewNode const*      node = nullptr;
        NodeRef              parent = 0;
        bool                 isRoot = false;
        std::vector<NodeRef> children;
        std::string          path; // "" for the root, then "0", "0/2", ...
    };

    ViewTree() = default;
    explicit ViewTree(ViewNode const* root);

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    [[nodiscard]] auto entry(NodeRef ref) const -> Entry const& { return entries_.at(ref); }
    [[nodiscard]] auto node(NodeRef ref) const -> ViewNode const& { return *entries_.at(ref).node; }
    [[nodiscard]] auto path(NodeRef ref) const -> std::string const& { return entries_.at(ref).path; }

    // Inverse of path(); nullopt for paths that name no node.
    [[nodiscard]] auto find(std::string_view path) const -> std::optional<NodeRef>;

private:
    auto append(ViewNode const& node, NodeRef parent, bool isRoot, std::string path) -> NodeRef;

    std::vector<Entry> entries_;
};

} // namespace Prism
