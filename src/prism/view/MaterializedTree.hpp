#pragma once
#include "ast/Document.hpp"
#include "core/Value.hpp"
#include "view/ViewTree.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Prism {

// Resolved state of one view node as the renderer sees it.
struct MaterializedNode {
    NodeKind                     kind = NodeKind::Column;
    std::optional<std::string>   text;
    bool                         visible = true;
    std::map<std::string, Value> props; // handler properties excluded

    [[nodiscard]] auto footprint() const -> std::size_t;

    friend auto operator==(MaterializedNode const&, MaterializedNode const&) -> bool = default;
};

using MaterializedNodePtr = std::shared_ptr<MaterializedNode const>;

/**
 * MaterializedTree: per-NodeRef resolved nodes, mirroring the ViewTree arena.
 *
 * Nodes are immutable and shared: a reconciliation pass copies the pointer
 * vector of the previous tree and replaces only the nodes it recomputed, so
 * an untouched node is the same object in both trees.
 */
class MaterializedTree {
public:
    MaterializedTree() = default;
    explicit MaterializedTree(std::vector<MaterializedNodePtr> nodes)
        : nodes_(std::move(nodes)) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return nodes_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }
    [[nodiscard]] auto node(NodeRef ref) const -> MaterializedNode const& { return *nodes_.at(ref); }
    [[nodiscard]] auto shared(NodeRef ref) const -> MaterializedNodePtr const& { return nodes_.at(ref); }
    [[nodiscard]] auto nodes() const noexcept -> std::vector<MaterializedNodePtr> const& { return nodes_; }

    // Conservative estimate; shared nodes are counted in full.
    [[nodiscard]] auto footprint() const -> std::size_t;

private:
    std::vector<MaterializedNodePtr> nodes_;
};

} // namespace Prism
