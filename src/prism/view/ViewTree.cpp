#include "ViewTree.hpp"

#include <algorithm>

namespace Prism {

ViewTree::ViewTree(ViewNode const* root) {
    if (root)
        append(*root, 0, true, std::string{});
}

auto ViewTree::append(ViewNode const& node, NodeRef parent, bool isRoot, std::string path) -> NodeRef {
    auto const ref = static_cast<NodeRef>(entries_.size());
    entries_.push_back(Entry{.node = &node, .parent = parent, .isRoot = isRoot, .children = {}, .path = std::move(path)});

    std::vector<NodeRef> children;
    children.reserve(node.children.size());
    for (std::size_t i = 0; i < node.children.size(); ++i) {
        auto const& parentPath = entries_[ref].path;
        auto childPath = parentPath.empty() ? std::to_string(i) : parentPath + "/" + std::to_string(i);
        children.push_back(append(node.children[i], ref, false, std::move(childPath)));
    }
    entries_[ref].children = std::move(children);
    return ref;
}

auto ViewTree::find(std::string_view path) const -> std::optional<NodeRef> {
    auto it = std::ranges::find(entries_, path, &Entry::path);
    if (it == entries_.end())
        return std::nullopt;
    return static_cast<NodeRef>(std::distance(entries_.begin(), it));
}

} // namespace Prism
