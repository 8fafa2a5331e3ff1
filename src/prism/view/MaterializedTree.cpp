#include "MaterializedTree.hpp"

namespace Prism {

auto MaterializedNode::footprint() const -> std::size_t {
    std::size_t total = sizeof(MaterializedNode);
    if (text)
        total += text->capacity();
    for (auto const& [name, value] : props)
        total += sizeof(std::pair<std::string const, Value>) + name.capacity() + value.footprint();
    return total;
}

auto MaterializedTree::footprint() const -> std::size_t {
    std::size_t total = sizeof(MaterializedTree) + nodes_.capacity() * sizeof(MaterializedNodePtr);
    for (auto const& node : nodes_) {
        if (node)
            total += node->footprint();
    }
    return total;
}

} // namespace Prism
