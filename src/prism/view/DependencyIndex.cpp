#include "DependencyIndex.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace Prism {

auto readKindName(ReadKind kind) -> std::string_view {
    switch (kind) {
    case ReadKind::Interpolation:
        return "interpolation";
    case ReadKind::Visible:
        return "visible";
    case ReadKind::Bind:
        return "bind";
    case ReadKind::Property:
        return "property";
    }
    return "unknown";
}

DependencyIndex::DependencyIndex(ViewTree const& tree) {
    std::vector<std::string> names;
    for (std::size_t i = 0; i < tree.size(); ++i) {
        auto const  ref  = static_cast<NodeRef>(i);
        auto const& node = tree.node(ref);

        if (node.textTemplate) {
            for (auto const& span : *node.textTemplate) {
                if (span.kind == TextSpan::Kind::VarRef)
                    record(span.text, Dependent{ref, ReadKind::Interpolation, {}});
            }
        }

        auto const bound = node.props.contains(std::string{kBindProperty});
        for (auto const& [name, prop] : node.props) {
            if (isHandlerProperty(name) || (bound && name == kBoundValueProperty))
                continue;

            if (name == kBindProperty) {
                if (auto const* identifier = std::get_if<PropValue::Identifier>(&prop.value))
                    record(identifier->name, Dependent{ref, ReadKind::Bind, std::string{kBoundValueProperty}});
                continue;
            }

            auto const kind     = name == kVisibleProperty ? ReadKind::Visible : ReadKind::Property;
            auto       property = kind == ReadKind::Visible ? std::string{} : name;
            if (auto const* identifier = std::get_if<PropValue::Identifier>(&prop.value)) {
                record(identifier->name, Dependent{ref, kind, property});
            } else if (auto const* expression = std::get_if<ExpressionPtr>(&prop.value)) {
                names.clear();
                collectVariables(**expression, names);
                for (auto const& variable : names)
                    record(variable, Dependent{ref, kind, property});
            }
        }
    }
    prism_log("Dependency index covers " + std::to_string(byVariable_.size()) + " variables over "
                  + std::to_string(tree.size()) + " nodes",
              "DependencyIndex", "INFO");
}

auto DependencyIndex::record(std::string const& variable, Dependent dependent) -> void {
    auto& readers = byVariable_[variable];
    // Nodes are visited in pre-order, so a duplicate can only be at the back
    // or among this node's other facets.
    if (std::ranges::find(readers, dependent) != readers.end())
        return;
    readers.push_back(std::move(dependent));
}

auto DependencyIndex::readersOf(std::string const& variable) const -> std::vector<Dependent> const& {
    static std::vector<Dependent> const kNone;
    auto it = byVariable_.find(variable);
    return it == byVariable_.end() ? kNone : it->second;
}

auto DependencyIndex::facetsOf(VariableSet const& variables) const -> std::vector<Dependent> {
    std::vector<Dependent> facets;
    for (auto const& variable : variables) {
        auto const& readers = readersOf(variable);
        facets.insert(facets.end(), readers.begin(), readers.end());
    }
    std::ranges::sort(facets);
    auto const duplicates = std::ranges::unique(facets);
    facets.erase(duplicates.begin(), duplicates.end());
    return facets;
}

auto DependencyIndex::dependentsOf(VariableSet const& variables) const -> std::vector<NodeRef> {
    std::vector<NodeRef> nodes;
    for (auto const& variable : variables) {
        for (auto const& dependent : readersOf(variable))
            nodes.push_back(dependent.node);
    }
    std::ranges::sort(nodes);
    auto const duplicates = std::ranges::unique(nodes);
    nodes.erase(duplicates.begin(), duplicates.end());
    return nodes;
}

} // namespace Prism
