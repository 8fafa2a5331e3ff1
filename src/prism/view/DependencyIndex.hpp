#pragma once
#include "core/Snapshot.hpp"
#include "view/ViewTree.hpp"

#include <parallel_hashmap/phmap.h>

#include <compare>
#include <string>
#include <string_view>
#include <vector>

namespace Prism {

enum class ReadKind {
    Interpolation = 0, // text template variable reference
    Visible,           // free variable of the `visible` expression
    Bind,              // `bind` target
    Property           // free variable of any other expression-valued property
};

[[nodiscard]] auto readKindName(ReadKind kind) -> std::string_view;

// One recomputable facet of a view node. `property` is empty for
// Interpolation and Visible; for Bind it is the published property name.
struct Dependent {
    NodeRef     node = 0;
    ReadKind    kind = ReadKind::Interpolation;
    std::string property;

    friend auto operator<=>(Dependent const&, Dependent const&) = default;
    friend auto operator==(Dependent const&, Dependent const&) -> bool = default;
};

/**
 * DependencyIndex: static map from state variable to the view facets that
 * read it.
 *
 * Built once from the ViewTree by a single walk and never rebuilt: the view
 * AST is immutable. Each (variable, node, kind, property) is recorded once,
 * so a variable read twice by the same template still yields one facet.
 */
class DependencyIndex {
public:
    DependencyIndex() = default;
    explicit DependencyIndex(ViewTree const& tree);

    // Nodes with at least one facet reading any of `variables`, in pre-order.
    [[nodiscard]] auto dependentsOf(VariableSet const& variables) const -> std::vector<NodeRef>;

    // Facets reading any of `variables`, ordered by node then kind then property.
    [[nodiscard]] auto facetsOf(VariableSet const& variables) const -> std::vector<Dependent>;

    // Facets reading one variable; empty for unknown names.
    [[nodiscard]] auto readersOf(std::string const& variable) const -> std::vector<Dependent> const&;

    [[nodiscard]] auto variableCount() const noexcept -> std::size_t { return byVariable_.size(); }

private:
    auto record(std::string const& variable, Dependent dependent) -> void;

    phmap::flat_hash_map<std::string, std::vector<Dependent>> byVariable_;
};

} // namespace Prism
