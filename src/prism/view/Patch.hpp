#pragma once
#include "core/Value.hpp"
#include "view/ViewTree.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Prism {

struct SetText {
    NodeRef     node = 0;
    std::string text;

    friend auto operator==(SetText const&, SetText const&) -> bool = default;
};

struct SetVisible {
    NodeRef node    = 0;
    bool    visible = true;

    friend auto operator==(SetVisible const&, SetVisible const&) -> bool = default;
};

struct SetProp {
    NodeRef     node = 0;
    std::string name;
    Value       value;

    friend auto operator==(SetProp const&, SetProp const&) -> bool = default;
};

// One change handed to the renderer. A pass emits its patches in tree
// pre-order; within a node text first, then visibility, then properties in
// name order.
using PatchOp = std::variant<SetText, SetVisible, SetProp>;
using Patches = std::vector<PatchOp>;

[[nodiscard]] inline auto patchTarget(PatchOp const& patch) -> NodeRef {
    return std::visit([](auto const& op) { return op.node; }, patch);
}

[[nodiscard]] inline auto patchOpName(PatchOp const& patch) -> std::string_view {
    switch (patch.index()) {
    case 0:
        return "set_text";
    case 1:
        return "set_visible";
    default:
        return "set_prop";
    }
}

} // namespace Prism
