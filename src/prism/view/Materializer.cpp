#include "Materializer.hpp"

#include "eval/Evaluator.hpp"
#include "log/TaggedLogger.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace Prism {
namespace {

auto resolveProperty(PropValue const& prop, Snapshot const& snapshot) -> EvalResult<Value> {
    if (auto const* value = std::get_if<Value>(&prop.value))
        return *value;
    if (auto const* color = std::get_if<Color>(&prop.value))
        return Value::string(color->toHex());
    if (auto const* expression = std::get_if<ExpressionPtr>(&prop.value))
        return evaluate(**expression, snapshot);

    auto const& name = std::get<PropValue::Identifier>(prop.value).name;
    if (auto const* value = snapshot.find(name))
        return *value;
    return std::unexpected(EvalError{EvalError::Code::UndefinedVariable, name});
}

// Properties that become facets of the materialized node. Handlers stay with
// the runtime, `visible` and `bind` have facets of their own, and a bound
// node publishes the variable under "value" in place of any literal.
auto isMaterializedProperty(ViewNode const& node, std::string const& name) -> bool {
    if (isHandlerProperty(name) || name == kVisibleProperty || name == kBindProperty)
        return false;
    if (name == kBoundValueProperty && node.props.contains(std::string{kBindProperty}))
        return false;
    return true;
}

class FacetEvaluator {
public:
    FacetEvaluator(Snapshot const& snapshot, std::vector<FacetDiagnostic>& diagnostics)
        : snapshot_(snapshot), diagnostics_(diagnostics) {}

    auto text(NodeRef ref, ViewNode const& node) -> std::optional<std::string> {
        if (!node.textTemplate)
            return std::nullopt;
        auto rendered = renderTemplate(*node.textTemplate, snapshot_);
        if (!rendered) {
            report(Dependent{ref, ReadKind::Interpolation, {}}, rendered.error());
            return std::string{};
        }
        return std::move(*rendered);
    }

    auto visible(NodeRef ref, ViewNode const& node) -> bool {
        auto it = node.props.find(std::string{kVisibleProperty});
        if (it == node.props.end())
            return true;
        auto const facet    = Dependent{ref, ReadKind::Visible, {}};
        auto       resolved = resolveProperty(it->second, snapshot_);
        if (!resolved) {
            report(facet, resolved.error());
            return false;
        }
        if (!resolved->isBool()) {
            report(facet,
                   EvalError{EvalError::Code::TypeMismatch,
                             "visible must be bool, got " + std::string{kindName(resolved->kind())}});
            return false;
        }
        return resolved->asBool();
    }

    auto bound(NodeRef ref, ViewNode const& node) -> std::optional<Value> {
        auto it = node.props.find(std::string{kBindProperty});
        if (it == node.props.end())
            return std::nullopt;
        auto resolved = resolveProperty(it->second, snapshot_);
        if (!resolved) {
            report(Dependent{ref, ReadKind::Bind, std::string{kBoundValueProperty}}, resolved.error());
            return Value::null();
        }
        return std::move(*resolved);
    }

    auto property(NodeRef ref, std::string const& name, PropValue const& prop) -> Value {
        auto resolved = resolveProperty(prop, snapshot_);
        if (!resolved) {
            report(Dependent{ref, ReadKind::Property, name}, resolved.error());
            return Value::null();
        }
        return std::move(*resolved);
    }

private:
    auto report(Dependent facet, EvalError error) -> void {
        prism_log("Facet " + std::string{readKindName(facet.kind)} + " of node " + std::to_string(facet.node)
                      + (facet.property.empty() ? std::string{} : " (" + facet.property + ")")
                      + " failed: " + describeError(error),
                  "Materializer", "WARNING");
        diagnostics_.push_back(FacetDiagnostic{std::move(facet), std::move(error)});
    }

    Snapshot const&               snapshot_;
    std::vector<FacetDiagnostic>& diagnostics_;
};

auto buildFull(ViewTree const& view, Snapshot const& snapshot) -> ReconcileResult {
    ReconcileResult result;
    FacetEvaluator  facets{snapshot, result.diagnostics};

    std::vector<MaterializedNodePtr> nodes;
    nodes.reserve(view.size());
    for (std::size_t i = 0; i < view.size(); ++i) {
        auto const  ref    = static_cast<NodeRef>(i);
        auto const& source = view.node(ref);
        auto        node   = std::make_shared<MaterializedNode>();
        node->kind         = source.kind;

        if (source.textTemplate) {
            result.recomputed.push_back(Dependent{ref, ReadKind::Interpolation, {}});
            node->text = facets.text(ref, source);
        }
        if (source.props.contains(std::string{kVisibleProperty}))
            result.recomputed.push_back(Dependent{ref, ReadKind::Visible, {}});
        node->visible = facets.visible(ref, source);
        if (auto bound = facets.bound(ref, source)) {
            result.recomputed.push_back(Dependent{ref, ReadKind::Bind, std::string{kBoundValueProperty}});
            node->props[std::string{kBoundValueProperty}] = std::move(*bound);
        }
        for (auto const& [name, prop] : source.props) {
            if (!isMaterializedProperty(source, name))
                continue;
            result.recomputed.push_back(Dependent{ref, ReadKind::Property, name});
            node->props[name] = facets.property(ref, name, prop);
        }

        if (node->text)
            result.patches.emplace_back(SetText{ref, *node->text});
        result.patches.emplace_back(SetVisible{ref, node->visible});
        for (auto const& [name, value] : node->props)
            result.patches.emplace_back(SetProp{ref, name, value});

        nodes.push_back(std::move(node));
    }
    result.tree = MaterializedTree{std::move(nodes)};
    prism_log("Full layout of " + std::to_string(view.size()) + " nodes, " + std::to_string(result.patches.size())
                  + " patches",
              "Materializer", "INFO");
    return result;
}

auto propertyOf(MaterializedNode const& node, std::string const& name) -> Value {
    auto it = node.props.find(name);
    return it == node.props.end() ? Value::null() : it->second;
}

} // namespace

auto reconcile(ViewTree const&         view,
               DependencyIndex const&  index,
               Snapshot const&         snapshot,
               MaterializedTree const* previous,
               VariableSet const&      dirty) -> ReconcileResult {
    if (!previous || previous->size() != view.size())
        return buildFull(view, snapshot);

    ReconcileResult result;
    FacetEvaluator  evaluator{snapshot, result.diagnostics};
    auto            nodes  = previous->nodes();
    auto const      facets = index.facetsOf(dirty);

    std::size_t i = 0;
    while (i < facets.size()) {
        auto const  ref    = facets[i].node;
        auto const& source = view.node(ref);
        auto const& before = previous->node(ref);

        std::optional<std::string>   text;
        std::optional<bool>          visible;
        std::map<std::string, Value> props;

        for (; i < facets.size() && facets[i].node == ref; ++i) {
            auto const& facet = facets[i];
            result.recomputed.push_back(facet);
            switch (facet.kind) {
            case ReadKind::Interpolation: {
                auto next = evaluator.text(ref, source);
                if (next != before.text && next)
                    text = std::move(next);
                break;
            }
            case ReadKind::Visible: {
                auto next = evaluator.visible(ref, source);
                if (next != before.visible)
                    visible = next;
                break;
            }
            case ReadKind::Bind: {
                auto next = evaluator.bound(ref, source).value_or(Value::null());
                if (next != propertyOf(before, facet.property))
                    props.insert_or_assign(facet.property, std::move(next));
                break;
            }
            case ReadKind::Property: {
                auto it = source.props.find(facet.property);
                if (it == source.props.end())
                    break;
                auto next = evaluator.property(ref, facet.property, it->second);
                if (next != propertyOf(before, facet.property))
                    props.insert_or_assign(facet.property, std::move(next));
                break;
            }
            }
        }

        if (!text && !visible && props.empty())
            continue;

        auto updated = std::make_shared<MaterializedNode>(before);

        if (text) {
            updated->text = *text;
            result.patches.emplace_back(SetText{ref, std::move(*text)});
        }
        if (visible) {
            updated->visible = *visible;
            result.patches.emplace_back(SetVisible{ref, *visible});
        }
        for (auto& [name, value] : props) {
            updated->props.insert_or_assign(name, value);
            result.patches.emplace_back(SetProp{ref, name, std::move(value)});
        }
        nodes[ref] = std::move(updated);
    }

    result.tree = MaterializedTree{std::move(nodes)};
    prism_log("Reconciled " + std::to_string(dirty.size()) + " dirty variables: " + std::to_string(result.recomputed.size())
                  + " facets recomputed, " + std::to_string(result.patches.size()) + " patches",
              "Materializer", "INFO");
    return result;
}

} // namespace Prism
