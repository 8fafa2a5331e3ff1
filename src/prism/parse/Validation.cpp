#include "Parser.hpp"

#include "log/TaggedLogger.hpp"

#include <string>
#include <vector>

namespace Prism {
namespace {

auto unresolved(std::string message) -> std::unexpected<LoadError> {
    prism_log("Load rejected: " + message, "Loader", "ERROR");
    return std::unexpected(LoadError{LoadError::Code::UnresolvedIdentifier, std::move(message)});
}

auto checkVariables(Document const& document, Expression const& expression, std::string const& where) -> LoadResult<void> {
    std::vector<std::string> names;
    collectVariables(expression, names);
    for (auto const& name : names) {
        if (!document.hasVariable(name))
            return unresolved("unknown variable '" + name + "' in " + where);
    }
    return {};
}

auto checkProperty(Document const& document, std::string const& name, PropValue const& prop, std::string const& where)
    -> LoadResult<void> {
    auto const context = "property '" + name + "' of " + where;

    if (isHandlerProperty(name)) {
        auto const* identifier = std::get_if<PropValue::Identifier>(&prop.value);
        if (!identifier)
            return unresolved(context + " must name an action");
        if (!document.findAction(identifier->name))
            return unresolved("unknown action '" + identifier->name + "' in " + context);
        return {};
    }

    if (name == kBindProperty) {
        auto const* identifier = std::get_if<PropValue::Identifier>(&prop.value);
        if (!identifier)
            return unresolved(context + " must name a state variable");
        if (!document.hasVariable(identifier->name))
            return unresolved("unknown variable '" + identifier->name + "' in " + context);
        return {};
    }

    if (auto const* identifier = std::get_if<PropValue::Identifier>(&prop.value)) {
        if (!document.hasVariable(identifier->name))
            return unresolved("unknown variable '" + identifier->name + "' in " + context);
    } else if (auto const* expression = std::get_if<ExpressionPtr>(&prop.value)) {
        return checkVariables(document, **expression, context);
    }
    return {};
}

auto checkNode(Document const& document, ViewNode const& node, std::string const& path) -> LoadResult<void> {
    auto const where = std::string{nodeKindName(node.kind)} + " node at '" + path + "'";

    if (node.textTemplate) {
        for (auto const& span : *node.textTemplate) {
            if (span.kind == TextSpan::Kind::VarRef && !document.hasVariable(span.text))
                return unresolved("unknown variable '" + span.text + "' in text of " + where);
        }
    }

    for (auto const& [name, prop] : node.props) {
        if (auto checked = checkProperty(document, name, prop, where); !checked)
            return checked;
    }

    for (std::size_t i = 0; i < node.children.size(); ++i) {
        auto childPath = path.empty() ? std::to_string(i) : path + "/" + std::to_string(i);
        if (auto checked = checkNode(document, node.children[i], childPath); !checked)
            return checked;
    }
    return {};
}

} // namespace

auto validateDocument(Document const& document) -> LoadResult<void> {
    for (auto const& action : document.actions) {
        for (auto const& mutation : action.mutations) {
            auto const where = "action '" + action.name + "'";
            if (!document.hasVariable(mutation.target))
                return unresolved("unknown assignment target '" + mutation.target + "' in " + where);
            if (auto checked = checkVariables(document, *mutation.value, where); !checked)
                return checked;
        }
    }

    if (document.view) {
        if (auto checked = checkNode(document, *document.view, ""); !checked)
            return checked;
    }
    return {};
}

} // namespace Prism
