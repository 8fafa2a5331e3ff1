#include "JsonExport.hpp"

#include "core/Error.hpp"

#include <cmath>

namespace Prism {
namespace {

auto nodeJson(MaterializedTree const& tree, ViewTree const& view, NodeRef ref) -> nlohmann::json {
    auto const& node = tree.node(ref);

    nlohmann::json props = nlohmann::json::object();
    for (auto const& [name, value] : node.props)
        props[name] = toJson(value);

    nlohmann::json children = nlohmann::json::array();
    for (auto child : view.entry(ref).children)
        children.push_back(nodeJson(tree, view, child));

    nlohmann::json json{{"kind", std::string{nodeKindName(node.kind)}},
                        {"path", view.path(ref)},
                        {"visible", node.visible},
                        {"props", std::move(props)},
                        {"children", std::move(children)}};
    if (node.text)
        json["text"] = *node.text;
    return json;
}

} // namespace

auto toJson(Value const& value) -> nlohmann::json {
    switch (value.kind()) {
    case Value::Kind::Null:
        return nullptr;
    case Value::Kind::Bool:
        return value.asBool();
    case Value::Kind::Int:
        return value.asInt();
    case Value::Kind::Float:
        if (!std::isfinite(value.asFloat()))
            return value.toText();
        return value.asFloat();
    case Value::Kind::Str:
        return value.asStr();
    }
    return nullptr;
}

auto toJson(PatchOp const& patch, ViewTree const& view) -> nlohmann::json {
    auto const     target = patchTarget(patch);
    nlohmann::json json{{"op", std::string{patchOpName(patch)}}, {"node", target}, {"path", view.path(target)}};
    if (auto const* text = std::get_if<SetText>(&patch)) {
        json["text"] = text->text;
    } else if (auto const* visible = std::get_if<SetVisible>(&patch)) {
        json["visible"] = visible->visible;
    } else {
        auto const& prop = std::get<SetProp>(patch);
        json["name"]     = prop.name;
        json["value"]    = toJson(prop.value);
    }
    return json;
}

auto toJson(Patches const& patches, ViewTree const& view) -> nlohmann::json {
    nlohmann::json json = nlohmann::json::array();
    for (auto const& patch : patches)
        json.push_back(toJson(patch, view));
    return json;
}

auto toJson(MaterializedTree const& tree, ViewTree const& view) -> nlohmann::json {
    if (tree.empty() || view.empty())
        return nullptr;
    return nodeJson(tree, view, 0);
}

auto toJson(FacetDiagnostic const& diagnostic, ViewTree const& view) -> nlohmann::json {
    nlohmann::json json{{"node", diagnostic.facet.node},
                        {"path", view.path(diagnostic.facet.node)},
                        {"facet", std::string{readKindName(diagnostic.facet.kind)}},
                        {"error", std::string{errorCodeToString(diagnostic.error.code)}},
                        {"message", describeError(diagnostic.error)}};
    if (!diagnostic.facet.property.empty())
        json["property"] = diagnostic.facet.property;
    return json;
}

auto dumpJson(nlohmann::json const& json, int indent) -> std::string {
    return json.dump(indent < 0 ? -1 : indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace Prism
