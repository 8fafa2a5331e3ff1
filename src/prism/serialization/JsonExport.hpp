#pragma once
#include "core/Value.hpp"
#include "view/Materializer.hpp"
#include "view/MaterializedTree.hpp"
#include "view/Patch.hpp"
#include "view/ViewTree.hpp"

#include <string>

#include "nlohmann/json.hpp"

namespace Prism {

/*
 * JSON encoding used at the renderer boundary and by prism_run.
 *
 *   Value     null / true / 42 / 1.5 / "text"
 *   PatchOp   {"op":"set_text","node":3,"path":"0/1","text":"1"}
 *             {"op":"set_visible","node":3,"path":"0/1","visible":false}
 *             {"op":"set_prop","node":3,"path":"0/1","name":"value","value":0.5}
 *   tree      {"kind":"column","path":"","visible":true,"props":{},"children":[...]}
 *             with "text" present only on nodes that carry text
 *
 * Non-finite floats have no JSON form and encode as their canonical text.
 */
[[nodiscard]] auto toJson(Value const& value) -> nlohmann::json;
[[nodiscard]] auto toJson(PatchOp const& patch, ViewTree const& view) -> nlohmann::json;
[[nodiscard]] auto toJson(Patches const& patches, ViewTree const& view) -> nlohmann::json;
[[nodiscard]] auto toJson(MaterializedTree const& tree, ViewTree const& view) -> nlohmann::json;
[[nodiscard]] auto toJson(FacetDiagnostic const& diagnostic, ViewTree const& view) -> nlohmann::json;

// indent < 0 gives a single line. Invalid UTF-8 is replaced, never thrown.
[[nodiscard]] auto dumpJson(nlohmann::json const& json, int indent) -> std::string;

} // namespace Prism
