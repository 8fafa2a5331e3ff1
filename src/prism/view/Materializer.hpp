#pragma once
#include "core/Error.hpp"
#include "core/Snapshot.hpp"
#include "view/DependencyIndex.hpp"
#include "view/MaterializedTree.hpp"
#include "view/Patch.hpp"
#include "view/ViewTree.hpp"

#include <vector>

namespace Prism {

// A facet whose evaluation failed. The pass carried on with the fallback
// (`false` for visibility, Null for a property, "" for text).
struct FacetDiagnostic {
    Dependent facet;
    EvalError error;
};

struct ReconcileResult {
    MaterializedTree             tree;
    Patches                      patches;
    std::vector<Dependent>       recomputed;
    std::vector<FacetDiagnostic> diagnostics;
};

/*
 * Builds the next materialized tree.
 *
 * Without a previous tree (or with one of a different shape) every facet of
 * every node is computed and the patches describe the full layout: for each
 * node its text, its visibility and all of its properties.
 *
 * With a previous tree only `index.facetsOf(dirty)` is recomputed; every
 * other node is shared with `previous`. A recomputed facet that compares
 * equal to its previous value emits nothing, so an empty dirty set yields an
 * empty patch list.
 *
 * Pure with respect to its inputs: the snapshot is only read.
 */
[[nodiscard]] auto reconcile(ViewTree const&         view,
                             DependencyIndex const&  index,
                             Snapshot const&         snapshot,
                             MaterializedTree const* previous,
                             VariableSet const&      dirty) -> ReconcileResult;

} // namespace Prism
