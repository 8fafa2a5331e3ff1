#include "../PrismTestHelper.hpp"

#include "view/DependencyIndex.hpp"
#include "view/Materializer.hpp"
#include "view/ViewTree.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace Prism;
using Prism::Test::kCounterSource;
using Prism::Test::parseOrFail;

namespace {

auto initialSnapshot(Document const& document) -> Snapshot {
    Snapshot snapshot;
    for (auto const& decl : document.state)
        snapshot.set(decl.name, decl.initial);
    return snapshot;
}

struct Fixture {
    explicit Fixture(std::string_view source)
        : document(parseOrFail(source)), view(&*document.view), index(view), snapshot(initialSnapshot(document)) {}

    auto layout() -> ReconcileResult { return reconcile(view, index, snapshot, nullptr, {}); }

    Document        document;
    ViewTree        view;
    DependencyIndex index;
    Snapshot        snapshot;
};

} // namespace

TEST_SUITE("view.materializer") {
    TEST_CASE("Initial layout describes every node") {
        Fixture fixture{kCounterSource};
        auto    result = fixture.layout();

        Patches expected{
                SetVisible{0, true},
                SetText{1, "Count: 0"},
                SetVisible{1, true},
                SetText{2, "Increment"},
                SetVisible{2, true},
                SetText{3, "Toggle"},
                SetVisible{3, true},
                SetText{4, "Hello Ada"},
                SetVisible{4, false},
                SetVisible{5, true},
                SetProp{5, "color", Value::string("#3366ffff")},
                SetProp{5, "value", Value::number(0.5)},
                SetVisible{6, true},
                SetProp{6, "placeholder", Value::string("Name")},
                SetProp{6, "value", Value::string("Ada")},
        };
        CHECK(result.patches == expected);
        CHECK(result.diagnostics.empty());
        REQUIRE(result.tree.size() == 7);

        // Handlers never reach the materialized tree.
        CHECK_FALSE(result.tree.node(2).props.contains("on_click"));
        CHECK_FALSE(result.tree.node(6).props.contains("bind"));
        CHECK(result.tree.node(0).kind == NodeKind::Column);
        CHECK_FALSE(result.tree.node(5).text.has_value());
        CHECK(result.tree.footprint() > 0);
    }

    TEST_CASE("An empty dirty set changes nothing") {
        Fixture fixture{kCounterSource};
        auto    first  = fixture.layout();
        auto    second = reconcile(fixture.view, fixture.index, fixture.snapshot, &first.tree, {});
        CHECK(second.patches.empty());
        CHECK(second.recomputed.empty());
        REQUIRE(second.tree.size() == first.tree.size());
        for (NodeRef ref = 0; ref < first.tree.size(); ++ref)
            CHECK(second.tree.shared(ref) == first.tree.shared(ref));
    }

    TEST_CASE("Only the facets of dirty variables are recomputed") {
        Fixture fixture{kCounterSource};
        auto    first = fixture.layout();

        fixture.snapshot.set("count", Value::integer(1));
        VariableSet dirty{"count"};
        auto        next = reconcile(fixture.view, fixture.index, fixture.snapshot, &first.tree, dirty);

        CHECK(next.recomputed == fixture.index.facetsOf(dirty));
        CHECK(next.patches == Patches{SetText{1, "Count: 1"}});
        CHECK(next.tree.node(1).text == std::optional<std::string>{"Count: 1"});
        CHECK(next.tree.shared(1) != first.tree.shared(1));
        for (NodeRef ref : {0u, 2u, 3u, 4u, 5u, 6u})
            CHECK(next.tree.shared(ref) == first.tree.shared(ref));

        // The previous tree is untouched.
        CHECK(first.tree.node(1).text == std::optional<std::string>{"Count: 0"});
    }

    TEST_CASE("Recomputed facets with equal values emit nothing") {
        Fixture fixture{kCounterSource};
        auto    first = fixture.layout();

        // 5 / 10 and 1 / 2 both resolve to 0.5.
        fixture.snapshot.set("done", Value::integer(1));
        fixture.snapshot.set("total", Value::integer(2));
        auto next = reconcile(fixture.view, fixture.index, fixture.snapshot, &first.tree, {"done", "total"});
        CHECK(next.recomputed == std::vector<Dependent>{{5, ReadKind::Property, "value"}});
        CHECK(next.patches.empty());
        CHECK(next.tree.shared(5) == first.tree.shared(5));
    }

    TEST_CASE("Patches within a node follow text, visibility, properties") {
        Fixture fixture{R"(@app "o"
@version 1
state { n: 0 }
view { text "Hi {n}" { visible: n > 0, width: n, height: n * 2 } }
)"};
        auto first = fixture.layout();
        CHECK(first.patches
              == Patches{SetText{0, "Hi 0"},
                         SetVisible{0, false},
                         SetProp{0, "height", Value::integer(0)},
                         SetProp{0, "width", Value::integer(0)}});

        fixture.snapshot.set("n", Value::integer(1));
        auto next = reconcile(fixture.view, fixture.index, fixture.snapshot, &first.tree, {"n"});
        CHECK(next.patches
              == Patches{SetText{0, "Hi 1"},
                         SetVisible{0, true},
                         SetProp{0, "height", Value::integer(2)},
                         SetProp{0, "width", Value::integer(1)}});
    }

    TEST_CASE("Bound values and properties share one name order") {
        Fixture fixture{R"(@app "b"
@version 1
state { name: "Ada" }
view { input { bind: name, alpha: name + "!" } }
)"};
        auto first = fixture.layout();
        fixture.snapshot.set("name", Value::string("Bo"));
        auto next = reconcile(fixture.view, fixture.index, fixture.snapshot, &first.tree, {"name"});
        CHECK(next.patches
              == Patches{SetProp{0, "alpha", Value::string("Bo!")}, SetProp{0, "value", Value::string("Bo")}});
    }

    TEST_CASE("Failing facets fall back and report diagnostics") {
        Fixture fixture{R"(@app "f"
@version 1
state { name: "Ada", zero: 0, count: 1 }
view {
  column {
    text "x" { visible: name > 3 }
    box { width: count / zero }
  }
}
)"};
        auto result = fixture.layout();
        CHECK_FALSE(result.tree.node(1).visible);
        CHECK(result.tree.node(2).props.at("width").isNull());
        REQUIRE(result.diagnostics.size() == 2);
        CHECK(result.diagnostics[0].facet == Dependent{1, ReadKind::Visible, ""});
        CHECK(result.diagnostics[0].error.code == EvalError::Code::TypeMismatch);
        CHECK(result.diagnostics[1].facet == Dependent{2, ReadKind::Property, "width"});
        CHECK(result.diagnostics[1].error.code == EvalError::Code::DivisionByZero);

        fixture.snapshot.set("zero", Value::integer(2));
        auto next = reconcile(fixture.view, fixture.index, fixture.snapshot, &result.tree, {"zero"});
        CHECK(next.diagnostics.empty());
        CHECK(next.patches == Patches{SetProp{2, "width", Value::number(0.5)}});
    }

    TEST_CASE("A tree of another shape triggers a full layout") {
        Fixture fixture{kCounterSource};
        MaterializedTree stale;
        auto             result = reconcile(fixture.view, fixture.index, fixture.snapshot, &stale, {"count"});
        CHECK(result.patches.size() == 15);
        CHECK(result.tree.size() == 7);
    }

    TEST_CASE("Patch helpers") {
        PatchOp op = SetProp{3, "width", Value::integer(1)};
        CHECK(patchTarget(op) == 3);
        CHECK(patchOpName(op) == "set_prop");
        CHECK(patchOpName(PatchOp{SetText{0, "a"}}) == "set_text");
        CHECK(patchOpName(PatchOp{SetVisible{0, true}}) == "set_visible");
    }
}
