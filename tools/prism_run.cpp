#include <prism/runtime/Runtime.hpp>
#include <prism/runtime/RuntimeOptions.hpp>

#include "log/TaggedLogger.hpp"
#include "serialization/JsonExport.hpp"

#include <iostream>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace {

auto eventJson(Prism::RunStep const& step) -> nlohmann::json {
    switch (step.kind) {
    case Prism::RunStep::Kind::Action:
        return {{"action", step.target}};
    case Prism::RunStep::Kind::Click:
        return {{"click", step.target}};
    case Prism::RunStep::Kind::Type:
        return {{"type", step.target}, {"text", step.text}};
    case Prism::RunStep::Kind::Backspace:
        return {{"backspace", step.target}};
    }
    return nullptr;
}

auto updateJson(Prism::Update const& update, Prism::ViewTree const& view) -> nlohmann::json {
    nlohmann::json diagnostics = nlohmann::json::array();
    for (auto const& diagnostic : update.diagnostics)
        diagnostics.push_back(Prism::toJson(diagnostic, view));
    return {{"dirty", update.dirty}, {"patches", Prism::toJson(update.patches, view)}, {"diagnostics", diagnostics}};
}

// Resolves the view path a node step names; actions target no node.
auto stepNode(Prism::Runtime const& runtime, Prism::RunStep const& step) -> std::optional<Prism::NodeRef> {
    if (step.kind == Prism::RunStep::Kind::Action)
        return Prism::NodeRef{0};
    return runtime.find(step.target);
}

auto runStep(Prism::Runtime& runtime, Prism::RunStep const& step, Prism::NodeRef node)
    -> Prism::RuntimeResult<Prism::Update> {
    switch (step.kind) {
    case Prism::RunStep::Kind::Action:
        return runtime.execute(step.target);
    case Prism::RunStep::Kind::Click:
        return runtime.dispatch(node, Prism::UserEvent::click());
    case Prism::RunStep::Kind::Type:
        return runtime.dispatch(node, Prism::UserEvent::textInput(step.text));
    default:
        return runtime.dispatch(node, Prism::UserEvent::backspace());
    }
}

} // namespace

int main(int argc, char** argv) {
    auto arguments = Prism::ParseRuntimeArguments(argc, argv);
    if (!arguments) {
        Prism::PrintRuntimeUsage();
        return 1;
    }
    if (arguments->show_help) {
        Prism::PrintRuntimeUsage();
        return 0;
    }

    auto const& options = arguments->options;
#ifdef PRISM_LOG_DEBUG
    Prism::set_thread_name("Main");
    Prism::configure_logging_from_env();
    if (options.logging)
        Prism::set_logging_enabled(true);
#endif

    auto runtime = Prism::Runtime::Load(arguments->document, options);
    if (!runtime) {
        std::cerr << "prism_run: " << Prism::describeError(runtime.error()) << "\n";
        return 2;
    }

    auto const& view    = runtime->view();
    auto const& initial = runtime->initialLayout();
    nlohmann::json layout{{"app", runtime->document().appName},
                          {"version", runtime->document().version},
                          {"tree", Prism::toJson(runtime->tree(), view)},
                          {"update", updateJson(initial, view)}};
    std::cout << Prism::dumpJson(layout, options.json_indent) << "\n";

    int exitCode = 0;
    for (auto const& step : arguments->steps) {
        nlohmann::json line{{"event", eventJson(step)}};
        auto node = stepNode(*runtime, step);
        if (!node) {
            line["error"] = "bad_step:no node at path '" + step.target + "'";
            std::cout << Prism::dumpJson(line, options.json_indent) << "\n";
            continue;
        }
        auto update = runStep(*runtime, step, *node);
        if (update) {
            line["update"] = updateJson(*update, view);
        } else {
            line["error"] = Prism::describeError(update.error());
            if (Prism::isFatal(update.error())) {
                std::cout << Prism::dumpJson(line, options.json_indent) << "\n";
                exitCode = 3;
                break;
            }
        }
        std::cout << Prism::dumpJson(line, options.json_indent) << "\n";
    }

#ifdef PRISM_LOG_DEBUG
    Prism::logger().flush();
#endif
    return exitCode;
}
