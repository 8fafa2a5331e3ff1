#include <prism/runtime/Runtime.hpp>

#include "log/TaggedLogger.hpp"
#include "parse/Loader.hpp"

#include <utility>

namespace Prism {
namespace {

auto policyFrom(RuntimeOptions const& options) -> SandboxPolicy {
    return SandboxPolicy{.appRoot          = options.app_root,
                         .maxSourceBytes   = options.max_source_bytes,
                         .memoryLimitBytes = options.memory_limit_bytes};
}

// Drops the final UTF-8 code point: any continuation bytes, then the lead byte.
auto removeLastCodePoint(std::string& text) -> void {
    while (!text.empty() && (static_cast<unsigned char>(text.back()) & 0xC0) == 0x80)
        text.pop_back();
    if (!text.empty())
        text.pop_back();
}

auto terminatedError() -> SandboxError {
    return SandboxError{SandboxError::Code::MemoryExceeded, "runtime terminated after a memory violation"};
}

} // namespace

auto describeError(RuntimeError const& error) -> std::string {
    return std::visit([](auto const& e) { return describeError(e); }, error);
}

Runtime::Runtime(std::unique_ptr<Document> document, RuntimeOptions const& options)
    : document_(std::move(document)),
      view_(document_->view ? &*document_->view : nullptr),
      index_(view_),
      store_(document_->state),
      executor_(*document_),
      budget_(options.memory_limit_bytes) {}

auto Runtime::Load(std::string_view path, RuntimeOptions const& options) -> LoadResult<Runtime> {
    auto loaded = loadDocument(path, policyFrom(options));
    if (!loaded)
        return std::unexpected(loaded.error());

    Runtime runtime{std::make_unique<Document>(std::move(loaded->document)), options};
    if (auto started = runtime.start(loaded->sourceBytes); !started)
        return std::unexpected(LoadError{started.error()});
    return runtime;
}

auto Runtime::FromSource(std::string_view source, RuntimeOptions const& options) -> LoadResult<Runtime> {
    auto loaded = loadSource(source, policyFrom(options));
    if (!loaded)
        return std::unexpected(loaded.error());

    Runtime runtime{std::make_unique<Document>(std::move(loaded->document)), options};
    if (auto started = runtime.start(loaded->sourceBytes); !started)
        return std::unexpected(LoadError{started.error()});
    return runtime;
}

auto Runtime::FromDocument(Document document, RuntimeOptions const& options) -> LoadResult<Runtime> {
    Runtime runtime{std::make_unique<Document>(std::move(document)), options};
    if (auto started = runtime.start(0); !started)
        return std::unexpected(LoadError{started.error()});
    return runtime;
}

auto Runtime::start(std::size_t sourceBytes) -> SandboxResult<void> {
    if (auto accounted = budget_.update(MemoryBudget::Component::Source, sourceBytes); !accounted)
        return std::unexpected(terminate(accounted.error()));
    if (auto accounted = budget_.update(MemoryBudget::Component::State, store_.footprint()); !accounted)
        return std::unexpected(terminate(accounted.error()));

    auto result = reconcile(view_, index_, store_.snapshot(), nullptr, {});
    if (auto accounted = budget_.update(MemoryBudget::Component::Tree, result.tree.footprint()); !accounted)
        return std::unexpected(terminate(accounted.error()));

    tree_    = std::move(result.tree);
    initial_ = Update{.dirty = {}, .patches = std::move(result.patches), .diagnostics = std::move(result.diagnostics)};
    prism_log("Started '" + document_->appName + "' with " + std::to_string(view_.size()) + " nodes, "
                  + std::to_string(budget_.used()) + " bytes accounted",
              "Runtime", "INFO");
    return {};
}

auto Runtime::execute(std::string_view action) -> RuntimeResult<Update> {
    if (terminated_)
        return std::unexpected(RuntimeError{terminatedError()});

    auto dirty = executor_.execute(action, store_, budget_.headroom(MemoryBudget::Component::State));
    if (!dirty) {
        prism_log("Action " + std::string{action} + " rejected: " + describeError(dirty.error()), "Runtime", "WARNING");
        return std::unexpected(reject(std::move(dirty.error())));
    }
    return settle(std::move(*dirty));
}

auto Runtime::dispatch(NodeRef node, UserEvent const& event) -> RuntimeResult<Update> {
    if (terminated_)
        return std::unexpected(RuntimeError{terminatedError()});
    if (node >= view_.size()) {
        prism_log("Event for unknown node " + std::to_string(node), "Runtime", "WARNING");
        return Update{};
    }

    if (std::holds_alternative<UserEvent::Click>(event.event)) {
        auto const& props = view_.node(node).props;
        auto        it    = props.find(std::string{kClickProperty});
        if (it == props.end())
            return Update{};
        auto const* handler = std::get_if<PropValue::Identifier>(&it->second.value);
        if (!handler)
            return Update{};
        return execute(handler->name);
    }
    if (auto const* input = std::get_if<UserEvent::TextInput>(&event.event))
        return writeText(node, true, input->text);
    return writeText(node, false, {});
}

auto Runtime::writeText(NodeRef node, bool append, std::string const& text) -> RuntimeResult<Update> {
    auto const& props = view_.node(node).props;
    auto        it    = props.find(std::string{kBindProperty});
    if (it == props.end())
        return Update{};
    auto const* variable = std::get_if<PropValue::Identifier>(&it->second.value);
    if (!variable)
        return Update{};

    auto const* current = store_.get(variable->name);
    auto        edited  = current ? current->toText() : std::string{};
    if (append) {
        edited.append(text);
    } else {
        if (edited.empty())
            return Update{};
        removeLastCodePoint(edited);
    }

    auto dirty = executor_.writeBinding(variable->name, Value::string(std::move(edited)), store_,
                                        budget_.headroom(MemoryBudget::Component::State));
    if (!dirty)
        return std::unexpected(reject(std::move(dirty.error())));
    return settle(std::move(*dirty));
}

auto Runtime::settle(VariableSet dirty) -> RuntimeResult<Update> {
    if (auto accounted = budget_.update(MemoryBudget::Component::State, store_.footprint()); !accounted)
        return std::unexpected(RuntimeError{terminate(accounted.error())});
    if (auto accounted = budget_.update(MemoryBudget::Component::PreviousTree, tree_.footprint()); !accounted)
        return std::unexpected(RuntimeError{terminate(accounted.error())});

    auto result = reconcile(view_, index_, store_.snapshot(), &tree_, dirty);
    if (auto accounted = budget_.update(MemoryBudget::Component::Tree, result.tree.footprint()); !accounted)
        return std::unexpected(RuntimeError{terminate(accounted.error())});

    tree_ = std::move(result.tree);
    budget_.release(MemoryBudget::Component::PreviousTree);
    return Update{.dirty = std::move(dirty), .patches = std::move(result.patches), .diagnostics = std::move(result.diagnostics)};
}

auto Runtime::reject(ActionError error) -> RuntimeError {
    if (error.code == ActionError::Code::Sandbox && error.sandbox)
        return RuntimeError{terminate(std::move(*error.sandbox))};
    return RuntimeError{std::move(error)};
}

auto Runtime::terminate(SandboxError error) -> SandboxError {
    terminated_ = true;
    prism_log("Terminating: " + describeError(error), "Runtime", "ERROR");
    return error;
}

} // namespace Prism
