#pragma once
#include "ast/Document.hpp"
#include "core/Error.hpp"
#include "core/Snapshot.hpp"
#include "sandbox/Sandbox.hpp"
#include "state/ActionExecutor.hpp"
#include "state/StateStore.hpp"
#include "view/DependencyIndex.hpp"
#include "view/Materializer.hpp"
#include "view/MaterializedTree.hpp"
#include "view/Patch.hpp"
#include "view/ViewTree.hpp"

#include <prism/runtime/RuntimeOptions.hpp>

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Prism {

// ActionError is recoverable (state untouched); SandboxError is fatal.
using RuntimeError = std::variant<ActionError, SandboxError>;

template <typename T>
using RuntimeResult = std::expected<T, RuntimeError>;

[[nodiscard]] auto describeError(RuntimeError const& error) -> std::string;

[[nodiscard]] inline auto isFatal(RuntimeError const& error) -> bool {
    return std::holds_alternative<SandboxError>(error);
}

// Input resolved by the renderer's hit-testing.
struct UserEvent {
    struct Click {};
    struct TextInput {
        std::string text;
    };
    struct Backspace {};

    std::variant<Click, TextInput, Backspace> event;

    static auto click() -> UserEvent { return UserEvent{Click{}}; }
    static auto textInput(std::string text) -> UserEvent { return UserEvent{TextInput{std::move(text)}}; }
    static auto backspace() -> UserEvent { return UserEvent{Backspace{}}; }
};

// Result of one event: the variables whose value changed and the patches
// that bring the renderer's tree up to date.
struct Update {
    VariableSet                  dirty;
    Patches                      patches;
    std::vector<FacetDiagnostic> diagnostics;
};

/**
 * Runtime: one running Prism application.
 *
 * Owns the Document and everything derived from it: the view arena, the
 * dependency index, the state store, the memory budget and the current
 * materialized tree. Events are processed one at a time to completion on
 * the caller's thread.
 *
 * A memory violation terminates the runtime; every later call reports
 * MemoryExceeded.
 */
class Runtime {
public:
    static auto Load(std::string_view path, RuntimeOptions const& options = {}) -> LoadResult<Runtime>;
    static auto FromSource(std::string_view source, RuntimeOptions const& options = {}) -> LoadResult<Runtime>;
    // For documents built in code; the caller is responsible for validation.
    static auto FromDocument(Document document, RuntimeOptions const& options = {}) -> LoadResult<Runtime>;

    Runtime(Runtime&&) noexcept            = default;
    Runtime& operator=(Runtime&&) noexcept = default;
    Runtime(Runtime const&)                = delete;
    Runtime& operator=(Runtime const&)     = delete;

    // Full layout produced at start-up.
    [[nodiscard]] auto initialLayout() const noexcept -> Update const& { return initial_; }

    [[nodiscard]] auto execute(std::string_view action) -> RuntimeResult<Update>;
    [[nodiscard]] auto dispatch(NodeRef node, UserEvent const& event) -> RuntimeResult<Update>;

    [[nodiscard]] auto find(std::string_view path) const -> std::optional<NodeRef> { return view_.find(path); }

    [[nodiscard]] auto document() const noexcept -> Document const& { return *document_; }
    [[nodiscard]] auto view() const noexcept -> ViewTree const& { return view_; }
    [[nodiscard]] auto index() const noexcept -> DependencyIndex const& { return index_; }
    [[nodiscard]] auto tree() const noexcept -> MaterializedTree const& { return tree_; }
    [[nodiscard]] auto snapshot() const noexcept -> Snapshot const& { return store_.snapshot(); }
    [[nodiscard]] auto budget() const noexcept -> MemoryBudget const& { return budget_; }
    [[nodiscard]] auto terminated() const noexcept -> bool { return terminated_; }

private:
    Runtime(std::unique_ptr<Document> document, RuntimeOptions const& options);

    auto start(std::size_t sourceBytes) -> SandboxResult<void>;
    auto settle(VariableSet dirty) -> RuntimeResult<Update>;
    auto terminate(SandboxError error) -> SandboxError;
    // Sandbox failures from a transaction terminate; other action errors pass through.
    auto reject(ActionError error) -> RuntimeError;
    auto writeText(NodeRef node, bool append, std::string const& text) -> RuntimeResult<Update>;

    std::unique_ptr<Document> document_;
    ViewTree                  view_;
    DependencyIndex           index_;
    StateStore                store_;
    ActionExecutor            executor_;
    MemoryBudget              budget_;
    MaterializedTree          tree_;
    Update                    initial_;
    bool                      terminated_ = false;
};

} // namespace Prism
