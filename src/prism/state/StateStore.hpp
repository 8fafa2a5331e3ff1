#pragma once
#include "ast/Document.hpp"
#include "core/Error.hpp"
#include "core/Snapshot.hpp"
#include "core/Value.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace Prism {

/**
 * StateStore: the committed values of every declared state variable.
 *
 * Mutation goes through transactions only. A transaction runs against a
 * working copy of the committed snapshot; mutations are applied in order and
 * each sees the results of the earlier ones. The first failure discards the
 * working copy, so the committed snapshot is left exactly as it was. On
 * success the working copy replaces the committed snapshot and the variables
 * whose Value actually changed are reported as dirty.
 *
 * `maxBytes` bounds the footprint the working copy may reach. Text
 * concatenation is refused before it allocates past the bound and the
 * footprint is rechecked after every mutation; either overrun fails the
 * transaction with an ActionError carrying a MemoryExceeded SandboxError.
 */
class StateStore {
public:
    static constexpr std::size_t kUnboundedState = std::numeric_limits<std::size_t>::max();

    StateStore() = default;
    explicit StateStore(std::vector<StateDecl> const& declarations);

    [[nodiscard]] auto apply(Action const& action, std::size_t maxBytes = kUnboundedState) -> ActionResult<VariableSet>;

    // Single-variable transaction; UnknownVariable for undeclared names.
    [[nodiscard]] auto assign(std::string const& variable, Value value, std::size_t maxBytes = kUnboundedState)
        -> ActionResult<VariableSet>;

    [[nodiscard]] auto snapshot() const noexcept -> Snapshot const& { return committed_; }
    [[nodiscard]] auto get(std::string const& variable) const -> Value const* { return committed_.find(variable); }
    [[nodiscard]] auto footprint() const -> std::size_t { return committed_.footprint(); }

private:
    auto commit(Snapshot working, VariableSet const& touched) -> VariableSet;

    Snapshot committed_;
};

} // namespace Prism
