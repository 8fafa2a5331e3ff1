#pragma once
#include "ast/Document.hpp"
#include "core/Error.hpp"
#include "state/StateStore.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace Prism {

// Routes named actions and bound-input writes to the StateStore. Lookup is
// exact and case-sensitive. Holds a non-owning pointer to the Document.
class ActionExecutor {
public:
    explicit ActionExecutor(Document const& document)
        : document_(&document) {}

    [[nodiscard]] auto execute(std::string_view name, StateStore& store,
                               std::size_t maxBytes = StateStore::kUnboundedState) const -> ActionResult<VariableSet>;

    [[nodiscard]] auto writeBinding(std::string const& variable, Value value, StateStore& store,
                                    std::size_t maxBytes = StateStore::kUnboundedState) const
        -> ActionResult<VariableSet>;

private:
    Document const* document_;
};

} // namespace Prism
