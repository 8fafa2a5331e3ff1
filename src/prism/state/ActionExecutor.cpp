#include "ActionExecutor.hpp"

#include "log/TaggedLogger.hpp"

namespace Prism {

auto ActionExecutor::execute(std::string_view name, StateStore& store, std::size_t maxBytes) const -> ActionResult<VariableSet> {
    auto const* action = document_->findAction(name);
    if (!action) {
        prism_log("Unknown action " + std::string{name}, "Executor", "ERROR");
        return std::unexpected(ActionError{ActionError::Code::UnknownAction, std::string{name}});
    }
    return store.apply(*action, maxBytes);
}

auto ActionExecutor::writeBinding(std::string const& variable, Value value, StateStore& store,
                                  std::size_t maxBytes) const
    -> ActionResult<VariableSet> {
    prism_log("Bound write to " + variable, "Executor", "DEBUG");
    return store.assign(variable, std::move(value), maxBytes);
}

} // namespace Prism
