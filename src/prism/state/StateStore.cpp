#include "StateStore.hpp"

#include "eval/Evaluator.hpp"
#include "log/TaggedLogger.hpp"

namespace Prism {
namespace {

auto overrun(std::string const& target, std::size_t bytes, std::size_t maxBytes) -> ActionError {
    prism_log("State grew to " + std::to_string(bytes) + " bytes at " + target, "Store", "ERROR");
    return ActionError{SandboxError{SandboxError::Code::MemoryExceeded,
                                    "state reached " + std::to_string(bytes) + " of " + std::to_string(maxBytes)
                                        + " allowed bytes"},
                       target};
}

} // namespace

StateStore::StateStore(std::vector<StateDecl> const& declarations) {
    for (auto const& declaration : declarations)
        committed_.set(declaration.name, declaration.initial);
}

auto StateStore::apply(Action const& action, std::size_t maxBytes) -> ActionResult<VariableSet> {
    auto        working = committed_;
    VariableSet touched;

    for (auto const& mutation : action.mutations) {
        if (!working.contains(mutation.target)) {
            prism_log("Action " + action.name + " assigns undeclared " + mutation.target, "Store", "ERROR");
            return std::unexpected(
                    ActionError{ActionError::Code::UnknownVariable, "'" + mutation.target + "' is not a state variable"});
        }
        auto const used = working.footprint();
        if (used > maxBytes)
            return std::unexpected(overrun(mutation.target, used, maxBytes));

        auto value = evaluate(*mutation.value, working, maxBytes - used);
        if (!value) {
            prism_log("Action " + action.name + " aborted at " + mutation.target + ": " + describeError(value.error()),
                      "Store", "ERROR");
            if (value.error().code == EvalError::Code::ValueTooLarge)
                return std::unexpected(ActionError{
                        SandboxError{SandboxError::Code::MemoryExceeded, value.error().message.value_or("value too large")},
                        mutation.target});
            return std::unexpected(ActionError::evaluation(std::move(value.error()), mutation.target));
        }
        working.set(mutation.target, std::move(*value));
        touched.insert(mutation.target);

        if (auto const grown = working.footprint(); grown > maxBytes)
            return std::unexpected(overrun(mutation.target, grown, maxBytes));
    }

    auto dirty = commit(std::move(working), touched);
    prism_log("Action " + action.name + " committed, " + std::to_string(dirty.size()) + " dirty", "Store", "INFO");
    return dirty;
}

auto StateStore::assign(std::string const& variable, Value value, std::size_t maxBytes) -> ActionResult<VariableSet> {
    if (!committed_.contains(variable))
        return std::unexpected(ActionError{ActionError::Code::UnknownVariable, "'" + variable + "' is not a state variable"});

    auto working = committed_;
    working.set(variable, std::move(value));
    if (auto const grown = working.footprint(); grown > maxBytes)
        return std::unexpected(overrun(variable, grown, maxBytes));
    return commit(std::move(working), VariableSet{variable});
}

auto StateStore::commit(Snapshot working, VariableSet const& touched) -> VariableSet {
    VariableSet dirty;
    for (auto const& name : touched) {
        auto const* before = committed_.find(name);
        auto const* after  = working.find(name);
        if (!before || !after || !(*before == *after))
            dirty.insert(name);
    }
    committed_ = std::move(working);
    return dirty;
}

} // namespace Prism
