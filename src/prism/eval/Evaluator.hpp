#pragma once
#include "ast/Document.hpp"
#include "ast/Expression.hpp"
#include "core/Error.hpp"
#include "core/Snapshot.hpp"
#include "core/Value.hpp"

#include <cstddef>
#include <limits>
#include <string>

namespace Prism {

/*
 * Expression evaluation is a pure function of the expression tree and a
 * snapshot. Nothing here can reach state mutation, the filesystem or any
 * other capability; callers own what happens with the result.
 *
 * Type rules:
 *   + - *  on Int/Int give Int, with any Float operand give Float
 *   /      always gives Float, zero divisor is DivisionByZero
 *   +      with a Str operand concatenates canonical text; a result longer
 *          than `maxTextBytes` is ValueTooLarge and is never allocated
 *   == !=  never fail; values of different kinds differ (Int 1 != Float 1.0)
 *   < > <= >=  numeric operands only
 *   and or Bool operands only, short-circuit
 */
inline constexpr std::size_t kUnlimitedTextBytes = std::numeric_limits<std::size_t>::max();

[[nodiscard]] auto evaluate(Expression const& expression,
                            Snapshot const&   snapshot,
                            std::size_t       maxTextBytes = kUnlimitedTextBytes) -> EvalResult<Value>;

[[nodiscard]] auto evaluateBinary(BinaryOp    op,
                                  Value const& lhs,
                                  Value const& rhs,
                                  std::size_t  maxTextBytes = kUnlimitedTextBytes) -> EvalResult<Value>;

// The `==` operator's semantics: kind-sensitive, Floats by IEEE comparison
// (0.0 == -0.0, NaN != NaN).
[[nodiscard]] auto valuesEqual(Value const& lhs, Value const& rhs) -> bool;

// Substitutes each variable reference with its canonical text.
[[nodiscard]] auto renderTemplate(TextTemplate const& spans, Snapshot const& snapshot) -> EvalResult<std::string>;

} // namespace Prism
