#include "Evaluator.hpp"

#include "log/TaggedLogger.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace Prism {
namespace {

auto typeMismatch(BinaryOp op, Value const& lhs, Value const& rhs) -> EvalError {
    std::string message{"operator '"};
    message.append(binaryOpSymbol(op));
    message.append("' cannot combine ");
    message.append(kindName(lhs.kind()));
    message.append(" and ");
    message.append(kindName(rhs.kind()));
    return EvalError{EvalError::Code::TypeMismatch, std::move(message)};
}

auto overflow(BinaryOp op) -> EvalError {
    return EvalError{EvalError::Code::IntegerOverflow,
                     std::string{"integer overflow in '"} + std::string{binaryOpSymbol(op)} + "'"};
}

auto integerArithmetic(BinaryOp op, std::int64_t a, std::int64_t b) -> EvalResult<Value> {
    std::int64_t result = 0;
    bool         failed = false;
    switch (op) {
    case BinaryOp::Add:
        failed = __builtin_add_overflow(a, b, &result);
        break;
    case BinaryOp::Sub:
        failed = __builtin_sub_overflow(a, b, &result);
        break;
    case BinaryOp::Mul:
        failed = __builtin_mul_overflow(a, b, &result);
        break;
    default:
        return std::unexpected(EvalError{EvalError::Code::TypeMismatch, "not an integer operator"});
    }
    if (failed)
        return std::unexpected(overflow(op));
    return Value::integer(result);
}

auto concatenate(Value const& lhs, Value const& rhs, std::size_t maxTextBytes) -> EvalResult<Value> {
    auto left  = lhs.toText();
    auto right = rhs.toText();
    if (left.size() > maxTextBytes || right.size() > maxTextBytes - left.size()) {
        return std::unexpected(EvalError{EvalError::Code::ValueTooLarge,
                                         "concatenation of " + std::to_string(left.size()) + " and "
                                                 + std::to_string(right.size()) + " bytes exceeds "
                                                 + std::to_string(maxTextBytes)});
    }
    left.append(right);
    return Value::string(std::move(left));
}

auto arithmetic(BinaryOp op, Value const& lhs, Value const& rhs, std::size_t maxTextBytes) -> EvalResult<Value> {
    if (op == BinaryOp::Add && (lhs.isStr() || rhs.isStr()))
        return concatenate(lhs, rhs, maxTextBytes);

    if (!lhs.isNumeric() || !rhs.isNumeric())
        return std::unexpected(typeMismatch(op, lhs, rhs));

    if (op == BinaryOp::Div) {
        if (rhs.toDouble() == 0.0)
            return std::unexpected(EvalError{EvalError::Code::DivisionByZero, "division by zero"});
        return Value::number(lhs.toDouble() / rhs.toDouble());
    }

    if (lhs.isInt() && rhs.isInt())
        return integerArithmetic(op, lhs.asInt(), rhs.asInt());

    auto const a = lhs.toDouble();
    auto const b = rhs.toDouble();
    switch (op) {
    case BinaryOp::Add:
        return Value::number(a + b);
    case BinaryOp::Sub:
        return Value::number(a - b);
    case BinaryOp::Mul:
        return Value::number(a * b);
    default:
        return std::unexpected(typeMismatch(op, lhs, rhs));
    }
}

auto relational(BinaryOp op, Value const& lhs, Value const& rhs) -> EvalResult<Value> {
    if (!lhs.isNumeric() || !rhs.isNumeric())
        return std::unexpected(typeMismatch(op, lhs, rhs));

    auto compare = [op](auto a, auto b) {
        switch (op) {
        case BinaryOp::Lt:
            return a < b;
        case BinaryOp::Gt:
            return a > b;
        case BinaryOp::Le:
            return a <= b;
        default:
            return a >= b;
        }
    };
    if (lhs.isInt() && rhs.isInt())
        return Value::boolean(compare(lhs.asInt(), rhs.asInt()));
    return Value::boolean(compare(lhs.toDouble(), rhs.toDouble()));
}

auto requireBool(BinaryOp op, Value const& operand, Value const& other) -> EvalResult<bool> {
    if (!operand.isBool())
        return std::unexpected(typeMismatch(op, operand, other));
    return operand.asBool();
}

} // namespace

auto valuesEqual(Value const& lhs, Value const& rhs) -> bool {
    if (lhs.kind() != rhs.kind())
        return false;
    if (lhs.isFloat())
        return lhs.asFloat() == rhs.asFloat();
    return lhs == rhs;
}

auto evaluateBinary(BinaryOp op, Value const& lhs, Value const& rhs, std::size_t maxTextBytes) -> EvalResult<Value> {
    switch (op) {
    case BinaryOp::Add:
    case BinaryOp::Sub:
    case BinaryOp::Mul:
    case BinaryOp::Div:
        return arithmetic(op, lhs, rhs, maxTextBytes);
    case BinaryOp::Lt:
    case BinaryOp::Gt:
    case BinaryOp::Le:
    case BinaryOp::Ge:
        return relational(op, lhs, rhs);
    case BinaryOp::Eq:
        return Value::boolean(valuesEqual(lhs, rhs));
    case BinaryOp::Ne:
        return Value::boolean(!valuesEqual(lhs, rhs));
    case BinaryOp::And:
    case BinaryOp::Or: {
        auto left = requireBool(op, lhs, rhs);
        if (!left)
            return std::unexpected(left.error());
        auto right = requireBool(op, rhs, lhs);
        if (!right)
            return std::unexpected(right.error());
        return Value::boolean(op == BinaryOp::And ? (*left && *right) : (*left || *right));
    }
    }
    return std::unexpected(EvalError{EvalError::Code::TypeMismatch, "unknown operator"});
}

auto evaluate(Expression const& expression, Snapshot const& snapshot, std::size_t maxTextBytes) -> EvalResult<Value> {
    if (auto const* literal = std::get_if<Expression::Literal>(&expression.node))
        return literal->value;

    if (auto const* variable = std::get_if<Expression::Variable>(&expression.node)) {
        if (auto const* value = snapshot.find(variable->name))
            return *value;
        return std::unexpected(EvalError{EvalError::Code::UndefinedVariable, variable->name});
    }

    auto const& binary = std::get<Expression::Binary>(expression.node);
    auto        lhs    = evaluate(*binary.lhs, snapshot, maxTextBytes);
    if (!lhs)
        return lhs;

    if (binary.op == BinaryOp::And || binary.op == BinaryOp::Or) {
        if (!lhs->isBool())
            return std::unexpected(typeMismatch(binary.op, *lhs, Value::null()));
        bool const decided = binary.op == BinaryOp::And ? !lhs->asBool() : lhs->asBool();
        if (decided)
            return *lhs;
    }

    auto rhs = evaluate(*binary.rhs, snapshot, maxTextBytes);
    if (!rhs)
        return rhs;
    return evaluateBinary(binary.op, *lhs, *rhs, maxTextBytes);
}

auto renderTemplate(TextTemplate const& spans, Snapshot const& snapshot) -> EvalResult<std::string> {
    std::string out;
    for (auto const& span : spans) {
        if (span.kind == TextSpan::Kind::Literal) {
            out.append(span.text);
            continue;
        }
        auto const* value = snapshot.find(span.text);
        if (!value) {
            prism_log("Template references unknown variable " + span.text, "Evaluator", "ERROR");
            return std::unexpected(EvalError{EvalError::Code::UndefinedVariable, span.text});
        }
        out.append(value->toText());
    }
    return out;
}

} // namespace Prism
