#include "Expression.hpp"

namespace Prism {

auto Expression::literal(Value value) -> ExpressionPtr {
    return std::make_shared<Expression const>(Expression{Literal{std::move(value)}});
}

auto Expression::variable(std::string name) -> ExpressionPtr {
    return std::make_shared<Expression const>(Expression{Variable{std::move(name)}});
}

auto Expression::binary(BinaryOp op, ExpressionPtr lhs, ExpressionPtr rhs) -> ExpressionPtr {
    return std::make_shared<Expression const>(Expression{Binary{op, std::move(lhs), std::move(rhs)}});
}

auto binaryOpSymbol(BinaryOp op) -> std::string_view {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Lt:
        return "<";
    case BinaryOp::Gt:
        return ">";
    case BinaryOp::Le:
        return "<=";
    case BinaryOp::Ge:
        return ">=";
    case BinaryOp::Eq:
        return "==";
    case BinaryOp::Ne:
        return "!=";
    case BinaryOp::And:
        return "and";
    case BinaryOp::Or:
        return "or";
    }
    return "?";
}

auto collectVariables(Expression const& expression, std::vector<std::string>& out) -> void {
    if (auto const* variable = std::get_if<Expression::Variable>(&expression.node)) {
        out.push_back(variable->name);
    } else if (auto const* binary = std::get_if<Expression::Binary>(&expression.node)) {
        collectVariables(*binary->lhs, out);
        collectVariables(*binary->rhs, out);
    }
}

auto toSource(Expression const& expression) -> std::string {
    if (auto const* literal = std::get_if<Expression::Literal>(&expression.node)) {
        if (literal->value.isStr())
            return "\"" + literal->value.asStr() + "\"";
        if (literal->value.isNull())
            return "null";
        return literal->value.toText();
    }
    if (auto const* variable = std::get_if<Expression::Variable>(&expression.node))
        return variable->name;

    auto const& binary = std::get<Expression::Binary>(expression.node);
    std::string out{"("};
    out.append(toSource(*binary.lhs));
    out.push_back(' ');
    out.append(binaryOpSymbol(binary.op));
    out.push_back(' ');
    out.append(toSource(*binary.rhs));
    out.push_back(')');
    return out;
}

} // namespace Prism
