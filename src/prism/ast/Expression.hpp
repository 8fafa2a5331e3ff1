#pragma once
#include "core/Value.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Prism {

enum class BinaryOp {
    Add,
    Sub,
    Mul,
    Div,
    Lt,
    Gt,
    Le,
    Ge,
    Eq,
    Ne,
    And,
    Or
};

struct Expression;

// Expression trees are immutable after load and shared between the document,
// the view arena and actions.
using ExpressionPtr = std::shared_ptr<Expression const>;

struct Expression {
    struct Literal {
        Value value;
    };
    struct Variable {
        std::string name;
    };
    struct Binary {
        BinaryOp      op;
        ExpressionPtr lhs;
        ExpressionPtr rhs;
    };

    std::variant<Literal, Variable, Binary> node;

    static auto literal(Value value) -> ExpressionPtr;
    static auto variable(std::string name) -> ExpressionPtr;
    static auto binary(BinaryOp op, ExpressionPtr lhs, ExpressionPtr rhs) -> ExpressionPtr;
};

[[nodiscard]] auto binaryOpSymbol(BinaryOp op) -> std::string_view;

// Free variables in left-to-right order, duplicates included.
auto collectVariables(Expression const& expression, std::vector<std::string>& out) -> void;

// Fully parenthesised rendering, used in diagnostics and tests.
[[nodiscard]] auto toSource(Expression const& expression) -> std::string;

} // namespace Prism
