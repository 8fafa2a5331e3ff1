#include "eval/Evaluator.hpp"
#include "parse/Parser.hpp"

#include <doctest/doctest.h>

#include <cmath>
#include <string>

using namespace Prism;

namespace {

auto eval(std::string_view source, Snapshot const& snapshot = {}) -> EvalResult<Value> {
    auto expression = parseExpression(source);
    REQUIRE_MESSAGE(expression.has_value(), source);
    return evaluate(**expression, snapshot);
}

auto errorOf(std::string_view source, Snapshot const& snapshot = {}) -> EvalError::Code {
    auto result = eval(source, snapshot);
    REQUIRE_FALSE_MESSAGE(result.has_value(), source);
    return result.error().code;
}

} // namespace

TEST_SUITE("eval.evaluator") {
    TEST_CASE("Precedence and associativity") {
        CHECK(*eval("2 + 3 * 4") == Value::integer(14));
        CHECK(*eval("(2 + 3) * 4") == Value::integer(20));
        CHECK(*eval("10 - 2 - 3") == Value::integer(5));
        CHECK(*eval("1 < 2 == true") == Value::boolean(true));
        CHECK(*eval("false and false or true") == Value::boolean(true));
        CHECK(*eval("-3 + 5") == Value::integer(2));

        auto parsed = parseExpression("2 + 3 * 4");
        REQUIRE(parsed.has_value());
        CHECK(toSource(**parsed) == "(2 + (3 * 4))");
    }

    TEST_CASE("Arithmetic kinds") {
        CHECK(*eval("7 / 2") == Value::number(3.5));
        CHECK(*eval("4 / 2") == Value::number(2.0));
        CHECK(eval("4 / 2")->toText() == "2");
        CHECK(*eval("2.5 * 2") == Value::number(5.0));
        CHECK(*eval("1 + 0.5") == Value::number(1.5));
        CHECK(*eval("6 * 7") == Value::integer(42));
    }

    TEST_CASE("String concatenation uses canonical text") {
        CHECK(*eval("\"a\" + 1") == Value::string("a1"));
        CHECK(*eval("1 + \"a\"") == Value::string("1a"));
        CHECK(*eval("\"x\" + true") == Value::string("xtrue"));
        CHECK(*eval("\"v\" + 2.0") == Value::string("v2"));
        CHECK(*eval("\"n\" + null") == Value::string("n"));
    }

    TEST_CASE("Evaluation errors") {
        CHECK(errorOf("1 / 0") == EvalError::Code::DivisionByZero);
        CHECK(errorOf("1.5 / 0.0") == EvalError::Code::DivisionByZero);
        CHECK(errorOf("1 + true") == EvalError::Code::TypeMismatch);
        CHECK(errorOf("\"a\" - 1") == EvalError::Code::TypeMismatch);
        CHECK(errorOf("\"a\" < 1") == EvalError::Code::TypeMismatch);
        CHECK(errorOf("1 and true") == EvalError::Code::TypeMismatch);
        CHECK(errorOf("true and 1") == EvalError::Code::TypeMismatch);
        CHECK(errorOf("missing + 1") == EvalError::Code::UndefinedVariable);
        CHECK(errorOf("9223372036854775807 + 1") == EvalError::Code::IntegerOverflow);
        CHECK(errorOf("-9223372036854775807 - 2") == EvalError::Code::IntegerOverflow);
        CHECK(errorOf("4611686018427387904 * 2") == EvalError::Code::IntegerOverflow);
    }

    TEST_CASE("Equality never fails and is kind-sensitive") {
        CHECK(*eval("1 == 1.0") == Value::boolean(false));
        CHECK(*eval("1 != 1.0") == Value::boolean(true));
        CHECK(*eval("2.0 == 4 / 2") == Value::boolean(true));
        CHECK(*eval("0.0 == -0.0") == Value::boolean(true));
        CHECK(*eval("1 == \"1\"") == Value::boolean(false));
        CHECK(*eval("null == null") == Value::boolean(true));
        CHECK(*eval("null != false") == Value::boolean(true));
        CHECK(*eval("\"a\" == \"a\"") == Value::boolean(true));
        CHECK_FALSE(valuesEqual(Value::integer(2), Value::number(2.0)));
        CHECK(valuesEqual(Value::integer(2), Value::integer(2)));
        CHECK_FALSE(valuesEqual(Value::boolean(true), Value::integer(1)));
        CHECK_FALSE(valuesEqual(Value::number(std::nan("")), Value::number(std::nan(""))));
    }

    TEST_CASE("Relational operators on numerics") {
        CHECK(*eval("2 < 3") == Value::boolean(true));
        CHECK(*eval("2 >= 2.0") == Value::boolean(true));
        CHECK(*eval("2.5 > 3") == Value::boolean(false));
        CHECK(*eval("3 <= 2") == Value::boolean(false));
    }

    TEST_CASE("Logical operators short-circuit") {
        CHECK(*eval("false and missing") == Value::boolean(false));
        CHECK(*eval("true or missing") == Value::boolean(true));
        CHECK(errorOf("true and missing") == EvalError::Code::UndefinedVariable);
        CHECK(errorOf("false or 3") == EvalError::Code::TypeMismatch);
    }

    TEST_CASE("Variables come from the snapshot") {
        Snapshot snapshot;
        snapshot.set("count", Value::integer(5));
        snapshot.set("name", Value::string("Ada"));
        CHECK(*eval("count * 2", snapshot) == Value::integer(10));
        CHECK(*eval("name + \"!\"", snapshot) == Value::string("Ada!"));
        CHECK(errorOf("count / 0", snapshot) == EvalError::Code::DivisionByZero);
    }

    TEST_CASE("Template rendering") {
        Snapshot snapshot;
        snapshot.set("count", Value::integer(3));
        snapshot.set("ratio", Value::number(0.25));
        auto rendered = renderTemplate(parseTextTemplate("Count: {count}, ratio {ratio}"), snapshot);
        REQUIRE(rendered.has_value());
        CHECK(*rendered == "Count: 3, ratio 0.25");

        auto failed = renderTemplate(parseTextTemplate("{missing}"), snapshot);
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == EvalError::Code::UndefinedVariable);
    }

    TEST_CASE("Concatenation respects a byte allowance") {
        Snapshot snapshot;
        snapshot.set("s", Value::string("abc"));
        auto expression = parseExpression("s + s");
        REQUIRE(expression.has_value());

        auto refused = evaluate(**expression, snapshot, 5);
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code == EvalError::Code::ValueTooLarge);

        auto exact = evaluate(**expression, snapshot, 6);
        REQUIRE(exact.has_value());
        CHECK(*exact == Value::string("abcabc"));

        auto numbers = parseExpression("1 + 2 + 3");
        REQUIRE(numbers.has_value());
        CHECK(*evaluate(**numbers, snapshot, 0) == Value::integer(6));
    }
}
