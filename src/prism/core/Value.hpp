#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace Prism {

/**
 * Value: the runtime value of a Prism expression or state variable.
 *
 * A closed tagged union of five kinds. Values are immutable once produced;
 * an assignment replaces the Value held for a variable, possibly with one of
 * a different kind.
 *
 * Equality (operator==) is identity of the stored value: kinds must match
 * and Floats compare by bit pattern, so -0.0 differs from 0.0 and a NaN
 * equals itself. Dirty tracking and patch diffing rely on this; the
 * evaluator's `==` operator compares Floats numerically (see Evaluator).
 */
class Value {
public:
    enum class Kind {
        Null = 0,
        Bool,
        Int,
        Float,
        Str
    };

    struct Null {
        friend constexpr auto operator==(Null, Null) -> bool { return true; }
    };

    using Storage = std::variant<Null, bool, std::int64_t, double, std::string>;

    Value() = default;

    static auto null() -> Value { return Value{}; }
    static auto boolean(bool b) -> Value { return Value{Storage{std::in_place_type<bool>, b}}; }
    static auto integer(std::int64_t i) -> Value { return Value{Storage{std::in_place_type<std::int64_t>, i}}; }
    static auto number(double d) -> Value { return Value{Storage{std::in_place_type<double>, d}}; }
    static auto string(std::string s) -> Value { return Value{Storage{std::in_place_type<std::string>, std::move(s)}}; }

    [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(storage_.index()); }

    [[nodiscard]] auto isNull() const noexcept -> bool { return kind() == Kind::Null; }
    [[nodiscard]] auto isBool() const noexcept -> bool { return kind() == Kind::Bool; }
    [[nodiscard]] auto isInt() const noexcept -> bool { return kind() == Kind::Int; }
    [[nodiscard]] auto isFloat() const noexcept -> bool { return kind() == Kind::Float; }
    [[nodiscard]] auto isStr() const noexcept -> bool { return kind() == Kind::Str; }
    [[nodiscard]] auto isNumeric() const noexcept -> bool { return isInt() || isFloat(); }

    // Accessors assume the matching kind; check kind() first.
    [[nodiscard]] auto asBool() const -> bool { return std::get<bool>(storage_); }
    [[nodiscard]] auto asInt() const -> std::int64_t { return std::get<std::int64_t>(storage_); }
    [[nodiscard]] auto asFloat() const -> double { return std::get<double>(storage_); }
    [[nodiscard]] auto asStr() const -> std::string const& { return std::get<std::string>(storage_); }

    // Int or Float widened to double.
    [[nodiscard]] auto toDouble() const -> double;

    // Canonical textual form used for interpolation and string concatenation.
    [[nodiscard]] auto toText() const -> std::string;

    // Approximate heap + inline footprint, used for memory accounting.
    [[nodiscard]] auto footprint() const noexcept -> std::size_t;

    [[nodiscard]] auto storage() const noexcept -> Storage const& { return storage_; }

    friend auto operator==(Value const& lhs, Value const& rhs) -> bool;

private:
    explicit Value(Storage storage)
        : storage_(std::move(storage)) {}

    Storage storage_;
};

[[nodiscard]] auto kindName(Value::Kind kind) -> std::string_view;

// Shortest decimal text that round-trips; integral values print without a
// fractional part ("2" for 2.0).
[[nodiscard]] auto formatFloat(double value) -> std::string;

} // namespace Prism
