#include "Value.hpp"

#include <array>
#include <bit>
#include <charconv>
#include <cmath>

namespace Prism {

auto Value::toDouble() const -> double {
    if (isInt())
        return static_cast<double>(asInt());
    return asFloat();
}

auto Value::toText() const -> std::string {
    switch (kind()) {
    case Kind::Null:
        return {};
    case Kind::Bool:
        return asBool() ? "true" : "false";
    case Kind::Int:
        return std::to_string(asInt());
    case Kind::Float:
        return formatFloat(asFloat());
    case Kind::Str:
        return asStr();
    }
    return {};
}

auto Value::footprint() const noexcept -> std::size_t {
    if (isStr())
        return sizeof(Value) + asStr().capacity();
    return sizeof(Value);
}

auto operator==(Value const& lhs, Value const& rhs) -> bool {
    if (lhs.kind() != rhs.kind())
        return false;
    if (lhs.isFloat())
        return std::bit_cast<std::uint64_t>(lhs.asFloat()) == std::bit_cast<std::uint64_t>(rhs.asFloat());
    return lhs.storage_ == rhs.storage_;
}

auto kindName(Value::Kind kind) -> std::string_view {
    switch (kind) {
    case Value::Kind::Null:
        return "null";
    case Value::Kind::Bool:
        return "bool";
    case Value::Kind::Int:
        return "int";
    case Value::Kind::Float:
        return "float";
    case Value::Kind::Str:
        return "string";
    }
    return "unknown";
}

auto formatFloat(double value) -> std::string {
    if (std::isnan(value))
        return "NaN";
    if (std::isinf(value))
        return value < 0 ? "-inf" : "inf";

    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{})
        return std::to_string(value);
    return std::string(buffer.data(), end);
}

} // namespace Prism
