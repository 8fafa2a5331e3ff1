#pragma once
#include "ast/Expression.hpp"
#include "core/Value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Prism {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    // Accepts "rgb", "rgba", "rrggbb" and "rrggbbaa", with or without '#'.
    static auto fromHex(std::string_view hex) -> std::optional<Color>;

    // Lower-case "#rrggbbaa".
    [[nodiscard]] auto toHex() const -> std::string;

    friend auto operator==(Color const&, Color const&) -> bool = default;
};

// One piece of a text template: literal text or a variable reference.
struct TextSpan {
    enum class Kind {
        Literal,
        VarRef
    };
    Kind        kind = Kind::Literal;
    std::string text; // literal text, or the variable name for VarRef
};

using TextTemplate = std::vector<TextSpan>;

// Splits "Count: {count}" into spans. Text outside braces is literal; an
// unterminated '{' is kept as literal text.
[[nodiscard]] auto parseTextTemplate(std::string_view text) -> TextTemplate;

struct PropValue {
    struct Identifier {
        std::string name;
    };
    std::variant<Value, Color, ExpressionPtr, Identifier> value;
};

enum class NodeKind {
    Column,
    Row,
    Stack,
    Grid,
    Scroll,
    Center,
    Box,
    Spacer,
    Divider,
    Text,
    Link,
    Markdown,
    Button,
    Input,
    TextArea,
    Checkbox,
    Radio,
    Select,
    Slider,
    Toggle,
    Image,
    Icon,
    Video,
    Audio,
    Table,
    List,
    Card,
    Badge,
    Progress,
    Avatar,
    Modal,
    Toast,
    Tooltip,
    Popover,
    Show
};

[[nodiscard]] auto nodeKindFromName(std::string_view name) -> std::optional<NodeKind>;
[[nodiscard]] auto nodeKindName(NodeKind kind) -> std::string_view;

// Properties whose bare-identifier value names an action rather than a variable.
[[nodiscard]] auto isHandlerProperty(std::string_view name) -> bool;

inline constexpr std::string_view kVisibleProperty = "visible";
inline constexpr std::string_view kBindProperty    = "bind";
inline constexpr std::string_view kClickProperty   = "on_click";
inline constexpr std::string_view kContentProperty = "content";
// Name under which a bound variable's current value is published.
inline constexpr std::string_view kBoundValueProperty = "value";

struct ViewNode {
    NodeKind                         kind = NodeKind::Column;
    std::map<std::string, PropValue> props;
    std::vector<ViewNode>            children;
    std::optional<TextTemplate>      textTemplate;
};

struct Mutation {
    std::string   target;
    ExpressionPtr value;
};

struct Action {
    std::string           name;
    std::vector<Mutation> mutations;
};

struct StateDecl {
    std::string name;
    Value       initial;
};

/**
 * Document: the validated, immutable result of loading a .prism source.
 *
 * Directives are opaque metadata to the reactive core. State declarations
 * and actions keep source order; names are unique (enforced by the loader).
 */
struct Document {
    std::string             appName;
    std::int64_t            version = 0;
    std::vector<StateDecl>  state;
    std::optional<ViewNode> view;
    std::vector<Action>     actions;

    [[nodiscard]] auto findAction(std::string_view name) const -> Action const*;
    [[nodiscard]] auto hasVariable(std::string_view name) const -> bool;
};

} // namespace Prism
