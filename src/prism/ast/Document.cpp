#include "Document.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string>

namespace Prism {
namespace {

struct KindEntry {
    std::string_view name;
    NodeKind         kind;
};

constexpr std::array<KindEntry, 35> kKindTable{{
    {"column", NodeKind::Column},     {"row", NodeKind::Row},
    {"stack", NodeKind::Stack},       {"grid", NodeKind::Grid},
    {"scroll", NodeKind::Scroll},     {"center", NodeKind::Center},
    {"box", NodeKind::Box},           {"spacer", NodeKind::Spacer},
    {"divider", NodeKind::Divider},   {"text", NodeKind::Text},
    {"link", NodeKind::Link},         {"markdown", NodeKind::Markdown},
    {"button", NodeKind::Button},     {"input", NodeKind::Input},
    {"textarea", NodeKind::TextArea}, {"checkbox", NodeKind::Checkbox},
    {"radio", NodeKind::Radio},       {"select", NodeKind::Select},
    {"slider", NodeKind::Slider},     {"toggle", NodeKind::Toggle},
    {"image", NodeKind::Image},       {"icon", NodeKind::Icon},
    {"video", NodeKind::Video},       {"audio", NodeKind::Audio},
    {"table", NodeKind::Table},       {"list", NodeKind::List},
    {"card", NodeKind::Card},         {"badge", NodeKind::Badge},
    {"progress", NodeKind::Progress}, {"avatar", NodeKind::Avatar},
    {"modal", NodeKind::Modal},       {"toast", NodeKind::Toast},
    {"tooltip", NodeKind::Tooltip},   {"popover", NodeKind::Popover},
    {"show", NodeKind::Show},
}};

auto hexNibble(char c) -> std::optional<std::uint8_t> {
    if (c >= '0' && c <= '9')
        return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f')
        return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F')
        return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

auto trim(std::string_view text) -> std::string_view {
    auto const first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

auto Color::fromHex(std::string_view hex) -> std::optional<Color> {
    if (!hex.empty() && hex.front() == '#')
        hex.remove_prefix(1);

    std::array<std::uint8_t, 8> nibbles{};
    if (hex.size() > nibbles.size())
        return std::nullopt;
    for (std::size_t i = 0; i < hex.size(); ++i) {
        auto nibble = hexNibble(hex[i]);
        if (!nibble)
            return std::nullopt;
        nibbles[i] = *nibble;
    }

    auto wide = [&](std::size_t i) { return static_cast<std::uint8_t>(nibbles[i] * 16 + nibbles[i + 1]); };
    auto shorthand = [&](std::size_t i) { return static_cast<std::uint8_t>(nibbles[i] * 17); };

    switch (hex.size()) {
    case 8:
        return Color{wide(0), wide(2), wide(4), wide(6)};
    case 6:
        return Color{wide(0), wide(2), wide(4), 255};
    case 4:
        return Color{shorthand(0), shorthand(1), shorthand(2), shorthand(3)};
    case 3:
        return Color{shorthand(0), shorthand(1), shorthand(2), 255};
    default:
        return std::nullopt;
    }
}

auto Color::toHex() const -> std::string {
    constexpr char digits[] = "0123456789abcdef";
    std::string out{"#"};
    for (auto channel : {r, g, b, a}) {
        out.push_back(digits[channel >> 4]);
        out.push_back(digits[channel & 0x0f]);
    }
    return out;
}

auto parseTextTemplate(std::string_view text) -> TextTemplate {
    TextTemplate spans;
    std::string  literal;

    auto flushLiteral = [&] {
        if (!literal.empty()) {
            spans.push_back(TextSpan{TextSpan::Kind::Literal, std::move(literal)});
            literal.clear();
        }
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto const open = text.find('{', pos);
        if (open == std::string_view::npos) {
            literal.append(text.substr(pos));
            break;
        }
        auto const close = text.find('}', open + 1);
        if (close == std::string_view::npos) {
            literal.append(text.substr(pos));
            break;
        }
        literal.append(text.substr(pos, open - pos));
        auto const name = trim(text.substr(open + 1, close - open - 1));
        if (!name.empty()) {
            flushLiteral();
            spans.push_back(TextSpan{TextSpan::Kind::VarRef, std::string{name}});
        }
        pos = close + 1;
    }
    flushLiteral();
    return spans;
}

auto nodeKindFromName(std::string_view name) -> std::optional<NodeKind> {
    auto it = std::ranges::find(kKindTable, name, &KindEntry::name);
    if (it == kKindTable.end())
        return std::nullopt;
    return it->kind;
}

auto nodeKindName(NodeKind kind) -> std::string_view {
    auto it = std::ranges::find(kKindTable, kind, &KindEntry::kind);
    if (it == kKindTable.end())
        return "unknown";
    return it->name;
}

auto isHandlerProperty(std::string_view name) -> bool {
    return name.starts_with("on_");
}

auto Document::findAction(std::string_view name) const -> Action const* {
    auto it = std::ranges::find(actions, name, &Action::name);
    return it == actions.end() ? nullptr : &*it;
}

auto Document::hasVariable(std::string_view name) const -> bool {
    return std::ranges::find(state, name, &StateDecl::name) != state.end();
}

} // namespace Prism
