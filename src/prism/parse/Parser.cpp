#include "Parser.hpp"

#include "log/TaggedLogger.hpp"

#include <charconv>
#include <optional>
#include <set>
#include <string>

namespace Prism {
namespace {

auto isIdentStart(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto isIdentChar(char c) -> bool {
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

auto isDigit(char c) -> bool {
    return c >= '0' && c <= '9';
}

class Parser {
public:
    explicit Parser(std::string_view source)
        : input_(source) {}

    auto parseProgram() -> LoadResult<Document> {
        Document document;
        bool     sawApp = false, sawVersion = false;
        bool     sawState = false, sawView = false, sawActions = false;

        skipTrivia();
        while (!atEnd()) {
            if (peek() == '@') {
                advance();
                auto directive = parseIdentifier();
                if (!directive)
                    return std::unexpected(directive.error());
                skipHorizontal();
                if (*directive == "app") {
                    if (sawApp)
                        return fail("duplicate @app directive");
                    auto name = parseStringLiteral();
                    if (!name)
                        return std::unexpected(name.error());
                    document.appName = std::move(*name);
                    sawApp           = true;
                } else if (*directive == "version") {
                    if (sawVersion)
                        return fail("duplicate @version directive");
                    auto version = parseNumber();
                    if (!version)
                        return std::unexpected(version.error());
                    if (!version->isInt())
                        return fail("@version expects an integer");
                    document.version = version->asInt();
                    sawVersion       = true;
                } else {
                    return fail("unknown directive @" + *directive);
                }
            } else if (checkKeyword("state")) {
                if (sawState)
                    return fail("duplicate state block");
                consume(5);
                auto state = parseStateBlock(document);
                if (!state)
                    return std::unexpected(state.error());
                sawState = true;
            } else if (checkKeyword("view")) {
                if (sawView)
                    return fail("duplicate view block");
                consume(4);
                auto view = parseViewBlock();
                if (!view)
                    return std::unexpected(view.error());
                document.view = std::move(*view);
                sawView       = true;
            } else if (checkKeyword("actions")) {
                if (sawActions)
                    return fail("duplicate actions block");
                consume(7);
                auto actions = parseActionsBlock(document);
                if (!actions)
                    return std::unexpected(actions.error());
                sawActions = true;
            } else {
                return fail(std::string{"unexpected character '"} + peek() + "'");
            }
            skipTrivia();
        }

        if (!sawApp)
            return std::unexpected(LoadError{LoadError::Code::MissingDirective, "@app directive is required"});
        if (!sawVersion)
            return std::unexpected(LoadError{LoadError::Code::MissingDirective, "@version directive is required"});
        return document;
    }

    auto parseStandaloneExpression() -> LoadResult<ExpressionPtr> {
        skipTrivia();
        auto expression = parseOr();
        if (!expression)
            return expression;
        skipTrivia();
        if (!atEnd())
            return fail(std::string{"unexpected character '"} + peek() + "' after expression");
        return expression;
    }

private:
    // ----- blocks -----

    auto parseStateBlock(Document& document) -> LoadResult<void> {
        if (auto open = expectAfterTrivia('{'); !open)
            return open;
        std::set<std::string> seen;
        skipTrivia();
        while (!atEnd() && peek() != '}') {
            auto const line = line_, column = column_;
            auto       name = parseIdentifier();
            if (!name)
                return std::unexpected(name.error());
            skipHorizontal();
            if (auto colon = expect(':'); !colon)
                return colon;
            skipHorizontal();
            auto value = parseLiteral();
            if (!value)
                return std::unexpected(value.error());
            if (!seen.insert(*name).second)
                return failAt(LoadError::Code::DuplicateVariable, "duplicate state variable '" + *name + "'", line, column);
            document.state.push_back(StateDecl{std::move(*name), std::move(*value)});
            skipSeparators();
        }
        return expect('}');
    }

    auto parseViewBlock() -> LoadResult<ViewNode> {
        if (auto open = expectAfterTrivia('{'); !open)
            return std::unexpected(open.error());
        skipTrivia();
        auto root = parseNode();
        if (!root)
            return root;
        skipTrivia();
        if (auto close = expect('}'); !close)
            return std::unexpected(close.error());
        return root;
    }

    auto parseNode() -> LoadResult<ViewNode> {
        auto const line = line_, column = column_;
        auto       kindName = parseIdentifier();
        if (!kindName)
            return std::unexpected(kindName.error());
        auto kind = nodeKindFromName(*kindName);
        if (!kind)
            return failAt(LoadError::Code::UnknownNodeKind, "unknown node kind '" + *kindName + "'", line, column);

        ViewNode node;
        node.kind = *kind;
        skipHorizontal();

        if (peek() == '"') {
            auto content = parseStringLiteral();
            if (!content)
                return std::unexpected(content.error());
            node.textTemplate = parseTextTemplate(*content);
            skipHorizontal();
        }

        if (peek() != '{')
            return node;
        advance();
        skipTrivia();

        while (!atEnd() && peek() != '}') {
            auto const memberLine = line_, memberColumn = column_;
            auto const mark       = pos_;
            auto       ident      = parseIdentifier();
            if (!ident)
                return std::unexpected(ident.error());
            skipHorizontal();

            if (peek() == ':') {
                advance();
                skipHorizontal();
                auto added = parseProperty(node, *ident, memberLine, memberColumn);
                if (!added)
                    return std::unexpected(added.error());
            } else {
                rewind(mark, memberLine, memberColumn);
                auto child = parseNode();
                if (!child)
                    return child;
                node.children.push_back(std::move(*child));
            }
            skipSeparators();
        }
        if (auto close = expect('}'); !close)
            return std::unexpected(close.error());
        return node;
    }

    auto parseProperty(ViewNode& node, std::string const& name, std::size_t line, std::size_t column) -> LoadResult<void> {
        if (node.props.contains(name) || (name == kContentProperty && node.textTemplate))
            return failAt(LoadError::Code::Syntax, "duplicate property '" + name + "'", line, column);

        if (peek() == '#') {
            auto const hexLine = line_, hexColumn = column_;
            advance();
            auto const start = pos_;
            while (!atEnd() && isIdentChar(peek()))
                advance();
            auto hex   = input_.substr(start, pos_ - start);
            auto color = Color::fromHex(hex);
            if (!color)
                return failAt(LoadError::Code::Syntax, "invalid hex color '#" + std::string{hex} + "'", hexLine, hexColumn);
            node.props.emplace(name, PropValue{*color});
            return {};
        }

        if (peek() == '"') {
            auto text = parseStringLiteral();
            if (!text)
                return std::unexpected(text.error());
            if (name == kContentProperty)
                node.textTemplate = parseTextTemplate(*text);
            else
                node.props.emplace(name, PropValue{Value::string(std::move(*text))});
            return {};
        }

        auto expression = parseOr();
        if (!expression)
            return std::unexpected(expression.error());
        if (auto const* literal = std::get_if<Expression::Literal>(&(*expression)->node)) {
            node.props.emplace(name, PropValue{literal->value});
        } else if (auto const* variable = std::get_if<Expression::Variable>(&(*expression)->node)) {
            if (name == kContentProperty)
                node.textTemplate = TextTemplate{TextSpan{TextSpan::Kind::VarRef, variable->name}};
            else
                node.props.emplace(name, PropValue{PropValue::Identifier{variable->name}});
        } else {
            node.props.emplace(name, PropValue{std::move(*expression)});
        }
        return {};
    }

    auto parseActionsBlock(Document& document) -> LoadResult<void> {
        if (auto open = expectAfterTrivia('{'); !open)
            return open;
        std::set<std::string> seen;
        skipTrivia();
        while (!atEnd() && peek() != '}') {
            auto const line = line_, column = column_;
            auto       name = parseIdentifier();
            if (!name)
                return std::unexpected(name.error());
            if (!seen.insert(*name).second)
                return failAt(LoadError::Code::DuplicateAction, "duplicate action '" + *name + "'", line, column);
            if (auto open = expectAfterTrivia('{'); !open)
                return open;

            Action action{.name = std::move(*name), .mutations = {}};
            skipTrivia();
            while (!atEnd() && peek() != '}') {
                auto target = parseIdentifier();
                if (!target)
                    return std::unexpected(target.error());
                skipHorizontal();
                if (auto colon = expect(':'); !colon)
                    return colon;
                skipHorizontal();
                auto value = parseOr();
                if (!value)
                    return std::unexpected(value.error());
                action.mutations.push_back(Mutation{std::move(*target), std::move(*value)});
                skipSeparators();
            }
            if (auto close = expect('}'); !close)
                return close;
            document.actions.push_back(std::move(action));
            skipTrivia();
        }
        return expect('}');
    }

    // ----- expressions, lowest precedence first -----

    template <typename Next>
    auto parseLeftAssociative(Next next, std::optional<BinaryOp> (Parser::*matchOp)()) -> LoadResult<ExpressionPtr> {
        auto lhs = (this->*next)();
        if (!lhs)
            return lhs;
        while (true) {
            skipExpressionSpace();
            auto op = (this->*matchOp)();
            if (!op)
                return lhs;
            skipExpressionSpace();
            auto rhs = (this->*next)();
            if (!rhs)
                return rhs;
            lhs = Expression::binary(*op, std::move(*lhs), std::move(*rhs));
        }
    }

    auto parseOr() -> LoadResult<ExpressionPtr> {
        return parseLeftAssociative(&Parser::parseAnd, &Parser::matchOr);
    }

    auto parseAnd() -> LoadResult<ExpressionPtr> {
        return parseLeftAssociative(&Parser::parseEquality, &Parser::matchAnd);
    }

    auto parseEquality() -> LoadResult<ExpressionPtr> {
        return parseLeftAssociative(&Parser::parseRelational, &Parser::matchEquality);
    }

    auto parseRelational() -> LoadResult<ExpressionPtr> {
        return parseLeftAssociative(&Parser::parseAdditive, &Parser::matchRelational);
    }

    auto parseAdditive() -> LoadResult<ExpressionPtr> {
        return parseLeftAssociative(&Parser::parseMultiplicative, &Parser::matchAdditive);
    }

    auto parseMultiplicative() -> LoadResult<ExpressionPtr> {
        return parseLeftAssociative(&Parser::parsePrimary, &Parser::matchMultiplicative);
    }

    auto matchOr() -> std::optional<BinaryOp> {
        if (checkKeyword("or")) {
            consume(2);
            return BinaryOp::Or;
        }
        return std::nullopt;
    }

    auto matchAnd() -> std::optional<BinaryOp> {
        if (checkKeyword("and")) {
            consume(3);
            return BinaryOp::And;
        }
        return std::nullopt;
    }

    auto matchEquality() -> std::optional<BinaryOp> {
        if (tryConsume("=="))
            return BinaryOp::Eq;
        if (tryConsume("!="))
            return BinaryOp::Ne;
        return std::nullopt;
    }

    auto matchRelational() -> std::optional<BinaryOp> {
        if (tryConsume("<="))
            return BinaryOp::Le;
        if (tryConsume(">="))
            return BinaryOp::Ge;
        if (tryConsume("<"))
            return BinaryOp::Lt;
        if (tryConsume(">"))
            return BinaryOp::Gt;
        return std::nullopt;
    }

    auto matchAdditive() -> std::optional<BinaryOp> {
        // "--" starts a comment, never a subtraction.
        if (input_.substr(pos_).starts_with("--"))
            return std::nullopt;
        if (tryConsume("+"))
            return BinaryOp::Add;
        if (tryConsume("-"))
            return BinaryOp::Sub;
        return std::nullopt;
    }

    auto matchMultiplicative() -> std::optional<BinaryOp> {
        if (tryConsume("*"))
            return BinaryOp::Mul;
        if (tryConsume("/"))
            return BinaryOp::Div;
        return std::nullopt;
    }

    auto parsePrimary() -> LoadResult<ExpressionPtr> {
        skipExpressionSpace();
        if (atEnd())
            return fail("expected an expression, found end of input");

        char const c = peek();
        if (c == '"') {
            auto text = parseStringLiteral();
            if (!text)
                return std::unexpected(text.error());
            return Expression::literal(Value::string(std::move(*text)));
        }
        if (isDigit(c) || (c == '-' && isDigit(peekAt(1)))) {
            auto number = parseNumber();
            if (!number)
                return std::unexpected(number.error());
            return Expression::literal(std::move(*number));
        }
        if (c == '(') {
            advance();
            ++parenDepth_;
            auto inner = parseOr();
            if (!inner)
                return inner;
            skipExpressionSpace();
            --parenDepth_;
            if (auto close = expect(')'); !close)
                return std::unexpected(close.error());
            return inner;
        }
        if (checkKeyword("true")) {
            consume(4);
            return Expression::literal(Value::boolean(true));
        }
        if (checkKeyword("false")) {
            consume(5);
            return Expression::literal(Value::boolean(false));
        }
        if (checkKeyword("null")) {
            consume(4);
            return Expression::literal(Value::null());
        }
        auto name = parseIdentifier();
        if (!name)
            return std::unexpected(name.error());
        return Expression::variable(std::move(*name));
    }

    // ----- literals -----

    auto parseLiteral() -> LoadResult<Value> {
        if (atEnd())
            return fail("expected a value, found end of input");
        char const c = peek();
        if (c == '"') {
            auto text = parseStringLiteral();
            if (!text)
                return std::unexpected(text.error());
            return Value::string(std::move(*text));
        }
        if (checkKeyword("true")) {
            consume(4);
            return Value::boolean(true);
        }
        if (checkKeyword("false")) {
            consume(5);
            return Value::boolean(false);
        }
        if (checkKeyword("null")) {
            consume(4);
            return Value::null();
        }
        if (isDigit(c) || c == '-')
            return parseNumber();
        if (c == '[' || c == '{')
            return fail("list and object values are not supported");
        return fail("expected a value");
    }

    auto parseNumber() -> LoadResult<Value> {
        auto const line = line_, column = column_;
        auto const start = pos_;
        if (peek() == '-')
            advance();
        if (!isDigit(peek()))
            return fail("expected a digit");
        while (isDigit(peek()))
            advance();

        bool isFloat = false;
        if (peek() == '.' && isDigit(peekAt(1))) {
            isFloat = true;
            advance();
            while (isDigit(peek()))
                advance();
        }

        auto const text  = input_.substr(start, pos_ - start);
        auto const* first = text.data();
        auto const* last  = text.data() + text.size();
        if (isFloat) {
            double value = 0.0;
            auto [end, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || end != last)
                return failAt(LoadError::Code::Syntax, "invalid float literal '" + std::string{text} + "'", line, column);
            return Value::number(value);
        }
        std::int64_t value = 0;
        auto [end, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || end != last)
            return failAt(LoadError::Code::Syntax, "integer literal '" + std::string{text} + "' out of range", line, column);
        return Value::integer(value);
    }

    auto parseStringLiteral() -> LoadResult<std::string> {
        auto const line = line_, column = column_;
        if (auto open = expect('"'); !open)
            return std::unexpected(open.error());
        std::string out;
        while (!atEnd() && peek() != '"') {
            char c = advance();
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (atEnd())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                out.push_back('\n');
                break;
            case 't':
                out.push_back('\t');
                break;
            default:
                out.push_back(escaped);
                break;
            }
        }
        if (atEnd())
            return failAt(LoadError::Code::Syntax, "unterminated string literal", line, column);
        advance();
        return out;
    }

    auto parseIdentifier() -> LoadResult<std::string> {
        if (atEnd())
            return fail("expected identifier, found end of input");
        if (!isIdentStart(peek()))
            return fail(std::string{"expected identifier, found '"} + peek() + "'");
        auto const start = pos_;
        while (!atEnd() && isIdentChar(peek()))
            advance();
        return std::string{input_.substr(start, pos_ - start)};
    }

    // ----- cursor -----

    auto atEnd() const -> bool { return pos_ >= input_.size(); }
    auto peek() const -> char { return atEnd() ? '\0' : input_[pos_]; }
    auto peekAt(std::size_t offset) const -> char {
        return pos_ + offset < input_.size() ? input_[pos_ + offset] : '\0';
    }

    auto advance() -> char {
        char const c = input_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    auto consume(std::size_t count) -> void {
        for (std::size_t i = 0; i < count && !atEnd(); ++i)
            advance();
    }

    auto rewind(std::size_t pos, std::size_t line, std::size_t column) -> void {
        pos_    = pos;
        line_   = line;
        column_ = column;
    }

    auto checkKeyword(std::string_view keyword) const -> bool {
        auto rest = input_.substr(pos_);
        if (!rest.starts_with(keyword))
            return false;
        return rest.size() == keyword.size() || !isIdentChar(rest[keyword.size()]);
    }

    auto tryConsume(std::string_view token) -> bool {
        if (!input_.substr(pos_).starts_with(token))
            return false;
        consume(token.size());
        return true;
    }

    auto skipHorizontal() -> void {
        while (!atEnd() && (peek() == ' ' || peek() == '\t'))
            advance();
    }

    auto skipLine() -> void {
        while (!atEnd() && advance() != '\n') {
        }
    }

    // Whitespace, newlines and "--" comments.
    auto skipTrivia() -> void {
        while (!atEnd()) {
            char const c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                advance();
            } else if (c == '-' && peekAt(1) == '-') {
                skipLine();
            } else {
                break;
            }
        }
    }

    auto skipSeparators() -> void {
        skipTrivia();
        while (peek() == ',') {
            advance();
            skipTrivia();
        }
    }

    auto skipExpressionSpace() -> void {
        if (parenDepth_ > 0)
            skipTrivia();
        else
            skipHorizontal();
    }

    auto expect(char expected) -> LoadResult<void> {
        if (atEnd())
            return fail(std::string{"expected '"} + expected + "', found end of input");
        if (peek() != expected)
            return fail(std::string{"expected '"} + expected + "', found '" + peek() + "'");
        advance();
        return {};
    }

    auto expectAfterTrivia(char expected) -> LoadResult<void> {
        skipTrivia();
        return expect(expected);
    }

    auto failAt(LoadError::Code code, std::string message, std::size_t line, std::size_t column) const -> std::unexpected<LoadError> {
        LoadError error{code, std::move(message)};
        error.line   = line;
        error.column = column;
        return std::unexpected(std::move(error));
    }

    auto fail(std::string message) const -> std::unexpected<LoadError> {
        return failAt(LoadError::Code::Syntax, std::move(message), line_, column_);
    }

    std::string_view input_;
    std::size_t      pos_        = 0;
    std::size_t      line_       = 1;
    std::size_t      column_     = 1;
    int              parenDepth_ = 0;
};

} // namespace

auto parseDocument(std::string_view source) -> LoadResult<Document> {
    Parser parser{source};
    auto   document = parser.parseProgram();
    if (!document) {
        prism_log("Parse failed: " + describeError(document.error()), "Loader", "ERROR");
    }
    return document;
}

auto parseExpression(std::string_view source) -> LoadResult<ExpressionPtr> {
    Parser parser{source};
    return parser.parseStandaloneExpression();
}

} // namespace Prism
