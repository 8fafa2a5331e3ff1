#pragma once
#include "ast/Document.hpp"
#include "core/Error.hpp"

#include <string_view>

namespace Prism {

/*
 * Hand-written recursive descent parser for .prism sources.
 *
 *   program   = { directive | "--" comment } [state] [view] [actions]
 *   directive = "@app" string | "@version" integer
 *   state     = "state" "{" { ident ":" literal } "}"
 *   view      = "view" "{" node "}"
 *   node      = kind [string] [ "{" { ident ":" prop | node } "}" ]
 *   prop      = "#" hex | string | expression
 *   actions   = "actions" "{" { ident "{" { ident ":" expression } "}" } "}"
 *
 * Expressions end at a newline unless inside parentheses. Syntax errors carry
 * the 1-based line and column of the offending character.
 *
 * parseDocument only checks syntax, directive presence and duplicate names;
 * identifier resolution is done by validateDocument.
 */
[[nodiscard]] auto parseDocument(std::string_view source) -> LoadResult<Document>;

// Parses a single expression; used by tests and tools.
[[nodiscard]] auto parseExpression(std::string_view source) -> LoadResult<ExpressionPtr>;

// Every variable read, bind target, action target and handler must resolve.
[[nodiscard]] auto validateDocument(Document const& document) -> LoadResult<void>;

} // namespace Prism
