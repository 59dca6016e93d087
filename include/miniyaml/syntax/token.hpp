#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "miniyaml/basic/span.hpp"

namespace miniyaml::syntax
{

enum class TokenKind : uint8_t {
  Error,
  Whitespace,
  Comment,  // # ... up to (not including) the line terminator

  // Boolean keywords (case-insensitive)
  True,
  Yes,
  False,
  No,

  Identifier,
  IntLiteral,
  FloatLiteral,

  Symbol,  // any other run of punctuation or non-ASCII text

  Tilde,
  Bang,
  At,
  Caret,
  Colon,

  LogicalOr,
  LogicalAnd,

  EndOfLine,  // \n or \r\n
};

struct Token
{
  TokenKind kind = TokenKind::Error;
  ByteSpan span;

  /// Source text of the token; empty optional when `src` does not cover the span.
  [[nodiscard]] std::optional<std::string_view> slice(std::string_view src) const noexcept
  {
    return span.slice(src);
  }

  [[nodiscard]] bool is_identifier_or_number() const noexcept
  {
    return kind == TokenKind::Identifier || kind == TokenKind::IntLiteral ||
           kind == TokenKind::FloatLiteral;
  }

  [[nodiscard]] bool operator==(const Token & other) const noexcept
  {
    return kind == other.kind && span == other.span;
  }
  [[nodiscard]] bool operator!=(const Token & other) const noexcept { return !(*this == other); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Error:
      return "<error>";
    case TokenKind::Whitespace:
      return "<whitespace>";
    case TokenKind::Comment:
      return "<comment>";
    case TokenKind::True:
      return "true";
    case TokenKind::Yes:
      return "yes";
    case TokenKind::False:
      return "false";
    case TokenKind::No:
      return "no";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::Symbol:
      return "symbol";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Bang:
      return "!";
    case TokenKind::At:
      return "@";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Colon:
      return ":";
    case TokenKind::LogicalOr:
      return "||";
    case TokenKind::LogicalAnd:
      return "&&";
    case TokenKind::EndOfLine:
      return "<eol>";
  }
  return "";
}

}  // namespace miniyaml::syntax
