#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "miniyaml/syntax/token.hpp"

namespace miniyaml::syntax
{

/**
 * One logical source line split into its components:
 *
 *   <indentation><key tokens>:<value tokens><comment>
 *
 * `key_terminator` is only ever set when `key_tokens` is non-empty or the line
 * is malformed (reported by the nodeizer). A node with no component at all is
 * an empty line.
 */
struct Node
{
  std::optional<Token> indentation;
  std::vector<Token> key_tokens;
  std::optional<Token> key_terminator;
  std::vector<Token> value_tokens;
  std::optional<Token> comment;

  [[nodiscard]] bool is_empty() const noexcept
  {
    return !indentation && key_tokens.empty() && !key_terminator && value_tokens.empty() &&
           !comment;
  }

  /// Only indentation, nothing else on the line.
  [[nodiscard]] bool is_whitespace_only() const noexcept
  {
    return indentation && key_tokens.empty() && !key_terminator && value_tokens.empty() &&
           !comment;
  }

  [[nodiscard]] bool is_comment_only() const noexcept
  {
    return comment && key_tokens.empty() && !key_terminator && value_tokens.empty();
  }

  [[nodiscard]] bool has_key() const noexcept { return !key_tokens.empty(); }
  [[nodiscard]] bool has_value() const noexcept { return !value_tokens.empty(); }

  /// First key token through the last non-whitespace key token.
  [[nodiscard]] std::optional<ByteSpan> key_span() const noexcept;
  [[nodiscard]] std::optional<ByteSpan> value_span() const noexcept;

  /// Whole line without its terminator; empty optional for an empty line.
  [[nodiscard]] std::optional<ByteSpan> span() const noexcept;

  [[nodiscard]] std::optional<std::string_view> key_text(std::string_view src) const noexcept;
  [[nodiscard]] std::optional<std::string_view> value_text(std::string_view src) const noexcept;

  /// Number of indentation characters (a tab counts as one).
  [[nodiscard]] size_t indentation_level(std::string_view src) const noexcept;

  [[nodiscard]] bool is_top_level() const noexcept { return !indentation.has_value(); }

  /// All tokens of the line in source order.
  [[nodiscard]] std::vector<Token> tokens() const;

  [[nodiscard]] bool operator==(const Node & other) const
  {
    return indentation == other.indentation && key_tokens == other.key_tokens &&
           key_terminator == other.key_terminator && value_tokens == other.value_tokens &&
           comment == other.comment;
  }
  [[nodiscard]] bool operator!=(const Node & other) const { return !(*this == other); }
};

}  // namespace miniyaml::syntax
