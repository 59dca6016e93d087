#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "miniyaml/basic/diagnostic.hpp"
#include "miniyaml/syntax/token.hpp"

namespace miniyaml::syntax
{

/**
 * Single forward pass over the scalar values of a MiniYaml document.
 *
 * The produced tokens are contiguous and cover the whole input. Problems are
 * reported as diagnostics; lexing never stops early.
 */
class Tokenizer
{
public:
  Tokenizer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  [[nodiscard]] std::vector<Token> run();

  /// Diagnostics raised since the last call; the internal batch is cleared.
  [[nodiscard]] std::vector<Diagnostic> take_diagnostics() { return diags_.take(); }

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char32_t peek() const noexcept;
  [[nodiscard]] char32_t peek_next() const noexcept;
  void advance() noexcept;

  [[nodiscard]] Token lex_newline();
  [[nodiscard]] Token lex_whitespace();
  [[nodiscard]] Token lex_symbol_run();
  [[nodiscard]] Token lex_identifier_or_number();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start) const noexcept
  {
    return Token{kind, ByteSpan(file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(pos_))};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
  DiagnosticBag diags_;
};

/// Convenience wrapper: tokens plus the diagnostics of one pass.
struct TokenizeResult
{
  std::vector<Token> tokens;
  std::vector<Diagnostic> diagnostics;
};

[[nodiscard]] TokenizeResult tokenize(FileId file_id, std::string_view src);

}  // namespace miniyaml::syntax
