#include "miniyaml/syntax/tokenizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <string>

#include "miniyaml/basic/utf8.hpp"

namespace miniyaml::syntax
{
namespace
{

// Characters that may form a multi-character symbol run. `~ ! @ ^ :` are
// handled before runs are considered so they never merge.
bool is_run_symbol(char32_t ch) { return ch == '|' || ch == '&' || ch == '#'; }

bool is_ascii_digit(char32_t ch) { return ch >= '0' && ch <= '9'; }

bool is_digit_or_numeric_symbol(char32_t ch) { return is_ascii_digit(ch) || ch == '-' || ch == '.'; }

bool is_dec_digit_start(char32_t ch) { return ch == '-' || is_ascii_digit(ch); }

bool is_identifier_start(char32_t ch)
{
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

bool is_identifier_continue(char32_t ch)
{
  return is_identifier_start(ch) || is_digit_or_numeric_symbol(ch);
}

bool equals_ignore_ascii_case(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = a[i];
    char cb = b[i];
    if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
    if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
    if (ca != cb) {
      return false;
    }
  }
  return true;
}

bool parses_as_int64(std::string_view text)
{
  int64_t value = 0;
  const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
  return res.ec == std::errc{} && res.ptr == text.data() + text.size();
}

/// Locale-independent; values beyond the double range still count as floats.
bool parses_as_double(std::string_view text)
{
  double value = 0.0;
  const auto res = std::from_chars(
    text.data(), text.data() + text.size(), value, std::chars_format::fixed);
  const bool parsed = res.ec == std::errc{} || res.ec == std::errc::result_out_of_range;
  return parsed && res.ptr == text.data() + text.size();
}

}  // namespace

// ============================================================================
// Character access
// ============================================================================

char32_t Tokenizer::peek() const noexcept
{
  if (eof()) {
    return 0;
  }
  return utf8::decode(src_, pos_).code_point;
}

char32_t Tokenizer::peek_next() const noexcept
{
  if (eof()) {
    return 0;
  }
  const size_t next = pos_ + utf8::decode(src_, pos_).width;
  if (next >= src_.size()) {
    return 0;
  }
  return utf8::decode(src_, next).code_point;
}

void Tokenizer::advance() noexcept
{
  if (!eof()) {
    pos_ += utf8::decode(src_, pos_).width;
  }
}

// ============================================================================
// Driver
// ============================================================================

std::vector<Token> Tokenizer::run()
{
  std::vector<Token> tokens;
  while (!eof()) {
    tokens.push_back(next_token());
  }
  return tokens;
}

Token Tokenizer::next_token()
{
  const size_t start = pos_;
  const char32_t ch = peek();

  switch (ch) {
    case '~':
      advance();
      return make_token(TokenKind::Tilde, start);
    case '!':
      advance();
      return make_token(TokenKind::Bang, start);
    case '@':
      advance();
      return make_token(TokenKind::At, start);
    case '^':
      advance();
      return make_token(TokenKind::Caret, start);
    case ':':
      advance();
      return make_token(TokenKind::Colon, start);
    case '-': {
      // Bullet dash (`- text`) or property removal (`-Name`).
      const char32_t next = peek_next();
      if (utf8::is_whitespace(next) || is_identifier_start(next)) {
        advance();
        return make_token(TokenKind::Symbol, start);
      }
      break;
    }
    case '\n':
    case '\r':
      return lex_newline();
    default:
      break;
  }

  if (is_run_symbol(ch)) {
    return lex_symbol_run();
  }
  if (utf8::is_whitespace(ch)) {
    return lex_whitespace();
  }
  if (is_dec_digit_start(ch) || is_identifier_start(ch)) {
    return lex_identifier_or_number();
  }

  // Non-ASCII text and unhandled punctuation.
  advance();
  return make_token(TokenKind::Symbol, start);
}

// ============================================================================
// Token classes
// ============================================================================

Token Tokenizer::lex_newline()
{
  const size_t start = pos_;
  const char32_t ch = peek();
  advance();

  if (ch == '\n') {
    return make_token(TokenKind::EndOfLine, start);
  }

  if (peek() == '\n') {
    advance();
    return make_token(TokenKind::EndOfLine, start);
  }

  Token t = make_token(TokenKind::Error, start);
  diags_.report_warning(t.span, "invalid newline sequence", "bare carriage return")
    .with_code("W0004")
    .with_help("use `\\n` or `\\r\\n` to end a line");
  return t;
}

Token Tokenizer::lex_whitespace()
{
  const size_t start = pos_;
  advance();
  while (!eof()) {
    const char32_t ch = peek();
    if (ch == '\r' || ch == '\n' || !utf8::is_whitespace(ch)) {
      break;
    }
    advance();
  }
  return make_token(TokenKind::Whitespace, start);
}

Token Tokenizer::lex_symbol_run()
{
  const size_t start = pos_;
  while (!eof() && is_run_symbol(peek())) {
    advance();
  }

  const std::string_view slice = src_.substr(start, pos_ - start);

  if (slice.empty()) {
    // Entered on a character that does not start a run.
    advance();
    Token t = make_token(TokenKind::Error, start);
    diags_.report_bug(t.span, "symbol consumption started on a non-symbol character")
      .with_code("L:B0001");
    return t;
  }

  if (slice == "&&") {
    return make_token(TokenKind::LogicalAnd, start);
  }
  if (slice == "||") {
    return make_token(TokenKind::LogicalOr, start);
  }
  if (slice.front() == '#') {
    while (!eof() && peek() != '\n' && peek() != '\r') {
      advance();
    }
    return make_token(TokenKind::Comment, start);
  }
  return make_token(TokenKind::Symbol, start);
}

Token Tokenizer::lex_identifier_or_number()
{
  const size_t start = pos_;
  advance();
  while (!eof() && is_identifier_continue(peek())) {
    advance();
  }

  const std::string_view slice = src_.substr(start, pos_ - start);

  if (equals_ignore_ascii_case(slice, "true")) return make_token(TokenKind::True, start);
  if (equals_ignore_ascii_case(slice, "false")) return make_token(TokenKind::False, start);
  if (equals_ignore_ascii_case(slice, "yes")) return make_token(TokenKind::Yes, start);
  if (equals_ignore_ascii_case(slice, "no")) return make_token(TokenKind::No, start);

  // All dashes is plain text (e.g. a separator in a value).
  if (std::all_of(slice.begin(), slice.end(), [](char c) { return c == '-'; })) {
    return make_token(TokenKind::Identifier, start);
  }

  const bool numeric_chars = std::all_of(slice.begin(), slice.end(), [](char c) {
    return is_digit_or_numeric_symbol(static_cast<unsigned char>(c));
  });
  if (numeric_chars && is_ascii_digit(static_cast<unsigned char>(slice.back()))) {
    if (slice.find('.') != std::string_view::npos) {
      if (parses_as_double(slice)) {
        return make_token(TokenKind::FloatLiteral, start);
      }
      spdlog::debug("failed to parse '{}' as a 64-bit float, treating it as an identifier", slice);
    } else {
      if (parses_as_int64(slice)) {
        return make_token(TokenKind::IntLiteral, start);
      }
      spdlog::debug("failed to parse '{}' as a 64-bit integer, treating it as an identifier", slice);
    }
  }

  return make_token(TokenKind::Identifier, start);
}

TokenizeResult tokenize(FileId file_id, std::string_view src)
{
  Tokenizer tokenizer(file_id, src);
  TokenizeResult result;
  result.tokens = tokenizer.run();
  result.diagnostics = tokenizer.take_diagnostics();
  return result;
}

}  // namespace miniyaml::syntax
