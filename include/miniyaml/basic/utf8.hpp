// miniyaml/basic/utf8.hpp - Minimal UTF-8 helpers used by the lexer and line index
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace miniyaml::utf8
{

/// Replacement scalar produced for malformed input.
inline constexpr char32_t k_replacement = 0xFFFD;

struct Decoded
{
  char32_t code_point = k_replacement;
  uint32_t width = 1;  // bytes consumed, always >= 1 inside the text
};

/**
 * Decode the scalar value starting at `index`.
 *
 * Malformed or truncated sequences decode as U+FFFD with width 1 so callers
 * always make forward progress. `index` must be < text.size().
 */
[[nodiscard]] Decoded decode(std::string_view text, size_t index) noexcept;

[[nodiscard]] constexpr bool is_continuation_byte(unsigned char c) noexcept
{
  return (c & 0xC0U) == 0x80U;
}

/// True when `index` is the start of a scalar value (or the end of text).
[[nodiscard]] bool is_char_boundary(std::string_view text, size_t index) noexcept;

/// Number of scalar values in `text`.
[[nodiscard]] size_t count_scalars(std::string_view text) noexcept;

/// Unicode White_Space property.
[[nodiscard]] bool is_whitespace(char32_t cp) noexcept;

/// Trim Unicode whitespace from both ends.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace miniyaml::utf8
