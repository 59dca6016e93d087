// miniyaml/basic/utf8.cpp - UTF-8 decoding helpers
#include "miniyaml/basic/utf8.hpp"

namespace miniyaml::utf8
{

Decoded decode(std::string_view text, size_t index) noexcept
{
  const auto c0 = static_cast<unsigned char>(text[index]);
  if (c0 < 0x80U) {
    return {static_cast<char32_t>(c0), 1};
  }

  uint32_t width = 0;
  char32_t cp = 0;
  char32_t min_cp = 0;
  if ((c0 & 0xE0U) == 0xC0U) {
    width = 2;
    cp = c0 & 0x1FU;
    min_cp = 0x80;
  } else if ((c0 & 0xF0U) == 0xE0U) {
    width = 3;
    cp = c0 & 0x0FU;
    min_cp = 0x800;
  } else if ((c0 & 0xF8U) == 0xF0U) {
    width = 4;
    cp = c0 & 0x07U;
    min_cp = 0x10000;
  } else {
    return {};
  }

  if (index + width > text.size()) {
    return {};
  }

  for (uint32_t i = 1; i < width; ++i) {
    const auto c = static_cast<unsigned char>(text[index + i]);
    if (!is_continuation_byte(c)) {
      return {};
    }
    cp = (cp << 6U) | (c & 0x3FU);
  }

  // Overlong encodings, surrogates and out-of-range values are malformed.
  if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return {};
  }

  return {cp, width};
}

bool is_char_boundary(std::string_view text, size_t index) noexcept
{
  if (index == 0 || index == text.size()) {
    return true;
  }
  if (index > text.size()) {
    return false;
  }
  return !is_continuation_byte(static_cast<unsigned char>(text[index]));
}

size_t count_scalars(std::string_view text) noexcept
{
  size_t count = 0;
  size_t i = 0;
  while (i < text.size()) {
    i += decode(text, i).width;
    ++count;
  }
  return count;
}

bool is_whitespace(char32_t cp) noexcept
{
  switch (cp) {
    case 0x09:
    case 0x0A:
    case 0x0B:
    case 0x0C:
    case 0x0D:
    case 0x20:
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

std::string_view trim(std::string_view text) noexcept
{
  size_t start = 0;
  while (start < text.size()) {
    const Decoded d = decode(text, start);
    if (!is_whitespace(d.code_point)) {
      break;
    }
    start += d.width;
  }

  size_t end = text.size();
  while (end > start) {
    // Step back to the start of the previous scalar.
    size_t prev = end - 1;
    while (prev > start && is_continuation_byte(static_cast<unsigned char>(text[prev]))) {
      --prev;
    }
    if (!is_whitespace(decode(text, prev).code_point)) {
      break;
    }
    end = prev;
  }

  return text.substr(start, end - start);
}

}  // namespace miniyaml::utf8
