// miniyaml/basic/span.cpp - Span helpers
#include "miniyaml/basic/span.hpp"

#include "miniyaml/basic/utf8.hpp"

namespace miniyaml
{

std::optional<std::string_view> ByteSpan::slice(std::string_view text) const noexcept
{
  const size_t s = start_.to_size();
  const size_t e = end_.to_size();
  if (e > text.size()) {
    return std::nullopt;
  }
  if (!utf8::is_char_boundary(text, s) || !utf8::is_char_boundary(text, e)) {
    return std::nullopt;
  }
  return text.substr(s, e - s);
}

}  // namespace miniyaml
