#include "miniyaml/syntax/node.hpp"

#include "miniyaml/basic/utf8.hpp"

namespace miniyaml::syntax
{
namespace
{

std::optional<ByteSpan> merge_spans(std::optional<ByteSpan> acc, ByteSpan span) noexcept
{
  if (!acc) {
    return span;
  }
  return acc->merge(span);
}

}  // namespace

std::optional<ByteSpan> Node::key_span() const noexcept
{
  size_t last = key_tokens.size();
  while (last > 0 && key_tokens[last - 1].kind == TokenKind::Whitespace) {
    --last;
  }
  if (last == 0) {
    return std::nullopt;
  }
  return key_tokens.front().span.merge(key_tokens[last - 1].span);
}

std::optional<ByteSpan> Node::value_span() const noexcept
{
  if (value_tokens.empty()) {
    return std::nullopt;
  }
  return value_tokens.front().span.merge(value_tokens.back().span);
}

std::optional<ByteSpan> Node::span() const noexcept
{
  std::optional<ByteSpan> result;
  if (indentation) {
    result = merge_spans(result, indentation->span);
  }
  for (const auto & t : key_tokens) {
    result = merge_spans(result, t.span);
  }
  if (key_terminator) {
    result = merge_spans(result, key_terminator->span);
  }
  for (const auto & t : value_tokens) {
    result = merge_spans(result, t.span);
  }
  if (comment) {
    result = merge_spans(result, comment->span);
  }
  return result;
}

std::optional<std::string_view> Node::key_text(std::string_view src) const noexcept
{
  const auto s = key_span();
  if (!s) {
    return std::nullopt;
  }
  return s->slice(src);
}

std::optional<std::string_view> Node::value_text(std::string_view src) const noexcept
{
  const auto s = value_span();
  if (!s) {
    return std::nullopt;
  }
  return s->slice(src);
}

size_t Node::indentation_level(std::string_view src) const noexcept
{
  if (!indentation) {
    return 0;
  }
  const auto text = indentation->slice(src);
  return text ? utf8::count_scalars(*text) : 0;
}

std::vector<Token> Node::tokens() const
{
  std::vector<Token> out;
  out.reserve(key_tokens.size() + value_tokens.size() + 3);
  if (indentation) {
    out.push_back(*indentation);
  }
  out.insert(out.end(), key_tokens.begin(), key_tokens.end());
  if (key_terminator) {
    out.push_back(*key_terminator);
  }
  out.insert(out.end(), value_tokens.begin(), value_tokens.end());
  if (comment) {
    out.push_back(*comment);
  }
  return out;
}

}  // namespace miniyaml::syntax
