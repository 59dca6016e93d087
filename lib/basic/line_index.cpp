// miniyaml/basic/line_index.cpp - Line table construction and position conversion
#include "miniyaml/basic/line_index.hpp"

#include <algorithm>

#include "miniyaml/basic/utf8.hpp"

namespace miniyaml
{

namespace
{

uint32_t units_of(char32_t cp, PositionEncoding encoding) noexcept
{
  if (encoding == PositionEncoding::Utf16 && cp > 0xFFFF) {
    return 2;
  }
  return 1;
}

size_t count_units(std::string_view text, PositionEncoding encoding) noexcept
{
  if (encoding == PositionEncoding::Utf32) {
    return utf8::count_scalars(text);
  }
  size_t units = 0;
  for (size_t i = 0; i < text.size();) {
    const utf8::Decoded d = utf8::decode(text, i);
    units += units_of(d.code_point, encoding);
    i += d.width;
  }
  return units;
}

}  // namespace

std::vector<ByteIndex> compute_line_start_offsets(std::string_view text)
{
  std::vector<ByteIndex> offsets;

  size_t line_start = 0;
  while (true) {
    const size_t nl = text.find('\n', line_start);
    if (nl == std::string_view::npos) {
      // Final line without a terminator.
      if (line_start < text.size()) {
        offsets.emplace_back(static_cast<uint32_t>(line_start));
      }
      break;
    }
    offsets.emplace_back(static_cast<uint32_t>(line_start));
    line_start = nl + 1;
  }

  offsets.emplace_back(static_cast<uint32_t>(text.size()));
  return offsets;
}

size_t line_count(std::string_view text, const std::vector<ByteIndex> & offsets) noexcept
{
  if (offsets.empty()) {
    return 0;
  }
  if (text.empty() || text.back() == '\n') {
    return offsets.size();
  }
  return offsets.size() - 1;
}

std::string_view line_text(
  std::string_view text, const std::vector<ByteIndex> & offsets, size_t line_idx) noexcept
{
  if (line_idx >= line_count(text, offsets)) {
    return {};
  }

  const size_t start = offsets[line_idx].to_size();
  size_t end = (line_idx + 1 < offsets.size()) ? offsets[line_idx + 1].to_size() : text.size();
  end = std::min(end, text.size());

  if (end > start && text[end - 1] == '\n') {
    --end;
    if (end > start && text[end - 1] == '\r') {
      --end;
    }
  }
  return text.substr(start, end - start);
}

std::optional<Position> byte_index_to_position(
  std::string_view text, const std::vector<ByteIndex> & offsets, ByteIndex index,
  PositionEncoding encoding) noexcept
{
  const size_t idx = index.to_size();
  if (idx > text.size() || offsets.empty() || !utf8::is_char_boundary(text, idx)) {
    return std::nullopt;
  }

  const size_t lines = line_count(text, offsets);
  if (lines == 0) {
    return std::nullopt;
  }

  const auto it = std::lower_bound(offsets.begin(), offsets.end(), index);
  const auto exact_line = static_cast<size_t>(it - offsets.begin());
  if (it != offsets.end() && *it == index && exact_line < lines) {
    return Position{static_cast<uint32_t>(exact_line), 0};
  }

  // The containing line is the last line start before `index`.
  const auto upper = std::upper_bound(offsets.begin(), offsets.end(), index);
  size_t line = static_cast<size_t>(upper - offsets.begin());
  line = (line == 0) ? 0 : line - 1;
  line = std::min(line, lines - 1);

  // Bytes of the terminator clamp to the end of the content.
  const std::string_view content = line_text(text, offsets, line);
  const size_t within = std::min(idx - offsets[line].to_size(), content.size());
  const size_t column = count_units(content.substr(0, within), encoding);
  return Position{static_cast<uint32_t>(line), static_cast<uint32_t>(column)};
}

std::optional<ByteIndex> position_to_byte_index(
  std::string_view text, const std::vector<ByteIndex> & offsets, Position position,
  PositionEncoding encoding) noexcept
{
  if (position.line_idx >= line_count(text, offsets)) {
    return std::nullopt;
  }

  const size_t line_start = offsets[position.line_idx].to_size();
  const std::string_view content = line_text(text, offsets, position.line_idx);

  size_t byte = 0;
  uint32_t units = 0;
  while (units < position.character_idx) {
    if (byte >= content.size()) {
      return std::nullopt;
    }
    const utf8::Decoded d = utf8::decode(content, byte);
    units += units_of(d.code_point, encoding);
    byte += d.width;
  }
  if (units != position.character_idx) {
    return std::nullopt;
  }

  return ByteIndex(static_cast<uint32_t>(line_start + byte));
}

std::optional<Position> convert_position(
  std::string_view text, const std::vector<ByteIndex> & offsets, Position position,
  PositionEncoding from, PositionEncoding to) noexcept
{
  if (from == to) {
    return position;
  }
  const auto byte = position_to_byte_index(text, offsets, position, from);
  if (!byte) {
    return std::nullopt;
  }
  return byte_index_to_position(text, offsets, *byte, to);
}

}  // namespace miniyaml
