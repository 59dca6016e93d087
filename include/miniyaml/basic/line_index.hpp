// miniyaml/basic/line_index.hpp - Line start table and Position <-> ByteIndex conversion
//
// The functions here are pure; the query database caches the line table per
// file and calls these for every conversion.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "miniyaml/basic/span.hpp"

namespace miniyaml
{

/// Unit used to count the character index of a Position.
enum class PositionEncoding : uint8_t {
  Utf32,  // Unicode scalar values
  Utf16,  // UTF-16 code units; scalars above U+FFFF count twice
};

/**
 * Byte offsets of every line start in `text`.
 *
 * Both `\n` and `\r\n` terminate a line. The table always ends with one
 * synthetic entry equal to `text.size()`, so it is never empty.
 */
[[nodiscard]] std::vector<ByteIndex> compute_line_start_offsets(std::string_view text);

/**
 * Number of addressable lines.
 *
 * The trailing synthetic entry is a real (empty) line only when the text is
 * empty or ends with a line terminator.
 */
[[nodiscard]] size_t line_count(std::string_view text, const std::vector<ByteIndex> & offsets) noexcept;

/**
 * Convert a byte index to a zero-based line / character position.
 *
 * The character index counts `encoding` units from the line start. An index
 * inside a line terminator maps to the end of that line's content.
 * Fails for indices past the end of `text` or inside a multi-byte scalar.
 */
[[nodiscard]] std::optional<Position> byte_index_to_position(
  std::string_view text, const std::vector<ByteIndex> & offsets, ByteIndex index,
  PositionEncoding encoding = PositionEncoding::Utf32) noexcept;

/**
 * Convert a position back to a byte index.
 *
 * Fails when the line does not exist, the character index runs past the end
 * of the line content (the terminator is not addressable) or, for UTF-16,
 * falls between the two halves of a surrogate pair.
 */
[[nodiscard]] std::optional<ByteIndex> position_to_byte_index(
  std::string_view text, const std::vector<ByteIndex> & offsets, Position position,
  PositionEncoding encoding = PositionEncoding::Utf32) noexcept;

/// Re-express `position` in another encoding. Fails where either conversion does.
[[nodiscard]] std::optional<Position> convert_position(
  std::string_view text, const std::vector<ByteIndex> & offsets, Position position,
  PositionEncoding from, PositionEncoding to) noexcept;

/// Line content without its terminator. Empty for an out-of-range line.
[[nodiscard]] std::string_view line_text(
  std::string_view text, const std::vector<ByteIndex> & offsets, size_t line_idx) noexcept;

}  // namespace miniyaml
