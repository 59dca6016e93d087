// miniyaml/basic/span.hpp - File identity, byte spans and line/character positions
//
// Spans are half-open byte intervals [start, end) scoped to a FileId.
// Line and character positions are derived on demand from a line index
// (see miniyaml/basic/line_index.hpp).
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace miniyaml
{

// ============================================================================
// FileId - Opaque handle identifying a tracked file
// ============================================================================

struct FileId
{
  static constexpr uint32_t k_invalid = UINT32_MAX;

  uint32_t value = k_invalid;

  constexpr FileId() noexcept = default;
  constexpr explicit FileId(uint32_t v) noexcept : value(v) {}

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
  [[nodiscard]] constexpr bool operator<(FileId other) const noexcept
  {
    return value < other.value;
  }
};

// ============================================================================
// ByteIndex - Byte offset into a file's UTF-8 text
// ============================================================================

class ByteIndex
{
public:
  constexpr ByteIndex() noexcept = default;
  constexpr explicit ByteIndex(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr uint32_t value() const noexcept { return offset_; }
  [[nodiscard]] constexpr size_t to_size() const noexcept { return offset_; }

  [[nodiscard]] constexpr ByteIndex operator+(uint32_t n) const noexcept
  {
    return ByteIndex(offset_ + n);
  }

  [[nodiscard]] constexpr bool operator==(ByteIndex other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(ByteIndex other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(ByteIndex other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(ByteIndex other) const noexcept
  {
    return offset_ <= other.offset_;
  }
  [[nodiscard]] constexpr bool operator>(ByteIndex other) const noexcept
  {
    return offset_ > other.offset_;
  }
  [[nodiscard]] constexpr bool operator>=(ByteIndex other) const noexcept
  {
    return offset_ >= other.offset_;
  }

private:
  uint32_t offset_ = 0;
};

// ============================================================================
// ByteSpan - Half-open byte range tied to a file
// ============================================================================

class ByteSpan
{
public:
  constexpr ByteSpan() noexcept = default;

  /// An inverted range is clamped to an empty span at `start`.
  constexpr ByteSpan(FileId file, ByteIndex start, ByteIndex end) noexcept
  : file_(file), start_(start), end_(end < start ? start : end)
  {
  }

  constexpr ByteSpan(FileId file, uint32_t start, uint32_t end) noexcept
  : ByteSpan(file, ByteIndex(start), ByteIndex(end))
  {
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr ByteIndex start() const noexcept { return start_; }
  [[nodiscard]] constexpr ByteIndex end() const noexcept { return end_; }
  [[nodiscard]] constexpr uint32_t length() const noexcept { return end_.value() - start_.value(); }
  [[nodiscard]] constexpr bool is_empty() const noexcept { return start_ == end_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return file_.is_valid(); }

  [[nodiscard]] constexpr bool contains(ByteIndex index) const noexcept
  {
    return start_ <= index && index < end_;
  }

  [[nodiscard]] constexpr bool contains(ByteSpan other) const noexcept
  {
    return file_ == other.file_ && start_ <= other.start_ && other.end_ <= end_;
  }

  /// Smallest span covering both `*this` and `other` (same file assumed).
  [[nodiscard]] constexpr ByteSpan merge(ByteSpan other) const noexcept
  {
    const ByteIndex s = other.start_ < start_ ? other.start_ : start_;
    const ByteIndex e = end_ < other.end_ ? other.end_ : end_;
    return {file_, s, e};
  }

  /// Slice of `text` covered by this span.
  ///
  /// Fails when the span runs past the end of `text` or either edge falls
  /// inside a multi-byte UTF-8 sequence.
  [[nodiscard]] std::optional<std::string_view> slice(std::string_view text) const noexcept;

  [[nodiscard]] constexpr bool operator==(const ByteSpan & other) const noexcept
  {
    return file_ == other.file_ && start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(const ByteSpan & other) const noexcept
  {
    return !(*this == other);
  }

private:
  FileId file_;
  ByteIndex start_;
  ByteIndex end_;
};

// ============================================================================
// Position - Zero-based line / character (Unicode scalar values)
// ============================================================================

struct Position
{
  uint32_t line_idx = 0;
  uint32_t character_idx = 0;

  constexpr Position() noexcept = default;
  constexpr Position(uint32_t line, uint32_t character) noexcept
  : line_idx(line), character_idx(character)
  {
  }

  [[nodiscard]] constexpr bool operator==(const Position & other) const noexcept
  {
    return line_idx == other.line_idx && character_idx == other.character_idx;
  }
  [[nodiscard]] constexpr bool operator!=(const Position & other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(const Position & other) const noexcept
  {
    return line_idx < other.line_idx ||
           (line_idx == other.line_idx && character_idx < other.character_idx);
  }
};

struct PositionRange
{
  Position start;
  Position end_exclusive;

  [[nodiscard]] constexpr bool operator==(const PositionRange & other) const noexcept
  {
    return start == other.start && end_exclusive == other.end_exclusive;
  }
  [[nodiscard]] constexpr bool operator!=(const PositionRange & other) const noexcept
  {
    return !(*this == other);
  }
};

}  // namespace miniyaml

// ============================================================================
// Hashing (query keys are built from these types)
// ============================================================================

namespace std
{

template <>
struct hash<miniyaml::FileId>
{
  size_t operator()(miniyaml::FileId id) const noexcept { return hash<uint32_t>{}(id.value); }
};

template <>
struct hash<miniyaml::ByteIndex>
{
  size_t operator()(miniyaml::ByteIndex idx) const noexcept { return hash<uint32_t>{}(idx.value()); }
};

template <>
struct hash<miniyaml::Position>
{
  size_t operator()(const miniyaml::Position & pos) const noexcept
  {
    return hash<uint64_t>{}((static_cast<uint64_t>(pos.line_idx) << 32U) | pos.character_idx);
  }
};

}  // namespace std
