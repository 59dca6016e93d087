// miniyaml/basic/source_file.hpp - A named source text with its line table
//
// Used outside the query database (CLI, diagnostic printing) where a file is
// read once and never edited.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "miniyaml/basic/span.hpp"

namespace miniyaml
{

class SourceFile
{
public:
  SourceFile() = default;

  SourceFile(std::filesystem::path path, std::string text);

  // ===========================================================================
  // File Path Accessors
  // ===========================================================================

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Path relative to the working directory when possible, "<input>" when unnamed.
  [[nodiscard]] std::string display_name() const;

  // ===========================================================================
  // Source Content Accessors
  // ===========================================================================

  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] const std::vector<ByteIndex> & line_offsets() const noexcept
  {
    return line_offsets_;
  }
  [[nodiscard]] size_t line_count() const noexcept;

  /// Content of a line (0-indexed) without its terminator.
  [[nodiscard]] std::string_view line(size_t line_idx) const noexcept;

  // ===========================================================================
  // Location Conversion
  // ===========================================================================

  [[nodiscard]] std::optional<Position> position(ByteIndex index) const noexcept;
  [[nodiscard]] std::optional<ByteIndex> byte_index(Position pos) const noexcept;

private:
  std::filesystem::path path_;
  std::string text_;
  std::vector<ByteIndex> line_offsets_;
};

}  // namespace miniyaml
