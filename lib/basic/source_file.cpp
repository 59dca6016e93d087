// miniyaml/basic/source_file.cpp - SourceFile implementation
#include "miniyaml/basic/source_file.hpp"

#include <system_error>
#include <utility>

#include "miniyaml/basic/line_index.hpp"

namespace miniyaml
{

SourceFile::SourceFile(std::filesystem::path path, std::string text)
: path_(std::move(path)), text_(std::move(text)), line_offsets_(compute_line_start_offsets(text_))
{
}

std::string SourceFile::display_name() const
{
  if (path_.empty()) {
    return "<input>";
  }
  std::error_code ec;
  const auto rel = std::filesystem::relative(path_, std::filesystem::current_path(), ec);
  if (ec || rel.empty()) {
    return path_.string();
  }
  return rel.string();
}

size_t SourceFile::line_count() const noexcept { return miniyaml::line_count(text_, line_offsets_); }

std::string_view SourceFile::line(size_t line_idx) const noexcept
{
  return line_text(text_, line_offsets_, line_idx);
}

std::optional<Position> SourceFile::position(ByteIndex index) const noexcept
{
  return byte_index_to_position(text_, line_offsets_, index);
}

std::optional<ByteIndex> SourceFile::byte_index(Position pos) const noexcept
{
  return position_to_byte_index(text_, line_offsets_, pos);
}

}  // namespace miniyaml
