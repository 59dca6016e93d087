// miniyaml/query/ide.hpp - Value types returned by the language queries
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "miniyaml/basic/span.hpp"

namespace miniyaml::query
{

/// Document outline entry.
struct Symbol
{
  std::string name;
  std::optional<std::string> detail;
  PositionRange range;
  std::optional<std::vector<Symbol>> children;

  bool operator==(const Symbol & other) const
  {
    return name == other.name && detail == other.detail && range == other.range &&
           children == other.children;
  }
  bool operator!=(const Symbol & other) const { return !(*this == other); }
};

struct DefinitionLocation
{
  FileId file_id;
  Position start;
  Position end_exclusive;

  bool operator==(const DefinitionLocation & other) const
  {
    return file_id == other.file_id && start == other.start && end_exclusive == other.end_exclusive;
  }
  bool operator!=(const DefinitionLocation & other) const { return !(*this == other); }
};

/// Replace `range` with `text`; no range replaces the whole document.
struct TextEdit
{
  std::optional<PositionRange> range;
  std::string text;
};

}  // namespace miniyaml::query
