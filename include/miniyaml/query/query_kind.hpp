// miniyaml/query/query_kind.hpp - Tags for every input and derived query
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace miniyaml::query
{

/// Tag enum for fast query type discrimination.
enum class QueryKind : uint8_t {
  // Inputs
  FileText,
  FilePath,
  AllFileIds,
  TypeData,

  // Derived
  FileIdOfFilePath,
  LineStartOffsets,
  FileTokens,
  FileNodes,
  FileTree,
  FileDiagnostics,
  PositionToByteIndex,
  ByteIndexToPosition,
  TokenSpanningByteIndex,
  NodeSpanningByteIndex,
  AllTopLevelNodes,
  TopLevelNodeByKey,
  TopLevelNodesInAllFiles,
  DocLinesForTrait,
  HoverAt,
  DefinitionAt,
  SymbolsIn,

  COUNT
};

inline constexpr size_t k_query_kind_count = static_cast<size_t>(QueryKind::COUNT);

[[nodiscard]] constexpr size_t to_index(QueryKind kind) noexcept
{
  return static_cast<size_t>(kind);
}

/// Get a human-readable name for a query kind.
[[nodiscard]] std::string_view query_kind_name(QueryKind kind) noexcept;

[[nodiscard]] constexpr bool is_input(QueryKind kind) noexcept
{
  return kind == QueryKind::FileText || kind == QueryKind::FilePath ||
         kind == QueryKind::AllFileIds || kind == QueryKind::TypeData;
}

}  // namespace miniyaml::query
