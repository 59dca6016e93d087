#include "miniyaml/query/query_kind.hpp"

namespace miniyaml::query
{

std::string_view query_kind_name(QueryKind kind) noexcept
{
  switch (kind) {
    case QueryKind::FileText:
      return "file_text";
    case QueryKind::FilePath:
      return "file_path";
    case QueryKind::AllFileIds:
      return "all_file_ids";
    case QueryKind::TypeData:
      return "type_data";
    case QueryKind::FileIdOfFilePath:
      return "file_id_of_file_path";
    case QueryKind::LineStartOffsets:
      return "line_start_offsets";
    case QueryKind::FileTokens:
      return "file_tokens";
    case QueryKind::FileNodes:
      return "file_nodes";
    case QueryKind::FileTree:
      return "file_tree";
    case QueryKind::FileDiagnostics:
      return "file_diagnostics";
    case QueryKind::PositionToByteIndex:
      return "position_to_byte_index";
    case QueryKind::ByteIndexToPosition:
      return "byte_index_to_position";
    case QueryKind::TokenSpanningByteIndex:
      return "token_spanning_byte_index";
    case QueryKind::NodeSpanningByteIndex:
      return "node_spanning_byte_index";
    case QueryKind::AllTopLevelNodes:
      return "all_top_level_nodes";
    case QueryKind::TopLevelNodeByKey:
      return "top_level_node_by_key";
    case QueryKind::TopLevelNodesInAllFiles:
      return "top_level_nodes_in_all_files";
    case QueryKind::DocLinesForTrait:
      return "doc_lines_for_trait";
    case QueryKind::HoverAt:
      return "hover_at";
    case QueryKind::DefinitionAt:
      return "definition_at";
    case QueryKind::SymbolsIn:
      return "symbols_in";
    case QueryKind::COUNT:
      break;
  }
  return "<unknown>";
}

}  // namespace miniyaml::query
