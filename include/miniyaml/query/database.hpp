// miniyaml/query/database.hpp - Incremental query database over MiniYaml files
//
// Inputs (file text, file path, the list of tracked files, type data) are set
// by the caller. Every derived artifact, from the line table and token stream
// up to hover text and document symbols, is a memoized query that is
// recomputed lazily after one of the inputs it read has changed.
//
#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "miniyaml/basic/diagnostic.hpp"
#include "miniyaml/basic/line_index.hpp"
#include "miniyaml/basic/span.hpp"
#include "miniyaml/query/ide.hpp"
#include "miniyaml/query/query_kind.hpp"
#include "miniyaml/query/runtime.hpp"
#include "miniyaml/query/storage.hpp"
#include "miniyaml/query/type_data.hpp"
#include "miniyaml/syntax/node.hpp"
#include "miniyaml/syntax/token.hpp"
#include "miniyaml/syntax/tree.hpp"

namespace miniyaml::query
{

// ============================================================================
// Per-file parse artifacts
// ============================================================================

struct FileTokens
{
  std::vector<syntax::Token> tokens;
  std::vector<Diagnostic> diagnostics;

  bool operator==(const FileTokens & other) const
  {
    return tokens == other.tokens && diagnostics == other.diagnostics;
  }
};

struct FileNodes
{
  std::vector<syntax::Node> nodes;
  std::vector<Diagnostic> diagnostics;

  bool operator==(const FileNodes & other) const
  {
    return nodes == other.nodes && diagnostics == other.diagnostics;
  }
};

struct FileTree
{
  syntax::Tree tree;
  std::vector<Diagnostic> diagnostics;

  bool operator==(const FileTree & other) const
  {
    return tree == other.tree && diagnostics == other.diagnostics;
  }
};

struct TopLevelNode
{
  FileId file_id;
  syntax::Node node;

  bool operator==(const TopLevelNode & other) const
  {
    return file_id == other.file_id && node == other.node;
  }
};

using TextPtr = std::shared_ptr<const std::string>;
using FileIdList = std::shared_ptr<const std::vector<FileId>>;
using TypeDataPtr = std::shared_ptr<const TypeData>;
using LineOffsetsPtr = std::shared_ptr<const std::vector<ByteIndex>>;
using FileTokensPtr = std::shared_ptr<const FileTokens>;
using FileNodesPtr = std::shared_ptr<const FileNodes>;
using FileTreePtr = std::shared_ptr<const FileTree>;
using DiagnosticsPtr = std::shared_ptr<const std::vector<Diagnostic>>;
using NodeListPtr = std::shared_ptr<const std::vector<syntax::Node>>;
using TopLevelNodeListPtr = std::shared_ptr<const std::vector<TopLevelNode>>;

class Snapshot;

class Database final : public QueryContext
{
  struct SnapshotTag
  {
    explicit SnapshotTag() = default;
  };

public:
  Database();
  ~Database() override = default;

  /// Used by snapshot(): copies every slot, fresh runtime at the same revision.
  Database(SnapshotTag, const Database & other);

  Database(const Database &) = delete;
  Database(Database &&) = delete;
  Database & operator=(const Database &) = delete;
  Database & operator=(Database &&) = delete;

  // QueryContext
  [[nodiscard]] Runtime & runtime() const override { return *runtime_; }
  [[nodiscard]] QueryStorageBase & storage_for(QueryKind kind) const override;

  /// Observe query execution (tests, tracing). Carried over into snapshots.
  void set_event_hook(EventHook hook);

  /// Point-in-time read-only copy, safe to hand to another thread.
  [[nodiscard]] Snapshot snapshot() const;

  // ==========================================================================
  // Inputs
  // ==========================================================================

  /// nullptr when the file has no text.
  [[nodiscard]] TextPtr file_text(FileId file_id) const;
  [[nodiscard]] std::optional<std::string> file_path(FileId file_id) const;
  [[nodiscard]] FileIdList all_file_ids() const;
  [[nodiscard]] TypeDataPtr type_data() const;

  void set_file_text(FileId file_id, std::string text);
  void set_file_path(FileId file_id, std::string path);
  void set_all_file_ids(std::vector<FileId> file_ids);
  void set_type_data(TypeDataPtr data);

  /// Register a new file. Ids are never reused.
  FileId add_file(std::string path, std::string text);
  void remove_file(FileId file_id);

  /**
   * Apply a batch of edits to a private copy of the text, in order, and
   * commit the result with a single input write.
   *
   * Returns false and leaves the text untouched when the file has no text or
   * any range does not resolve against the text at that point of the batch.
   * Range characters are counted in `encoding` units.
   */
  [[nodiscard]] bool apply_edit(
    FileId file_id, const std::vector<TextEdit> & edits,
    PositionEncoding encoding = PositionEncoding::Utf32);

  // ==========================================================================
  // Derived queries
  // ==========================================================================

  [[nodiscard]] std::optional<FileId> file_id_of_file_path(const std::string & path) const;
  [[nodiscard]] LineOffsetsPtr line_start_offsets(FileId file_id) const;

  [[nodiscard]] FileTokensPtr file_tokens(FileId file_id) const;
  [[nodiscard]] FileNodesPtr file_nodes(FileId file_id) const;
  [[nodiscard]] FileTreePtr file_tree(FileId file_id) const;

  /// Tokenizer, nodeizer and treeizer diagnostics in stage order.
  [[nodiscard]] DiagnosticsPtr file_diagnostics(FileId file_id) const;

  [[nodiscard]] std::optional<ByteIndex> position_to_byte_index(
    FileId file_id, Position position) const;
  [[nodiscard]] std::optional<Position> byte_index_to_position(
    FileId file_id, ByteIndex index) const;

  [[nodiscard]] std::optional<syntax::Token> token_spanning_byte_index(
    FileId file_id, ByteIndex index) const;
  [[nodiscard]] std::optional<syntax::Node> node_spanning_byte_index(
    FileId file_id, ByteIndex index) const;

  /// Unindented nodes that have a key.
  [[nodiscard]] NodeListPtr all_top_level_nodes(FileId file_id) const;
  [[nodiscard]] std::optional<syntax::Node> top_level_node_by_key(
    FileId file_id, const std::string & key) const;
  [[nodiscard]] TopLevelNodeListPtr top_level_nodes_in_all_files() const;

  [[nodiscard]] std::optional<std::vector<std::string>> doc_lines_for_trait(
    const std::string & trait_name) const;

  [[nodiscard]] std::optional<std::string> hover_at(FileId file_id, Position position) const;
  [[nodiscard]] std::optional<DefinitionLocation> definition_at(
    FileId file_id, Position position) const;
  [[nodiscard]] std::optional<std::vector<Symbol>> symbols_in(FileId file_id) const;

private:
  void register_storages();

  using FilePositionKey = std::tuple<FileId, Position>;
  using FileByteKey = std::tuple<FileId, ByteIndex>;
  using FileStringKey = std::tuple<FileId, std::string>;

  std::unique_ptr<Runtime> runtime_;
  uint32_t next_file_id_ = 0;

  // Inputs
  mutable InputStorage<FileId, TextPtr> file_text_{QueryKind::FileText};
  mutable InputStorage<FileId, std::string> file_path_{QueryKind::FilePath};
  mutable InputStorage<std::monostate, FileIdList> all_file_ids_{QueryKind::AllFileIds};
  mutable InputStorage<std::monostate, TypeDataPtr> type_data_{QueryKind::TypeData};

  // Derived
  mutable DerivedStorage<Database, std::string, std::optional<FileId>> file_id_of_file_path_;
  mutable DerivedStorage<Database, FileId, LineOffsetsPtr> line_start_offsets_;
  mutable DerivedStorage<Database, FileId, FileTokensPtr> file_tokens_;
  mutable DerivedStorage<Database, FileId, FileNodesPtr> file_nodes_;
  mutable DerivedStorage<Database, FileId, FileTreePtr> file_tree_;
  mutable DerivedStorage<Database, FileId, DiagnosticsPtr> file_diagnostics_;
  mutable DerivedStorage<Database, FilePositionKey, std::optional<ByteIndex>, TupleHash>
    position_to_byte_index_;
  mutable DerivedStorage<Database, FileByteKey, std::optional<Position>, TupleHash>
    byte_index_to_position_;
  mutable DerivedStorage<Database, FileByteKey, std::optional<syntax::Token>, TupleHash>
    token_spanning_byte_index_;
  mutable DerivedStorage<Database, FileByteKey, std::optional<syntax::Node>, TupleHash>
    node_spanning_byte_index_;
  mutable DerivedStorage<Database, FileId, NodeListPtr> all_top_level_nodes_;
  mutable DerivedStorage<Database, FileStringKey, std::optional<syntax::Node>, TupleHash>
    top_level_node_by_key_;
  mutable DerivedStorage<Database, std::monostate, TopLevelNodeListPtr>
    top_level_nodes_in_all_files_;
  mutable DerivedStorage<Database, std::string, std::optional<std::vector<std::string>>>
    doc_lines_for_trait_;
  mutable DerivedStorage<Database, FilePositionKey, std::optional<std::string>, TupleHash>
    hover_at_;
  mutable DerivedStorage<Database, FilePositionKey, std::optional<DefinitionLocation>, TupleHash>
    definition_at_;
  mutable DerivedStorage<Database, FileId, std::optional<std::vector<Symbol>>> symbols_in_;

  std::array<QueryStorageBase *, k_query_kind_count> storages_{};
};

// ============================================================================
// Snapshot
// ============================================================================

/// Owns a frozen copy of a Database. Only const access is exposed.
class Snapshot
{
public:
  explicit Snapshot(std::unique_ptr<Database> db) : db_(std::move(db)) {}

  Snapshot(Snapshot &&) noexcept = default;
  Snapshot & operator=(Snapshot &&) noexcept = default;
  Snapshot(const Snapshot &) = delete;
  Snapshot & operator=(const Snapshot &) = delete;

  [[nodiscard]] const Database & operator*() const noexcept { return *db_; }
  [[nodiscard]] const Database * operator->() const noexcept { return db_.get(); }

  [[nodiscard]] Revision revision() const { return db_->runtime().current_revision(); }

private:
  std::unique_ptr<Database> db_;
};

}  // namespace miniyaml::query
