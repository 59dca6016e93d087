#include "miniyaml/query/database.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "miniyaml/basic/line_index.hpp"
#include "miniyaml/basic/utf8.hpp"
#include "miniyaml/syntax/nodeizer.hpp"
#include "miniyaml/syntax/tokenizer.hpp"
#include "miniyaml/syntax/treeizer.hpp"

namespace miniyaml::query
{

namespace
{

using syntax::Node;
using syntax::NodeId;
using syntax::Token;
using syntax::TokenKind;
using syntax::Tree;

// ============================================================================
// File queries
// ============================================================================

std::optional<FileId> compute_file_id_of_file_path(const Database & db, const std::string & path)
{
  const FileIdList ids = db.all_file_ids();
  if (!ids) {
    return std::nullopt;
  }
  for (const FileId id : *ids) {
    if (db.file_path(id) == path) {
      return id;
    }
  }
  return std::nullopt;
}

LineOffsetsPtr compute_line_start_offsets(const Database & db, const FileId & file_id)
{
  const TextPtr text = db.file_text(file_id);
  if (!text) {
    return nullptr;
  }
  return std::make_shared<const std::vector<ByteIndex>>(miniyaml::compute_line_start_offsets(*text));
}

// ============================================================================
// Parse pipeline
// ============================================================================

FileTokensPtr compute_file_tokens(const Database & db, const FileId & file_id)
{
  const TextPtr text = db.file_text(file_id);
  if (!text) {
    return nullptr;
  }
  auto lexed = syntax::tokenize(file_id, *text);
  return std::make_shared<const FileTokens>(
    FileTokens{std::move(lexed.tokens), std::move(lexed.diagnostics)});
}

FileNodesPtr compute_file_nodes(const Database & db, const FileId & file_id)
{
  const FileTokensPtr tokens = db.file_tokens(file_id);
  if (!tokens) {
    return nullptr;
  }
  auto grouped = syntax::nodeize(tokens->tokens);
  return std::make_shared<const FileNodes>(
    FileNodes{std::move(grouped.nodes), std::move(grouped.diagnostics)});
}

FileTreePtr compute_file_tree(const Database & db, const FileId & file_id)
{
  const FileNodesPtr nodes = db.file_nodes(file_id);
  const TextPtr text = db.file_text(file_id);
  if (!nodes || !text) {
    return nullptr;
  }
  auto built = syntax::treeize(nodes->nodes, *text);
  return std::make_shared<const FileTree>(
    FileTree{std::move(built.tree), std::move(built.diagnostics)});
}

DiagnosticsPtr compute_file_diagnostics(const Database & db, const FileId & file_id)
{
  const FileTokensPtr tokens = db.file_tokens(file_id);
  const FileNodesPtr nodes = db.file_nodes(file_id);
  const FileTreePtr tree = db.file_tree(file_id);
  if (!tokens || !nodes || !tree) {
    return nullptr;
  }

  std::vector<Diagnostic> all;
  all.reserve(tokens->diagnostics.size() + nodes->diagnostics.size() + tree->diagnostics.size());
  all.insert(all.end(), tokens->diagnostics.begin(), tokens->diagnostics.end());
  all.insert(all.end(), nodes->diagnostics.begin(), nodes->diagnostics.end());
  all.insert(all.end(), tree->diagnostics.begin(), tree->diagnostics.end());
  return std::make_shared<const std::vector<Diagnostic>>(std::move(all));
}

// ============================================================================
// Position conversion and lookup
// ============================================================================

std::optional<ByteIndex> compute_position_to_byte_index(
  const Database & db, const std::tuple<FileId, Position> & key)
{
  const auto & [file_id, position] = key;
  const TextPtr text = db.file_text(file_id);
  const LineOffsetsPtr offsets = db.line_start_offsets(file_id);
  if (!text || !offsets) {
    return std::nullopt;
  }
  return miniyaml::position_to_byte_index(*text, *offsets, position);
}

std::optional<Position> compute_byte_index_to_position(
  const Database & db, const std::tuple<FileId, ByteIndex> & key)
{
  const auto & [file_id, index] = key;
  const TextPtr text = db.file_text(file_id);
  const LineOffsetsPtr offsets = db.line_start_offsets(file_id);
  if (!text || !offsets) {
    return std::nullopt;
  }
  return miniyaml::byte_index_to_position(*text, *offsets, index);
}

std::optional<Token> compute_token_spanning_byte_index(
  const Database & db, const std::tuple<FileId, ByteIndex> & key)
{
  const FileId file_id = std::get<0>(key);
  const ByteIndex index = std::get<1>(key);
  const FileTokensPtr tokens = db.file_tokens(file_id);
  if (!tokens) {
    return std::nullopt;
  }
  const auto it = std::find_if(tokens->tokens.begin(), tokens->tokens.end(), [&](const Token & t) {
    return t.span.contains(index);
  });
  if (it == tokens->tokens.end()) {
    return std::nullopt;
  }
  return *it;
}

std::optional<Node> compute_node_spanning_byte_index(
  const Database & db, const std::tuple<FileId, ByteIndex> & key)
{
  const auto & [file_id, index] = key;
  const FileNodesPtr nodes = db.file_nodes(file_id);
  if (!nodes) {
    return std::nullopt;
  }
  for (const Node & node : nodes->nodes) {
    const auto span = node.span();
    if (span && span->contains(index)) {
      return node;
    }
  }
  return std::nullopt;
}

// ============================================================================
// Definitions
// ============================================================================

NodeListPtr compute_all_top_level_nodes(const Database & db, const FileId & file_id)
{
  const FileNodesPtr nodes = db.file_nodes(file_id);
  if (!nodes) {
    return nullptr;
  }
  std::vector<Node> out;
  std::copy_if(nodes->nodes.begin(), nodes->nodes.end(), std::back_inserter(out), [](const Node & n) {
    return n.is_top_level() && n.has_key();
  });
  return std::make_shared<const std::vector<Node>>(std::move(out));
}

std::optional<Node> compute_top_level_node_by_key(
  const Database & db, const std::tuple<FileId, std::string> & key)
{
  const auto & [file_id, wanted] = key;
  const TextPtr text = db.file_text(file_id);
  const NodeListPtr nodes = db.all_top_level_nodes(file_id);
  if (!text || !nodes) {
    return std::nullopt;
  }
  for (const Node & node : *nodes) {
    if (node.key_text(*text) == std::string_view(wanted)) {
      return node;
    }
  }
  return std::nullopt;
}

TopLevelNodeListPtr compute_top_level_nodes_in_all_files(
  const Database & db, const std::monostate & /*unit*/)
{
  std::vector<TopLevelNode> out;
  if (const FileIdList ids = db.all_file_ids()) {
    for (const FileId id : *ids) {
      const NodeListPtr nodes = db.all_top_level_nodes(id);
      if (!nodes) {
        continue;
      }
      for (const Node & node : *nodes) {
        out.push_back(TopLevelNode{id, node});
      }
    }
  }
  return std::make_shared<const std::vector<TopLevelNode>>(std::move(out));
}

// ============================================================================
// Language queries
// ============================================================================

std::optional<std::vector<std::string>> compute_doc_lines_for_trait(
  const Database & db, const std::string & trait_name)
{
  const TypeDataPtr data = db.type_data();
  if (!data) {
    return std::nullopt;
  }
  const auto it = std::find_if(
    data->begin(), data->end(), [&](const TraitDetail & td) { return td.name == trait_name; });
  if (it == data->end()) {
    return std::nullopt;
  }
  return it->doc_lines;
}

std::optional<std::string> compute_hover_at(
  const Database & db, const std::tuple<FileId, Position> & key)
{
  const auto & [file_id, position] = key;
  const TextPtr text = db.file_text(file_id);
  if (!text) {
    return std::nullopt;
  }

  const auto index = db.position_to_byte_index(file_id, position);
  if (!index) {
    return std::nullopt;
  }
  const auto token = db.token_spanning_byte_index(file_id, *index);
  if (!token) {
    return std::nullopt;
  }
  const auto token_text = token->slice(*text);
  if (!token_text) {
    return std::nullopt;
  }

  // Empty hover text is not useful to a client.
  const std::string_view trimmed = utf8::trim(*token_text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  const auto doc_lines = db.doc_lines_for_trait(std::string(trimmed));
  if (!doc_lines) {
    return std::nullopt;
  }

  std::string joined;
  for (size_t i = 0; i < doc_lines->size(); ++i) {
    if (i > 0) {
      joined += '\n';
    }
    joined += (*doc_lines)[i];
  }
  return joined;
}

std::optional<DefinitionLocation> compute_definition_at(
  const Database & db, const std::tuple<FileId, Position> & key)
{
  const auto & [file_id, position] = key;
  const TextPtr text = db.file_text(file_id);
  if (!text) {
    return std::nullopt;
  }

  const auto index = db.position_to_byte_index(file_id, position);
  if (!index) {
    return std::nullopt;
  }

  // Whole node, so the token before the requested one can be inspected.
  const auto node = db.node_spanning_byte_index(file_id, *index);
  if (!node) {
    return std::nullopt;
  }
  const std::vector<Token> tokens = node->tokens();
  const auto it = std::find_if(
    tokens.begin(), tokens.end(), [&](const Token & t) { return t.span.contains(*index); });
  if (it == tokens.end()) {
    return std::nullopt;
  }
  const auto token_text = it->slice(*text);
  if (!token_text) {
    return std::nullopt;
  }

  std::string search(*token_text);
  if (it != tokens.begin() && std::prev(it)->kind == TokenKind::Caret) {
    search.insert(search.begin(), '^');
  }

  const FileIdList ids = db.all_file_ids();
  if (!ids) {
    return std::nullopt;
  }
  for (const FileId candidate : *ids) {
    const auto def = db.top_level_node_by_key(candidate, search);
    if (!def) {
      continue;
    }
    const auto span = def->key_span();
    if (!span) {
      continue;
    }
    const auto start = db.byte_index_to_position(candidate, span->start());
    const auto end = db.byte_index_to_position(candidate, span->end());
    if (!start || !end) {
      continue;
    }
    return DefinitionLocation{candidate, *start, *end};
  }

  spdlog::debug("no definition found for '{}'", search);
  return std::nullopt;
}

std::optional<Symbol> symbol_for(
  const Tree & tree, NodeId id, std::string_view text, const std::vector<ByteIndex> & offsets)
{
  const Node * node = tree.node(id);
  if (node == nullptr || !node->has_key()) {
    return std::nullopt;
  }

  const auto key_span = node->key_span();
  const auto node_span = node->span();
  const auto name = node->key_text(text);
  if (!key_span || !node_span || !name) {
    return std::nullopt;
  }

  const auto start = miniyaml::byte_index_to_position(text, offsets, key_span->start());
  const auto end = miniyaml::byte_index_to_position(text, offsets, node_span->end());
  if (!start || !end) {
    return std::nullopt;
  }

  Symbol symbol;
  symbol.name = std::string(*name);
  symbol.range = PositionRange{*start, *end};

  if (const auto value = node->value_text(text)) {
    const std::string_view trimmed = utf8::trim(*value);
    if (!trimmed.empty()) {
      symbol.detail = std::string(trimmed);
    }
  }

  std::vector<Symbol> children;
  for (const NodeId child : tree.children(id)) {
    if (auto child_symbol = symbol_for(tree, child, text, offsets)) {
      children.push_back(std::move(*child_symbol));
    }
  }
  if (!children.empty()) {
    symbol.children = std::move(children);
  }
  return symbol;
}

std::optional<std::vector<Symbol>> compute_symbols_in(const Database & db, const FileId & file_id)
{
  const TextPtr text = db.file_text(file_id);
  const LineOffsetsPtr offsets = db.line_start_offsets(file_id);
  const FileTreePtr tree = db.file_tree(file_id);
  if (!text || !offsets || !tree) {
    return std::nullopt;
  }

  std::vector<Symbol> symbols;
  for (const NodeId id : tree->tree.children(tree->tree.sentinel())) {
    if (auto symbol = symbol_for(tree->tree, id, *text, *offsets)) {
      symbols.push_back(std::move(*symbol));
    }
  }
  return symbols;
}

/// File a per-file query key belongs to.
FileId file_of(FileId key) { return key; }

template <typename... Rest>
FileId file_of(const std::tuple<FileId, Rest...> & key)
{
  return std::get<0>(key);
}

}  // namespace

// ============================================================================
// Database
// ============================================================================

Database::Database()
: runtime_(std::make_unique<Runtime>()),
  file_id_of_file_path_(QueryKind::FileIdOfFilePath, &compute_file_id_of_file_path),
  line_start_offsets_(QueryKind::LineStartOffsets, &compute_line_start_offsets),
  file_tokens_(QueryKind::FileTokens, &compute_file_tokens),
  file_nodes_(QueryKind::FileNodes, &compute_file_nodes),
  file_tree_(QueryKind::FileTree, &compute_file_tree),
  file_diagnostics_(QueryKind::FileDiagnostics, &compute_file_diagnostics),
  position_to_byte_index_(QueryKind::PositionToByteIndex, &compute_position_to_byte_index),
  byte_index_to_position_(QueryKind::ByteIndexToPosition, &compute_byte_index_to_position),
  token_spanning_byte_index_(
    QueryKind::TokenSpanningByteIndex, &compute_token_spanning_byte_index),
  node_spanning_byte_index_(QueryKind::NodeSpanningByteIndex, &compute_node_spanning_byte_index),
  all_top_level_nodes_(QueryKind::AllTopLevelNodes, &compute_all_top_level_nodes),
  top_level_node_by_key_(QueryKind::TopLevelNodeByKey, &compute_top_level_node_by_key),
  top_level_nodes_in_all_files_(
    QueryKind::TopLevelNodesInAllFiles, &compute_top_level_nodes_in_all_files),
  doc_lines_for_trait_(QueryKind::DocLinesForTrait, &compute_doc_lines_for_trait),
  hover_at_(QueryKind::HoverAt, &compute_hover_at),
  definition_at_(QueryKind::DefinitionAt, &compute_definition_at),
  symbols_in_(QueryKind::SymbolsIn, &compute_symbols_in)
{
  register_storages();
}

Database::Database(SnapshotTag /*tag*/, const Database & other)
: QueryContext(),
  runtime_(std::make_unique<Runtime>(
    other.runtime_->current_revision(), other.runtime_->event_hook())),
  next_file_id_(other.next_file_id_),
  file_text_(other.file_text_),
  file_path_(other.file_path_),
  all_file_ids_(other.all_file_ids_),
  type_data_(other.type_data_),
  file_id_of_file_path_(other.file_id_of_file_path_),
  line_start_offsets_(other.line_start_offsets_),
  file_tokens_(other.file_tokens_),
  file_nodes_(other.file_nodes_),
  file_tree_(other.file_tree_),
  file_diagnostics_(other.file_diagnostics_),
  position_to_byte_index_(other.position_to_byte_index_),
  byte_index_to_position_(other.byte_index_to_position_),
  token_spanning_byte_index_(other.token_spanning_byte_index_),
  node_spanning_byte_index_(other.node_spanning_byte_index_),
  all_top_level_nodes_(other.all_top_level_nodes_),
  top_level_node_by_key_(other.top_level_node_by_key_),
  top_level_nodes_in_all_files_(other.top_level_nodes_in_all_files_),
  doc_lines_for_trait_(other.doc_lines_for_trait_),
  hover_at_(other.hover_at_),
  definition_at_(other.definition_at_),
  symbols_in_(other.symbols_in_)
{
  register_storages();
}

void Database::register_storages()
{
  const auto put = [this](QueryStorageBase & storage) {
    storages_[to_index(storage.kind())] = &storage;
  };

  put(file_text_);
  put(file_path_);
  put(all_file_ids_);
  put(type_data_);
  put(file_id_of_file_path_);
  put(line_start_offsets_);
  put(file_tokens_);
  put(file_nodes_);
  put(file_tree_);
  put(file_diagnostics_);
  put(position_to_byte_index_);
  put(byte_index_to_position_);
  put(token_spanning_byte_index_);
  put(node_spanning_byte_index_);
  put(all_top_level_nodes_);
  put(top_level_node_by_key_);
  put(top_level_nodes_in_all_files_);
  put(doc_lines_for_trait_);
  put(hover_at_);
  put(definition_at_);
  put(symbols_in_);
}

QueryStorageBase & Database::storage_for(QueryKind kind) const
{
  const size_t idx = to_index(kind);
  if (idx >= storages_.size() || storages_[idx] == nullptr) {
    throw std::logic_error("no storage registered for query kind " + std::to_string(idx));
  }
  return *storages_[idx];
}

void Database::set_event_hook(EventHook hook)
{
  std::lock_guard<std::recursive_mutex> lock(runtime_->mutex());
  runtime_->set_event_hook(std::move(hook));
}

Snapshot Database::snapshot() const
{
  std::lock_guard<std::recursive_mutex> lock(runtime_->mutex());
  return Snapshot(std::make_unique<Database>(SnapshotTag{}, *this));
}

// ----------------------------------------------------------------------------
// Inputs
// ----------------------------------------------------------------------------

TextPtr Database::file_text(FileId file_id) const
{
  return file_text_.get(*this, file_id).value_or(TextPtr{});
}

std::optional<std::string> Database::file_path(FileId file_id) const
{
  return file_path_.get(*this, file_id);
}

FileIdList Database::all_file_ids() const
{
  return all_file_ids_.get(*this, std::monostate{}).value_or(FileIdList{});
}

TypeDataPtr Database::type_data() const
{
  return type_data_.get(*this, std::monostate{}).value_or(TypeDataPtr{});
}

void Database::set_file_text(FileId file_id, std::string text)
{
  file_text_.set(*this, file_id, std::make_shared<const std::string>(std::move(text)));
}

void Database::set_file_path(FileId file_id, std::string path)
{
  file_path_.set(*this, file_id, std::move(path));
}

void Database::set_all_file_ids(std::vector<FileId> file_ids)
{
  all_file_ids_.set(
    *this, std::monostate{}, std::make_shared<const std::vector<FileId>>(std::move(file_ids)));
}

void Database::set_type_data(TypeDataPtr data)
{
  type_data_.set(*this, std::monostate{}, std::move(data));
}

FileId Database::add_file(std::string path, std::string text)
{
  std::lock_guard<std::recursive_mutex> lock(runtime_->mutex());

  const FileId id(next_file_id_++);
  spdlog::debug("adding file #{} '{}'", id.value, path);

  set_file_path(id, std::move(path));
  set_file_text(id, std::move(text));

  std::vector<FileId> ids;
  if (const FileIdList current = all_file_ids()) {
    ids = *current;
  }
  ids.push_back(id);
  set_all_file_ids(std::move(ids));
  return id;
}

void Database::remove_file(FileId file_id)
{
  std::lock_guard<std::recursive_mutex> lock(runtime_->mutex());

  file_text_.remove(*this, file_id);
  file_path_.remove(*this, file_id);

  const auto of_file = [file_id](const auto & key) { return file_of(key) == file_id; };
  line_start_offsets_.purge(*this, of_file);
  file_tokens_.purge(*this, of_file);
  file_nodes_.purge(*this, of_file);
  file_tree_.purge(*this, of_file);
  file_diagnostics_.purge(*this, of_file);
  position_to_byte_index_.purge(*this, of_file);
  byte_index_to_position_.purge(*this, of_file);
  token_spanning_byte_index_.purge(*this, of_file);
  node_spanning_byte_index_.purge(*this, of_file);
  all_top_level_nodes_.purge(*this, of_file);
  top_level_node_by_key_.purge(*this, of_file);
  hover_at_.purge(*this, of_file);
  definition_at_.purge(*this, of_file);
  symbols_in_.purge(*this, of_file);

  std::vector<FileId> ids;
  if (const FileIdList current = all_file_ids()) {
    ids = *current;
  }
  ids.erase(std::remove(ids.begin(), ids.end(), file_id), ids.end());
  set_all_file_ids(std::move(ids));
}

bool Database::apply_edit(
  FileId file_id, const std::vector<TextEdit> & edits, PositionEncoding encoding)
{
  std::lock_guard<std::recursive_mutex> lock(runtime_->mutex());

  const TextPtr current = file_text(file_id);
  if (!current) {
    spdlog::warn("edit for file #{} which has no text", file_id.value);
    return false;
  }

  std::string text = *current;
  for (const TextEdit & edit : edits) {
    if (!edit.range) {
      text = edit.text;
      continue;
    }

    const auto offsets = miniyaml::compute_line_start_offsets(text);
    const auto start =
      miniyaml::position_to_byte_index(text, offsets, edit.range->start, encoding);
    const auto end =
      miniyaml::position_to_byte_index(text, offsets, edit.range->end_exclusive, encoding);
    if (!start || !end || *end < *start) {
      spdlog::warn(
        "rejecting edit batch for file #{}: range {}:{}-{}:{} does not resolve", file_id.value,
        edit.range->start.line_idx, edit.range->start.character_idx,
        edit.range->end_exclusive.line_idx, edit.range->end_exclusive.character_idx);
      return false;
    }
    text.replace(start->to_size(), end->to_size() - start->to_size(), edit.text);
  }

  set_file_text(file_id, std::move(text));
  return true;
}

// ----------------------------------------------------------------------------
// Derived
// ----------------------------------------------------------------------------

std::optional<FileId> Database::file_id_of_file_path(const std::string & path) const
{
  return file_id_of_file_path_.fetch(*this, path);
}

LineOffsetsPtr Database::line_start_offsets(FileId file_id) const
{
  return line_start_offsets_.fetch(*this, file_id);
}

FileTokensPtr Database::file_tokens(FileId file_id) const
{
  return file_tokens_.fetch(*this, file_id);
}

FileNodesPtr Database::file_nodes(FileId file_id) const
{
  return file_nodes_.fetch(*this, file_id);
}

FileTreePtr Database::file_tree(FileId file_id) const { return file_tree_.fetch(*this, file_id); }

DiagnosticsPtr Database::file_diagnostics(FileId file_id) const
{
  return file_diagnostics_.fetch(*this, file_id);
}

std::optional<ByteIndex> Database::position_to_byte_index(FileId file_id, Position position) const
{
  return position_to_byte_index_.fetch(*this, {file_id, position});
}

std::optional<Position> Database::byte_index_to_position(FileId file_id, ByteIndex index) const
{
  return byte_index_to_position_.fetch(*this, {file_id, index});
}

std::optional<Token> Database::token_spanning_byte_index(FileId file_id, ByteIndex index) const
{
  return token_spanning_byte_index_.fetch(*this, {file_id, index});
}

std::optional<Node> Database::node_spanning_byte_index(FileId file_id, ByteIndex index) const
{
  return node_spanning_byte_index_.fetch(*this, {file_id, index});
}

NodeListPtr Database::all_top_level_nodes(FileId file_id) const
{
  return all_top_level_nodes_.fetch(*this, file_id);
}

std::optional<Node> Database::top_level_node_by_key(FileId file_id, const std::string & key) const
{
  return top_level_node_by_key_.fetch(*this, {file_id, key});
}

TopLevelNodeListPtr Database::top_level_nodes_in_all_files() const
{
  return top_level_nodes_in_all_files_.fetch(*this, std::monostate{});
}

std::optional<std::vector<std::string>> Database::doc_lines_for_trait(
  const std::string & trait_name) const
{
  return doc_lines_for_trait_.fetch(*this, trait_name);
}

std::optional<std::string> Database::hover_at(FileId file_id, Position position) const
{
  return hover_at_.fetch(*this, {file_id, position});
}

std::optional<DefinitionLocation> Database::definition_at(FileId file_id, Position position) const
{
  return definition_at_.fetch(*this, {file_id, position});
}

std::optional<std::vector<Symbol>> Database::symbols_in(FileId file_id) const
{
  return symbols_in_.fetch(*this, file_id);
}

}  // namespace miniyaml::query
