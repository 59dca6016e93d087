#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "miniyaml/query/database.hpp"
#include "miniyaml/query/storage.hpp"

using miniyaml::ByteIndex;
using miniyaml::FileId;
using miniyaml::Position;
using miniyaml::query::Database;
using miniyaml::query::Event;
using miniyaml::query::EventKind;
using miniyaml::query::QueryKind;

namespace
{

/// Counts recomputations per (query kind, slot).
class ExecutionLog
{
public:
  void attach(Database & db)
  {
    db.set_event_hook([this](const Event & e) {
      if (e.kind == EventKind::WillExecute) {
        ++executed_[{e.key.kind, e.key.key_index}];
      }
    });
  }

  int count(QueryKind kind) const
  {
    int n = 0;
    for (const auto & [key, c] : executed_) {
      if (key.first == kind) {
        n += c;
      }
    }
    return n;
  }

private:
  std::map<std::pair<QueryKind, uint32_t>, int> executed_;
};

}  // namespace

TEST(QueryDatabase, MissingFileGivesNoResult)
{
  Database db;
  const FileId unknown(42);

  EXPECT_EQ(db.file_text(unknown), nullptr);
  EXPECT_EQ(db.file_tokens(unknown), nullptr);
  EXPECT_EQ(db.file_tree(unknown), nullptr);
  EXPECT_FALSE(db.position_to_byte_index(unknown, Position{0, 0}).has_value());
  EXPECT_FALSE(db.hover_at(unknown, Position{0, 0}).has_value());
  EXPECT_FALSE(db.symbols_in(unknown).has_value());
  EXPECT_FALSE(db.file_id_of_file_path("nope.yaml").has_value());
}

TEST(QueryDatabase, TokenAndNodeSpanningOffset)
{
  Database db;
  const FileId id = db.add_file("infantry.yaml", "E1:\n\tTooltip:\n\t\tName: Standard Infantry\n");

  const auto text = db.file_text(id);
  ASSERT_NE(text, nullptr);

  const auto token = db.token_spanning_byte_index(id, ByteIndex(24));
  ASSERT_TRUE(token.has_value());
  EXPECT_EQ(token->slice(*text), "Standard");

  const auto node = db.node_spanning_byte_index(id, ByteIndex(24));
  ASSERT_TRUE(node.has_value());
  EXPECT_EQ(node->key_text(*text), "Name");
}

TEST(QueryDatabase, RepeatedReadsAreMemoized)
{
  Database db;
  const FileId id = db.add_file("a.yaml", "A:\n    B: 1\n");
  ExecutionLog log;
  log.attach(db);

  (void)db.file_tree(id);
  (void)db.file_tree(id);
  (void)db.file_diagnostics(id);

  EXPECT_EQ(log.count(QueryKind::FileTokens), 1);
  EXPECT_EQ(log.count(QueryKind::FileNodes), 1);
  EXPECT_EQ(log.count(QueryKind::FileTree), 1);
}

TEST(QueryDatabase, EditingOneFileLeavesOthersCached)
{
  Database db;
  const FileId a = db.add_file("a.yaml", "A:\n    B: 1\n");
  const FileId b = db.add_file("b.yaml", "C:\n    D: 2\n");

  (void)db.file_tree(a);
  (void)db.file_tree(b);

  ExecutionLog log;
  log.attach(db);
  db.set_file_text(a, "A:\n    B: 1\n    E: 3\n");

  (void)db.file_tree(a);
  (void)db.file_tree(b);

  EXPECT_EQ(log.count(QueryKind::FileTokens), 1);
  EXPECT_EQ(log.count(QueryKind::FileNodes), 1);
  EXPECT_EQ(log.count(QueryKind::FileTree), 1);

  const auto tree_b = db.file_tree(b);
  ASSERT_NE(tree_b, nullptr);
  EXPECT_EQ(tree_b->tree.size(), 3U);
}

TEST(QueryDatabase, EqualRecomputationIsBackdated)
{
  Database db;
  // Same token kinds and spans before and after the edit.
  const FileId id = db.add_file("a.yaml", "A: 1\n");
  (void)db.file_nodes(id);
  (void)db.all_top_level_nodes(id);

  ExecutionLog log;
  log.attach(db);
  db.set_file_text(id, "A: 2\n");

  (void)db.all_top_level_nodes(id);

  EXPECT_EQ(log.count(QueryKind::FileTokens), 1);
  EXPECT_EQ(log.count(QueryKind::FileNodes), 0);
  EXPECT_EQ(log.count(QueryKind::AllTopLevelNodes), 0);
}

TEST(QueryDatabase, UnsetInputIsTrackedUntilSet)
{
  Database db;
  const FileId id(0);
  EXPECT_EQ(db.file_tokens(id), nullptr);

  db.set_file_text(id, "Late:\n");
  const auto tokens = db.file_tokens(id);
  ASSERT_NE(tokens, nullptr);
  EXPECT_FALSE(tokens->tokens.empty());
}

TEST(QueryDatabase, FileIdsAreNeverReused)
{
  Database db;
  const FileId a = db.add_file("a.yaml", "A:\n");
  db.remove_file(a);
  const FileId b = db.add_file("a.yaml", "A:\n");

  EXPECT_NE(a, b);
  EXPECT_EQ(db.file_text(a), nullptr);
  ASSERT_TRUE(db.file_id_of_file_path("a.yaml").has_value());
  EXPECT_EQ(*db.file_id_of_file_path("a.yaml"), b);

  const auto ids = db.all_file_ids();
  ASSERT_NE(ids, nullptr);
  EXPECT_EQ(*ids, (std::vector<FileId>{b}));
}

TEST(QueryDatabase, RemovingAFileDropsItsMemos)
{
  Database db;
  const FileId base = db.add_file("base.yaml", "^Infantry:\n\tHealth:\n");
  const FileId unit = db.add_file("unit.yaml", "E1:\n\tInherits: ^Infantry\n");

  for (uint32_t c = 0; c < 8; ++c) {
    (void)db.hover_at(base, Position{0, c});
  }
  (void)db.symbols_in(base);
  const auto def = db.definition_at(unit, Position{1, 14});
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->file_id, base);
  EXPECT_EQ(db.storage_for(QueryKind::HoverAt).slot_count(), 8U);

  db.remove_file(base);

  EXPECT_EQ(db.storage_for(QueryKind::HoverAt).slot_count(), 0U);
  EXPECT_EQ(db.storage_for(QueryKind::SymbolsIn).slot_count(), 0U);
  EXPECT_EQ(db.storage_for(QueryKind::FileTokens).slot_count(), 1U);
  EXPECT_EQ(db.storage_for(QueryKind::DefinitionAt).slot_count(), 1U);

  // Memos that read the removed file are recomputed, not served stale.
  EXPECT_FALSE(db.definition_at(unit, Position{1, 14}).has_value());
  EXPECT_FALSE(db.hover_at(base, Position{0, 1}).has_value());
  EXPECT_EQ(db.file_tokens(base), nullptr);
}

TEST(QueryDatabase, ApplyEditSplicesInOrder)
{
  Database db;
  const FileId id = db.add_file("a.yaml", "A:\n    B: 1\n");

  std::vector<miniyaml::query::TextEdit> edits;
  edits.push_back({miniyaml::PositionRange{{1, 7}, {1, 8}}, "42"});
  edits.push_back({miniyaml::PositionRange{{2, 0}, {2, 0}}, "    C: x\n"});
  ASSERT_TRUE(db.apply_edit(id, edits));
  EXPECT_EQ(*db.file_text(id), "A:\n    B: 42\n    C: x\n");

  // Whole-document replacement.
  ASSERT_TRUE(db.apply_edit(id, {{std::nullopt, "Z:\n"}}));
  EXPECT_EQ(*db.file_text(id), "Z:\n");
}

TEST(QueryDatabase, ApplyEditRejectsWholeBatchOnBadRange)
{
  Database db;
  const FileId id = db.add_file("a.yaml", "A:\n");
  const auto before = db.runtime().current_revision();

  std::vector<miniyaml::query::TextEdit> edits;
  edits.push_back({miniyaml::PositionRange{{0, 0}, {0, 1}}, "B"});
  edits.push_back({miniyaml::PositionRange{{9, 0}, {9, 1}}, "C"});
  EXPECT_FALSE(db.apply_edit(id, edits));

  EXPECT_EQ(*db.file_text(id), "A:\n");
  EXPECT_EQ(db.runtime().current_revision(), before);

  EXPECT_FALSE(db.apply_edit(FileId(99), {{std::nullopt, "x"}}));
}

TEST(QueryDatabase, ApplyEditCountsUtf16Units)
{
  // "\xC3\xA9" is one BMP scalar, "\xF0\x9F\x98\x80" one astral scalar.
  Database db;
  const FileId id = db.add_file("a.yaml", "A: \xC3\xA9\xF0\x9F\x98\x80" "b\n");

  // UTF-16 columns: e-acute at 3, the emoji at 4..6, "b" at 6.
  ASSERT_TRUE(db.apply_edit(
    id, {{miniyaml::PositionRange{{0, 6}, {0, 7}}, "c"}}, miniyaml::PositionEncoding::Utf16));
  EXPECT_EQ(*db.file_text(id), "A: \xC3\xA9\xF0\x9F\x98\x80" "c\n");

  // Column 5 splits the surrogate pair.
  EXPECT_FALSE(db.apply_edit(
    id, {{miniyaml::PositionRange{{0, 5}, {0, 6}}, "x"}}, miniyaml::PositionEncoding::Utf16));
}

TEST(QueryDatabase, DiagnosticsFollowStageOrder)
{
  Database db;
  const FileId id = db.add_file("a.yaml", "A: x\ry\n: v\n   B:\n");

  const auto diags = db.file_diagnostics(id);
  ASSERT_NE(diags, nullptr);
  ASSERT_GE(diags->size(), 3U);
  EXPECT_EQ((*diags)[0].code, "W0004");
  EXPECT_EQ((*diags)[1].code, "N:E0001");
  EXPECT_EQ((*diags)[2].code, "A:E0002");
}

TEST(QuerySnapshot, IsIsolatedFromLaterEdits)
{
  Database db;
  const FileId id = db.add_file("a.yaml", "A:\n    B: 1\n");
  (void)db.file_tree(id);

  const miniyaml::query::Snapshot snapshot = db.snapshot();
  db.set_file_text(id, "Changed:\n");

  EXPECT_EQ(*snapshot->file_text(id), "A:\n    B: 1\n");
  EXPECT_EQ(*db.file_text(id), "Changed:\n");

  const auto tops = snapshot->all_top_level_nodes(id);
  ASSERT_NE(tops, nullptr);
  ASSERT_EQ(tops->size(), 1U);
  EXPECT_EQ(tops->front().key_text(*snapshot->file_text(id)), "A");
  EXPECT_LT(snapshot.revision(), db.runtime().current_revision());
}

TEST(QuerySnapshot, ReusesMemoizedResults)
{
  Database db;
  const FileId id = db.add_file("a.yaml", "A:\n    B: 1\n");
  (void)db.file_tree(id);

  ExecutionLog log;
  log.attach(db);
  const miniyaml::query::Snapshot snapshot = db.snapshot();
  (void)snapshot->file_tree(id);

  EXPECT_EQ(log.count(QueryKind::FileTree), 0);
  EXPECT_EQ(log.count(QueryKind::FileTokens), 0);
}

TEST(QuerySnapshot, CanBeQueriedFromAnotherThread)
{
  Database db;
  const FileId id = db.add_file("a.yaml", "A:\n    B: 1\n");
  auto snapshot = std::make_shared<miniyaml::query::Snapshot>(db.snapshot());

  std::optional<std::vector<miniyaml::query::Symbol>> symbols;
  std::thread worker([&] { symbols = (*snapshot)->symbols_in(id); });
  db.set_file_text(id, "X:\n");
  worker.join();

  ASSERT_TRUE(symbols.has_value());
  ASSERT_EQ(symbols->size(), 1U);
  EXPECT_EQ(symbols->front().name, "A");
}

// ============================================================================
// Engine
// ============================================================================

namespace
{

/// Two queries that read each other.
class CyclicDb final : public miniyaml::query::QueryContext
{
public:
  CyclicDb()
  : ping_(QueryKind::HoverAt, &CyclicDb::compute_ping),
    pong_(QueryKind::DefinitionAt, &CyclicDb::compute_pong)
  {
  }

  miniyaml::query::Runtime & runtime() const override { return runtime_; }

  miniyaml::query::QueryStorageBase & storage_for(QueryKind kind) const override
  {
    if (kind == QueryKind::HoverAt) {
      return ping_;
    }
    return pong_;
  }

  int ping(int n) const { return ping_.fetch(*this, n); }
  int pong(int n) const { return pong_.fetch(*this, n); }

private:
  static int compute_ping(const CyclicDb & db, const int & n) { return db.pong(n) + 1; }
  static int compute_pong(const CyclicDb & db, const int & n) { return db.ping(n) + 1; }

  mutable miniyaml::query::Runtime runtime_;
  mutable miniyaml::query::DerivedStorage<CyclicDb, int, int> ping_;
  mutable miniyaml::query::DerivedStorage<CyclicDb, int, int> pong_;
};

}  // namespace

TEST(QueryEngine, CyclesRaiseCycleError)
{
  CyclicDb db;
  EXPECT_THROW((void)db.ping(1), miniyaml::query::CycleError);

  // The active stack is unwound, so the runtime is usable afterwards.
  EXPECT_THROW((void)db.pong(2), miniyaml::query::CycleError);
}

TEST(QueryEngine, QueryKindNamesAreStable)
{
  EXPECT_EQ(miniyaml::query::query_kind_name(QueryKind::FileText), "file_text");
  EXPECT_EQ(miniyaml::query::query_kind_name(QueryKind::SymbolsIn), "symbols_in");
  EXPECT_TRUE(miniyaml::query::is_input(QueryKind::TypeData));
  EXPECT_FALSE(miniyaml::query::is_input(QueryKind::FileTree));
}
