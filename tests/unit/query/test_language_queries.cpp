#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "miniyaml/query/database.hpp"
#include "miniyaml/query/type_data.hpp"

using miniyaml::FileId;
using miniyaml::Position;
using miniyaml::PositionRange;
using miniyaml::query::Database;
using miniyaml::query::Symbol;
using miniyaml::query::TraitDetail;
using miniyaml::query::TypeData;

namespace
{

TraitDetail trait(std::string name, std::vector<std::string> doc_lines)
{
  TraitDetail t;
  t.namespace_name = "OpenRA.Mods.Common.Traits";
  t.name = std::move(name);
  t.defining_assembly_name = "OpenRA.Mods.Common";
  t.doc_lines = std::move(doc_lines);
  return t;
}

std::shared_ptr<const TypeData> sample_type_data()
{
  TypeData data;
  data.push_back(trait("Tooltip", {"Shown in the build palette.", "Supports multiple lines."}));
  data.push_back(trait("Health", {"How much damage this actor can take."}));
  return std::make_shared<const TypeData>(std::move(data));
}

}  // namespace

// ============================================================================
// Hover
// ============================================================================

TEST(QueryHover, ShowsTraitDocumentation)
{
  Database db;
  db.set_type_data(sample_type_data());
  const FileId id = db.add_file("rules.yaml", "E1:\n\tTooltip:\n\t\tName: Rifle\n");

  const auto hover = db.hover_at(id, Position{1, 3});
  ASSERT_TRUE(hover.has_value());
  EXPECT_EQ(*hover, "Shown in the build palette.\nSupports multiple lines.");
}

TEST(QueryHover, NothingForUnknownTraitsOrWhitespace)
{
  Database db;
  db.set_type_data(sample_type_data());
  const FileId id = db.add_file("rules.yaml", "E1:\n\tMobile:  x\n");

  EXPECT_FALSE(db.hover_at(id, Position{1, 2}).has_value());  // unknown trait
  EXPECT_FALSE(db.hover_at(id, Position{1, 8}).has_value());  // whitespace
  EXPECT_FALSE(db.hover_at(id, Position{7, 0}).has_value());  // no such line
}

TEST(QueryHover, FollowsTypeDataChanges)
{
  Database db;
  const FileId id = db.add_file("rules.yaml", "Health:\n");
  EXPECT_FALSE(db.hover_at(id, Position{0, 1}).has_value());

  db.set_type_data(sample_type_data());
  const auto hover = db.hover_at(id, Position{0, 1});
  ASSERT_TRUE(hover.has_value());
  EXPECT_EQ(*hover, "How much damage this actor can take.");
}

// ============================================================================
// Definition
// ============================================================================

TEST(QueryDefinition, FindsTopLevelKeyInAnotherFile)
{
  Database db;
  const FileId defs = db.add_file("defaults.yaml", "# base units\n^Infantry:\n\tHealth:\n");
  const FileId rules = db.add_file("rules.yaml", "E1:\n\tInherits: ^Infantry\n");

  // Cursor on "Infantry", right after the caret.
  const auto def = db.definition_at(rules, Position{1, 14});
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->file_id, defs);
  EXPECT_EQ(def->start, (Position{1, 0}));
  EXPECT_EQ(def->end_exclusive, (Position{1, 9}));
}

TEST(QueryDefinition, FirstFileWins)
{
  Database db;
  const FileId first = db.add_file("a.yaml", "Shared:\n");
  (void)db.add_file("b.yaml", "Shared:\n");
  const FileId user = db.add_file("c.yaml", "X:\n\tUses: Shared\n");

  const auto def = db.definition_at(user, Position{1, 8});
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->file_id, first);
}

TEST(QueryDefinition, NothingForUnknownNames)
{
  Database db;
  const FileId id = db.add_file("a.yaml", "A:\n\tB: Missing\n");
  EXPECT_FALSE(db.definition_at(id, Position{1, 6}).has_value());
}

TEST(QueryDefinition, NestedKeysAreNotDefinitions)
{
  Database db;
  (void)db.add_file("a.yaml", "A:\n\tInner:\n");
  const FileId user = db.add_file("b.yaml", "B: Inner\n");
  EXPECT_FALSE(db.definition_at(user, Position{0, 4}).has_value());
}

// ============================================================================
// Symbols
// ============================================================================

TEST(QuerySymbols, NestedSymbolsWithDetailAndRange)
{
  Database db;
  const FileId id = db.add_file("rules.yaml", "E1:\n\tTooltip:\n\t\tName: Rifle  \n\tHealth:\n# done\n");

  const auto symbols = db.symbols_in(id);
  ASSERT_TRUE(symbols.has_value());
  ASSERT_EQ(symbols->size(), 1U);

  const Symbol & e1 = symbols->front();
  EXPECT_EQ(e1.name, "E1");
  EXPECT_FALSE(e1.detail.has_value());
  EXPECT_EQ(e1.range, (PositionRange{{0, 0}, {0, 3}}));
  ASSERT_TRUE(e1.children.has_value());
  ASSERT_EQ(e1.children->size(), 2U);

  const Symbol & tooltip = (*e1.children)[0];
  EXPECT_EQ(tooltip.name, "Tooltip");
  ASSERT_TRUE(tooltip.children.has_value());
  const Symbol & name = tooltip.children->front();
  EXPECT_EQ(name.name, "Name");
  ASSERT_TRUE(name.detail.has_value());
  EXPECT_EQ(*name.detail, "Rifle");
  EXPECT_EQ(name.range.start, (Position{2, 2}));
  EXPECT_FALSE(name.children.has_value());

  const Symbol & health = (*e1.children)[1];
  EXPECT_EQ(health.name, "Health");
  EXPECT_FALSE(health.children.has_value());
}

TEST(QuerySymbols, EmptyFileHasNoSymbols)
{
  Database db;
  const FileId id = db.add_file("empty.yaml", "");
  const auto symbols = db.symbols_in(id);
  ASSERT_TRUE(symbols.has_value());
  EXPECT_TRUE(symbols->empty());
}

TEST(QueryTopLevel, NodesAcrossAllFiles)
{
  Database db;
  const FileId a = db.add_file("a.yaml", "A:\n\tX:\nB:\n");
  const FileId b = db.add_file("b.yaml", "# comment\nC:\n");

  const auto all = db.top_level_nodes_in_all_files();
  ASSERT_NE(all, nullptr);
  ASSERT_EQ(all->size(), 3U);
  EXPECT_EQ((*all)[0].file_id, a);
  EXPECT_EQ((*all)[1].file_id, a);
  EXPECT_EQ((*all)[2].file_id, b);

  const auto c = db.top_level_node_by_key(b, "C");
  ASSERT_TRUE(c.has_value());
  EXPECT_FALSE(db.top_level_node_by_key(a, "X").has_value());
}
