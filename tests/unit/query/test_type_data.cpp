#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "miniyaml/query/type_data.hpp"

namespace fs = std::filesystem;

using miniyaml::query::TraitPropertyKind;

namespace
{

constexpr const char * k_sample = R"json([
  {
    "Name": "Tooltip",
    "Namespace": "OpenRA.Mods.Common.Traits",
    "DefiningAssemblyName": "OpenRA.Mods.Common",
    "IsConditional": true,
    "RequiredTraits": [{ "Namespace": "OpenRA.Traits", "Name": "IOccupySpace" }],
    "Properties": [
      {
        "Kind": "Single",
        "TypeName": "System.String",
        "HumanFriendlyTypeName": "String",
        "Name": "Name",
        "DocLines": ["An optional name."],
        "DefaultValue": ""
      },
      {
        "Kind": "Choice",
        "TypeName": "OpenRA.Stance",
        "HumanFriendlyTypeName": "Stance",
        "Name": "Stance",
        "ValidValues": ["Ally", "Enemy"]
      }
    ],
    "DocLines": ["Shown in the build palette."]
  },
  {
    "Name": "Health",
    "Namespace": "OpenRA.Mods.Common.Traits",
    "DefiningAssemblyName": "OpenRA.Mods.Common",
    "IsConditional": false,
    "RequiredTraits": [],
    "Properties": []
  }
])json";

class TempDir
{
public:
  TempDir()
  {
    path_ = fs::temp_directory_path() /
            ("miniyaml_type_data_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    fs::create_directories(path_);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  [[nodiscard]] const fs::path & path() const { return path_; }

private:
  fs::path path_;
};

}  // namespace

TEST(QueryTypeData, ParsesTraitsAndProperties)
{
  const auto result = miniyaml::query::parse_type_data(k_sample);
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.data->size(), 2U);

  const auto & tooltip = (*result.data)[0];
  EXPECT_EQ(tooltip.name, "Tooltip");
  EXPECT_TRUE(tooltip.is_conditional);
  ASSERT_EQ(tooltip.required_traits.size(), 1U);
  EXPECT_EQ(tooltip.required_traits[0].name, "IOccupySpace");
  ASSERT_EQ(tooltip.properties.size(), 2U);
  EXPECT_EQ(tooltip.properties[0].kind, TraitPropertyKind::Single);
  ASSERT_TRUE(tooltip.properties[0].default_value.has_value());
  EXPECT_EQ(*tooltip.properties[0].default_value, "");
  EXPECT_EQ(tooltip.properties[1].kind, TraitPropertyKind::Choice);
  ASSERT_TRUE(tooltip.properties[1].valid_values.has_value());
  EXPECT_EQ(tooltip.properties[1].valid_values->size(), 2U);
  ASSERT_TRUE(tooltip.doc_lines.has_value());
  EXPECT_EQ(tooltip.doc_lines->front(), "Shown in the build palette.");

  const auto & health = (*result.data)[1];
  EXPECT_FALSE(health.doc_lines.has_value());
  EXPECT_TRUE(health.properties.empty());
}

TEST(QueryTypeData, ReportsMalformedInput)
{
  const auto not_json = miniyaml::query::parse_type_data("{ nope");
  EXPECT_FALSE(not_json.success);
  EXPECT_NE(not_json.error.find("failed to parse JSON"), std::string::npos);

  const auto not_array = miniyaml::query::parse_type_data(R"({"Name": "X"})");
  EXPECT_FALSE(not_array.success);
  EXPECT_EQ(not_array.error, "type data must be a JSON array");

  const auto missing_field = miniyaml::query::parse_type_data(R"([{"Name": "X"}])");
  EXPECT_FALSE(missing_field.success);
  EXPECT_NE(missing_field.error.find("invalid trait at index 0"), std::string::npos);

  const auto bad_kind = miniyaml::query::parse_type_data(R"([{
    "Name": "X", "Namespace": "N", "DefiningAssemblyName": "A", "IsConditional": false,
    "RequiredTraits": [],
    "Properties": [{"Kind": "Weird", "TypeName": "T", "HumanFriendlyTypeName": "T", "Name": "P"}]
  }])");
  EXPECT_FALSE(bad_kind.success);
  EXPECT_NE(bad_kind.error.find("unknown property kind 'Weird'"), std::string::npos);
}

TEST(QueryTypeData, LoadsFromWorkspaceFile)
{
  TempDir dir;
  const fs::path file = miniyaml::query::default_type_data_path(dir.path());
  EXPECT_EQ(file, dir.path() / ".oraide" / "type-data.json");

  const auto missing = miniyaml::query::load_type_data(file);
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("type data file not found"), std::string::npos);

  fs::create_directories(file.parent_path());
  {
    std::ofstream out(file);
    out << k_sample;
  }
  const auto loaded = miniyaml::query::load_type_data(file);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.data->size(), 2U);
}

TEST(QueryTypeData, PropertyKindNames)
{
  EXPECT_EQ(miniyaml::query::to_string(TraitPropertyKind::Multi), "Multi");
  EXPECT_EQ(miniyaml::query::to_string(TraitPropertyKind::Map), "Map");
}
