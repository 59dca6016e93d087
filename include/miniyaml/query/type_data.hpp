// miniyaml/query/type_data.hpp - Trait documentation loaded from type-data.json
//
// The type-data file is a JSON array produced by the game's tooling. Each
// entry describes one trait: its namespace, required traits, properties and
// documentation lines. Hover reads the documentation lines by trait name.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace miniyaml::query
{

enum class TraitPropertyKind {
  Single,
  Multi,
  Choice,
  Map,
};

struct NamespacedType
{
  std::string namespace_name;
  std::string name;

  bool operator==(const NamespacedType & other) const
  {
    return namespace_name == other.namespace_name && name == other.name;
  }
};

struct TraitProperty
{
  TraitPropertyKind kind = TraitPropertyKind::Single;
  std::string type_name;
  std::string human_friendly_type_name;
  std::string name;

  std::optional<std::vector<std::string>> doc_lines;
  std::optional<std::string> default_value;
  std::optional<std::vector<std::string>> valid_values;

  bool operator==(const TraitProperty & other) const
  {
    return kind == other.kind && type_name == other.type_name &&
           human_friendly_type_name == other.human_friendly_type_name && name == other.name &&
           doc_lines == other.doc_lines && default_value == other.default_value &&
           valid_values == other.valid_values;
  }
};

struct TraitDetail
{
  std::string namespace_name;
  std::string name;
  std::string defining_assembly_name;
  bool is_conditional = false;
  std::vector<NamespacedType> required_traits;
  std::vector<TraitProperty> properties;
  std::optional<std::vector<std::string>> doc_lines;

  bool operator==(const TraitDetail & other) const
  {
    return namespace_name == other.namespace_name && name == other.name &&
           defining_assembly_name == other.defining_assembly_name &&
           is_conditional == other.is_conditional && required_traits == other.required_traits &&
           properties == other.properties && doc_lines == other.doc_lines;
  }
};

using TypeData = std::vector<TraitDetail>;

/**
 * Result of loading a type-data file.
 */
struct TypeDataLoadResult
{
  /// Loaded entries (only valid if success == true)
  std::shared_ptr<const TypeData> data;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static TypeDataLoadResult ok(TypeData entries)
  {
    TypeDataLoadResult r;
    r.data = std::make_shared<const TypeData>(std::move(entries));
    r.success = true;
    return r;
  }

  static TypeDataLoadResult fail(std::string msg)
  {
    TypeDataLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

/// Parse type data from JSON text.
[[nodiscard]] TypeDataLoadResult parse_type_data(std::string_view json_text);

/// Read and parse a type-data file.
[[nodiscard]] TypeDataLoadResult load_type_data(const std::filesystem::path & path);

/// `<workspace_root>/.oraide/type-data.json`
[[nodiscard]] std::filesystem::path default_type_data_path(
  const std::filesystem::path & workspace_root);

[[nodiscard]] std::string_view to_string(TraitPropertyKind kind) noexcept;

}  // namespace miniyaml::query
