#include "miniyaml/query/type_data.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace miniyaml::query
{

namespace
{

std::optional<std::vector<std::string>> optional_string_list(const json & obj, const char * key)
{
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::vector<std::string>>();
}

TraitPropertyKind parse_property_kind(const std::string & text)
{
  if (text == "Single") return TraitPropertyKind::Single;
  if (text == "Multi") return TraitPropertyKind::Multi;
  if (text == "Choice") return TraitPropertyKind::Choice;
  if (text == "Map") return TraitPropertyKind::Map;
  throw std::invalid_argument("unknown property kind '" + text + "'");
}

TraitProperty parse_property(const json & obj)
{
  TraitProperty prop;
  prop.kind = parse_property_kind(obj.at("Kind").get<std::string>());
  prop.type_name = obj.at("TypeName").get<std::string>();
  prop.human_friendly_type_name = obj.at("HumanFriendlyTypeName").get<std::string>();
  prop.name = obj.at("Name").get<std::string>();
  prop.doc_lines = optional_string_list(obj, "DocLines");
  if (const auto it = obj.find("DefaultValue"); it != obj.end() && !it->is_null()) {
    prop.default_value = it->get<std::string>();
  }
  prop.valid_values = optional_string_list(obj, "ValidValues");
  return prop;
}

TraitDetail parse_trait(const json & obj)
{
  TraitDetail detail;
  detail.namespace_name = obj.at("Namespace").get<std::string>();
  detail.name = obj.at("Name").get<std::string>();
  detail.defining_assembly_name = obj.at("DefiningAssemblyName").get<std::string>();
  detail.is_conditional = obj.at("IsConditional").get<bool>();

  for (const auto & req : obj.at("RequiredTraits")) {
    detail.required_traits.push_back(
      NamespacedType{req.at("Namespace").get<std::string>(), req.at("Name").get<std::string>()});
  }
  for (const auto & prop : obj.at("Properties")) {
    detail.properties.push_back(parse_property(prop));
  }

  detail.doc_lines = optional_string_list(obj, "DocLines");
  return detail;
}

}  // namespace

TypeDataLoadResult parse_type_data(std::string_view json_text)
{
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error & e) {
    return TypeDataLoadResult::fail("failed to parse JSON: " + std::string(e.what()));
  }

  if (!root.is_array()) {
    return TypeDataLoadResult::fail("type data must be a JSON array");
  }

  TypeData entries;
  entries.reserve(root.size());
  for (size_t i = 0; i < root.size(); ++i) {
    try {
      entries.push_back(parse_trait(root[i]));
    } catch (const json::exception & e) {
      return TypeDataLoadResult::fail(
        "invalid trait at index " + std::to_string(i) + ": " + std::string(e.what()));
    } catch (const std::invalid_argument & e) {
      return TypeDataLoadResult::fail(
        "invalid trait at index " + std::to_string(i) + ": " + std::string(e.what()));
    }
  }

  return TypeDataLoadResult::ok(std::move(entries));
}

TypeDataLoadResult load_type_data(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return TypeDataLoadResult::fail("type data file not found: " + path.string());
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return parse_type_data(buf.str());
}

std::filesystem::path default_type_data_path(const std::filesystem::path & workspace_root)
{
  return workspace_root / ".oraide" / "type-data.json";
}

std::string_view to_string(TraitPropertyKind kind) noexcept
{
  switch (kind) {
    case TraitPropertyKind::Single:
      return "Single";
    case TraitPropertyKind::Multi:
      return "Multi";
    case TraitPropertyKind::Choice:
      return "Choice";
    case TraitPropertyKind::Map:
      return "Map";
  }
  return "Single";
}

}  // namespace miniyaml::query
