// miniyaml/project/server_config.cpp - Server configuration implementation
//
#include "miniyaml/project/server_config.hpp"

#include <yaml-cpp/yaml.h>

namespace miniyaml
{

namespace
{

/// Read a strictly positive integer at `section.key`.
std::optional<long long> positive_int(
  const YAML::Node & node, const std::string & qualified_key, std::string & error)
{
  long long value = 0;
  try {
    value = node.as<long long>();
  } catch (const YAML::Exception &) {
    error = qualified_key + " must be an integer";
    return std::nullopt;
  }
  if (value <= 0) {
    error = qualified_key + " must be positive (got " + std::to_string(value) + ")";
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::filesystem::path ServerConfig::type_data_path() const
{
  if (type_data.path.is_absolute()) {
    return type_data.path;
  }
  return config_root / type_data.path;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string & text)
{
  if (text == "trace") return spdlog::level::trace;
  if (text == "debug") return spdlog::level::debug;
  if (text == "info") return spdlog::level::info;
  if (text == "warn") return spdlog::level::warn;
  if (text == "error") return spdlog::level::err;
  if (text == "critical") return spdlog::level::critical;
  if (text == "off") return spdlog::level::off;
  return std::nullopt;
}

ConfigLoadResult load_server_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ServerConfig config;
  config.config_root = fs::absolute(config_path).parent_path();

  // An empty file is a valid, all-defaults configuration.
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of miniyaml.yaml must be a map");
  }

  // Parse 'server' section
  if (const auto server = root["server"]) {
    if (!server.IsMap()) {
      return ConfigLoadResult::fail("server must be a map");
    }

    std::string error;
    if (server["request_timeout_ms"]) {
      const auto v = positive_int(server["request_timeout_ms"], "server.request_timeout_ms", error);
      if (!v) {
        return ConfigLoadResult::fail(error);
      }
      config.server.request_timeout = std::chrono::milliseconds(*v);
    }

    if (server["max_similar_concurrent_work"]) {
      const auto v = positive_int(
        server["max_similar_concurrent_work"], "server.max_similar_concurrent_work", error);
      if (!v) {
        return ConfigLoadResult::fail(error);
      }
      config.server.max_similar_concurrent_work = static_cast<size_t>(*v);
    }

    if (server["max_concurrent_work"]) {
      const auto v =
        positive_int(server["max_concurrent_work"], "server.max_concurrent_work", error);
      if (!v) {
        return ConfigLoadResult::fail(error);
      }
      config.server.max_concurrent_work = static_cast<size_t>(*v);
    }

    if (const auto node = server["log_level"]) {
      if (!node.IsScalar()) {
        return ConfigLoadResult::fail("server.log_level must be a string");
      }
      const auto text = node.as<std::string>();
      const auto level = parse_log_level(text);
      if (!level) {
        return ConfigLoadResult::fail(
          "invalid server.log_level: '" + text +
          "' (must be one of trace, debug, info, warn, error, critical, off)");
      }
      config.server.log_level = *level;
    }
  }

  // Parse 'type_data' section
  if (const auto type_data = root["type_data"]) {
    if (!type_data.IsMap()) {
      return ConfigLoadResult::fail("type_data must be a map");
    }
    if (const auto path = type_data["path"]) {
      if (!path.IsScalar()) {
        return ConfigLoadResult::fail("type_data.path must be a string");
      }
      config.type_data.path = path.as<std::string>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_server_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_server_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

ConfigLoadResult resolve_server_config(const std::filesystem::path & workspace_root)
{
  if (const auto found = find_server_config(workspace_root)) {
    return load_server_config(*found);
  }

  ServerConfig config;
  config.config_root = std::filesystem::absolute(workspace_root);
  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace miniyaml
