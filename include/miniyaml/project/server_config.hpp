// miniyaml/project/server_config.hpp - Language server configuration (miniyaml.yaml)
//
// Parses and validates the optional miniyaml.yaml found in (or above) the
// workspace root. Shared by the language server and the CLI.
//
#pragma once

#include <spdlog/common.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>

namespace miniyaml
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct ServerSettings
{
  /// Requests that waited longer than this before starting yield a fallback
  std::chrono::milliseconds request_timeout{1500};

  /// Jobs of one kind that may be in flight at once
  size_t max_similar_concurrent_work = 2;

  /// Jobs that may be in flight at once
  size_t max_concurrent_work = std::max(1U, std::thread::hardware_concurrency());

  spdlog::level::level_enum log_level = spdlog::level::warn;
};

struct TypeDataSettings
{
  /// Resolved against `config_root`
  std::filesystem::path path = std::filesystem::path(".oraide") / "type-data.json";
};

/**
 * Complete server configuration (miniyaml.yaml).
 */
struct ServerConfig
{
  ServerSettings server;
  TypeDataSettings type_data;

  /// Directory containing miniyaml.yaml, or the workspace root for defaults
  std::filesystem::path config_root;

  /// Absolute path of the type-data file.
  [[nodiscard]] std::filesystem::path type_data_path() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ServerConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ServerConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a server configuration from a miniyaml.yaml file.
 *
 * @param config_path Path to miniyaml.yaml
 * @return ConfigLoadResult with the loaded config or an error naming the key
 */
[[nodiscard]] ConfigLoadResult load_server_config(const std::filesystem::path & config_path);

/**
 * Find miniyaml.yaml by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to miniyaml.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_server_config(
  const std::filesystem::path & start_dir);

/// Configuration for a workspace: the nearest miniyaml.yaml, or defaults
/// rooted at `workspace_root` when there is none.
[[nodiscard]] ConfigLoadResult resolve_server_config(const std::filesystem::path & workspace_root);

/// `trace|debug|info|warn|error|critical|off`
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string & text);

inline constexpr const char * k_server_config_file_name = "miniyaml.yaml";

}  // namespace miniyaml
