#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "miniyaml/project/server_config.hpp"

namespace fs = std::filesystem;

namespace
{

class ServerConfigTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    root_ = fs::temp_directory_path() /
            ("miniyaml_config_" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
    fs::create_directories(root_);
  }

  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path write_config(const fs::path & dir, const std::string & content)
  {
    fs::create_directories(dir);
    const fs::path path = dir / miniyaml::k_server_config_file_name;
    std::ofstream out(path);
    out << content;
    return path;
  }

  fs::path root_;
};

}  // namespace

TEST_F(ServerConfigTest, EmptyFileUsesDefaults)
{
  const auto path = write_config(root_, "");
  const auto result = miniyaml::load_server_config(path);
  ASSERT_TRUE(result.success) << result.error;

  const auto & cfg = result.config;
  EXPECT_EQ(cfg.server.request_timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(cfg.server.max_similar_concurrent_work, 2U);
  EXPECT_GE(cfg.server.max_concurrent_work, 1U);
  EXPECT_EQ(cfg.server.log_level, spdlog::level::warn);
  EXPECT_EQ(cfg.type_data_path(), fs::absolute(root_) / ".oraide" / "type-data.json");
}

TEST_F(ServerConfigTest, ReadsServerAndTypeDataSections)
{
  const auto path = write_config(
    root_,
    "server:\n"
    "  request_timeout_ms: 250\n"
    "  max_similar_concurrent_work: 3\n"
    "  max_concurrent_work: 8\n"
    "  log_level: debug\n"
    "type_data:\n"
    "  path: data/traits.json\n");

  const auto result = miniyaml::load_server_config(path);
  ASSERT_TRUE(result.success) << result.error;

  const auto & cfg = result.config;
  EXPECT_EQ(cfg.server.request_timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(cfg.server.max_similar_concurrent_work, 3U);
  EXPECT_EQ(cfg.server.max_concurrent_work, 8U);
  EXPECT_EQ(cfg.server.log_level, spdlog::level::debug);
  EXPECT_EQ(cfg.type_data_path(), fs::absolute(root_) / "data" / "traits.json");
}

TEST_F(ServerConfigTest, RejectsNonPositiveLimits)
{
  const auto zero = miniyaml::load_server_config(
    write_config(root_ / "zero", "server:\n  max_concurrent_work: 0\n"));
  EXPECT_FALSE(zero.success);
  EXPECT_EQ(zero.error, "server.max_concurrent_work must be positive (got 0)");

  const auto text = miniyaml::load_server_config(
    write_config(root_ / "text", "server:\n  request_timeout_ms: soon\n"));
  EXPECT_FALSE(text.success);
  EXPECT_EQ(text.error, "server.request_timeout_ms must be an integer");
}

TEST_F(ServerConfigTest, RejectsUnknownLogLevel)
{
  const auto result =
    miniyaml::load_server_config(write_config(root_, "server:\n  log_level: loud\n"));
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid server.log_level: 'loud'"), std::string::npos);
}

TEST_F(ServerConfigTest, RejectsMalformedStructure)
{
  EXPECT_FALSE(miniyaml::load_server_config(write_config(root_ / "list", "- a\n- b\n")).success);
  EXPECT_FALSE(
    miniyaml::load_server_config(write_config(root_ / "server", "server: 3\n")).success);
  EXPECT_FALSE(miniyaml::load_server_config(root_ / "missing" / "miniyaml.yaml").success);
}

TEST_F(ServerConfigTest, FindsConfigInParentDirectory)
{
  const auto path = write_config(root_, "server:\n  max_concurrent_work: 2\n");
  const fs::path nested = root_ / "mods" / "ra" / "rules";
  fs::create_directories(nested);

  const auto found = miniyaml::find_server_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(path));

  const auto resolved = miniyaml::resolve_server_config(nested);
  ASSERT_TRUE(resolved.success) << resolved.error;
  EXPECT_EQ(resolved.config.server.max_concurrent_work, 2U);
  EXPECT_EQ(fs::canonical(resolved.config.config_root), fs::canonical(root_));
}

TEST_F(ServerConfigTest, ResolveWithoutFileRootsDefaultsAtWorkspace)
{
  const auto resolved = miniyaml::resolve_server_config(root_);
  ASSERT_TRUE(resolved.success) << resolved.error;
  if (miniyaml::find_server_config(root_)) {
    GTEST_SKIP() << "a miniyaml.yaml exists above the temp directory";
  }
  EXPECT_EQ(resolved.config.config_root, fs::absolute(root_));
  EXPECT_EQ(resolved.config.type_data_path(), fs::absolute(root_) / ".oraide" / "type-data.json");
}

TEST(ServerConfigLogLevel, ParsesKnownNames)
{
  EXPECT_EQ(miniyaml::parse_log_level("trace"), spdlog::level::trace);
  EXPECT_EQ(miniyaml::parse_log_level("error"), spdlog::level::err);
  EXPECT_EQ(miniyaml::parse_log_level("off"), spdlog::level::off);
  EXPECT_FALSE(miniyaml::parse_log_level("WARN").has_value());
  EXPECT_FALSE(miniyaml::parse_log_level("").has_value());
}
