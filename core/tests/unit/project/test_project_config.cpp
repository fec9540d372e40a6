// tests/unit/project/test_project_config.cpp - callscope.yaml parsing

#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>

#include "callscope/project/project_config.hpp"
#include "callscope/test_support/program_helpers.hpp"

using namespace callscope;
using test_support::TempDir;

// ============================================================================
// Test: Parsing
// ============================================================================
TEST(ProjectConfig, ParsesFullConfiguration)
{
  const std::string yaml =
    "project:\n"
    "  name: 'shop'\n"
    "  version: '1.2.0'\n"
    "program:\n"
    "  location: './program'\n"
    "analysis:\n"
    "  resolution: signature_aware\n"
    "  max_nodes: 500\n"
    "  max_depth: 12\n"
    "output:\n"
    "  format: json\n"
    "  store: 'results/calls.jsonl'\n"
    "entry_points:\n"
    "  - class: 'com.shop.Checkout'\n"
    "    method: 'pay'\n"
    "  - class: 'com.shop.Cart'\n"
    "    method: 'add'\n";

  const auto result = parse_project_config(yaml, "/work/shop");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & cfg = result.config;
  EXPECT_EQ(cfg.project.name, "shop");
  EXPECT_EQ(cfg.project.version, "1.2.0");
  EXPECT_EQ(cfg.analysis.resolution, ResolutionMode::SignatureAware);
  EXPECT_EQ(cfg.analysis.max_nodes, 500u);
  EXPECT_EQ(cfg.analysis.max_depth, 12u);
  EXPECT_EQ(cfg.output.format, OutputFormat::Json);
  EXPECT_EQ(cfg.resolved_program_location(), std::filesystem::path("/work/shop") / "./program");
  ASSERT_TRUE(cfg.resolved_store().has_value());
  EXPECT_EQ(*cfg.resolved_store(), std::filesystem::path("/work/shop") / "results/calls.jsonl");

  ASSERT_EQ(cfg.entry_points.size(), 2u);
  EXPECT_EQ(cfg.entry_points[0].class_name, "com.shop.Checkout");
  EXPECT_EQ(cfg.entry_points[0].method_name, "pay");
  EXPECT_EQ(cfg.entry_points[1].method_name, "add");
}

TEST(ProjectConfig, DefaultsForOptionalSections)
{
  const auto result = parse_project_config("program:\n  location: /abs/program\n", "/work");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & cfg = result.config;
  EXPECT_EQ(cfg.analysis.resolution, ResolutionMode::NameOnly);
  EXPECT_EQ(cfg.analysis.max_nodes, 0u);
  EXPECT_EQ(cfg.analysis.max_depth, 0u);
  EXPECT_EQ(cfg.output.format, OutputFormat::Text);
  EXPECT_FALSE(cfg.resolved_store().has_value());
  EXPECT_TRUE(cfg.entry_points.empty());
  EXPECT_EQ(cfg.resolved_program_location(), std::filesystem::path("/abs/program"));
}

// ============================================================================
// Test: Validation errors
// ============================================================================
TEST(ProjectConfig, MissingProgramLocation)
{
  const auto result = parse_project_config("project:\n  name: x\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "program.location is required");
}

TEST(ProjectConfig, InvalidResolutionMode)
{
  const auto result = parse_project_config(
    "program:\n  location: p\nanalysis:\n  resolution: fuzzy\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("must be 'name_only' or 'signature_aware'"), std::string::npos);
}

TEST(ProjectConfig, NegativeBudget)
{
  const auto result =
    parse_project_config("program:\n  location: p\nanalysis:\n  max_nodes: -3\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "analysis.max_nodes must not be negative");
}

TEST(ProjectConfig, NonNumericBudget)
{
  const auto result =
    parse_project_config("program:\n  location: p\nanalysis:\n  max_depth: lots\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid configuration value"), std::string::npos);
}

TEST(ProjectConfig, InvalidOutputFormat)
{
  const auto result =
    parse_project_config("program:\n  location: p\noutput:\n  format: xml\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid output.format"), std::string::npos);
}

TEST(ProjectConfig, EntryPointsMustBeAList)
{
  const auto result =
    parse_project_config("program:\n  location: p\nentry_points:\n  class: a.A\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "entry_points must be a list");
}

TEST(ProjectConfig, EntryPointNeedsClassAndMethod)
{
  const auto result =
    parse_project_config("program:\n  location: p\nentry_points:\n  - class: a.A\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(
    result.error, "invalid entry point: entry point must have both 'class' and 'method'");
}

TEST(ProjectConfig, MalformedYaml)
{
  const auto result = parse_project_config("program: [unclosed\n", "/work");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST(ProjectConfig, ParseResolutionMode)
{
  EXPECT_EQ(parse_resolution_mode("name_only"), ResolutionMode::NameOnly);
  EXPECT_EQ(parse_resolution_mode("signature_aware"), ResolutionMode::SignatureAware);
  EXPECT_FALSE(parse_resolution_mode("NameOnly").has_value());
}

// ============================================================================
// Test: Files
// ============================================================================
TEST(ProjectConfig, LoadFromFileUsesItsDirectoryAsRoot)
{
  TempDir dir("config_load");
  const auto path = dir.write(
    k_project_config_file_name,
    "program:\n  location: program\nentry_points:\n  - class: a.A\n    method: main\n");

  const auto result = load_project_config(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.project_root, std::filesystem::absolute(dir.path()));
  EXPECT_EQ(result.config.resolved_program_location(), std::filesystem::absolute(dir.path()) / "program");
}

TEST(ProjectConfig, LoadMissingFile)
{
  TempDir dir("config_missing");
  const auto result = load_project_config(dir.path() / k_project_config_file_name);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesParentDirectories)
{
  TempDir dir("config_find");
  const auto config = dir.write(k_project_config_file_name, "program:\n  location: p\n");
  dir.write("src/deep/nested/file.txt", "x");

  const auto found = find_project_config(dir.path() / "src" / "deep" / "nested");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(std::filesystem::canonical(*found), std::filesystem::canonical(config));

  const auto from_file = find_project_config(dir.path() / "src" / "deep" / "nested" / "file.txt");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(std::filesystem::canonical(*from_file), std::filesystem::canonical(config));
}

TEST(ProjectConfig, LoadDirectoryPathFails)
{
  TempDir dir("config_dir_path");
  std::filesystem::create_directories(dir.path() / k_project_config_file_name);

  ConfigLoadResult result;
  ASSERT_NO_THROW(result = load_project_config(dir.path() / k_project_config_file_name));
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not a file"), std::string::npos);
}

TEST(ProjectConfig, FindFromMissingStartDirectory)
{
  TempDir dir("config_find_missing");
  const auto config = dir.write(k_project_config_file_name, "program:\n  location: p\n");

  std::optional<std::filesystem::path> found;
  ASSERT_NO_THROW(found = find_project_config(dir.path() / "no" / "such" / "dir"));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(std::filesystem::canonical(*found), std::filesystem::canonical(config));
}
