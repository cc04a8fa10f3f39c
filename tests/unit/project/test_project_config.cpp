// tests/unit/project/test_project_config.cpp - pg-sema.yaml loading and schema file discovery
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include "pg_sema/driver/analyzer.hpp"
#include "pg_sema/project/project_config.hpp"

using namespace pg_sema;
namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  explicit TempDir(const std::string & name) : path(fs::temp_directory_path() / name)
  {
    std::error_code ec;
    fs::remove_all(path, ec);
    fs::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  fs::path write(const std::string & rel, const std::string & content) const
  {
    const fs::path p = path / rel;
    fs::create_directories(p.parent_path());
    std::ofstream f(p);
    f << content;
    return p;
  }
};

std::vector<std::string> filenames(const std::vector<fs::path> & files)
{
  std::vector<std::string> out;
  for (const auto & f : files) out.push_back(f.filename().string());
  return out;
}

}  // namespace

// ============================================================================
// Loading
// ============================================================================

TEST(ProjectConfig, LoadFullConfig)
{
  const TempDir dir("pg_sema_config_full");
  const fs::path cfg = dir.write(
    "pg-sema.yaml",
    "package:\n"
    "  name: shop\n"
    "  version: 1.2.0\n"
    "schema:\n"
    "  include:\n"
    "    - schema/tables.sql\n"
    "    - views\n"
    "  exclude_routines: [internal_stats, api.debug]\n"
    "output:\n"
    "  report: build/report.json\n");

  const auto result = load_project_config(cfg);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.package.name, "shop");
  EXPECT_EQ(result.config.package.version, "1.2.0");
  EXPECT_EQ(
    result.config.schema.include, (std::vector<std::string>{"schema/tables.sql", "views"}));
  EXPECT_EQ(
    result.config.schema.exclude_routines,
    (std::vector<std::string>{"internal_stats", "api.debug"}));
  EXPECT_EQ(result.config.output.report, fs::path("build/report.json"));
  EXPECT_EQ(result.config.project_root, fs::absolute(dir.path));
}

TEST(ProjectConfig, ScalarIncludeIsAOneElementList)
{
  const TempDir dir("pg_sema_config_scalar");
  const fs::path cfg = dir.write("pg-sema.yaml", "schema:\n  include: schema.sql\n");

  const auto result = load_project_config(cfg);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.schema.include, std::vector<std::string>{"schema.sql"});
  EXPECT_TRUE(result.config.output.report.empty());
}

TEST(ProjectConfig, LoadErrors)
{
  const TempDir dir("pg_sema_config_errors");

  const auto missing = load_project_config(dir.path / "pg-sema.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("not found"), std::string::npos);

  const auto bad_yaml =
    load_project_config(dir.write("bad.yaml", "schema:\n  include: [a.sql\n"));
  EXPECT_FALSE(bad_yaml.success);
  EXPECT_NE(bad_yaml.error.find("failed to parse YAML"), std::string::npos);

  const auto no_include = load_project_config(dir.write("empty.yaml", "package:\n  name: x\n"));
  EXPECT_FALSE(no_include.success);
  EXPECT_NE(no_include.error.find("schema.include"), std::string::npos);

  const auto nested =
    load_project_config(dir.write("nested.yaml", "schema:\n  include:\n    - {a: 1}\n"));
  EXPECT_FALSE(nested.success);
  EXPECT_NE(nested.error.find("must be strings"), std::string::npos);

  const auto not_map = load_project_config(dir.write("list.yaml", "schema: [a.sql]\n"));
  EXPECT_FALSE(not_map.success);
  EXPECT_NE(not_map.error.find("must be a map"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const TempDir dir("pg_sema_config_find");
  const fs::path cfg = dir.write("pg-sema.yaml", "schema:\n  include: schema\n");
  const fs::path nested = dir.write("schema/deep/tables.sql", "CREATE TABLE t (a int);\n");

  const auto from_dir = find_project_config(nested.parent_path());
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_TRUE(fs::equivalent(*from_dir, cfg));

  const auto from_file = find_project_config(nested);
  ASSERT_TRUE(from_file.has_value());
  EXPECT_TRUE(fs::equivalent(*from_file, cfg));
}

// ============================================================================
// Schema file discovery
// ============================================================================

TEST(ProjectConfig, CollectSchemaFiles)
{
  const TempDir dir("pg_sema_config_collect");
  dir.write("schema/01_tables.sql", "");
  dir.write("schema/02_views.sql", "");
  dir.write("schema/notes.txt", "");
  dir.write("schema/sub/03_funcs.sql", "");
  dir.write("extra/types.pgsql", "");
  dir.write("one.sql", "");

  ProjectConfig config;
  config.project_root = dir.path;
  config.schema.include = {"one.sql", "schema", "extra/**.pgsql", "schema/02_views.sql", "gone"};

  std::vector<std::string> missing;
  const auto files = collect_schema_files(config, missing);

  // Each entry contributes its files in path order; repeats are dropped.
  const std::vector<std::string> expected{
    "one.sql", "01_tables.sql", "02_views.sql", "03_funcs.sql", "types.pgsql"};
  EXPECT_EQ(filenames(files), expected);
  EXPECT_EQ(missing, std::vector<std::string>{"gone"});
}

TEST(ProjectConfig, AnalyzeProject)
{
  const TempDir dir("pg_sema_config_analyze");
  dir.write("schema/01_tables.sql", "CREATE TABLE t (a int NOT NULL);\n");
  dir.write(
    "schema/02_funcs.sql",
    "CREATE FUNCTION total() RETURNS bigint LANGUAGE sql AS $$ SELECT count(*) FROM t $$;\n"
    "CREATE FUNCTION debug() RETURNS int LANGUAGE sql AS $$ SELECT 1 $$;\n");
  const fs::path cfg = dir.write(
    "pg-sema.yaml",
    "schema:\n"
    "  include: schema\n"
    "  exclude_routines: debug\n");

  const auto loaded = load_project_config(cfg);
  ASSERT_TRUE(loaded.success) << loaded.error;

  const AnalysisResult result = Analyzer::analyze_project(loaded.config, AnalyzeOptions{});
  ASSERT_TRUE(result.success);
  EXPECT_NE(result.find(Identifier("", "total")), nullptr);
  EXPECT_EQ(result.find(Identifier("", "debug")), nullptr);
}

TEST(ProjectConfig, AnalyzeProjectReportsUnmatchedEntries)
{
  const TempDir dir("pg_sema_config_unmatched");
  ProjectConfig config;
  config.project_root = dir.path;
  config.schema.include = {"nothing_here"};

  const AnalysisResult result = Analyzer::analyze_project(config, AnalyzeOptions{});
  EXPECT_FALSE(result.success);
  const auto & all = result.diagnostics.all();
  EXPECT_TRUE(std::any_of(all.begin(), all.end(), [](const Diagnostic & d) {
    return d.message.find("matched no files: nothing_here") != std::string::npos;
  }));
}
