// tests/unit/driver/test_analyzer.cpp - End-to-end analysis pipeline
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

#include "pg_sema/basic/diagnostic_codes.hpp"
#include "pg_sema/catalog/builtin_types.hpp"
#include "pg_sema/driver/analyzer.hpp"

using namespace pg_sema;

namespace
{

AnalysisResult analyze(const std::string & sql, const AnalyzeOptions & options = {})
{
  std::vector<SourceInput> sources;
  sources.push_back(SourceInput{"schema.sql", sql});
  return Analyzer::analyze_sources(std::move(sources), options);
}

std::vector<std::string> names(const std::vector<const SchemaObject *> & objects)
{
  std::vector<std::string> out;
  for (const SchemaObject * obj : objects) out.push_back(obj->id().name);
  return out;
}

std::vector<std::string> result_names(const AnalysisResult & result)
{
  std::vector<std::string> out;
  for (const auto & r : result.objects) out.push_back(r.object->id().name);
  return out;
}

bool contains(const std::vector<std::string> & v, const std::string & s)
{
  return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

// ============================================================================
// Pipeline
// ============================================================================

TEST(Analyzer, AnalysesEveryObjectInDependencyOrder)
{
  auto result = analyze(
    "CREATE VIEW active AS SELECT id, name FROM users WHERE name IS NOT NULL;\n"
    "CREATE TABLE users (id int PRIMARY KEY, name text);\n"
    "CREATE TYPE mood AS ENUM ('ok', 'sad');\n"
    "CREATE FUNCTION user_count() RETURNS bigint LANGUAGE sql\n"
    "AS $$ SELECT count(*) FROM users $$;");

  ASSERT_TRUE(result.success);
  EXPECT_FALSE(result.cancelled);
  EXPECT_TRUE(result.failed.empty());
  ASSERT_EQ(result.objects.size(), 4U);

  const auto order = result_names(result);
  const auto users = std::find(order.begin(), order.end(), "users");
  const auto active = std::find(order.begin(), order.end(), "active");
  ASSERT_NE(users, order.end());
  ASSERT_NE(active, order.end());
  EXPECT_LT(users, active);

  const ObjectResult * view = result.find(Identifier("", "active"));
  ASSERT_NE(view, nullptr);
  ASSERT_EQ(view->fields.size(), 2U);
  EXPECT_EQ(view->fields[0].type_oid, oid::k_int4);
  EXPECT_FALSE(view->fields[0].nullable);

  const ObjectResult * mood = result.find(Identifier("public", "mood"));
  ASSERT_NE(mood, nullptr);
  EXPECT_TRUE(mood->fields.empty());

  EXPECT_EQ(result.find(Identifier("", "missing")), nullptr);
}

TEST(Analyzer, SyntaxErrorStopsTheRun)
{
  auto result = analyze("CREATE TABLE t (a int;\nCREATE VIEW v AS SELECT 1;");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_syntax_error));
  EXPECT_TRUE(result.objects.empty());
  EXPECT_EQ(result.metadata, nullptr);
}

TEST(Analyzer, DuplicateObjectStopsTheRun)
{
  auto result = analyze("CREATE TABLE t (a int);\nCREATE TABLE t (b int);");
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_duplicate_object));
  EXPECT_TRUE(result.order.empty());
  EXPECT_EQ(result.metadata, nullptr);
}

TEST(Analyzer, UnhandledStatementsOnlyWarn)
{
  auto result = analyze(
    "CREATE TABLE t (a int);\n"
    "GRANT SELECT ON t TO reader;");
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.has_warnings());
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_unhandled_statement));
  EXPECT_EQ(result.objects.size(), 1U);
}

// ============================================================================
// Failure isolation
// ============================================================================

TEST(Analyzer, FailingObjectDoesNotStopOthers)
{
  auto result = analyze(
    "CREATE TABLE t (a int);\n"
    "CREATE VIEW broken AS SELECT nope FROM t;\n"
    "CREATE VIEW fine AS SELECT a FROM t;");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(names(result.failed), std::vector<std::string>{"broken"});
  EXPECT_TRUE(result.is_failed(result.catalog->resolve_type(Identifier("", "broken"))));
  EXPECT_NE(result.find(Identifier("", "fine")), nullptr);
  EXPECT_EQ(result.find(Identifier("", "broken")), nullptr);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_unknown_column));
}

TEST(Analyzer, DependentsOfAFailedObjectFail)
{
  auto result = analyze(
    "CREATE TABLE bad (x no_such_type);\n"
    "CREATE VIEW over_bad AS SELECT x FROM bad;");

  const auto failed = names(result.failed);
  EXPECT_TRUE(contains(failed, "bad"));
  EXPECT_TRUE(contains(failed, "over_bad"));
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_unknown_type));
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_relation_not_found));
}

TEST(Analyzer, ViewOverASetOperationChecksEveryArm)
{
  auto result = analyze(
    "CREATE TABLE t (id int);\n"
    "CREATE VIEW v AS SELECT id FROM t UNION SELECT id FROM gone;");

  EXPECT_FALSE(result.success);
  EXPECT_EQ(names(result.failed), std::vector<std::string>{"v"});
  EXPECT_EQ(result.find(Identifier("", "v")), nullptr);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_relation_not_found));
}

TEST(Analyzer, DiagnosticsNameTheirObject)
{
  auto result = analyze(
    "CREATE TABLE t (a int);\n"
    "CREATE VIEW v AS SELECT b FROM t;");

  ASSERT_FALSE(result.diagnostics.empty());
  const auto errors = result.diagnostics.errors();
  ASSERT_EQ(errors.size(), 1U);
  ASSERT_TRUE(errors[0].object.has_value());
  EXPECT_EQ(*errors[0].object, "public.v");
}

TEST(Analyzer, CycleMembersAreFailedAndNotAnalysed)
{
  auto result = analyze(
    "CREATE VIEW a AS SELECT * FROM b;\n"
    "CREATE VIEW b AS SELECT * FROM a;\n"
    "CREATE TABLE t (x int);");

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_dependency_cycle));
  ASSERT_EQ(result.cycles.size(), 1U);
  EXPECT_EQ(result.cycles[0].size(), 2U);

  const auto failed = names(result.failed);
  EXPECT_TRUE(contains(failed, "a"));
  EXPECT_TRUE(contains(failed, "b"));
  EXPECT_FALSE(contains(names(result.order), "a"));
  EXPECT_EQ(result_names(result), std::vector<std::string>{"t"});
}

TEST(Analyzer, SelfContainingCompositeTypeIsACycle)
{
  auto result = analyze(
    "CREATE TYPE a AS (x int, y a);\n"
    "CREATE TABLE t (x int);");

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_dependency_cycle));
  ASSERT_EQ(result.cycles.size(), 1U);
  EXPECT_EQ(names(result.cycles[0]), std::vector<std::string>{"a"});
  EXPECT_EQ(names(result.failed), std::vector<std::string>{"a"});
  EXPECT_FALSE(contains(names(result.order), "a"));
  EXPECT_EQ(result_names(result), std::vector<std::string>{"t"});
}

// ============================================================================
// Options
// ============================================================================

TEST(Analyzer, CancelFlagStopsBeforeTheNextObject)
{
  std::atomic<bool> cancel{true};
  AnalyzeOptions options;
  options.cancel = &cancel;

  auto result = analyze("CREATE TABLE t (a int);\nCREATE VIEW v AS SELECT a FROM t;", options);
  EXPECT_TRUE(result.cancelled);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.objects.empty());
  EXPECT_EQ(result.order.size(), 2U);
}

TEST(Analyzer, PrivateAndExcludedRoutinesAreDropped)
{
  const std::string sql =
    "CREATE FUNCTION _helper() RETURNS int LANGUAGE sql AS $$ SELECT 1 $$;\n"
    "CREATE FUNCTION internal_only() RETURNS int LANGUAGE sql AS $$ SELECT 1 $$;\n"
    "CREATE FUNCTION api.visible() RETURNS int LANGUAGE sql AS $$ SELECT 1 $$;\n"
    "CREATE FUNCTION api.hidden() RETURNS int LANGUAGE sql AS $$ SELECT 1 $$;\n"
    "CREATE TABLE _private_table (a int);";

  AnalyzeOptions options;
  options.exclude_routines = {"internal_only", "api.hidden"};
  auto result = analyze(sql, options);
  ASSERT_TRUE(result.success);

  const auto kept = result_names(result);
  EXPECT_FALSE(contains(kept, "_helper"));
  EXPECT_FALSE(contains(kept, "internal_only"));
  EXPECT_FALSE(contains(kept, "hidden"));
  EXPECT_TRUE(contains(kept, "visible"));
  // Only routines are filtered.
  EXPECT_TRUE(contains(kept, "_private_table"));

  AnalyzeOptions no_hooks;
  no_hooks.builtin_hooks = false;
  EXPECT_EQ(analyze(sql, no_hooks).objects.size(), 5U);
}

TEST(Analyzer, CustomHooksRunAfterTheBuiltinOne)
{
  std::vector<size_t> seen;
  AnalyzeOptions options;
  options.hooks.push_back([&](AnalysisResult & r) { seen.push_back(r.objects.size()); });
  options.hooks.push_back([](AnalysisResult & r) {
    r.objects.erase(
      std::remove_if(
        r.objects.begin(), r.objects.end(),
        [](const ObjectResult & o) { return o.object->get_kind() == ObjectKind::Table; }),
      r.objects.end());
  });

  auto result = analyze(
    "CREATE TABLE t (a int);\n"
    "CREATE VIEW v AS SELECT a FROM t;\n"
    "CREATE FUNCTION _f() RETURNS int LANGUAGE sql AS $$ SELECT 1 $$;",
    options);

  ASSERT_EQ(seen.size(), 1U);
  EXPECT_EQ(seen[0], 2U);
  EXPECT_EQ(result_names(result), std::vector<std::string>{"v"});
}

// ============================================================================
// Files and ad-hoc queries
// ============================================================================

TEST(Analyzer, UnreadableFileIsReported)
{
  auto result = Analyzer::analyze_files({"/nonexistent/pg_sema/schema.sql"}, AnalyzeOptions{});
  EXPECT_FALSE(result.success);
  ASSERT_FALSE(result.diagnostics.empty());
  EXPECT_NE(result.diagnostics.all()[0].message.find("cannot read file"), std::string::npos);
}

TEST(Analyzer, InferQueryAgainstTheCatalog)
{
  auto result = analyze(
    "CREATE TABLE users (id int PRIMARY KEY, name text);\n"
    "CREATE VIEW named AS SELECT id, name FROM users WHERE name IS NOT NULL;");
  ASSERT_TRUE(result.success);

  DiagnosticBag diags;
  auto fields = Analyzer::infer_query(
    result, "SELECT n.id, u.name FROM named n JOIN users u ON u.id = n.id", diags);
  ASSERT_TRUE(fields.has_value());
  ASSERT_EQ(fields->size(), 2U);
  EXPECT_EQ((*fields)[0].name, "id");
  EXPECT_EQ((*fields)[1].type_oid, oid::k_text);

  // Queries can be run repeatedly against the same result.
  DiagnosticBag again;
  EXPECT_TRUE(Analyzer::infer_query(result, "SELECT 1 AS one", again).has_value());
}

TEST(Analyzer, InferQueryRejectsNonQueries)
{
  auto result = analyze("CREATE TABLE t (a int);");
  ASSERT_TRUE(result.success);

  DiagnosticBag ddl;
  EXPECT_FALSE(Analyzer::infer_query(result, "CREATE TABLE u (b int)", ddl).has_value());
  EXPECT_TRUE(ddl.has_code(diag_code::k_unsupported_construct));

  DiagnosticBag two;
  EXPECT_FALSE(Analyzer::infer_query(result, "SELECT 1; SELECT 2", two).has_value());
  EXPECT_TRUE(two.has_code(diag_code::k_unsupported_construct));

  DiagnosticBag syntax;
  EXPECT_FALSE(Analyzer::infer_query(result, "SELECT (1", syntax).has_value());
  EXPECT_TRUE(syntax.has_code(diag_code::k_syntax_error));

  DiagnosticBag unknown;
  EXPECT_FALSE(Analyzer::infer_query(result, "SELECT zzz FROM t", unknown).has_value());
  EXPECT_TRUE(unknown.has_code(diag_code::k_unknown_column));
}

TEST(Analyzer, InferQueryNeedsACatalog)
{
  auto failed = analyze("CREATE TABLE t (a int);\nCREATE TABLE t (a int);");
  DiagnosticBag diags;
  EXPECT_FALSE(Analyzer::infer_query(failed, "SELECT 1", diags).has_value());
  EXPECT_TRUE(diags.has_errors());
}
